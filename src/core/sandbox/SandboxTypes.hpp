#pragma once

#include <QtCore/QList>
#include <QtCore/QMap>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/process/ChildProcess.hpp"
#include "core/rootfs/RootfsCache.hpp"

namespace Evalbox {

enum class SandboxError {
    InstallDirInvalid,
    RootfsFailed,
    StorageFailed,
    DisplayFailed,
    LaunchFailed,
    WaitFailed
};

const char* toString(SandboxError error);

// Mount point inside the sandbox -> source path on the host
using MountTable = QMap<QString, QString>;

// Last writer wins: entries of overrides replace those of base
MountTable mergeMounts(const MountTable& base, const MountTable& overrides);
Environment mergeEnvironment(const Environment& base, const Environment& overrides);

struct SandboxConfig {
    MountTable readOnlyMounts;
    MountTable readWriteMounts;
    Environment environment;
    int uid = 0;
    int gid = 0;
    QString workingDirectory;
    bool persist = true; // writes go to host storage, never to a bounded tmpfs
    StdioBindings stdio;
    bool verbose = false;
};

struct SandboxCommand {
    QString program;
    QStringList arguments;

    QStringList toList() const { return QStringList{program} + arguments; }
    QString toString() const { return toList().join(' '); }
};

struct PreparedSandbox {
    SandboxConfig config;
    SandboxCommand command;
};

struct LaunchOptions {
    RootfsIdentity identity;

    QString registriesPath;    // settings default when empty
    QString installMountPoint; // settings default when empty

    Environment environment;   // lower precedence than the required variables
    MountTable mounts;         // extra read-write mounts
    StdioBindings stdio;

    bool xvfb = true;
    QList<int> cpus;           // restrict to these CPUs when not empty
    bool wait = true;
    bool verbose = false;
};

} // namespace Evalbox
