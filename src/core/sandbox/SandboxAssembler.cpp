#include "SandboxAssembler.hpp"
#include "core/common/Logger.hpp"
#include "core/storage/FileManager.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QtGlobal>

namespace Evalbox {

namespace {

const char* const kSandboxPath = "/usr/local/bin:/usr/local/sbin:/usr/bin:/usr/sbin:/bin:/sbin";

} // namespace

SandboxAssembler::SandboxAssembler(SandboxContext& context)
    : context_(context)
{
}

Expected<QString, SandboxError> SandboxAssembler::resolveInstallDir(const QString& installPath) {
    QDir dir(installPath);
    if (!dir.exists()) {
        Logger::instance().error("Installation directory {} does not exist", installPath.toStdString());
        return makeUnexpected(SandboxError::InstallDirInvalid);
    }

    const QStringList entries = dir.entryList(
        QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
    if (entries.size() == 1) {
        return dir.absoluteFilePath(entries.first());
    }
    return dir.absolutePath();
}

Environment SandboxAssembler::requiredEnvironment(const QString& home, const QString& registriesMountPoint) {
    Environment env;

    // evaluation detection
    env.insert("CI", "true");
    env.insert("PKGEVAL", "true");
    env.insert("JULIA_PKGEVAL", "true");

    // A registry in a non-primary depot entry is used as-is, without any
    // refresh of the registries during the session.
    env.insert("JULIA_DEPOT_PATH", "::" + QFileInfo(registriesMountPoint).path());

    // nothing runs through a login shell
    env.insert("PATH", kSandboxPath);
    env.insert("HOME", home);
    return env;
}

QString SandboxAssembler::cpuList(const QList<int>& cpus) {
    QStringList ids;
    for (int cpu : cpus) {
        ids << QString::number(cpu);
    }
    return ids.join(',');
}

SandboxCommand SandboxAssembler::restrictToCpus(const SandboxCommand& command, const QList<int>& cpus,
                                                const QString& affinityProgram) {
    if (cpus.isEmpty()) {
        return command;
    }

    SandboxCommand wrapped;
    wrapped.program = affinityProgram;
    wrapped.arguments << "--cpu-list" << cpuList(cpus) << command.program << command.arguments;
    return wrapped;
}

Expected<PreparedSandbox, SandboxError> SandboxAssembler::build(const QString& installPath,
                                                               const QStringList& args,
                                                               const LaunchOptions& options) {
    const Config::SandboxSettings& settings = context_.settings();
    const QString installMountPoint = options.installMountPoint.isEmpty()
        ? settings.installMountPoint : options.installMountPoint;
    const QString registriesPath = options.registriesPath.isEmpty()
        ? settings.registriesPath : options.registriesPath;

    auto runtimeDir = resolveInstallDir(installPath);
    if (!runtimeDir) {
        return makeUnexpected(runtimeDir.error());
    }

    auto rootfs = context_.rootfsCache().prepare(options.identity);
    if (!rootfs) {
        Logger::instance().error("Cannot prepare {} rootfs: {}",
                                 options.identity.distro.toStdString(), toString(rootfs.error()));
        return makeUnexpected(SandboxError::RootfsFailed);
    }

    PreparedSandbox prepared;
    SandboxConfig& config = prepared.config;

    config.readOnlyMounts.insert("/", rootfs->path);
    config.readOnlyMounts.insert(installMountPoint, runtimeDir.value());
    config.readOnlyMounts.insert(settings.registriesMountPoint, registriesPath);

    const QString artifactsPath = QDir(settings.storagePath).filePath("artifacts");
    if (!FileManager::ensureDirectoryExists(artifactsPath)) {
        Logger::instance().error("Cannot create artifacts directory {}", artifactsPath.toStdString());
        return makeUnexpected(SandboxError::StorageFailed);
    }
    MountTable defaultReadWrite;
    defaultReadWrite.insert(QDir(rootfs->home).filePath(".julia/artifacts"), artifactsPath);
    // caller mounts win over the defaults at the same mount point
    config.readWriteMounts = mergeMounts(defaultReadWrite, options.mounts);

    config.environment = mergeEnvironment(options.environment,
                                          requiredEnvironment(rootfs->home, settings.registriesMountPoint));
    if (qEnvironmentVariableIsSet("TERM")) {
        config.environment.insert("TERM", qEnvironmentVariable("TERM"));
    }

    if (options.xvfb) {
        DisplayServer& displayServer = context_.displayServer();
        auto display = displayServer.ensureRunning();
        if (!display) {
            return makeUnexpected(SandboxError::DisplayFailed);
        }
        config.environment.insert("DISPLAY", display.value());
        config.readWriteMounts.insert(displayServer.socketDirectory(), displayServer.socketDirectory());
    }

    SandboxCommand runtime;
    runtime.program = QDir(installMountPoint).filePath(settings.runtimeBinary);
    SandboxCommand& command = prepared.command;
    command = restrictToCpus(runtime, options.cpus, settings.cpuAffinityProgram);
    if (!options.cpus.isEmpty()) {
        // size the runtime's thread pool after the restriction
        config.environment.insert("JULIA_CPU_THREADS", QString::number(options.cpus.size()));
    }
    command.arguments << args;

    config.uid = rootfs->uid;
    config.gid = rootfs->gid;
    config.workingDirectory = rootfs->home;
    config.persist = true;
    config.stdio = options.stdio;
    config.verbose = options.verbose || Logger::instance().isEnabled(Logger::Level::Debug);

    Logger::instance().debug("Assembled sandbox for {}: {}", runtimeDir->toStdString(),
                             command.toString().toStdString());
    return prepared;
}

} // namespace Evalbox
