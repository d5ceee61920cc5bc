#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"
#include "core/sandbox/SandboxContext.hpp"
#include "core/sandbox/SandboxTypes.hpp"

namespace Evalbox {

/**
 * @brief Turns an installed runtime and launch options into a sandbox configuration
 *
 * build() only assembles: it prepares the rootfs and, when asked for, the
 * display server, but launches nothing. The returned configuration and
 * command can be handed to any executor.
 */
class SandboxAssembler {
public:
    explicit SandboxAssembler(SandboxContext& context);

    Expected<PreparedSandbox, SandboxError> build(const QString& installPath,
                                                  const QStringList& args = QStringList(),
                                                  const LaunchOptions& options = LaunchOptions());

    // A directory holding exactly one entry (an unpacked archive's top-level
    // directory) resolves to that entry, anything else to itself
    static Expected<QString, SandboxError> resolveInstallDir(const QString& installPath);

    // Variables every sandbox gets, overriding caller-supplied values
    static Environment requiredEnvironment(const QString& home, const QString& registriesMountPoint);

    // Prefixes command with the affinity wrapper; unchanged when cpus is empty
    static SandboxCommand restrictToCpus(const SandboxCommand& command, const QList<int>& cpus,
                                         const QString& affinityProgram);

    static QString cpuList(const QList<int>& cpus);

private:
    SandboxContext& context_;
};

} // namespace Evalbox
