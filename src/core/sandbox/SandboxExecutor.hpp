#pragma once

#include <QtCore/QString>
#include <functional>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/process/ChildProcess.hpp"
#include "core/sandbox/SandboxTypes.hpp"

namespace Evalbox {

enum class LaunchError {
    ProgramNotFound,
    PersistDirFailed,
    SpawnFailed,
    CleanupFailed
};

const char* toString(LaunchError error);

/**
 * @brief Runs a prepared command inside an isolated environment
 *
 * One executor serves one launch. cleanup() releases whatever run() set up
 * (namespaces, persistence directories) and must be safe to call twice.
 */
class SandboxExecutor {
public:
    virtual ~SandboxExecutor() = default;

    virtual Expected<std::shared_ptr<ChildProcess>, LaunchError> run(const SandboxConfig& config,
                                                                     const SandboxCommand& command) = 0;
    virtual Expected<void, LaunchError> cleanup() = 0;

    virtual QString name() const = 0;
    // True when the executor runs with elevated privileges (e.g. a setuid helper)
    virtual bool isPrivileged() const = 0;
};

using ExecutorFactory = std::function<std::unique_ptr<SandboxExecutor>()>;

} // namespace Evalbox
