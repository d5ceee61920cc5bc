#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/process/ChildProcess.hpp"
#include "core/sandbox/SandboxAssembler.hpp"
#include "core/sandbox/SandboxContext.hpp"
#include "core/sandbox/SandboxExecutor.hpp"

namespace Evalbox {

/**
 * @brief Launches sandboxed runtimes and owns their lifecycle
 *
 * With LaunchOptions::wait the call blocks until the process exits and runs
 * the executor's cleanup before returning the finished handle. Without it the
 * running handle is returned immediately and a task on the context's
 * supervision pool waits for the exit and then cleans up; failures of that
 * task are logged and reported through supervisionFailed(), never to the
 * caller. Either way cleanup runs exactly once per launch.
 */
class SandboxLauncher : public QObject {
    Q_OBJECT

public:
    explicit SandboxLauncher(SandboxContext& context, QObject* parent = nullptr);
    ~SandboxLauncher() override;

    Expected<std::shared_ptr<ChildProcess>, SandboxError> run(const QString& installPath,
                                                               const QStringList& args = QStringList(),
                                                               const LaunchOptions& options = LaunchOptions());

    // Same as run() for an already assembled sandbox
    Expected<std::shared_ptr<ChildProcess>, SandboxError> launch(const PreparedSandbox& prepared, bool wait = true);

signals:
    void processStarted(qint64 pid);
    // Emitted after cleanup, from the supervising thread for detached launches
    void processFinished(qint64 pid, int exitCode);
    void supervisionFailed(qint64 pid, const QString& reason);

private:
    void supervise(std::shared_ptr<SandboxExecutor> executor, std::shared_ptr<ChildProcess> process);
    static void releaseExecutor(SandboxExecutor& executor, qint64 pid);

    SandboxContext& context_;
    SandboxAssembler assembler_;
};

} // namespace Evalbox
