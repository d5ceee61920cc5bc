#include "SandboxLauncher.hpp"
#include "core/common/Logger.hpp"

#include <QtConcurrent/QtConcurrent>
#include <exception>
#include <string>

namespace Evalbox {

SandboxLauncher::SandboxLauncher(SandboxContext& context, QObject* parent)
    : QObject(parent)
    , context_(context)
    , assembler_(context)
{
}

SandboxLauncher::~SandboxLauncher() {
    // supervision tasks emit through this object
    context_.waitForSupervisions();
}

Expected<std::shared_ptr<ChildProcess>, SandboxError> SandboxLauncher::run(const QString& installPath,
                                                                           const QStringList& args,
                                                                           const LaunchOptions& options) {
    auto prepared = assembler_.build(installPath, args, options);
    if (!prepared) {
        Logger::instance().error("Cannot assemble sandbox for {}: {}",
                                 installPath.toStdString(), toString(prepared.error()));
        return makeUnexpected(prepared.error());
    }
    return launch(prepared.value(), options.wait);
}

Expected<std::shared_ptr<ChildProcess>, SandboxError> SandboxLauncher::launch(const PreparedSandbox& prepared,
                                                                              bool wait) {
    std::unique_ptr<SandboxExecutor> executor = context_.createExecutor();
    if (!executor) {
        Logger::instance().error("No sandbox executor available");
        return makeUnexpected(SandboxError::LaunchFailed);
    }
    if (executor->isPrivileged()) {
        Logger::instance().warn("Sandbox executor {} runs with elevated privileges",
                                executor->name().toStdString());
    }

    auto process = executor->run(prepared.config, prepared.command);
    if (!process) {
        Logger::instance().error("Cannot launch {} with {}: {}", prepared.command.toString().toStdString(),
                                 executor->name().toStdString(), toString(process.error()));
        releaseExecutor(*executor, 0);
        return makeUnexpected(SandboxError::LaunchFailed);
    }

    std::shared_ptr<ChildProcess> handle = process.value();
    Logger::instance().debug("Launched {} as pid {}", prepared.command.toString().toStdString(), handle->pid());
    emit processStarted(handle->pid());

    if (!wait) {
        std::shared_ptr<SandboxExecutor> shared(std::move(executor));
        QFuture<void> future = QtConcurrent::run(context_.supervisionPool(), [this, shared, handle]() {
            supervise(shared, handle);
        });
        context_.trackSupervision(future);
        return handle;
    }

    auto status = handle->wait();
    releaseExecutor(*executor, handle->pid());
    if (!status) {
        Logger::instance().error("Cannot wait for pid {}: {}", handle->pid(), toString(status.error()));
        return makeUnexpected(SandboxError::WaitFailed);
    }

    Logger::instance().debug("Process {} exited with code {}", handle->pid(), status->shellCode());
    emit processFinished(handle->pid(), status->shellCode());
    return handle;
}

void SandboxLauncher::supervise(std::shared_ptr<SandboxExecutor> executor, std::shared_ptr<ChildProcess> process) {
    const qint64 pid = process->pid();
    const std::string command = process->arguments().join(' ').toStdString();

    Expected<ExitStatus, ProcessError> status = makeUnexpected(ProcessError::WaitFailed);
    try {
        status = process->wait();
    } catch (const std::exception& e) {
        Logger::instance().error("Waiting for pid {} ({}) threw: {}", pid, command, e.what());
    }

    // cleanup follows the exit whatever the wait reported
    try {
        auto cleaned = executor->cleanup();
        if (!cleaned) {
            Logger::instance().error("Cleanup after pid {} ({}) failed: {}", pid, command,
                                     toString(cleaned.error()));
            emit supervisionFailed(pid, QString::fromUtf8(toString(cleaned.error())));
        }
    } catch (const std::exception& e) {
        Logger::instance().error("Cleanup after pid {} ({}) threw: {}", pid, command, e.what());
        emit supervisionFailed(pid, QString::fromUtf8(e.what()));
    }

    if (!status) {
        Logger::instance().error("Supervision of pid {} ({}) failed: {}", pid, command, toString(status.error()));
        emit supervisionFailed(pid, QString::fromUtf8(toString(status.error())));
        return;
    }

    Logger::instance().debug("Detached process {} exited with code {}", pid, status->shellCode());
    emit processFinished(pid, status->shellCode());
}

void SandboxLauncher::releaseExecutor(SandboxExecutor& executor, qint64 pid) {
    auto cleaned = executor.cleanup();
    if (!cleaned) {
        Logger::instance().error("Cleanup after pid {} failed: {}", pid, toString(cleaned.error()));
    }
}

} // namespace Evalbox
