#pragma once

#include <QtCore/QMap>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QWaitCondition>
#include <memory>
#include <optional>
#include <unistd.h>

#include "core/common/Expected.hpp"

namespace Evalbox {

enum class ProcessError {
    SpawnFailed,
    ExecFailed,
    WaitFailed,
    SignalFailed
};

const char* toString(ProcessError error);

using Environment = QMap<QString, QString>;

// Bindings may reference each other's slots, e.g. stdout to 2 and stderr to 1
struct StdioBindings {
    int stdinFd = STDIN_FILENO;   // if negative, use /dev/null
    int stdoutFd = STDOUT_FILENO; // if negative, use /dev/null
    int stderrFd = STDERR_FILENO; // if negative, use /dev/null
};

struct SpawnOptions {
    QString program;    // absolute, or looked up in PATH
    QStringList arguments;
    std::optional<Environment> environment; // inherit when unset
    QString workingDirectory;               // inherit when empty
    StdioBindings stdio;
};

struct ExitStatus {
    int exitCode = -1;
    int signal = 0;

    bool signaled() const { return signal != 0; }
    bool succeeded() const { return !signaled() && exitCode == 0; }
    // Shell convention: 128 + signal number for killed processes
    int shellCode() const { return signaled() ? 128 + signal : exitCode; }
};

/**
 * @brief Handle to a forked child process
 *
 * Thread-safe: wait() may be called from several threads at once, exactly one
 * of them reaps the child and the others observe the same status. A handle
 * destroyed while its child is still unreaped kills and reaps it.
 */
class ChildProcess {
public:
    static Expected<std::shared_ptr<ChildProcess>, ProcessError> spawn(const SpawnOptions& options);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    qint64 pid() const { return pid_; }
    const QString& program() const { return program_; }
    const QStringList& arguments() const { return arguments_; }

    bool isRunning();
    std::optional<ExitStatus> exitStatus() const;

    // Blocks until the child exits
    Expected<ExitStatus, ProcessError> wait();

    Expected<void, ProcessError> terminate();
    Expected<void, ProcessError> kill();

private:
    ChildProcess(pid_t pid, QString program, QStringList arguments);

    Expected<void, ProcessError> sendSignal(int signal);
    void recordStatus(int rawStatus);

    const pid_t pid_;
    const QString program_;
    const QStringList arguments_;

    mutable QMutex mutex_;
    QWaitCondition finished_;
    bool reaping_ = false;
    std::optional<ExitStatus> status_;
};

} // namespace Evalbox
