#include "ChildProcess.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QByteArray>
#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QStandardPaths>
#include <vector>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace Evalbox {

const char* toString(ProcessError error) {
    switch (error) {
        case ProcessError::SpawnFailed: return "spawn failed";
        case ProcessError::ExecFailed: return "exec failed";
        case ProcessError::WaitFailed: return "wait failed";
        case ProcessError::SignalFailed: return "signal delivery failed";
    }
    return "unknown process error";
}

namespace {

// Owns the strings behind a NULL-terminated char* array for execve()
class CStringArray {
public:
    void append(const QByteArray& value) {
        storage_.push_back(value);
    }

    char* const* data() {
        pointers_.clear();
        for (QByteArray& value : storage_) {
            pointers_.push_back(value.data());
        }
        pointers_.push_back(nullptr);
        return pointers_.data();
    }

private:
    std::vector<QByteArray> storage_;
    std::vector<char*> pointers_;
};

void closeFd(int fd) {
    if (fd >= 0) {
        ::close(fd);
    }
}

// Only async-signal-safe calls below, we are between fork() and exec()
[[noreturn]] void execChild(const char* path, char* const* argv, char* const* envp,
                            const char* workingDirectory, const int stdio[3], int errorFd) {
    sigset_t all;
    sigemptyset(&all);
    sigprocmask(SIG_SETMASK, &all, nullptr);

    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = SIG_DFL;
    sigaction(SIGPIPE, &action, nullptr);

    // bindings that are stdio fds themselves are moved above 2 first, so
    // crossed bindings (stdout to 2, stderr to 1) are not clobbered
    int fds[3] = {stdio[0], stdio[1], stdio[2]};
    for (int target = 0; target < 3; ++target) {
        if (fds[target] >= 0 && fds[target] < 3 && fds[target] != target) {
            fds[target] = ::fcntl(fds[target], F_DUPFD_CLOEXEC, 3);
            if (fds[target] < 0) {
                int error = errno;
                (void)!::write(errorFd, &error, sizeof(error));
                ::_exit(127);
            }
        }
    }

    for (int target = 0; target < 3; ++target) {
        if (fds[target] != target && ::dup2(fds[target], target) < 0) {
            int error = errno;
            (void)!::write(errorFd, &error, sizeof(error));
            ::_exit(127);
        }
    }

    if (workingDirectory && ::chdir(workingDirectory) < 0) {
        int error = errno;
        (void)!::write(errorFd, &error, sizeof(error));
        ::_exit(127);
    }

    if (envp) {
        ::execve(path, argv, envp);
    } else {
        ::execv(path, argv);
    }

    int error = errno;
    (void)!::write(errorFd, &error, sizeof(error));
    ::_exit(127);
}

} // namespace

ChildProcess::ChildProcess(pid_t pid, QString program, QStringList arguments)
    : pid_(pid)
    , program_(std::move(program))
    , arguments_(std::move(arguments))
{
}

ChildProcess::~ChildProcess() {
    QMutexLocker locker(&mutex_);
    if (status_ || reaping_) {
        return;
    }

    Logger::instance().warn("Process {} ({}) dropped while running, killing it",
                            pid_, program_.toStdString());
    ::kill(pid_, SIGKILL);
    int rawStatus = 0;
    while (::waitpid(pid_, &rawStatus, 0) < 0 && errno == EINTR) {
    }
}

Expected<std::shared_ptr<ChildProcess>, ProcessError> ChildProcess::spawn(const SpawnOptions& options) {
    QString path = options.program;
    if (!path.contains('/')) {
        path = QStandardPaths::findExecutable(options.program);
        if (path.isEmpty()) {
            Logger::instance().error("Program {} not found in PATH", options.program.toStdString());
            return makeUnexpected(ProcessError::ExecFailed);
        }
    }

    CStringArray argv;
    argv.append(QFile::encodeName(path));
    for (const QString& argument : options.arguments) {
        argv.append(argument.toLocal8Bit());
    }

    CStringArray envp;
    if (options.environment) {
        for (auto it = options.environment->constBegin(); it != options.environment->constEnd(); ++it) {
            envp.append((it.key() + '=' + it.value()).toLocal8Bit());
        }
    }

    const QByteArray encodedPath = QFile::encodeName(path);
    const QByteArray workingDirectory = QFile::encodeName(options.workingDirectory);

    int devNull = -1;
    const StdioBindings& bindings = options.stdio;
    if (bindings.stdinFd < 0 || bindings.stdoutFd < 0 || bindings.stderrFd < 0) {
        devNull = ::open("/dev/null", O_RDWR | O_CLOEXEC);
        if (devNull < 0) {
            Logger::instance().error("Cannot open /dev/null: {}", std::strerror(errno));
            return makeUnexpected(ProcessError::SpawnFailed);
        }
    }
    const int stdio[3] = {
        bindings.stdinFd < 0 ? devNull : bindings.stdinFd,
        bindings.stdoutFd < 0 ? devNull : bindings.stdoutFd,
        bindings.stderrFd < 0 ? devNull : bindings.stderrFd,
    };

    int statusPipe[2];
    if (::pipe2(statusPipe, O_CLOEXEC) < 0) {
        Logger::instance().error("Cannot create status pipe: {}", std::strerror(errno));
        closeFd(devNull);
        return makeUnexpected(ProcessError::SpawnFailed);
    }

    char* const* argvData = argv.data();
    char* const* envpData = options.environment ? envp.data() : nullptr;

    pid_t pid = ::fork();
    if (pid < 0) {
        Logger::instance().error("fork() failed for {}: {}", path.toStdString(), std::strerror(errno));
        closeFd(statusPipe[0]);
        closeFd(statusPipe[1]);
        closeFd(devNull);
        return makeUnexpected(ProcessError::SpawnFailed);
    }

    if (pid == 0) {
        execChild(encodedPath.constData(), argvData, envpData,
                  workingDirectory.isEmpty() ? nullptr : workingDirectory.constData(),
                  stdio, statusPipe[1]);
    }

    closeFd(statusPipe[1]);
    closeFd(devNull);

    int childErrno = 0;
    ssize_t received;
    do {
        received = ::read(statusPipe[0], &childErrno, sizeof(childErrno));
    } while (received < 0 && errno == EINTR);
    closeFd(statusPipe[0]);

    if (received == static_cast<ssize_t>(sizeof(childErrno))) {
        int rawStatus = 0;
        while (::waitpid(pid, &rawStatus, 0) < 0 && errno == EINTR) {
        }
        Logger::instance().error("Failed to execute {}: {}", path.toStdString(), std::strerror(childErrno));
        return makeUnexpected(ProcessError::ExecFailed);
    }

    Logger::instance().debug("Spawned {} as pid {}", path.toStdString(), pid);
    return std::shared_ptr<ChildProcess>(new ChildProcess(pid, path, options.arguments));
}

bool ChildProcess::isRunning() {
    QMutexLocker locker(&mutex_);
    if (status_) {
        return false;
    }
    if (reaping_) {
        // another thread is blocked in waitpid() and will publish the status
        return true;
    }

    int rawStatus = 0;
    pid_t result;
    do {
        result = ::waitpid(pid_, &rawStatus, WNOHANG);
    } while (result < 0 && errno == EINTR);

    if (result == 0) {
        return true;
    }
    if (result < 0) {
        Logger::instance().warn("waitpid({}) failed: {}", pid_, std::strerror(errno));
        return false;
    }

    recordStatus(rawStatus);
    return false;
}

std::optional<ExitStatus> ChildProcess::exitStatus() const {
    QMutexLocker locker(&mutex_);
    return status_;
}

Expected<ExitStatus, ProcessError> ChildProcess::wait() {
    QMutexLocker locker(&mutex_);
    while (!status_) {
        if (reaping_) {
            finished_.wait(&mutex_);
            continue;
        }

        reaping_ = true;
        locker.unlock();

        int rawStatus = 0;
        pid_t result;
        do {
            result = ::waitpid(pid_, &rawStatus, 0);
        } while (result < 0 && errno == EINTR);
        const int waitErrno = errno;

        locker.relock();
        reaping_ = false;

        if (result < 0) {
            finished_.wakeAll();
            Logger::instance().error("waitpid({}) failed: {}", pid_, std::strerror(waitErrno));
            return makeUnexpected(ProcessError::WaitFailed);
        }
        recordStatus(rawStatus);
    }
    return *status_;
}

Expected<void, ProcessError> ChildProcess::terminate() {
    return sendSignal(SIGTERM);
}

Expected<void, ProcessError> ChildProcess::kill() {
    return sendSignal(SIGKILL);
}

Expected<void, ProcessError> ChildProcess::sendSignal(int signal) {
    QMutexLocker locker(&mutex_);
    if (status_) {
        return {};
    }
    if (::kill(pid_, signal) < 0 && errno != ESRCH) {
        Logger::instance().error("Cannot send signal {} to {}: {}", signal, pid_, std::strerror(errno));
        return makeUnexpected(ProcessError::SignalFailed);
    }
    return {};
}

void ChildProcess::recordStatus(int rawStatus) {
    ExitStatus status;
    if (WIFSIGNALED(rawStatus)) {
        status.signal = WTERMSIG(rawStatus);
    } else if (WIFEXITED(rawStatus)) {
        status.exitCode = WEXITSTATUS(rawStatus);
    }
    status_ = status;
    finished_.wakeAll();

    Logger::instance().debug("Process {} exited (code {}, signal {})", pid_, status.exitCode, status.signal);
}

} // namespace Evalbox
