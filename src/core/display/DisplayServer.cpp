#include "DisplayServer.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QThread>

namespace Evalbox {

const char* toString(DisplayError error) {
    switch (error) {
        case DisplayError::SpawnFailed: return "display server could not be spawned";
        case DisplayError::NotRunning: return "display server is not running";
    }
    return "unknown display error";
}

QStringList DisplayOptions::arguments() const {
    return {display, "-screen", "0", screenGeometry};
}

DisplayServer::DisplayServer(const DisplayOptions& options, QObject* parent)
    : QObject(parent)
    , options_(options)
{
}

DisplayServer::~DisplayServer() {
    shutdown();
}

Expected<QString, DisplayError> DisplayServer::ensureRunning() {
    QMutexLocker locker(&mutex_);
    if (process_ && process_->isRunning()) {
        if (!hookRegistered_) {
            registerShutdownHook();
        }
        return options_.display;
    }

    if (process_) {
        auto status = process_->exitStatus();
        Logger::instance().warn("Display server {} is gone (code {}, signal {}), restarting",
                                process_->pid(), status ? status->exitCode : -1, status ? status->signal : 0);
    }

    SpawnOptions spawnOptions;
    spawnOptions.program = options_.program;
    spawnOptions.arguments = options_.arguments();
    spawnOptions.stdio.stdinFd = -1;

    auto spawned = ChildProcess::spawn(spawnOptions);
    if (!spawned) {
        Logger::instance().error("Could not start display server {}: {}",
                                 options_.program.toStdString(), toString(spawned.error()));
        return makeUnexpected(DisplayError::SpawnFailed);
    }
    std::shared_ptr<ChildProcess> process = spawned.value();
    ++starts_;

    QThread::msleep(static_cast<unsigned long>(options_.startupGraceMs));
    if (!process->isRunning()) {
        auto status = process->exitStatus();
        Logger::instance().error("Display server {} exited during startup (code {}, signal {})",
                                 options_.program.toStdString(),
                                 status ? status->exitCode : -1, status ? status->signal : 0);
        return makeUnexpected(DisplayError::NotRunning);
    }

    process_ = process;
    if (!hookRegistered_) {
        registerShutdownHook();
    }
    const qint64 pid = process->pid();
    locker.unlock();

    Logger::instance().info("Display server {} running on {} (pid {})",
                            options_.program.toStdString(), options_.display.toStdString(), pid);
    emit serverStarted(pid);
    return options_.display;
}

void DisplayServer::shutdown() {
    std::shared_ptr<ChildProcess> process;
    {
        QMutexLocker locker(&mutex_);
        process = std::move(process_);
        process_.reset();
    }
    if (!process) {
        return;
    }

    if (!process->terminate()) {
        Logger::instance().warn("Could not signal display server {}", process->pid());
    }
    auto status = process->wait();
    if (!status) {
        Logger::instance().warn("Could not reap display server {}: {}", process->pid(), toString(status.error()));
    } else {
        Logger::instance().info("Display server {} stopped", process->pid());
    }
    emit serverStopped();
}

bool DisplayServer::isRunning() {
    QMutexLocker locker(&mutex_);
    return process_ && process_->isRunning();
}

int DisplayServer::startCount() const {
    QMutexLocker locker(&mutex_);
    return starts_;
}

bool DisplayServer::hasShutdownHook() const {
    QMutexLocker locker(&mutex_);
    return hookRegistered_;
}

// Called with mutex_ held. Without an application object the hook is
// attached by a later ensureRunning() call.
void DisplayServer::registerShutdownHook() {
    if (auto* app = QCoreApplication::instance()) {
        connect(app, &QCoreApplication::aboutToQuit, this, &DisplayServer::shutdown, Qt::DirectConnection);
        hookRegistered_ = true;
    }
}

} // namespace Evalbox
