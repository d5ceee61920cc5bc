#pragma once

#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/process/ChildProcess.hpp"

namespace Evalbox {

enum class DisplayError {
    SpawnFailed,
    NotRunning
};

const char* toString(DisplayError error);

struct DisplayOptions {
    QString program = "Xvfb";
    QString display = ":1";
    QString screenGeometry = "1024x768x16";
    QString socketDirectory = "/tmp/.X11-unix";
    int startupGraceMs = 1000;

    // <display> -screen 0 <geometry>
    QStringList arguments() const;
};

/**
 * @brief Single virtual display server shared by every sandbox
 *
 * ensureRunning() starts the server lazily and restarts it when the previous
 * instance died. A freshly started server must still be alive after the
 * startup grace period, otherwise the attempt fails and nothing is kept, so
 * the next call tries again. shutdown() is idempotent; it is hooked to
 * QCoreApplication::aboutToQuit by the first ensureRunning() call that
 * finds an application object and is also called by the owning context.
 * Signals are emitted without the internal lock held.
 */
class DisplayServer : public QObject {
    Q_OBJECT

public:
    explicit DisplayServer(const DisplayOptions& options = DisplayOptions(), QObject* parent = nullptr);
    ~DisplayServer() override;

    // Returns the display identifier to export as DISPLAY
    Expected<QString, DisplayError> ensureRunning();
    void shutdown();

    bool isRunning();
    int startCount() const;
    // True once shutdown() is connected to QCoreApplication::aboutToQuit
    bool hasShutdownHook() const;

    const QString& display() const { return options_.display; }
    const QString& socketDirectory() const { return options_.socketDirectory; }

signals:
    void serverStarted(qint64 pid);
    void serverStopped();

private:
    void registerShutdownHook();

    const DisplayOptions options_;

    mutable QMutex mutex_;
    std::shared_ptr<ChildProcess> process_;
    bool hookRegistered_ = false;
    int starts_ = 0;
};

} // namespace Evalbox
