#pragma once

#include <QtCore/QFuture>
#include <QtCore/QList>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QThreadPool>
#include <memory>

#include "core/common/Config.hpp"
#include "core/display/DisplayServer.hpp"
#include "core/rootfs/RootfsCache.hpp"
#include "core/sandbox/SandboxExecutor.hpp"

namespace Evalbox {

/**
 * @brief Process-wide state shared by every sandbox launch
 *
 * Construct one per process and hand it to SandboxAssembler and
 * SandboxLauncher. It owns the rootfs cache, the display server, the executor
 * factory and the threads supervising non-blocking launches. shutdown() (also
 * run on destruction) waits for outstanding supervisions and then stops the
 * display server.
 */
class SandboxContext : public QObject {
    Q_OBJECT

public:
    explicit SandboxContext(const Config::SandboxSettings& settings, QObject* parent = nullptr);
    ~SandboxContext() override;

    const Config::SandboxSettings& settings() const { return settings_; }

    RootfsCache& rootfsCache() { return *rootfsCache_; }
    DisplayServer& displayServer() { return *displayServer_; }

    // Defaults to BubblewrapExecutor
    void setExecutorFactory(ExecutorFactory factory);
    std::unique_ptr<SandboxExecutor> createExecutor() const;

    QThreadPool* supervisionPool() { return &supervisionPool_; }
    void trackSupervision(const QFuture<void>& future);
    int pendingSupervisions() const;
    void waitForSupervisions();

    void shutdown();
    bool isShutDown() const;

private:
    const Config::SandboxSettings settings_;
    std::unique_ptr<RootfsCache> rootfsCache_;
    std::unique_ptr<DisplayServer> displayServer_;

    mutable QMutex mutex_;
    ExecutorFactory executorFactory_;
    QList<QFuture<void>> supervisions_;
    QThreadPool supervisionPool_;
    bool shutDown_ = false;
};

} // namespace Evalbox
