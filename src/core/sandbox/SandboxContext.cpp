#include "SandboxContext.hpp"
#include "core/common/Logger.hpp"
#include "core/sandbox/BubblewrapExecutor.hpp"

#include <algorithm>

namespace Evalbox {

namespace {

DisplayOptions displayOptionsFrom(const Config::SandboxSettings& settings) {
    DisplayOptions options;
    options.program = settings.displayProgram;
    options.display = settings.display;
    options.screenGeometry = settings.displayGeometry;
    options.socketDirectory = settings.displaySocketPath;
    options.startupGraceMs = settings.displayStartupGraceMs;
    return options;
}

} // namespace

SandboxContext::SandboxContext(const Config::SandboxSettings& settings, QObject* parent)
    : QObject(parent)
    , settings_(settings)
    , rootfsCache_(std::make_unique<RootfsCache>(settings.imagesPath, settings.scratchPath,
                                                 settings.resolverConfPath))
    , displayServer_(std::make_unique<DisplayServer>(displayOptionsFrom(settings)))
{
    const QString program = settings.executorProgram;
    const QString scratch = settings.scratchPath;
    executorFactory_ = [program, scratch]() -> std::unique_ptr<SandboxExecutor> {
        return std::make_unique<BubblewrapExecutor>(program, scratch);
    };

    supervisionPool_.setMaxThreadCount(qMax(1, settings.maxSupervisionThreads));
    // supervisors block for a whole sandbox lifetime, never let them expire mid-wait
    supervisionPool_.setExpiryTimeout(-1);

    Logger::instance().debug("Sandbox context created (images {}, scratch {}, storage {})",
                             settings.imagesPath.toStdString(), settings.scratchPath.toStdString(),
                             settings.storagePath.toStdString());
}

SandboxContext::~SandboxContext() {
    shutdown();
}

void SandboxContext::setExecutorFactory(ExecutorFactory factory) {
    QMutexLocker locker(&mutex_);
    executorFactory_ = std::move(factory);
}

std::unique_ptr<SandboxExecutor> SandboxContext::createExecutor() const {
    ExecutorFactory factory;
    {
        QMutexLocker locker(&mutex_);
        factory = executorFactory_;
    }
    return factory ? factory() : nullptr;
}

void SandboxContext::trackSupervision(const QFuture<void>& future) {
    QMutexLocker locker(&mutex_);
    // drop the ones that are done so the list only holds live supervisions
    supervisions_.erase(std::remove_if(supervisions_.begin(), supervisions_.end(),
                                       [](const QFuture<void>& f) { return f.isFinished(); }),
                        supervisions_.end());
    supervisions_.append(future);
}

int SandboxContext::pendingSupervisions() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(std::count_if(supervisions_.cbegin(), supervisions_.cend(),
                                          [](const QFuture<void>& f) { return !f.isFinished(); }));
}

void SandboxContext::waitForSupervisions() {
    for (;;) {
        QList<QFuture<void>> pending;
        {
            QMutexLocker locker(&mutex_);
            pending.swap(supervisions_);
        }
        if (pending.isEmpty()) {
            return;
        }
        Logger::instance().debug("Waiting for {} sandbox supervision task(s)", pending.size());
        for (QFuture<void>& future : pending) {
            future.waitForFinished();
        }
    }
}

void SandboxContext::shutdown() {
    {
        QMutexLocker locker(&mutex_);
        if (shutDown_) {
            return;
        }
        shutDown_ = true;
    }

    waitForSupervisions();
    supervisionPool_.waitForDone();
    displayServer_->shutdown();
    Logger::instance().debug("Sandbox context shut down");
}

bool SandboxContext::isShutDown() const {
    QMutexLocker locker(&mutex_);
    return shutDown_;
}

} // namespace Evalbox
