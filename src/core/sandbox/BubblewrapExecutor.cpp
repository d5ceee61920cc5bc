#include "BubblewrapExecutor.hpp"
#include "core/common/Logger.hpp"
#include "core/storage/FileManager.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QMap>
#include <QtCore/QPair>
#include <QtCore/QStandardPaths>

#include <sys/stat.h>

namespace Evalbox {

BubblewrapExecutor::BubblewrapExecutor(const QString& program, const QString& scratchPath)
    : program_(program)
    , scratchPath_(scratchPath.isEmpty() ? QDir::tempPath() : scratchPath)
{
}

BubblewrapExecutor::~BubblewrapExecutor() {
    if (persistDir_ && !cleanedUp_) {
        auto result = cleanup();
        if (!result) {
            Logger::instance().warn("Leaking persistence directory: {}", toString(result.error()));
        }
    }
}

QString BubblewrapExecutor::name() const {
    return QStringLiteral("bubblewrap");
}

QString BubblewrapExecutor::resolveProgram() const {
    if (program_.contains('/')) {
        return program_;
    }
    return QStandardPaths::findExecutable(program_);
}

bool BubblewrapExecutor::isPrivileged() const {
    const QString path = resolveProgram();
    if (path.isEmpty()) {
        return false;
    }
    struct stat st;
    if (::stat(QFile::encodeName(path).constData(), &st) < 0) {
        return false;
    }
    return (st.st_mode & S_ISUID) && st.st_uid == 0;
}

QString BubblewrapExecutor::persistDirectory() const {
    return persistDir_ ? persistDir_->path() : QString();
}

QStringList BubblewrapExecutor::buildArguments(const SandboxConfig& config, const SandboxCommand& command,
                                               const QString& persistDirectory) {
    QStringList args;
    args << "--unshare-user" << "--unshare-pid" << "--unshare-ipc" << "--unshare-uts"
         << "--die-with-parent"
         << "--uid" << QString::number(config.uid)
         << "--gid" << QString::number(config.gid);

    const auto root = config.readOnlyMounts.constFind("/");
    if (root != config.readOnlyMounts.constEnd()) {
        args << "--overlay-src" << root.value();
        if (persistDirectory.isEmpty()) {
            args << "--tmp-overlay" << "/";
        } else {
            const QDir persist(persistDirectory);
            args << "--overlay" << persist.filePath("upper") << persist.filePath("work") << "/";
        }
    }

    args << "--dev" << "/dev" << "--proc" << "/proc";

    // QMap iterates in key order, so a mount point always precedes the ones nested in it
    QMap<QString, QPair<QString, bool>> mounts;
    for (auto it = config.readOnlyMounts.constBegin(); it != config.readOnlyMounts.constEnd(); ++it) {
        if (it.key() != "/") {
            mounts.insert(it.key(), qMakePair(it.value(), false));
        }
    }
    for (auto it = config.readWriteMounts.constBegin(); it != config.readWriteMounts.constEnd(); ++it) {
        mounts.insert(it.key(), qMakePair(it.value(), true));
    }
    for (auto it = mounts.constBegin(); it != mounts.constEnd(); ++it) {
        args << (it.value().second ? "--bind" : "--ro-bind") << it.value().first << it.key();
    }

    args << "--clearenv";
    for (auto it = config.environment.constBegin(); it != config.environment.constEnd(); ++it) {
        args << "--setenv" << it.key() << it.value();
    }

    if (!config.workingDirectory.isEmpty()) {
        args << "--chdir" << config.workingDirectory;
    }

    args << "--" << command.toList();
    return args;
}

Expected<std::shared_ptr<ChildProcess>, LaunchError> BubblewrapExecutor::run(const SandboxConfig& config,
                                                                             const SandboxCommand& command) {
    const QString program = resolveProgram();
    if (program.isEmpty()) {
        Logger::instance().error("Sandbox program {} not found in PATH", program_.toStdString());
        return makeUnexpected(LaunchError::ProgramNotFound);
    }

    if (config.persist) {
        if (!FileManager::ensureDirectoryExists(scratchPath_)) {
            Logger::instance().error("Cannot create scratch directory {}", scratchPath_.toStdString());
            return makeUnexpected(LaunchError::PersistDirFailed);
        }
        persistDir_ = std::make_unique<QTemporaryDir>(QDir(scratchPath_).filePath("persist-XXXXXX"));
        persistDir_->setAutoRemove(false);
        if (!persistDir_->isValid()) {
            Logger::instance().error("Cannot create persistence directory under {}: {}",
                                     scratchPath_.toStdString(), persistDir_->errorString().toStdString());
            persistDir_.reset();
            return makeUnexpected(LaunchError::PersistDirFailed);
        }
        QDir persist(persistDir_->path());
        if (!persist.mkdir("upper") || !persist.mkdir("work")) {
            Logger::instance().error("Cannot create overlay directories in {}", persist.path().toStdString());
            return makeUnexpected(LaunchError::PersistDirFailed);
        }
    }

    SpawnOptions options;
    options.program = program;
    options.arguments = buildArguments(config, command, persistDirectory());
    options.stdio = config.stdio;

    if (config.verbose) {
        Logger::instance().info("Running {} {}", program.toStdString(), options.arguments.join(' ').toStdString());
    } else {
        Logger::instance().debug("Running {} {}", program.toStdString(), options.arguments.join(' ').toStdString());
    }

    auto process = ChildProcess::spawn(options);
    if (!process) {
        Logger::instance().error("Could not start {}: {}", program.toStdString(), toString(process.error()));
        return makeUnexpected(LaunchError::SpawnFailed);
    }
    return process.value();
}

Expected<void, LaunchError> BubblewrapExecutor::cleanup() {
    if (cleanedUp_) {
        return {};
    }
    cleanedUp_ = true;

    if (!persistDir_) {
        return {};
    }

    const QString path = persistDir_->path();
    persistDir_.reset();
    if (!FileManager::removeTree(path)) {
        return makeUnexpected(LaunchError::CleanupFailed);
    }
    Logger::instance().debug("Removed persistence directory {}", path.toStdString());
    return {};
}

} // namespace Evalbox
