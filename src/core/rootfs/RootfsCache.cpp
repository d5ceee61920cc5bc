#include "RootfsCache.hpp"
#include "core/common/Logger.hpp"
#include "core/storage/FileManager.hpp"

#include <QtCore/QDir>
#include <QtCore/QFileInfo>
#include <QtCore/QTemporaryDir>

namespace Evalbox {

const char* toString(RootfsError error) {
    switch (error) {
        case RootfsError::ImageNotFound: return "base image not found";
        case RootfsError::ScratchDirFailed: return "cannot create scratch directory";
        case RootfsError::CopyFailed: return "cannot copy base image";
        case RootfsError::IdentityWriteFailed: return "cannot write identity records";
        case RootfsError::ResolverWriteFailed: return "cannot replace resolver configuration";
    }
    return "unknown rootfs error";
}

QString RootfsIdentity::homeDirectory() const {
    return home.isEmpty() ? QStringLiteral("/home/") + user : home;
}

QString RootfsIdentity::cacheKey() const {
    const QChar separator(0x1f);
    return distro + separator + QString::number(uid) + separator + user + separator
        + QString::number(gid) + separator + group + separator + homeDirectory();
}

RootfsCache::RootfsCache(const QString& imagesPath, const QString& scratchPath,
                         const QString& resolverConfPath)
    : imagesPath_(imagesPath)
    , scratchPath_(scratchPath)
    , resolverConfPath_(resolverConfPath)
{
}

RootfsCache::~RootfsCache() {
    for (const QString& directory : directories_) {
        auto removed = FileManager::removeTree(directory);
        if (!removed) {
            Logger::instance().warn("Derived rootfs {} left behind: {}",
                                    directory.toStdString(), toString(removed.error()));
        }
    }
}

QString RootfsCache::imagePath(const QString& distro) const {
    return QDir(imagesPath_).filePath(distro);
}

int RootfsCache::buildCount() const {
    QMutexLocker locker(&mutex_);
    return builds_;
}

int RootfsCache::size() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(entries_.size());
}

Expected<RootfsDescriptor, RootfsError> RootfsCache::prepare(const RootfsIdentity& identity) {
    const QString key = identity.cacheKey();

    QMutexLocker locker(&mutex_);
    auto cached = entries_.constFind(key);
    if (cached != entries_.constEnd()) {
        return cached.value();
    }

    if (!FileManager::ensureDirectoryExists(scratchPath_)) {
        Logger::instance().error("Cannot create scratch directory {}", scratchPath_.toStdString());
        return makeUnexpected(RootfsError::ScratchDirFailed);
    }

    // QTemporaryDir only names the directory; removal goes through
    // FileManager::removeTree, which copes with read-only directories
    QTemporaryDir directory(QDir(scratchPath_).filePath(QStringLiteral("rootfs-%1-XXXXXX").arg(identity.distro)));
    if (!directory.isValid()) {
        Logger::instance().error("Cannot create rootfs directory under {}: {}",
                                 scratchPath_.toStdString(), directory.errorString().toStdString());
        return makeUnexpected(RootfsError::ScratchDirFailed);
    }
    directory.setAutoRemove(false);
    const QString path = directory.path();

    auto descriptor = derive(identity, path);
    if (!descriptor) {
        auto removed = FileManager::removeTree(path);
        if (!removed) {
            Logger::instance().warn("Failed rootfs derivation left {} behind: {}",
                                    path.toStdString(), toString(removed.error()));
        }
        return descriptor;
    }

    directories_.append(path);
    entries_.insert(key, descriptor.value());
    ++builds_;

    Logger::instance().info("Derived {} rootfs for {}:{} at {}",
                            identity.distro.toStdString(), identity.user.toStdString(),
                            identity.uid, descriptor->path.toStdString());
    return descriptor;
}

Expected<RootfsDescriptor, RootfsError> RootfsCache::derive(const RootfsIdentity& identity,
                                                             const QString& path) const {
    const QString base = imagePath(identity.distro);
    if (!QFileInfo(base).isDir()) {
        Logger::instance().error("No base image for distro {} at {}",
                                 identity.distro.toStdString(), base.toStdString());
        return makeUnexpected(RootfsError::ImageNotFound);
    }

    // base images are often read-only; the copy must accept the identity edits
    if (!FileManager::copyTree(base, path, FileManager::DirectoryMode::OwnerWritable)) {
        return makeUnexpected(RootfsError::CopyFailed);
    }

    const QDir etc(QDir(path).filePath("etc"));
    if (!FileManager::ensureDirectoryExists(etc.path())) {
        Logger::instance().error("Cannot create {}", etc.path().toStdString());
        return makeUnexpected(RootfsError::IdentityWriteFailed);
    }

    const QString home = identity.homeDirectory();
    constexpr auto worldReadable = QFileDevice::ReadOwner | QFileDevice::WriteOwner
                             | QFileDevice::ReadGroup | QFileDevice::ReadOther;
    constexpr auto groupReadable = QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ReadGroup;

    // Modes are relaxed so the records can be appended; they are left that way.
    struct Record {
        QString file;
        QFileDevice::Permissions mode;
        QString line;
    };
    const Record records[] = {
        {etc.filePath("passwd"), worldReadable,
         QStringLiteral("%1:x:%2:%3::%4:/bin/bash").arg(identity.user).arg(identity.uid).arg(identity.gid).arg(home)},
        {etc.filePath("group"), worldReadable,
         QStringLiteral("%1:x:%2:").arg(identity.group).arg(identity.gid)},
        {etc.filePath("shadow"), groupReadable,
         QStringLiteral("%1:*:::::::").arg(identity.user)},
    };

    for (const Record& record : records) {
        if (QFileInfo::exists(record.file) && !FileManager::setPermissions(record.file, record.mode)) {
            return makeUnexpected(RootfsError::IdentityWriteFailed);
        }
        if (!FileManager::appendLine(record.file, record.line)) {
            return makeUnexpected(RootfsError::IdentityWriteFailed);
        }
    }

    if (!FileManager::replaceWithCopy(etc.filePath("resolv.conf"), resolverConfPath_)) {
        return makeUnexpected(RootfsError::ResolverWriteFailed);
    }

    RootfsDescriptor descriptor;
    descriptor.path = path;
    descriptor.uid = identity.uid;
    descriptor.user = identity.user;
    descriptor.gid = identity.gid;
    descriptor.group = identity.group;
    descriptor.home = home;
    return descriptor;
}

} // namespace Evalbox
