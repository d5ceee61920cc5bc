#pragma once

#include <QtCore/QHash>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"

namespace Evalbox {

enum class RootfsError {
    ImageNotFound,
    ScratchDirFailed,
    CopyFailed,
    IdentityWriteFailed,
    ResolverWriteFailed
};

const char* toString(RootfsError error);

// Parameters a derived root filesystem is keyed on
struct RootfsIdentity {
    QString distro = "debian";
    int uid = 1000;
    QString user = "pkgeval";
    int gid = 1000;
    QString group = "pkgeval";
    QString home; // defaults to /home/<user>

    QString homeDirectory() const;
    QString cacheKey() const;
};

// A derived, writable copy of a base image; read-only once cached
struct RootfsDescriptor {
    QString path;
    int uid = 0;
    QString user;
    int gid = 0;
    QString group;
    QString home;
};

/**
 * @brief Derives root filesystems from base images and caches them per identity
 *
 * On a miss the base image of the distro is copied into a fresh scratch
 * directory, the identity is appended to etc/passwd, etc/group and
 * etc/shadow, and etc/resolv.conf is replaced by the host's resolver
 * configuration. Copied directories are made owner-writable, so read-only
 * base images can be derived. The whole derivation runs under one lock, so
 * concurrent requests never derive the same identity twice. Failed
 * derivations are neither cached nor kept on disk. Derived directories are
 * removed with the cache.
 */
class RootfsCache {
public:
    RootfsCache(const QString& imagesPath, const QString& scratchPath,
                const QString& resolverConfPath = "/etc/resolv.conf");
    ~RootfsCache();

    RootfsCache(const RootfsCache&) = delete;
    RootfsCache& operator=(const RootfsCache&) = delete;

    Expected<RootfsDescriptor, RootfsError> prepare(const RootfsIdentity& identity = RootfsIdentity());

    QString imagePath(const QString& distro) const;

    // Number of derivations that ran to completion
    int buildCount() const;
    int size() const;

private:
    Expected<RootfsDescriptor, RootfsError> derive(const RootfsIdentity& identity, const QString& path) const;

    const QString imagesPath_;
    const QString scratchPath_;
    const QString resolverConfPath_;

    mutable QMutex mutex_;
    QHash<QString, RootfsDescriptor> entries_;
    QStringList directories_;
    int builds_ = 0;
};

} // namespace Evalbox
