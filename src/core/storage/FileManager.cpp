#include "FileManager.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QDirIterator>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <vector>

#include <cerrno>
#include <climits>
#include <cstring>
#include <sys/stat.h>
#include <unistd.h>

namespace Evalbox {

const char* toString(FileError error) {
    switch (error) {
        case FileError::NotFound: return "not found";
        case FileError::CreateFailed: return "create failed";
        case FileError::CopyFailed: return "copy failed";
        case FileError::LinkFailed: return "symlink failed";
        case FileError::PermissionChangeFailed: return "chmod failed";
        case FileError::ReadFailed: return "read failed";
        case FileError::WriteFailed: return "write failed";
        case FileError::DeleteFailed: return "delete failed";
    }
    return "unknown file error";
}

namespace {

bool removeExisting(const QString& path) {
    QFileInfo info(path);
    if (!info.exists() && !info.isSymLink()) {
        return true;
    }
    if (info.isDir() && !info.isSymLink()) {
        return QDir(path).removeRecursively();
    }
    return QFile::remove(path);
}

Expected<void, FileError> copySymlink(const QString& source, const QString& destination) {
    const QByteArray encodedSource = QFile::encodeName(source);
    std::vector<char> target(PATH_MAX + 1);
    ssize_t length = ::readlink(encodedSource.constData(), target.data(), PATH_MAX);
    if (length < 0) {
        Logger::instance().error("readlink({}) failed: {}", source.toStdString(), std::strerror(errno));
        return makeUnexpected(FileError::ReadFailed);
    }
    target[static_cast<size_t>(length)] = '\0';

    if (!removeExisting(destination)) {
        Logger::instance().error("Cannot replace {}", destination.toStdString());
        return makeUnexpected(FileError::DeleteFailed);
    }
    if (::symlink(target.data(), QFile::encodeName(destination).constData()) < 0) {
        Logger::instance().error("symlink({} -> {}) failed: {}",
                                 destination.toStdString(), target.data(), std::strerror(errno));
        return makeUnexpected(FileError::LinkFailed);
    }
    return {};
}

Expected<void, FileError> copyDirectory(const QString& source, const QString& destination,
                                        FileManager::DirectoryMode directoryMode) {
    const QDir sourceDir(source);
    const QFileInfoList entries = sourceDir.entryInfoList(
        QDir::AllEntries | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot, QDir::Name);

    for (const QFileInfo& entry : entries) {
        const QString from = entry.absoluteFilePath();
        const QString to = destination + '/' + entry.fileName();

        struct stat st;
        if (::lstat(QFile::encodeName(from).constData(), &st) < 0) {
            Logger::instance().error("lstat({}) failed: {}", from.toStdString(), std::strerror(errno));
            return makeUnexpected(FileError::ReadFailed);
        }

        if (S_ISLNK(st.st_mode)) {
            auto linked = copySymlink(from, to);
            if (!linked) {
                return linked;
            }
        } else if (S_ISDIR(st.st_mode)) {
            QFileInfo existing(to);
            bool reuse = existing.isDir() && !existing.isSymLink();
            if (!reuse && !removeExisting(to)) {
                Logger::instance().error("Cannot replace {}", to.toStdString());
                return makeUnexpected(FileError::DeleteFailed);
            }
            if (!reuse && !QDir().mkdir(to)) {
                Logger::instance().error("Cannot create directory {}", to.toStdString());
                return makeUnexpected(FileError::CreateFailed);
            }
            // writable while filling, the real mode is applied afterwards
            if (::chmod(QFile::encodeName(to).constData(), 0700) < 0) {
                Logger::instance().error("chmod({}) failed: {}", to.toStdString(), std::strerror(errno));
                return makeUnexpected(FileError::PermissionChangeFailed);
            }

            auto copied = copyDirectory(from, to, directoryMode);
            if (!copied) {
                return copied;
            }
            mode_t mode = st.st_mode & 07777;
            if (directoryMode == FileManager::DirectoryMode::OwnerWritable) {
                mode |= S_IRWXU;
            }
            if (::chmod(QFile::encodeName(to).constData(), mode) < 0) {
                Logger::instance().error("chmod({}) failed: {}", to.toStdString(), std::strerror(errno));
                return makeUnexpected(FileError::PermissionChangeFailed);
            }
        } else if (S_ISREG(st.st_mode)) {
            if (!removeExisting(to)) {
                Logger::instance().error("Cannot replace {}", to.toStdString());
                return makeUnexpected(FileError::DeleteFailed);
            }
            if (!QFile::copy(from, to)) {
                Logger::instance().error("Cannot copy {} to {}", from.toStdString(), to.toStdString());
                return makeUnexpected(FileError::CopyFailed);
            }
            if (::chmod(QFile::encodeName(to).constData(), st.st_mode & 07777) < 0) {
                Logger::instance().error("chmod({}) failed: {}", to.toStdString(), std::strerror(errno));
                return makeUnexpected(FileError::PermissionChangeFailed);
            }
        } else {
            // device nodes, fifos and sockets cannot be recreated unprivileged
            Logger::instance().debug("Skipping special file {}", from.toStdString());
        }
    }
    return {};
}

} // namespace

bool FileManager::ensureDirectoryExists(const QString& path) {
    QDir dir;
    if (!dir.exists(path)) {
        return dir.mkpath(path);
    }
    return true;
}

Expected<void, FileError> FileManager::copyTree(const QString& source, const QString& destination,
                                                DirectoryMode directoryMode) {
    QFileInfo sourceInfo(source);
    if (!sourceInfo.isDir()) {
        Logger::instance().error("Copy source {} is not a directory", source.toStdString());
        return makeUnexpected(FileError::NotFound);
    }
    if (!ensureDirectoryExists(destination)) {
        Logger::instance().error("Cannot create copy destination {}", destination.toStdString());
        return makeUnexpected(FileError::CreateFailed);
    }
    return copyDirectory(sourceInfo.absoluteFilePath(), QFileInfo(destination).absoluteFilePath(),
                         directoryMode);
}

Expected<void, FileError> FileManager::setPermissions(const QString& path, QFileDevice::Permissions permissions) {
    if (!QFile::setPermissions(path, permissions)) {
        Logger::instance().error("Cannot change permissions of {}", path.toStdString());
        return makeUnexpected(FileError::PermissionChangeFailed);
    }
    return {};
}

Expected<void, FileError> FileManager::appendLine(const QString& path, const QString& line) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        Logger::instance().error("Cannot open {} for appending: {}",
                                 path.toStdString(), file.errorString().toStdString());
        return makeUnexpected(FileError::WriteFailed);
    }

    const QByteArray data = (line + '\n').toUtf8();
    if (file.write(data) != data.size()) {
        Logger::instance().error("Short write to {}: {}", path.toStdString(), file.errorString().toStdString());
        return makeUnexpected(FileError::WriteFailed);
    }
    return {};
}

Expected<QByteArray, FileError> FileManager::readAll(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        Logger::instance().error("Cannot read {}: {}", path.toStdString(), file.errorString().toStdString());
        return makeUnexpected(FileError::ReadFailed);
    }
    return file.readAll();
}

Expected<void, FileError> FileManager::replaceWithCopy(const QString& destination, const QString& source) {
    auto contents = readAll(source);
    if (!contents) {
        return makeUnexpected(contents.error());
    }

    if (!removeExisting(destination)) {
        Logger::instance().error("Cannot remove {}", destination.toStdString());
        return makeUnexpected(FileError::DeleteFailed);
    }

    QFile file(destination);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        Logger::instance().error("Cannot create {}: {}", destination.toStdString(), file.errorString().toStdString());
        return makeUnexpected(FileError::WriteFailed);
    }
    if (file.write(contents.value()) != contents.value().size()) {
        Logger::instance().error("Short write to {}", destination.toStdString());
        return makeUnexpected(FileError::WriteFailed);
    }
    return {};
}

Expected<void, FileError> FileManager::removeTree(const QString& path) {
    QFileInfo root(path);
    if (!root.exists() && !root.isSymLink()) {
        return {};
    }

    if (root.isDir() && !root.isSymLink()) {
        ::chmod(QFile::encodeName(path).constData(), 0700);
        QDirIterator it(path, QDir::Dirs | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot,
                        QDirIterator::Subdirectories);
        while (it.hasNext()) {
            const QString directory = it.next();
            if (!it.fileInfo().isSymLink()) {
                // best effort, removeExisting() reports what could not be deleted
                ::chmod(QFile::encodeName(directory).constData(), 0700);
            }
        }
    }

    if (!removeExisting(path)) {
        Logger::instance().error("Cannot remove {}", path.toStdString());
        return makeUnexpected(FileError::DeleteFailed);
    }
    return {};
}

} // namespace Evalbox
