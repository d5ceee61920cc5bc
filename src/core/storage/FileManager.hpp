#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QFileDevice>
#include <QtCore/QString>

#include "core/common/Expected.hpp"

namespace Evalbox {

enum class FileError {
    NotFound,
    CreateFailed,
    CopyFailed,
    LinkFailed,
    PermissionChangeFailed,
    ReadFailed,
    WriteFailed,
    DeleteFailed
};

const char* toString(FileError error);

/**
 * @brief Filesystem helpers used to derive root filesystems and storage dirs
 *
 * All functions are synchronous and stateless; failures are logged with the
 * offending path before being returned.
 */
class FileManager {
public:
    enum class DirectoryMode {
        Preserve,      // directories get the source mode
        OwnerWritable  // source mode plus owner rwx
    };

    // Creates the directory and its parents when missing
    static bool ensureDirectoryExists(const QString& path);

    // Copies the contents of source into destination, which must exist.
    // Symlinks are recreated verbatim (never followed), modes are preserved,
    // existing destination entries are overwritten and special files skipped.
    static Expected<void, FileError> copyTree(const QString& source, const QString& destination,
                                              DirectoryMode directoryMode = DirectoryMode::Preserve);

    static Expected<void, FileError> setPermissions(const QString& path, QFileDevice::Permissions permissions);

    // Appends one newline-terminated line, creating the file when missing
    static Expected<void, FileError> appendLine(const QString& path, const QString& line);

    // Deletes destination (whatever it is) and writes the contents of source in its place
    static Expected<void, FileError> replaceWithCopy(const QString& destination, const QString& source);

    static Expected<QByteArray, FileError> readAll(const QString& path);

    // Removes a directory tree, first making every directory in it writable
    static Expected<void, FileError> removeTree(const QString& path);
};

} // namespace Evalbox
