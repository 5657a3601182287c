/**
 * @file ifilesystem.h
 * @brief Interface for the file system operations used by the transfer engine.
 *
 * This interface allows dependency injection of the file system, enabling
 * tests to inject failures that are hard to provoke on a real disk.
 */

#ifndef IFILESYSTEM_H
#define IFILESYSTEM_H

#include <QFileDevice>
#include <QIODevice>
#include <QSaveFile>
#include <QString>
#include <QStringList>
#include <memory>

/**
 * @brief Metadata for one path. Symbolic links are reported, not followed.
 */
struct FileStat {
    bool exists = false;       ///< True for dangling symlinks as well
    bool isDirectory = false;  ///< Real directory (never a link to one)
    bool isFile = false;       ///< Regular file (never a link to one)
    bool isSymLink = false;
    bool readable = false;
    bool writable = false;
    qint64 size = 0;
    QFileDevice::Permissions permissions;
    QString symLinkTarget;
};

/**
 * @brief Abstract interface over the host file system.
 *
 * Implementations must be safe to call from several worker threads at once.
 * Failing operations return false (or nullptr) and describe the failure in
 * @p error when it is non-null.
 *
 * @par Example usage:
 * @code
 * // Production code
 * auto fs = std::make_shared<LocalFileSystem>();
 *
 * // Test code
 * auto fs = std::make_shared<MockFileSystem>();
 * fs->mockFailOpenForWrite("/dest/locked.bin");
 *
 * TransferEngine engine(fs, settings);
 * @endcode
 */
class IFileSystem
{
public:
    virtual ~IFileSystem() = default;

    /// @name Queries
    /// @{
    [[nodiscard]] virtual FileStat stat(const QString &path) const = 0;

    /**
     * @brief Lists the names of a directory's entries, hidden ones included.
     * @return Entry names sorted by name, without "." and "..".
     */
    [[nodiscard]] virtual QStringList entryNames(const QString &dir, QString *error) const = 0;

    /**
     * @brief Checks if two paths live on the same mounted device.
     */
    [[nodiscard]] virtual bool isSameDevice(const QString &a, const QString &b) const = 0;

    /**
     * @brief Returns @p path with every symbolic link resolved.
     * @return The physical path, or an empty string if @p path does not exist.
     */
    [[nodiscard]] virtual QString canonicalPath(const QString &path) const = 0;

    [[nodiscard]] bool exists(const QString &path) const { return stat(path).exists; }
    /// @}

    /// @name File content
    /// @{
    virtual std::unique_ptr<QIODevice> openForRead(const QString &path, QString *error) = 0;

    /**
     * @brief Opens an atomic writer for @p path.
     *
     * Data only appears under @p path once QSaveFile::commit() succeeds;
     * destroying the writer without committing leaves @p path untouched.
     */
    virtual std::unique_ptr<QSaveFile> openForWrite(const QString &path, QString *error) = 0;
    /// @}

    /// @name Mutations
    /// @{
    virtual bool makeDirectory(const QString &path, QString *error) = 0;
    virtual bool removeFile(const QString &path, QString *error) = 0;  ///< Files and symlinks
    virtual bool removeDirectory(const QString &path, QString *error) = 0;  ///< Empty directories only
    virtual bool rename(const QString &from, const QString &to, QString *error) = 0;
    virtual bool createSymLink(const QString &target, const QString &linkPath, QString *error) = 0;
    virtual bool setPermissions(const QString &path, QFileDevice::Permissions permissions, QString *error) = 0;
    /// @}
};

#endif // IFILESYSTEM_H
