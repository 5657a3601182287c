/**
 * @file localfilesystem.h
 * @brief IFileSystem implementation backed by Qt's file classes.
 */

#ifndef LOCALFILESYSTEM_H
#define LOCALFILESYSTEM_H

#include "ifilesystem.h"

/**
 * @brief Production file system used by the engine.
 *
 * Stateless, so a single instance can be shared by every worker.
 */
class LocalFileSystem : public IFileSystem
{
public:
    LocalFileSystem() = default;
    ~LocalFileSystem() override = default;

    [[nodiscard]] FileStat stat(const QString &path) const override;
    [[nodiscard]] QStringList entryNames(const QString &dir, QString *error) const override;
    [[nodiscard]] bool isSameDevice(const QString &a, const QString &b) const override;
    [[nodiscard]] QString canonicalPath(const QString &path) const override;

    std::unique_ptr<QIODevice> openForRead(const QString &path, QString *error) override;
    std::unique_ptr<QSaveFile> openForWrite(const QString &path, QString *error) override;

    bool makeDirectory(const QString &path, QString *error) override;
    bool removeFile(const QString &path, QString *error) override;
    bool removeDirectory(const QString &path, QString *error) override;
    bool rename(const QString &from, const QString &to, QString *error) override;
    bool createSymLink(const QString &target, const QString &linkPath, QString *error) override;
    bool setPermissions(const QString &path, QFileDevice::Permissions permissions, QString *error) override;
};

#endif // LOCALFILESYSTEM_H
