#include "localfilesystem.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QObject>
#include <QStorageInfo>

namespace {

void setError(QString *error, const QString &message)
{
    if (error) {
        *error = message;
    }
}

} // namespace

FileStat LocalFileSystem::stat(const QString &path) const
{
    FileStat result;
    const QFileInfo info(path);
    result.isSymLink = info.isSymLink();
    result.exists = info.exists() || result.isSymLink;
    if (!result.exists) {
        return result;
    }
    result.isDirectory = !result.isSymLink && info.isDir();
    result.isFile = !result.isSymLink && info.isFile();
    result.readable = info.isReadable();
    result.writable = info.isWritable();
    result.size = result.isFile ? info.size() : 0;
    result.permissions = info.permissions();
    if (result.isSymLink) {
        result.symLinkTarget = info.symLinkTarget();
    }
    return result;
}

QStringList LocalFileSystem::entryNames(const QString &dir, QString *error) const
{
    const QFileInfo info(dir);
    if (!info.isDir()) {
        setError(error, QObject::tr("Not a directory: %1").arg(dir));
        return {};
    }
    if (!info.isReadable()) {
        setError(error, QObject::tr("Permission denied reading %1").arg(dir));
        return {};
    }
    return QDir(dir).entryList(QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
                               QDir::Name);
}

bool LocalFileSystem::isSameDevice(const QString &a, const QString &b) const
{
    const QStorageInfo first(a);
    const QStorageInfo second(b);
    if (!first.isValid() || !second.isValid()) {
        return false;
    }
    return first.device() == second.device() && first.rootPath() == second.rootPath();
}

QString LocalFileSystem::canonicalPath(const QString &path) const
{
    return QFileInfo(path).canonicalFilePath();
}

std::unique_ptr<QIODevice> LocalFileSystem::openForRead(const QString &path, QString *error)
{
    auto file = std::make_unique<QFile>(path);
    if (!file->open(QIODevice::ReadOnly)) {
        setError(error, QObject::tr("Failed to open %1: %2").arg(path, file->errorString()));
        return nullptr;
    }
    return file;
}

std::unique_ptr<QSaveFile> LocalFileSystem::openForWrite(const QString &path, QString *error)
{
    auto file = std::make_unique<QSaveFile>(path);
    if (!file->open(QIODevice::WriteOnly)) {
        setError(error, QObject::tr("Failed to write %1: %2").arg(path, file->errorString()));
        return nullptr;
    }
    return file;
}

bool LocalFileSystem::makeDirectory(const QString &path, QString *error)
{
    if (QFileInfo(path).isDir()) {
        return true;
    }
    if (!QDir().mkdir(path)) {
        setError(error, QObject::tr("Failed to create directory %1").arg(path));
        return false;
    }
    return true;
}

bool LocalFileSystem::removeFile(const QString &path, QString *error)
{
    QFile file(path);
    if (!file.remove()) {
        setError(error, QObject::tr("Failed to delete %1: %2").arg(path, file.errorString()));
        return false;
    }
    return true;
}

bool LocalFileSystem::removeDirectory(const QString &path, QString *error)
{
    if (!QDir().rmdir(path)) {
        setError(error, QObject::tr("Failed to remove directory %1").arg(path));
        return false;
    }
    return true;
}

bool LocalFileSystem::rename(const QString &from, const QString &to, QString *error)
{
    if (!QDir().rename(from, to)) {
        setError(error, QObject::tr("Failed to rename %1 to %2").arg(from, to));
        return false;
    }
    return true;
}

bool LocalFileSystem::createSymLink(const QString &target, const QString &linkPath, QString *error)
{
    if (!QFile::link(target, linkPath)) {
        setError(error, QObject::tr("Failed to create link %1").arg(linkPath));
        return false;
    }
    return true;
}

bool LocalFileSystem::setPermissions(const QString &path, QFileDevice::Permissions permissions,
                                     QString *error)
{
    if (!QFile::setPermissions(path, permissions)) {
        setError(error, QObject::tr("Failed to set permissions on %1").arg(path));
        return false;
    }
    return true;
}
