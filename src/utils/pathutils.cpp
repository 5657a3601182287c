#include "pathutils.h"

#include <QDir>
#include <QFileInfo>

QString PathUtils::normalize(const QString &path)
{
    if (path.isEmpty()) {
        return QString();
    }
    return QDir::cleanPath(QFileInfo(path).absoluteFilePath());
}

bool PathUtils::isSameOrDescendant(const QString &path, const QString &ancestor)
{
    const QString p = normalize(path);
    const QString a = normalize(ancestor);
    if (p.isEmpty() || a.isEmpty()) {
        return false;
    }
    if (p == a) {
        return true;
    }
    const QString prefix = a.endsWith('/') ? a : a + '/';
    return p.startsWith(prefix);
}

bool PathUtils::overlaps(const QString &a, const QString &b)
{
    return isSameOrDescendant(a, b) || isSameOrDescendant(b, a);
}

QString PathUtils::join(const QString &dir, const QString &name)
{
    if (dir.endsWith('/')) {
        return dir + name;
    }
    return dir + '/' + name;
}

QString PathUtils::baseName(const QString &path)
{
    return QFileInfo(normalize(path)).fileName();
}

QString PathUtils::parentPath(const QString &path)
{
    return QFileInfo(normalize(path)).absolutePath();
}

QString PathUtils::resolveParent(const QString &path,
                                 const std::function<QString(const QString &)> &canonical)
{
    const QString normalized = normalize(path);
    const QString parent = parentPath(normalized);
    if (normalized.isEmpty() || parent == normalized) {
        return normalized;
    }
    const QString resolved = canonical(parent);
    if (resolved.isEmpty()) {
        return normalized;
    }
    return join(resolved, baseName(normalized));
}

QString PathUtils::numberedName(const QString &name, int n)
{
    // Only the last suffix counts as the extension, and a leading dot is
    // part of the stem (".profile" has no extension).
    const int dot = name.lastIndexOf('.');
    if (dot <= 0) {
        return QString("%1 (%2)").arg(name).arg(n);
    }
    return QString("%1 (%2)%3").arg(name.left(dot)).arg(n).arg(name.mid(dot));
}

QString PathUtils::uniquePathInDir(const QString &dir,
                                   const QString &name,
                                   const std::function<bool(const QString &)> &exists)
{
    QString path = join(dir, name);
    int i = 2;
    while (exists(path)) {
        path = join(dir, numberedName(name, i++));
    }
    return path;
}
