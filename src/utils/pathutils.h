/**
 * @file pathutils.h
 * @brief Path helpers shared by the transfer engine and its callers.
 */

#ifndef PATHUTILS_H
#define PATHUTILS_H

#include <QString>
#include <functional>

/**
 * @brief Static helpers for normalising and comparing local paths.
 *
 * All comparisons operate on normalised absolute paths, so "/a/b/",
 * "/a/./b" and "/a/c/../b" are treated as the same location.
 */
class PathUtils
{
public:
    /**
     * @brief Returns the cleaned absolute form of a path.
     * @param path Absolute or relative path (relative to the working directory).
     * @return Absolute path without trailing separator (except for "/").
     */
    [[nodiscard]] static QString normalize(const QString &path);

    /**
     * @brief Checks if @p path equals @p ancestor or lies below it.
     */
    [[nodiscard]] static bool isSameOrDescendant(const QString &path, const QString &ancestor);

    /**
     * @brief Checks if two paths overlap (equal, or one contains the other).
     */
    [[nodiscard]] static bool overlaps(const QString &a, const QString &b);

    /**
     * @brief Joins a directory and an entry name with a single separator.
     */
    [[nodiscard]] static QString join(const QString &dir, const QString &name);

    /**
     * @brief Returns the last path component of a normalised path.
     */
    [[nodiscard]] static QString baseName(const QString &path);

    /**
     * @brief Returns the parent directory of a normalised path.
     */
    [[nodiscard]] static QString parentPath(const QString &path);

    /**
     * @brief Resolves symbolic links in the directories above @p path.
     *
     * The last component is kept as it is, so a path naming a link still
     * names the link and not its target.
     * @param path Path to resolve.
     * @param canonical Returns the link-free form of an existing directory,
     *        or an empty string if it cannot be resolved.
     * @return The resolved path, or the normalised @p path if its parent
     *         does not resolve.
     */
    [[nodiscard]] static QString resolveParent(const QString &path,
                                               const std::function<QString(const QString &)> &canonical);

    /**
     * @brief Builds the name used for the @p n-th renamed copy of @p name.
     *
     * "report.txt" becomes "report (2).txt", "archive" becomes "archive (2)"
     * and dot files such as ".profile" become ".profile (2)". Only the last
     * suffix is treated as the extension: "archive.tar.gz" becomes
     * "archive.tar (2).gz".
     */
    [[nodiscard]] static QString numberedName(const QString &name, int n);

    /**
     * @brief Finds a free path in @p dir for an entry called @p name.
     * @param dir Target directory.
     * @param name Desired entry name.
     * @param exists Predicate reporting whether a candidate path is taken.
     * @return The first candidate path for which @p exists returns false.
     */
    [[nodiscard]] static QString uniquePathInDir(const QString &dir,
                                                 const QString &name,
                                                 const std::function<bool(const QString &)> &exists);
};

#endif // PATHUTILS_H
