/**
 * @file transferrequest.h
 * @brief Value types describing a file operation submitted to the engine.
 */

#ifndef TRANSFERREQUEST_H
#define TRANSFERREQUEST_H

#include <QMetaType>
#include <QString>
#include <QStringList>

enum class OperationType { Copy, Move, Delete };

/**
 * @brief What to do when the destination path is already occupied.
 */
enum class ConflictPolicy {
    Skip,        ///< Leave the existing entry alone and move on
    Overwrite,   ///< Replace the existing file, merge into an existing folder
    Rename,      ///< Write under a free "name (N)" instead
    AskEachTime  ///< Ask the caller for every conflict
};

enum class ErrorPolicy {
    ContinueOnError,   ///< Record the failure and carry on with the next item
    AbortOnFirstError  ///< Stop the job at the first failure
};

/**
 * @brief The caller's answer to a single AskEachTime conflict.
 *
 * The "All" variants also switch the job's policy for every later conflict.
 */
enum class ConflictResolution {
    Skip,
    SkipAll,
    Overwrite,
    OverwriteAll,
    Rename,
    RenameAll,
    Cancel
};

[[nodiscard]] const char* operationTypeToString(OperationType type);
[[nodiscard]] const char* conflictPolicyToString(ConflictPolicy policy);
[[nodiscard]] const char* conflictResolutionToString(ConflictResolution resolution);

/**
 * @brief Parses "skip", "overwrite", "rename" or "ask" (case-insensitive).
 * @param text The text to parse.
 * @param ok Set to false when the text is not a known policy.
 * @return The parsed policy, or AskEachTime when unknown.
 */
[[nodiscard]] ConflictPolicy conflictPolicyFromString(const QString &text, bool *ok = nullptr);

/**
 * @brief One side of the dual-pane layout, as seen by the engine.
 *
 * The engine only reads pane contexts to build requests; panes stay owned
 * and refreshed by the caller.
 */
struct PaneContext {
    QString currentDirectory;
    QStringList selection;  ///< Entry names relative to currentDirectory, or absolute paths

    /// Selection resolved to absolute paths, in selection order
    [[nodiscard]] QStringList selectedPaths() const;
};

/**
 * @brief A copy, move or delete request.
 *
 * Requests are plain values. The engine keeps its own copy on submission,
 * so later changes to the caller's instance never affect a running job.
 */
struct TransferRequest {
    OperationType operation = OperationType::Copy;
    QStringList sources;
    QString destination;  ///< Target directory; unused for Delete
    ConflictPolicy conflictPolicy = ConflictPolicy::AskEachTime;
    ErrorPolicy errorPolicy = ErrorPolicy::ContinueOnError;

    static TransferRequest copy(const QStringList &sources,
                                const QString &destination,
                                ConflictPolicy policy = ConflictPolicy::AskEachTime);
    static TransferRequest move(const QStringList &sources,
                                const QString &destination,
                                ConflictPolicy policy = ConflictPolicy::AskEachTime);
    static TransferRequest remove(const QStringList &sources);

    /**
     * @brief Builds a request from the active pane's selection into the other pane.
     * @param operation Copy, Move or Delete (Delete ignores @p target).
     * @param source Pane providing the selection.
     * @param target Pane whose current directory becomes the destination.
     * @param policy Conflict policy for the request.
     */
    static TransferRequest fromPanes(OperationType operation,
                                     const PaneContext &source,
                                     const PaneContext &target,
                                     ConflictPolicy policy = ConflictPolicy::AskEachTime);

    [[nodiscard]] bool writesToDestination() const { return operation != OperationType::Delete; }
    [[nodiscard]] bool removesSources() const { return operation != OperationType::Copy; }
};

Q_DECLARE_METATYPE(TransferRequest)

#endif // TRANSFERREQUEST_H
