/**
 * @file transfererror.h
 * @brief Error values reported by the transfer engine.
 */

#ifndef TRANSFERERROR_H
#define TRANSFERERROR_H

#include <QList>
#include <QMetaType>
#include <QString>

/**
 * @brief Reason a request was rejected by TransferEngine::submit().
 */
struct ValidationError {
    enum class Reason {
        None,
        EmptySources,
        MissingSource,
        UnreadableSource,
        MissingDestination,
        DestinationNotDirectory,
        DestinationNotWritable,
        SourceParentNotWritable,
        DestinationInsideSource,
        SameSourceAndDestination,
        OverlappingJob
    };

    Reason reason = Reason::None;
    QString path;     ///< Offending path, if any
    QString message;  ///< Human readable description
    quint64 conflictingJobId = 0;  ///< Set for OverlappingJob

    [[nodiscard]] bool isError() const { return reason != Reason::None; }
};

[[nodiscard]] const char* validationReasonToString(ValidationError::Reason reason);

/**
 * @brief A per-item failure recorded in a job's error list.
 */
struct TransferError {
    enum class Kind {
        IO,        ///< Read, write, delete or rename failed
        Conflict   ///< A conflict could not be resolved as requested
    };

    Kind kind = Kind::IO;
    QString path;     ///< Path the failure relates to
    QString message;  ///< Human readable description
};

/**
 * @brief Describes a destination conflict raised under AskEachTime.
 */
struct ConflictInfo {
    QString sourcePath;
    QString targetPath;
    bool sourceIsDirectory = false;
    bool targetIsDirectory = false;
    qint64 sourceSize = 0;
    qint64 targetSize = 0;
};

Q_DECLARE_METATYPE(TransferError)
Q_DECLARE_METATYPE(ConflictInfo)

#endif // TRANSFERERROR_H
