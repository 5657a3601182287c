/**
 * @file transferworker.h
 * @brief Executes one transfer job on the calling (worker) thread.
 */

#ifndef TRANSFERWORKER_H
#define TRANSFERWORKER_H

#include <QList>
#include <QString>
#include <QStringList>
#include <functional>
#include <memory>

#include "models/transferjob.h"
#include "services/ifilesystem.h"
#include "services/transfersettings.h"

/**
 * @brief Runs the copy/move/delete algorithm for a single job.
 *
 * The worker is created and run by TransferEngine on a pool thread. It is the
 * only writer of the job's progress counters and error list. Cancellation is
 * checked before every file system entry, never in the middle of a file.
 *
 * Files are copied chunk by chunk into an atomic save file, so a destination
 * file only ever appears complete. Moves rename in place when source and
 * destination share a device and fall back to copy + delete otherwise; the
 * source of a file is deleted only after its copy has been committed.
 *
 * An AskEachTime conflict only holds back the conflicting item: it is set
 * aside with its question published, and the worker carries on with the
 * other items. Answers are picked up at the next checkpoint. Once nothing
 * else is left, the worker waits for the remaining answers.
 */
class TransferWorker
{
public:
    /**
     * @brief Notifications raised while the job runs, all on the worker thread.
     */
    struct Callbacks {
        std::function<void()> progressChanged;
        std::function<void(const TransferError &)> itemFailed;
        std::function<void(const ConflictInfo &)> conflictRaised;
    };

    TransferWorker(std::shared_ptr<TransferJob> job,
                   std::shared_ptr<IFileSystem> fileSystem,
                   const TransferSettings &settings,
                   Callbacks callbacks);

    /**
     * @brief Processes every source of the job's request.
     * @return The terminal state the job should enter.
     */
    JobState run();

private:
    enum class Outcome {
        Done,     ///< Entry fully processed
        Skipped,  ///< Entry (or part of it) deliberately left alone
        Deferred, ///< Entry (or part of it) waiting for a conflict answer
        Failed    ///< Error recorded, or stopped by cancel/abort
    };

    enum class ConflictAction { Proceed, Skip, Overwrite, Rename, Defer, Cancel };

    struct PendingConflict {
        QString source;
        QString target;
        bool removeSource = false;
        bool sameDevice = false;
        ConflictInfo info;
    };

    void scanTotals();
    void countTree(const QString &path, int *files, qint64 *bytes) const;

    Outcome transferEntry(const QString &source, const QString &target, bool removeSource);
    Outcome applyConflictAction(ConflictAction action,
                                const QString &source, const FileStat &sourceStat,
                                const QString &target, const FileStat &targetStat,
                                bool removeSource);
    Outcome writeEntry(const QString &source, const FileStat &sourceStat,
                       const QString &destination, bool removeSource, bool merge);
    Outcome transferDirectory(const QString &source, const QString &target,
                              const FileStat &sourceStat, bool removeSource);
    Outcome copyFile(const QString &source, const QString &target, const FileStat &sourceStat);
    Outcome deleteEntry(const QString &path);
    bool tryRenameInPlace(const QString &source, const QString &target);

    ConflictAction resolveConflict(const QString &source, const FileStat &sourceStat,
                                   const QString &target, const FileStat &targetStat,
                                   bool removeSource);
    [[nodiscard]] static ConflictAction actionForPolicy(ConflictPolicy policy);
    ConflictAction actionForAnswer(ConflictResolution answer);
    void askNextQuestion();
    void takeAnswers();
    void resolvePending(ConflictResolution answer);
    void finishPending(const PendingConflict &item, ConflictAction action);
    void removeDeferredSourceDirs();
    [[nodiscard]] bool isSameEntry(const QString &source, const FileStat &sourceStat,
                                   const QString &target, const FileStat &targetStat) const;
    bool removeExisting(const QString &path, QString *error);
    void excludeTree(const QString &path);

    [[nodiscard]] bool shouldStop();
    void recordError(TransferError::Kind kind, const QString &path, const QString &message);
    void reportProgress();

    std::shared_ptr<TransferJob> job_;
    std::shared_ptr<IFileSystem> fs_;
    TransferSettings settings_;
    Callbacks callbacks_;

    ConflictPolicy policy_;  ///< Starts as the request's policy; "All" answers replace it
    bool sameDevice_ = false;
    bool cancelled_ = false;
    bool aborted_ = false;

    QList<PendingConflict> pending_;  ///< In question order; the first one is being asked
    bool questionOpen_ = false;
    bool resolving_ = false;
    QStringList deferredSourceDirs_;  ///< Move sources kept for deferred children
};

#endif // TRANSFERWORKER_H
