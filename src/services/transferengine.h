/**
 * @file transferengine.h
 * @brief Service coordinating copy, move and delete jobs between the two panes.
 *
 * The engine validates requests, runs each accepted job on a worker thread
 * and reports progress both through Qt signals (for widgets) and through
 * plain callbacks (for code that is not QObject based).
 */

#ifndef TRANSFERENGINE_H
#define TRANSFERENGINE_H

#include <QHash>
#include <QList>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QStringList>
#include <QThreadPool>
#include <memory>

#include "models/transfererror.h"
#include "models/transferjob.h"
#include "models/transferrequest.h"
#include "services/ifilesystem.h"
#include "services/transfersettings.h"

/**
 * @brief Asynchronous file operation engine.
 *
 * Every accepted request becomes a TransferJob that runs on the engine's
 * own thread pool. Jobs beyond the pool size wait in the Queued state. Two
 * active jobs never have overlapping write sets: submit() rejects a request
 * whose destination (or, for moves and deletes, whose sources) overlaps
 * those of a Queued or Running job.
 *
 * Signals are emitted from worker threads; receivers living in the GUI
 * thread get them queued. Subscriber callbacks run directly on the worker
 * and must not block.
 *
 * @par Example usage:
 * @code
 * TransferEngine *engine = new TransferEngine(this);
 *
 * connect(engine, &TransferEngine::jobFinished,
 *         this, &MyPanes::refreshAfterJob);
 * connect(engine, &TransferEngine::conflictResolutionNeeded,
 *         this, &MyPanes::askUser);  // later: engine->respondToConflict(...)
 *
 * ValidationError error;
 * JobHandle job = engine->submit(TransferRequest::fromPanes(
 *     OperationType::Copy, leftPane, rightPane, ConflictPolicy::Rename), &error);
 * if (!job.isValid()) {
 *     showError(error.message);
 * }
 * @endcode
 */
class TransferEngine : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an engine on the local file system with default settings.
     * @param parent Optional parent QObject for memory management.
     */
    explicit TransferEngine(QObject *parent = nullptr);

    /**
     * @brief Constructs an engine with an injected file system and settings.
     * @param fileSystem File system used by validation and by every job.
     * @param settings Engine configuration.
     * @param parent Optional parent QObject for memory management.
     */
    TransferEngine(std::shared_ptr<IFileSystem> fileSystem,
                   const TransferSettings &settings,
                   QObject *parent = nullptr);

    /**
     * @brief Destructor. Cancels every job and waits for the workers to stop.
     */
    ~TransferEngine() override;

    /// @name Job Control
    /// @{

    /**
     * @brief Validates a request and schedules it.
     * @param request The operation to perform. The engine keeps its own copy.
     * @param error Receives the reason when the request is rejected.
     * @return A valid handle, or an invalid one if validation failed.
     */
    JobHandle submit(const TransferRequest &request, ValidationError *error = nullptr);

    /**
     * @brief Requests cooperative cancellation of a job.
     * @return False if the job is unknown or already finished.
     *
     * Queued jobs are cancelled immediately. Running jobs stop at their next
     * per-file checkpoint; files already committed stay in place.
     */
    bool cancel(const JobHandle &handle);

    /**
     * @brief Cancels every active job.
     */
    void cancelAll();

    /**
     * @brief Answers a job's pending AskEachTime conflict.
     * @return False if the job is unknown or not waiting for an answer.
     */
    bool respondToConflict(const JobHandle &handle, ConflictResolution resolution);
    /// @}

    /// @name Job State
    /// @{

    /**
     * @brief Returns the current counters of a job without blocking on I/O.
     * @return An invalid snapshot (jobId 0) for unknown handles.
     */
    [[nodiscard]] ProgressSnapshot progress(const JobHandle &handle) const;

    /**
     * @brief Returns the errors recorded so far for a job.
     */
    [[nodiscard]] QList<TransferError> errors(const JobHandle &handle) const;

    /**
     * @brief Registers a callback for a job's progress, failures and completion.
     * @return False if the job is unknown.
     *
     * The callback runs on the job's worker thread. If the job already
     * finished, its Finished event is delivered immediately on the calling
     * thread.
     */
    bool subscribe(const JobHandle &handle, const JobCallback &callback);

    /**
     * @brief Returns snapshots of all known jobs, oldest first.
     */
    [[nodiscard]] QList<ProgressSnapshot> jobs() const;

    /**
     * @brief Returns the number of Queued and Running jobs.
     */
    [[nodiscard]] int activeJobCount() const;

    /**
     * @brief Forgets finished jobs. Their handles become unknown.
     * @return Number of jobs removed.
     */
    int removeFinished();

    /**
     * @brief Blocks until every job has finished or the timeout expires.
     * @param msecs Timeout in milliseconds, -1 to wait forever.
     * @return True if all jobs finished.
     */
    bool waitForDone(int msecs = -1);

    [[nodiscard]] const TransferSettings& settings() const { return settings_; }
    /// @}

signals:
    /**
     * @brief Emitted when a request has been accepted.
     */
    void jobQueued(quint64 jobId);

    /**
     * @brief Emitted when a worker starts executing a job.
     */
    void jobStarted(quint64 jobId);

    /**
     * @brief Emitted after every chunk and every file.
     */
    void jobProgress(const ProgressSnapshot &snapshot);

    /**
     * @brief Emitted when an item fails; the job carries on unless it aborts.
     */
    void itemFailed(quint64 jobId, const TransferError &error);

    /**
     * @brief Emitted when an AskEachTime job needs an answer.
     *
     * Only the conflicting item waits; the job keeps working on its other
     * items until respondToConflict() or cancel() is called. Questions are
     * asked one at a time.
     */
    void conflictResolutionNeeded(quint64 jobId, const ConflictInfo &info);

    /**
     * @brief Emitted once per job when it reaches a terminal state.
     */
    void jobFinished(quint64 jobId, JobState state);

private:
    [[nodiscard]] std::shared_ptr<TransferJob> findJob(quint64 id) const;
    [[nodiscard]] ValidationError validate(TransferRequest *request) const;
    [[nodiscard]] static QStringList writeSetFor(const TransferRequest &request);
    void runJob(const std::shared_ptr<TransferJob> &job);

    std::shared_ptr<IFileSystem> fs_;
    TransferSettings settings_;
    QThreadPool pool_;

    mutable QMutex mutex_;
    QMap<quint64, std::shared_ptr<TransferJob>> jobs_;
    QHash<quint64, QStringList> writeSets_;
    quint64 nextJobId_ = 1;
};

#endif // TRANSFERENGINE_H
