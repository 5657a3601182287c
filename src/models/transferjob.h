/**
 * @file transferjob.h
 * @brief Lifecycle, progress and error state of one submitted request.
 */

#ifndef TRANSFERJOB_H
#define TRANSFERJOB_H

#include <QList>
#include <QMutex>
#include <QString>
#include <QWaitCondition>
#include <atomic>
#include <functional>

#include "models/transfererror.h"
#include "models/transferrequest.h"

enum class JobState {
    Queued,     ///< Accepted, waiting for a worker
    Running,    ///< Executing on a worker thread
    Completed,  ///< Every item committed or deliberately skipped
    Failed,     ///< Finished with errors, or aborted on the first error
    Cancelled   ///< Stopped at a checkpoint by request
};

[[nodiscard]] const char* jobStateToString(JobState state);
[[nodiscard]] inline bool isTerminalState(JobState state)
{
    return state == JobState::Completed || state == JobState::Failed || state == JobState::Cancelled;
}

/**
 * @brief Point-in-time copy of a job's progress counters.
 */
struct ProgressSnapshot {
    quint64 jobId = 0;
    JobState state = JobState::Queued;
    OperationType operation = OperationType::Copy;
    qint64 bytesDone = 0;
    qint64 bytesTotal = 0;
    int filesDone = 0;
    int filesTotal = 0;
    QString currentPath;
    int errorCount = 0;
    bool awaitingAnswer = false;  ///< An AskEachTime question is waiting for an answer

    [[nodiscard]] bool isValid() const { return jobId != 0; }
    [[nodiscard]] bool isFinished() const { return isTerminalState(state); }
    [[nodiscard]] int percent() const
    {
        if (bytesTotal > 0) {
            return static_cast<int>((bytesDone * 100) / bytesTotal);
        }
        return filesTotal > 0 ? (filesDone * 100) / filesTotal : 0;
    }
};

/**
 * @brief Notification delivered to job subscribers.
 */
struct JobEvent {
    enum class Type { Progress, ItemFailed, Finished };

    Type type = Type::Progress;
    ProgressSnapshot snapshot;
    TransferError error;  ///< Only meaningful for ItemFailed
};

using JobCallback = std::function<void(const JobEvent &)>;

/**
 * @brief Opaque identity of a submitted job.
 *
 * A default constructed handle is invalid; submit() returns one when the
 * request is rejected.
 */
class JobHandle
{
public:
    JobHandle() = default;
    explicit JobHandle(quint64 id) : id_(id) {}

    [[nodiscard]] quint64 id() const { return id_; }
    [[nodiscard]] bool isValid() const { return id_ != 0; }

    bool operator==(const JobHandle &other) const { return id_ == other.id_; }
    bool operator!=(const JobHandle &other) const { return id_ != other.id_; }

private:
    quint64 id_ = 0;
};

/**
 * @brief Shared state of one job, written by its worker and read by everyone else.
 *
 * All accessors are thread-safe. Counter updates and snapshot reads hold a
 * short mutex; the cancel flag is atomic so checkpoints never lock.
 */
class TransferJob
{
public:
    TransferJob(quint64 id, const TransferRequest &request);

    [[nodiscard]] quint64 id() const { return id_; }
    [[nodiscard]] const TransferRequest& request() const { return request_; }

    [[nodiscard]] JobState state() const;
    [[nodiscard]] ProgressSnapshot snapshot() const;
    [[nodiscard]] QList<TransferError> errors() const;

    /// @name Lifecycle
    /// @{

    /**
     * @brief Moves Queued to Running.
     * @return False if the job was cancelled before a worker picked it up.
     */
    bool markRunning();

    /**
     * @brief Cancels a job that has not started yet.
     * @return True if the job was Queued and is now Cancelled.
     */
    bool cancelIfQueued();

    /**
     * @brief Enters a terminal state and notifies subscribers.
     */
    void finish(JobState state);

    void requestCancel();
    [[nodiscard]] bool isCancelRequested() const { return cancelRequested_.load(); }
    /// @}

    /// @name Progress (worker side)
    /// @{
    void setTotals(int files, qint64 bytes);
    void setCurrentPath(const QString &path);
    void addBytesDone(qint64 bytes);
    void addFilesDone(int count = 1);

    /**
     * @brief Removes skipped or abandoned work from the totals.
     *
     * Totals never drop below what is already done.
     */
    void excludeFromTotals(int files, qint64 bytes);
    void addError(const TransferError &error);
    /// @}

    /// @name Conflict questions
    /// @{

    /**
     * @brief Blocks the calling worker until the caller answers the conflict.
     * @return The caller's answer, or Cancel if the job was cancelled while waiting.
     */
    ConflictResolution waitForResolution();

    /**
     * @brief Takes the answer to the pending question if one has arrived.
     * @return False if the question is still unanswered.
     */
    bool takeResolution(ConflictResolution *resolution);

    /**
     * @brief Answers a pending conflict question.
     * @return False if the job is not waiting for an answer.
     */
    bool provideResolution(ConflictResolution resolution);

    /**
     * @brief Marks the job as waiting before the question is published.
     */
    void beginConflictQuestion();
    [[nodiscard]] bool isAwaitingAnswer() const;
    /// @}

    /// @name Subscribers
    /// @{

    /**
     * @brief Registers a callback for this job's events.
     * @return False if the job already finished; the callback is not stored.
     */
    bool addSubscriber(const JobCallback &callback);

    void notify(const JobEvent &event) const;
    /// @}

private:
    ProgressSnapshot snapshotLocked() const;

    const quint64 id_;
    const TransferRequest request_;

    mutable QMutex mutex_;
    QWaitCondition answerReady_;
    JobState state_ = JobState::Queued;
    qint64 bytesDone_ = 0;
    qint64 bytesTotal_ = 0;
    int filesDone_ = 0;
    int filesTotal_ = 0;
    QString currentPath_;
    QList<TransferError> errors_;
    bool awaitingAnswer_ = false;
    bool answerProvided_ = false;
    ConflictResolution answer_ = ConflictResolution::Skip;
    QList<JobCallback> subscribers_;

    std::atomic_bool cancelRequested_{false};
};

Q_DECLARE_METATYPE(ProgressSnapshot)

#endif // TRANSFERJOB_H
