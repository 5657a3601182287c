#include "transferjob.h"

#include <QMutexLocker>

const char* jobStateToString(JobState state)
{
    switch (state) {
        case JobState::Queued: return "Queued";
        case JobState::Running: return "Running";
        case JobState::Completed: return "Completed";
        case JobState::Failed: return "Failed";
        case JobState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

TransferJob::TransferJob(quint64 id, const TransferRequest &request)
    : id_(id)
    , request_(request)
{
}

JobState TransferJob::state() const
{
    QMutexLocker lock(&mutex_);
    return state_;
}

ProgressSnapshot TransferJob::snapshot() const
{
    QMutexLocker lock(&mutex_);
    return snapshotLocked();
}

ProgressSnapshot TransferJob::snapshotLocked() const
{
    ProgressSnapshot s;
    s.jobId = id_;
    s.state = state_;
    s.operation = request_.operation;
    s.bytesDone = bytesDone_;
    s.bytesTotal = bytesTotal_;
    s.filesDone = filesDone_;
    s.filesTotal = filesTotal_;
    s.currentPath = currentPath_;
    s.errorCount = static_cast<int>(errors_.size());
    s.awaitingAnswer = awaitingAnswer_;
    return s;
}

QList<TransferError> TransferJob::errors() const
{
    QMutexLocker lock(&mutex_);
    return errors_;
}

bool TransferJob::markRunning()
{
    QMutexLocker lock(&mutex_);
    if (state_ != JobState::Queued || cancelRequested_.load()) {
        return false;
    }
    state_ = JobState::Running;
    return true;
}

bool TransferJob::cancelIfQueued()
{
    {
        QMutexLocker lock(&mutex_);
        if (state_ != JobState::Queued) {
            return false;
        }
        cancelRequested_.store(true);
    }
    finish(JobState::Cancelled);
    return true;
}

void TransferJob::finish(JobState state)
{
    JobEvent event;
    QList<JobCallback> subscribers;
    {
        QMutexLocker lock(&mutex_);
        if (isTerminalState(state_)) {
            return;
        }
        state_ = state;
        awaitingAnswer_ = false;
        currentPath_.clear();
        event.type = JobEvent::Type::Finished;
        event.snapshot = snapshotLocked();
        // Terminal: nobody gets notified again, so drop the callbacks here.
        subscribers.swap(subscribers_);
    }
    for (const JobCallback &callback : subscribers) {
        callback(event);
    }
}

void TransferJob::requestCancel()
{
    cancelRequested_.store(true);
    QMutexLocker lock(&mutex_);
    answerReady_.wakeAll();
}

void TransferJob::setTotals(int files, qint64 bytes)
{
    QMutexLocker lock(&mutex_);
    filesTotal_ = qMax(files, filesDone_);
    bytesTotal_ = qMax(bytes, bytesDone_);
}

void TransferJob::setCurrentPath(const QString &path)
{
    QMutexLocker lock(&mutex_);
    currentPath_ = path;
}

void TransferJob::addBytesDone(qint64 bytes)
{
    QMutexLocker lock(&mutex_);
    bytesDone_ += bytes;
    if (bytesDone_ > bytesTotal_) {
        bytesTotal_ = bytesDone_;
    }
}

void TransferJob::addFilesDone(int count)
{
    QMutexLocker lock(&mutex_);
    filesDone_ += count;
    if (filesDone_ > filesTotal_) {
        filesTotal_ = filesDone_;
    }
}

void TransferJob::excludeFromTotals(int files, qint64 bytes)
{
    QMutexLocker lock(&mutex_);
    filesTotal_ = qMax(filesDone_, filesTotal_ - files);
    bytesTotal_ = qMax(bytesDone_, bytesTotal_ - bytes);
}

void TransferJob::addError(const TransferError &error)
{
    QMutexLocker lock(&mutex_);
    errors_.append(error);
}

void TransferJob::beginConflictQuestion()
{
    QMutexLocker lock(&mutex_);
    awaitingAnswer_ = true;
    answerProvided_ = false;
}

bool TransferJob::isAwaitingAnswer() const
{
    QMutexLocker lock(&mutex_);
    return awaitingAnswer_;
}

ConflictResolution TransferJob::waitForResolution()
{
    QMutexLocker lock(&mutex_);
    while (!answerProvided_ && !cancelRequested_.load()) {
        answerReady_.wait(&mutex_);
    }
    awaitingAnswer_ = false;
    if (!answerProvided_) {
        return ConflictResolution::Cancel;
    }
    answerProvided_ = false;
    return answer_;
}

bool TransferJob::takeResolution(ConflictResolution *resolution)
{
    QMutexLocker lock(&mutex_);
    if (!answerProvided_) {
        return false;
    }
    *resolution = answer_;
    answerProvided_ = false;
    awaitingAnswer_ = false;
    return true;
}

bool TransferJob::provideResolution(ConflictResolution resolution)
{
    QMutexLocker lock(&mutex_);
    if (!awaitingAnswer_ || answerProvided_) {
        return false;
    }
    answer_ = resolution;
    answerProvided_ = true;
    answerReady_.wakeAll();
    return true;
}

bool TransferJob::addSubscriber(const JobCallback &callback)
{
    QMutexLocker lock(&mutex_);
    if (isTerminalState(state_)) {
        return false;
    }
    subscribers_.append(callback);
    return true;
}

void TransferJob::notify(const JobEvent &event) const
{
    QList<JobCallback> subscribers;
    {
        QMutexLocker lock(&mutex_);
        subscribers = subscribers_;
    }
    for (const JobCallback &callback : subscribers) {
        callback(event);
    }
}
