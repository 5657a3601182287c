#include "transferengine.h"
#include "localfilesystem.h"
#include "transferworker.h"

#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QDebug>
#include <QMutexLocker>
#include <algorithm>

TransferEngine::TransferEngine(QObject *parent)
    : TransferEngine(std::make_shared<LocalFileSystem>(), TransferSettings::load(), parent)
{
}

TransferEngine::TransferEngine(std::shared_ptr<IFileSystem> fileSystem,
                               const TransferSettings &settings,
                               QObject *parent)
    : QObject(parent)
    , fs_(std::move(fileSystem))
    , settings_(settings)
{
    pool_.setMaxThreadCount(settings_.effectiveWorkerCount());
    LOG_VERBOSE() << "TransferEngine: Using" << pool_.maxThreadCount() << "worker threads, chunk size"
                  << settings_.chunkSize;
}

TransferEngine::~TransferEngine()
{
    // Workers emit through this object, so they must be gone before the
    // members are destroyed.
    cancelAll();
    pool_.waitForDone();
}

JobHandle TransferEngine::submit(const TransferRequest &request, ValidationError *error)
{
    TransferRequest accepted = request;
    ValidationError result = validate(&accepted);

    std::shared_ptr<TransferJob> job;
    if (!result.isError()) {
        const QStringList writeSet = writeSetFor(accepted);

        // Overlap check and registration happen under one lock so two
        // concurrent submissions cannot both pass.
        QMutexLocker lock(&mutex_);
        for (auto it = jobs_.cbegin(); it != jobs_.cend() && !result.isError(); ++it) {
            if (isTerminalState(it.value()->state())) {
                continue;
            }
            for (const QString &activePath : writeSets_.value(it.key())) {
                const auto overlapping = std::find_if(writeSet.cbegin(), writeSet.cend(),
                                                      [&activePath](const QString &path) {
                                                          return PathUtils::overlaps(activePath, path);
                                                      });
                if (overlapping != writeSet.cend()) {
                    result.reason = ValidationError::Reason::OverlappingJob;
                    result.path = *overlapping;
                    result.conflictingJobId = it.key();
                    result.message = tr("%1 is in use by another operation").arg(*overlapping);
                    break;
                }
            }
        }

        if (!result.isError()) {
            const quint64 id = nextJobId_++;
            job = std::make_shared<TransferJob>(id, accepted);
            jobs_.insert(id, job);
            writeSets_.insert(id, writeSet);
        }
    }

    if (error) {
        *error = result;
    }
    if (result.isError()) {
        qWarning().noquote() << "TransferEngine: Rejected" << operationTypeToString(request.operation)
                             << "-" << validationReasonToString(result.reason) << "-" << result.message;
        return JobHandle();
    }

    qDebug() << "TransferEngine: Queued job" << job->id() << operationTypeToString(accepted.operation)
             << accepted.sources.size() << "item(s)" << accepted.destination;
    emit jobQueued(job->id());

    pool_.start([this, job]() { runJob(job); });
    return JobHandle(job->id());
}

bool TransferEngine::cancel(const JobHandle &handle)
{
    const std::shared_ptr<TransferJob> job = findJob(handle.id());
    if (!job || isTerminalState(job->state())) {
        return false;
    }

    qInfo() << "TransferEngine: Cancelling job" << job->id();
    if (job->cancelIfQueued()) {
        emit jobFinished(job->id(), JobState::Cancelled);
        return true;
    }
    job->requestCancel();
    return true;
}

void TransferEngine::cancelAll()
{
    QList<quint64> ids;
    {
        QMutexLocker lock(&mutex_);
        ids = jobs_.keys();
    }
    for (const quint64 id : ids) {
        cancel(JobHandle(id));
    }
}

bool TransferEngine::respondToConflict(const JobHandle &handle, ConflictResolution resolution)
{
    const std::shared_ptr<TransferJob> job = findJob(handle.id());
    if (!job) {
        return false;
    }
    return job->provideResolution(resolution);
}

ProgressSnapshot TransferEngine::progress(const JobHandle &handle) const
{
    const std::shared_ptr<TransferJob> job = findJob(handle.id());
    return job ? job->snapshot() : ProgressSnapshot();
}

QList<TransferError> TransferEngine::errors(const JobHandle &handle) const
{
    const std::shared_ptr<TransferJob> job = findJob(handle.id());
    return job ? job->errors() : QList<TransferError>();
}

bool TransferEngine::subscribe(const JobHandle &handle, const JobCallback &callback)
{
    const std::shared_ptr<TransferJob> job = findJob(handle.id());
    if (!job || !callback) {
        return false;
    }
    if (!job->addSubscriber(callback)) {
        JobEvent event;
        event.type = JobEvent::Type::Finished;
        event.snapshot = job->snapshot();
        callback(event);
    }
    return true;
}

QList<ProgressSnapshot> TransferEngine::jobs() const
{
    QMutexLocker lock(&mutex_);
    QList<ProgressSnapshot> result;
    result.reserve(jobs_.size());
    for (const auto &job : jobs_) {
        result.append(job->snapshot());
    }
    return result;
}

int TransferEngine::activeJobCount() const
{
    QMutexLocker lock(&mutex_);
    return static_cast<int>(std::count_if(jobs_.cbegin(), jobs_.cend(), [](const std::shared_ptr<TransferJob> &job) {
        return !isTerminalState(job->state());
    }));
}

int TransferEngine::removeFinished()
{
    QMutexLocker lock(&mutex_);
    int removed = 0;
    for (auto it = jobs_.begin(); it != jobs_.end();) {
        if (isTerminalState(it.value()->state())) {
            writeSets_.remove(it.key());
            it = jobs_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

bool TransferEngine::waitForDone(int msecs)
{
    return pool_.waitForDone(msecs);
}

std::shared_ptr<TransferJob> TransferEngine::findJob(quint64 id) const
{
    QMutexLocker lock(&mutex_);
    return jobs_.value(id);
}

ValidationError TransferEngine::validate(TransferRequest *request) const
{
    ValidationError error;
    auto fail = [&error](ValidationError::Reason reason, const QString &path, const QString &message) {
        error.reason = reason;
        error.path = path;
        error.message = message;
        return error;
    };

    if (request->sources.isEmpty()) {
        return fail(ValidationError::Reason::EmptySources, QString(), tr("No files selected"));
    }

    // Every identity check below works on physical paths, so an entry
    // reached through a linked directory is recognised as the same entry.
    const auto canonical = [this](const QString &path) { return fs_->canonicalPath(path); };
    QStringList sources;
    sources.reserve(request->sources.size());
    for (const QString &source : request->sources) {
        sources.append(PathUtils::resolveParent(source, canonical));
    }
    sources.removeDuplicates();
    request->sources = sources;

    if (request->writesToDestination()) {
        if (request->destination.isEmpty()) {
            return fail(ValidationError::Reason::MissingDestination, QString(), tr("No destination directory"));
        }
        QString destination = PathUtils::normalize(request->destination);
        const QString resolved = fs_->canonicalPath(destination);
        if (!resolved.isEmpty()) {
            destination = resolved;
        }
        const FileStat destinationStat = fs_->stat(destination);
        // A link left unresolved here is dangling.
        if (!destinationStat.exists || destinationStat.isSymLink) {
            return fail(ValidationError::Reason::MissingDestination, destination,
                        tr("Destination does not exist: %1").arg(destination));
        }
        if (!destinationStat.isDirectory) {
            return fail(ValidationError::Reason::DestinationNotDirectory, destination,
                        tr("Destination is not a directory: %1").arg(destination));
        }
        if (!destinationStat.writable) {
            return fail(ValidationError::Reason::DestinationNotWritable, destination,
                        tr("Destination is not writable: %1").arg(destination));
        }
        request->destination = destination;
    } else {
        request->destination.clear();
    }

    for (const QString &source : sources) {
        const FileStat stat = fs_->stat(source);
        if (!stat.exists) {
            return fail(ValidationError::Reason::MissingSource, source, tr("No such file or directory: %1").arg(source));
        }
        if (request->writesToDestination()) {
            if (!stat.isSymLink && !stat.readable) {
                return fail(ValidationError::Reason::UnreadableSource, source, tr("Cannot read %1").arg(source));
            }
            if (stat.isDirectory && PathUtils::isSameOrDescendant(request->destination, source)) {
                return fail(ValidationError::Reason::DestinationInsideSource, source,
                            tr("Cannot %1 %2 into itself")
                                .arg(QString::fromLatin1(operationTypeToString(request->operation)).toLower(), source));
            }
            if (request->conflictPolicy == ConflictPolicy::Overwrite
                && PathUtils::parentPath(source) == request->destination) {
                return fail(ValidationError::Reason::SameSourceAndDestination, source,
                            tr("%1 is already in the destination directory").arg(source));
            }
        }
        if (request->removesSources()) {
            const QString parent = PathUtils::parentPath(source);
            if (!fs_->stat(parent).writable) {
                return fail(ValidationError::Reason::SourceParentNotWritable, source,
                            tr("Cannot remove %1: %2 is not writable").arg(source, parent));
            }
        }
    }

    return error;
}

QStringList TransferEngine::writeSetFor(const TransferRequest &request)
{
    QStringList paths;
    if (request.writesToDestination()) {
        paths.append(request.destination);
    }
    if (request.removesSources()) {
        paths.append(request.sources);
    }
    return paths;
}

void TransferEngine::runJob(const std::shared_ptr<TransferJob> &job)
{
    if (!job->markRunning()) {
        // Cancelled while it was still queued.
        return;
    }
    emit jobStarted(job->id());

    TransferWorker::Callbacks callbacks;
    callbacks.progressChanged = [this, job]() {
        JobEvent event;
        event.type = JobEvent::Type::Progress;
        event.snapshot = job->snapshot();
        job->notify(event);
        emit jobProgress(event.snapshot);
    };
    callbacks.itemFailed = [this, job](const TransferError &error) {
        JobEvent event;
        event.type = JobEvent::Type::ItemFailed;
        event.snapshot = job->snapshot();
        event.error = error;
        job->notify(event);
        emit itemFailed(job->id(), error);
    };
    callbacks.conflictRaised = [this, job](const ConflictInfo &info) {
        JobEvent event;
        event.type = JobEvent::Type::Progress;
        event.snapshot = job->snapshot();
        job->notify(event);
        emit conflictResolutionNeeded(job->id(), info);
    };

    TransferWorker worker(job, fs_, settings_, callbacks);
    const JobState state = worker.run();

    job->finish(state);
    emit jobFinished(job->id(), state);
}
