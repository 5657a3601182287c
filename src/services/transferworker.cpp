#include "transferworker.h"

#include "utils/logging.h"
#include "utils/pathutils.h"

#include <QByteArray>
#include <QDebug>
#include <QObject>
#include <algorithm>

TransferWorker::TransferWorker(std::shared_ptr<TransferJob> job,
                               std::shared_ptr<IFileSystem> fileSystem,
                               const TransferSettings &settings,
                               Callbacks callbacks)
    : job_(std::move(job))
    , fs_(std::move(fileSystem))
    , settings_(settings)
    , callbacks_(std::move(callbacks))
    , policy_(job_->request().conflictPolicy)
{
}

JobState TransferWorker::run()
{
    const TransferRequest &request = job_->request();
    qInfo() << "TransferWorker: Job" << job_->id() << "start" << operationTypeToString(request.operation)
            << request.sources
            << (request.writesToDestination() ? QString("dest=%1").arg(request.destination) : QString());

    scanTotals();
    reportProgress();

    for (const QString &source : request.sources) {
        if (shouldStop()) {
            break;
        }

        if (request.operation == OperationType::Delete) {
            deleteEntry(source);
            continue;
        }

        const bool removeSource = request.operation == OperationType::Move;
        if (removeSource) {
            sameDevice_ = fs_->isSameDevice(source, request.destination);
        }
        transferEntry(source, PathUtils::join(request.destination, PathUtils::baseName(source)), removeSource);
    }

    // Only deferred conflicts are left; wait for their answers.
    while (!pending_.isEmpty() && !shouldStop()) {
        resolvePending(job_->waitForResolution());
    }
    if (!cancelled_ && !aborted_) {
        removeDeferredSourceDirs();
    }

    JobState result = JobState::Completed;
    if (cancelled_) {
        result = JobState::Cancelled;
    } else if (aborted_ || !job_->errors().isEmpty()) {
        result = JobState::Failed;
    }

    const ProgressSnapshot done = job_->snapshot();
    qInfo() << "TransferWorker: Job" << job_->id() << "finished" << jobStateToString(result)
            << "files=" << done.filesDone << "/" << done.filesTotal
            << "bytes=" << done.bytesDone << "/" << done.bytesTotal
            << "errors=" << done.errorCount;
    return result;
}

void TransferWorker::scanTotals()
{
    int files = 0;
    qint64 bytes = 0;
    for (const QString &source : job_->request().sources) {
        if (job_->isCancelRequested()) {
            return;
        }
        countTree(source, &files, &bytes);
    }
    if (job_->request().operation == OperationType::Delete) {
        bytes = 0;
    }
    job_->setTotals(files, bytes);
    LOG_VERBOSE() << "TransferWorker: Job" << job_->id() << "scanned" << files << "files," << bytes << "bytes";
}

void TransferWorker::countTree(const QString &path, int *files, qint64 *bytes) const
{
    const FileStat stat = fs_->stat(path);
    if (!stat.exists) {
        return;
    }
    if (stat.isDirectory) {
        const QStringList names = fs_->entryNames(path, nullptr);
        for (const QString &name : names) {
            countTree(PathUtils::join(path, name), files, bytes);
        }
        return;
    }
    ++*files;
    *bytes += stat.size;
}

TransferWorker::Outcome TransferWorker::transferEntry(const QString &source, const QString &target,
                                                      bool removeSource)
{
    if (shouldStop()) {
        return Outcome::Failed;
    }
    takeAnswers();
    if (shouldStop()) {
        return Outcome::Failed;
    }
    job_->setCurrentPath(source);

    const FileStat sourceStat = fs_->stat(source);
    if (!sourceStat.exists) {
        recordError(TransferError::Kind::IO, source, QObject::tr("Source no longer exists: %1").arg(source));
        return Outcome::Failed;
    }

    const FileStat targetStat = fs_->stat(target);
    if (!targetStat.exists) {
        return writeEntry(source, sourceStat, target, removeSource, false);
    }
    const ConflictAction action = resolveConflict(source, sourceStat, target, targetStat, removeSource);
    return applyConflictAction(action, source, sourceStat, target, targetStat, removeSource);
}

TransferWorker::Outcome TransferWorker::applyConflictAction(ConflictAction action,
                                                            const QString &source, const FileStat &sourceStat,
                                                            const QString &target, const FileStat &targetStat,
                                                            bool removeSource)
{
    switch (action) {
    case ConflictAction::Proceed:
        break;
    case ConflictAction::Defer:
        return Outcome::Deferred;
    case ConflictAction::Skip:
        LOG_VERBOSE() << "TransferWorker: Skipping existing" << target;
        excludeTree(source);
        reportProgress();
        return Outcome::Skipped;
    case ConflictAction::Cancel:
        return Outcome::Failed;
    case ConflictAction::Rename: {
        const QString renamed = PathUtils::uniquePathInDir(
            PathUtils::parentPath(target), PathUtils::baseName(target),
            [this](const QString &path) { return fs_->exists(path); });
        LOG_VERBOSE() << "TransferWorker: Writing" << source << "as" << renamed;
        return writeEntry(source, sourceStat, renamed, removeSource, false);
    }
    case ConflictAction::Overwrite:
        if (isSameEntry(source, sourceStat, target, targetStat)) {
            recordError(TransferError::Kind::Conflict, source,
                        QObject::tr("Cannot overwrite %1 with itself").arg(source));
            excludeTree(source);
            return Outcome::Failed;
        }
        if (sourceStat.isDirectory && targetStat.isDirectory) {
            return writeEntry(source, sourceStat, target, removeSource, true);
        }
        if (!(sourceStat.isFile && targetStat.isFile)) {
            // Regular files are replaced atomically by the save file;
            // anything else has to go first.
            QString error;
            if (!removeExisting(target, &error)) {
                recordError(TransferError::Kind::IO, target, error);
                excludeTree(source);
                return Outcome::Failed;
            }
        }
        break;
    }
    return writeEntry(source, sourceStat, target, removeSource, false);
}

TransferWorker::Outcome TransferWorker::writeEntry(const QString &source, const FileStat &sourceStat,
                                                   const QString &destination, bool removeSource, bool merge)
{
    if (removeSource && sameDevice_ && !merge && !fs_->exists(destination)
        && tryRenameInPlace(source, destination)) {
        return Outcome::Done;
    }

    if (sourceStat.isDirectory) {
        return transferDirectory(source, destination, sourceStat, removeSource);
    }

    Outcome outcome = Outcome::Done;
    if (sourceStat.isSymLink) {
        QString error;
        if (!fs_->createSymLink(sourceStat.symLinkTarget, destination, &error)) {
            recordError(TransferError::Kind::IO, destination, error);
            job_->excludeFromTotals(1, 0);
            return Outcome::Failed;
        }
        job_->addFilesDone(1);
    } else if (sourceStat.isFile) {
        outcome = copyFile(source, destination, sourceStat);
    } else {
        recordError(TransferError::Kind::IO, source, QObject::tr("Unsupported file type: %1").arg(source));
        job_->excludeFromTotals(1, 0);
        return Outcome::Failed;
    }

    if (outcome == Outcome::Done && removeSource) {
        QString error;
        if (!fs_->removeFile(source, &error)) {
            recordError(TransferError::Kind::IO, source, error);
            outcome = Outcome::Failed;
        }
    }
    reportProgress();
    return outcome;
}

TransferWorker::Outcome TransferWorker::transferDirectory(const QString &source, const QString &target,
                                                          const FileStat &sourceStat, bool removeSource)
{
    QString error;
    if (!fs_->makeDirectory(target, &error)) {
        recordError(TransferError::Kind::IO, target, error);
        excludeTree(source);
        return Outcome::Failed;
    }

    // Children added after this listing are not part of the job.
    error.clear();
    const QStringList names = fs_->entryNames(source, &error);
    if (!error.isEmpty()) {
        recordError(TransferError::Kind::IO, source, error);
        excludeTree(source);
        return Outcome::Failed;
    }

    Outcome outcome = Outcome::Done;
    for (const QString &name : names) {
        const Outcome child = transferEntry(PathUtils::join(source, name), PathUtils::join(target, name),
                                            removeSource);
        if (child == Outcome::Failed) {
            outcome = Outcome::Failed;
        } else if (child == Outcome::Deferred && outcome != Outcome::Failed) {
            outcome = Outcome::Deferred;
        } else if (child == Outcome::Skipped && outcome == Outcome::Done) {
            outcome = Outcome::Skipped;
        }
        if (cancelled_ || aborted_) {
            return Outcome::Failed;
        }
    }

    if (settings_.preservePermissions && !fs_->setPermissions(target, sourceStat.permissions, &error)) {
        qWarning() << "TransferWorker:" << error;
    }

    // Removed once the deferred children have been answered.
    if (removeSource && outcome == Outcome::Deferred) {
        deferredSourceDirs_.append(source);
    }

    // A skipped or failed child keeps the source directory non-empty.
    if (removeSource && outcome == Outcome::Done) {
        if (!fs_->removeDirectory(source, &error)) {
            recordError(TransferError::Kind::IO, source, error);
            return Outcome::Failed;
        }
    }
    return outcome;
}

TransferWorker::Outcome TransferWorker::copyFile(const QString &source, const QString &target,
                                                 const FileStat &sourceStat)
{
    QString error;
    std::unique_ptr<QIODevice> in = fs_->openForRead(source, &error);
    if (!in) {
        recordError(TransferError::Kind::IO, source, error);
        job_->excludeFromTotals(1, sourceStat.size);
        return Outcome::Failed;
    }
    std::unique_ptr<QSaveFile> out = fs_->openForWrite(target, &error);
    if (!out) {
        recordError(TransferError::Kind::IO, target, error);
        job_->excludeFromTotals(1, sourceStat.size);
        return Outcome::Failed;
    }

    LOG_VERBOSE() << "TransferWorker: Copying" << source << "->" << target;

    QByteArray buffer;
    buffer.resize(settings_.chunkSize);
    qint64 copied = 0;
    while (true) {
        const qint64 read = in->read(buffer.data(), buffer.size());
        if (read < 0) {
            error = QObject::tr("Read error %1: %2").arg(source, in->errorString());
            break;
        }
        if (read == 0) {
            break;
        }
        if (out->write(buffer.constData(), read) != read) {
            error = QObject::tr("Write error %1: %2").arg(target, out->errorString());
            break;
        }
        copied += read;
        job_->addBytesDone(read);
        reportProgress();
    }

    if (error.isEmpty()) {
        if (!out->commit()) {
            error = QObject::tr("Failed to write %1: %2").arg(target, out->errorString());
        }
    } else {
        out->cancelWriting();
    }

    if (!error.isEmpty()) {
        job_->addBytesDone(-copied);
        job_->excludeFromTotals(1, sourceStat.size);
        recordError(TransferError::Kind::IO, target, error);
        return Outcome::Failed;
    }

    if (settings_.preservePermissions) {
        QString permissionError;
        if (!fs_->setPermissions(target, sourceStat.permissions, &permissionError)) {
            qWarning() << "TransferWorker:" << permissionError;
        }
    }

    job_->addFilesDone(1);
    return Outcome::Done;
}

TransferWorker::Outcome TransferWorker::deleteEntry(const QString &path)
{
    if (shouldStop()) {
        return Outcome::Failed;
    }
    job_->setCurrentPath(path);

    const FileStat stat = fs_->stat(path);
    if (!stat.exists) {
        recordError(TransferError::Kind::IO, path, QObject::tr("No such file or directory: %1").arg(path));
        return Outcome::Failed;
    }

    QString error;
    if (stat.isDirectory) {
        const QStringList names = fs_->entryNames(path, &error);
        if (!error.isEmpty()) {
            recordError(TransferError::Kind::IO, path, error);
            excludeTree(path);
            return Outcome::Failed;
        }

        Outcome outcome = Outcome::Done;
        for (const QString &name : names) {
            if (deleteEntry(PathUtils::join(path, name)) == Outcome::Failed) {
                outcome = Outcome::Failed;
            }
            if (cancelled_ || aborted_) {
                return Outcome::Failed;
            }
        }
        if (outcome != Outcome::Done) {
            return outcome;
        }
        if (!fs_->removeDirectory(path, &error)) {
            recordError(TransferError::Kind::IO, path, error);
            return Outcome::Failed;
        }
        reportProgress();
        return Outcome::Done;
    }

    if (!fs_->removeFile(path, &error)) {
        recordError(TransferError::Kind::IO, path, error);
        job_->excludeFromTotals(1, 0);
        return Outcome::Failed;
    }
    LOG_VERBOSE() << "TransferWorker: Deleted" << path;
    job_->addFilesDone(1);
    reportProgress();
    return Outcome::Done;
}

bool TransferWorker::tryRenameInPlace(const QString &source, const QString &target)
{
    int files = 0;
    qint64 bytes = 0;
    countTree(source, &files, &bytes);

    QString error;
    if (!fs_->rename(source, target, &error)) {
        LOG_VERBOSE() << "TransferWorker: Rename failed, copying instead:" << error;
        return false;
    }

    LOG_VERBOSE() << "TransferWorker: Renamed" << source << "->" << target;
    job_->addFilesDone(files);
    job_->addBytesDone(bytes);
    reportProgress();
    return true;
}

TransferWorker::ConflictAction TransferWorker::resolveConflict(const QString &source, const FileStat &sourceStat,
                                                               const QString &target, const FileStat &targetStat,
                                                               bool removeSource)
{
    if (policy_ != ConflictPolicy::AskEachTime) {
        return actionForPolicy(policy_);
    }

    // The item waits for its answer while the rest of the job carries on.
    PendingConflict pending;
    pending.source = source;
    pending.target = target;
    pending.removeSource = removeSource;
    pending.sameDevice = sameDevice_;
    pending.info.sourcePath = source;
    pending.info.targetPath = target;
    pending.info.sourceIsDirectory = sourceStat.isDirectory;
    pending.info.targetIsDirectory = targetStat.isDirectory;
    pending.info.sourceSize = sourceStat.size;
    pending.info.targetSize = targetStat.size;
    pending_.append(pending);
    LOG_VERBOSE() << "TransferWorker: Deferring" << source << "until the conflict on" << target << "is answered";

    askNextQuestion();
    return ConflictAction::Defer;
}

TransferWorker::ConflictAction TransferWorker::actionForPolicy(ConflictPolicy policy)
{
    switch (policy) {
    case ConflictPolicy::Skip:
        return ConflictAction::Skip;
    case ConflictPolicy::Overwrite:
        return ConflictAction::Overwrite;
    case ConflictPolicy::Rename:
        return ConflictAction::Rename;
    case ConflictPolicy::AskEachTime:
        break;
    }
    return ConflictAction::Defer;
}

TransferWorker::ConflictAction TransferWorker::actionForAnswer(ConflictResolution answer)
{
    switch (answer) {
    case ConflictResolution::Skip:
        return ConflictAction::Skip;
    case ConflictResolution::SkipAll:
        policy_ = ConflictPolicy::Skip;
        return ConflictAction::Skip;
    case ConflictResolution::Overwrite:
        return ConflictAction::Overwrite;
    case ConflictResolution::OverwriteAll:
        policy_ = ConflictPolicy::Overwrite;
        return ConflictAction::Overwrite;
    case ConflictResolution::Rename:
        return ConflictAction::Rename;
    case ConflictResolution::RenameAll:
        policy_ = ConflictPolicy::Rename;
        return ConflictAction::Rename;
    case ConflictResolution::Cancel:
        break;
    }
    job_->requestCancel();
    cancelled_ = true;
    return ConflictAction::Cancel;
}

void TransferWorker::askNextQuestion()
{
    if (questionOpen_ || pending_.isEmpty() || cancelled_ || aborted_) {
        return;
    }
    questionOpen_ = true;
    job_->beginConflictQuestion();
    if (callbacks_.conflictRaised) {
        callbacks_.conflictRaised(pending_.first().info);
    }
}

void TransferWorker::takeAnswers()
{
    ConflictResolution answer = ConflictResolution::Skip;
    while (!resolving_ && questionOpen_ && job_->takeResolution(&answer)) {
        resolvePending(answer);
    }
}

void TransferWorker::resolvePending(ConflictResolution answer)
{
    questionOpen_ = false;
    const PendingConflict item = pending_.takeFirst();
    qDebug() << "TransferWorker: Job" << job_->id() << "conflict on" << item.info.targetPath
             << "answered" << conflictResolutionToString(answer);

    resolving_ = true;
    finishPending(item, actionForAnswer(answer));

    // An "All" answer settles the remaining questions without asking.
    while (policy_ != ConflictPolicy::AskEachTime && !pending_.isEmpty() && !shouldStop()) {
        finishPending(pending_.takeFirst(), actionForPolicy(policy_));
    }
    resolving_ = false;

    askNextQuestion();
}

void TransferWorker::finishPending(const PendingConflict &item, ConflictAction action)
{
    if (action == ConflictAction::Cancel || shouldStop()) {
        return;
    }
    job_->setCurrentPath(item.source);

    const FileStat sourceStat = fs_->stat(item.source);
    if (!sourceStat.exists) {
        recordError(TransferError::Kind::IO, item.source,
                    QObject::tr("Source no longer exists: %1").arg(item.source));
        return;
    }
    const FileStat targetStat = fs_->stat(item.target);
    if (!targetStat.exists) {
        action = ConflictAction::Proceed;
    }

    const bool sameDevice = sameDevice_;
    sameDevice_ = item.sameDevice;
    applyConflictAction(action, item.source, sourceStat, item.target, targetStat, item.removeSource);
    sameDevice_ = sameDevice;
}

void TransferWorker::removeDeferredSourceDirs()
{
    // Deepest first, so a parent is only looked at once its children are gone.
    QStringList dirs = deferredSourceDirs_;
    deferredSourceDirs_.clear();
    std::sort(dirs.begin(), dirs.end(), [](const QString &a, const QString &b) { return a.size() > b.size(); });
    for (const QString &dir : dirs) {
        QString error;
        const QStringList names = fs_->entryNames(dir, &error);
        if (!error.isEmpty() || !names.isEmpty()) {
            // Something under it was skipped or failed.
            continue;
        }
        if (!fs_->removeDirectory(dir, &error)) {
            recordError(TransferError::Kind::IO, dir, error);
        }
    }
}

bool TransferWorker::isSameEntry(const QString &source, const FileStat &sourceStat,
                                 const QString &target, const FileStat &targetStat) const
{
    const auto canonical = [this](const QString &path) { return fs_->canonicalPath(path); };
    QString sourcePath = PathUtils::resolveParent(source, canonical);
    // Replacing a file with a link to itself would destroy it.
    if (sourceStat.isSymLink && !targetStat.isSymLink) {
        const QString linked = fs_->canonicalPath(source);
        if (!linked.isEmpty()) {
            sourcePath = linked;
        }
    }
    return sourcePath == PathUtils::resolveParent(target, canonical);
}

bool TransferWorker::removeExisting(const QString &path, QString *error)
{
    const FileStat stat = fs_->stat(path);
    if (!stat.isDirectory) {
        return fs_->removeFile(path, error);
    }

    error->clear();
    const QStringList names = fs_->entryNames(path, error);
    if (!error->isEmpty()) {
        return false;
    }
    for (const QString &name : names) {
        if (!removeExisting(PathUtils::join(path, name), error)) {
            return false;
        }
    }
    return fs_->removeDirectory(path, error);
}

void TransferWorker::excludeTree(const QString &path)
{
    int files = 0;
    qint64 bytes = 0;
    countTree(path, &files, &bytes);
    if (job_->request().operation == OperationType::Delete) {
        bytes = 0;
    }
    job_->excludeFromTotals(files, bytes);
}

bool TransferWorker::shouldStop()
{
    if (cancelled_ || aborted_) {
        return true;
    }
    if (job_->isCancelRequested()) {
        cancelled_ = true;
        qInfo() << "TransferWorker: Job" << job_->id() << "cancelled at checkpoint";
        return true;
    }
    return false;
}

void TransferWorker::recordError(TransferError::Kind kind, const QString &path, const QString &message)
{
    TransferError error;
    error.kind = kind;
    error.path = path;
    error.message = message;
    job_->addError(error);
    qWarning().noquote() << "TransferWorker: Job" << job_->id() << message;

    if (callbacks_.itemFailed) {
        callbacks_.itemFailed(error);
    }

    if (job_->request().errorPolicy == ErrorPolicy::AbortOnFirstError) {
        aborted_ = true;
        qWarning() << "TransferWorker: Job" << job_->id() << "aborting after first error";
    }
}

void TransferWorker::reportProgress()
{
    if (callbacks_.progressChanged) {
        callbacks_.progressChanged();
    }
}
