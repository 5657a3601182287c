#include "consolecontroller.h"
#include "services/errorhandler.h"
#include "services/transferengine.h"

#include "utils/logging.h"

#include <QDebug>
#include <QFile>
#include <QIODevice>
#include <QSocketNotifier>

ConsoleController::ConsoleController(TransferEngine *engine, QIODevice *input, QIODevice *output,
                                     QObject *parent)
    : QObject(parent)
    , engine_(engine)
    , errorHandler_(new ErrorHandler(this))
    , input_(input)
    , out_(output)
{
    auto *file = qobject_cast<QFile *>(input_);
    if (file && file->handle() >= 0) {
        inputNotifier_ = new QSocketNotifier(file->handle(), QSocketNotifier::Read, this);
        inputNotifier_->setEnabled(false);
        connect(inputNotifier_, &QSocketNotifier::activated,
                this, &ConsoleController::onInputReady);
    } else if (input_->isSequential()) {
        connect(input_, &QIODevice::readyRead, this, &ConsoleController::onInputReady);
        connect(input_, &QIODevice::readChannelFinished, this, &ConsoleController::onInputReady);
    }

    // Engine signals arrive from worker threads and are queued to us.
    connect(engine_, &TransferEngine::jobProgress,
            this, &ConsoleController::onJobProgress);
    connect(engine_, &TransferEngine::conflictResolutionNeeded,
            this, &ConsoleController::onConflict);
    connect(engine_, &TransferEngine::jobFinished,
            this, &ConsoleController::onJobFinished);
    connect(engine_, &TransferEngine::itemFailed,
            this, [this](quint64 jobId, const TransferError &error) {
        if (isOurJob(jobId)) {
            errorHandler_->handleTransferError(jobId, error);
        }
    });

    connect(errorHandler_, &ErrorHandler::statusMessage,
            this, &ConsoleController::onStatusMessage);
}

bool ConsoleController::start(const TransferRequest &request)
{
    ValidationError error;
    job_ = engine_->submit(request, &error);
    if (!job_.isValid()) {
        errorHandler_->handleValidationError(error);
        exitCode_ = ExitValidationError;
        return false;
    }

    out_ << tr("%1 job %2: %n item(s)", nullptr, static_cast<int>(request.sources.size()))
                .arg(QString::fromLatin1(operationTypeToString(request.operation)))
                .arg(job_.id())
         << Qt::endl;
    return true;
}

int ConsoleController::exitCodeForState(JobState state)
{
    switch (state) {
    case JobState::Completed:
        return ExitCompleted;
    case JobState::Cancelled:
        return ExitCancelled;
    case JobState::Failed:
    case JobState::Queued:
    case JobState::Running:
        break;
    }
    return ExitFailed;
}

bool ConsoleController::parseAnswer(const QString &answer, ConflictResolution *resolution)
{
    const QString text = answer.trimmed();
    if (text.size() != 1) {
        return false;
    }

    switch (text.at(0).unicode()) {
    case 's': *resolution = ConflictResolution::Skip; return true;
    case 'S': *resolution = ConflictResolution::SkipAll; return true;
    case 'o': *resolution = ConflictResolution::Overwrite; return true;
    case 'O': *resolution = ConflictResolution::OverwriteAll; return true;
    case 'r': *resolution = ConflictResolution::Rename; return true;
    case 'R': *resolution = ConflictResolution::RenameAll; return true;
    case 'c':
    case 'C': *resolution = ConflictResolution::Cancel; return true;
    default:
        return false;
    }
}

void ConsoleController::onJobProgress(const ProgressSnapshot &snapshot)
{
    if (!isOurJob(snapshot.jobId) || snapshot.isFinished()) {
        return;
    }

    const int percent = snapshot.percent();
    if (percent == lastPercent_ && snapshot.filesDone == lastFilesDone_) {
        return;
    }
    lastPercent_ = percent;
    lastFilesDone_ = snapshot.filesDone;

    out_ << QString("[%1%] %2/%3 files  %4")
                .arg(percent, 3)
                .arg(snapshot.filesDone)
                .arg(snapshot.filesTotal)
                .arg(snapshot.currentPath)
         << Qt::endl;
}

void ConsoleController::onConflict(quint64 jobId, const ConflictInfo &info)
{
    if (!isOurJob(jobId)) {
        return;
    }

    out_ << tr("%1 already exists.").arg(info.targetPath) << Qt::endl;
    if (!info.sourceIsDirectory && !info.targetIsDirectory) {
        out_ << tr("  source: %1 bytes, existing: %2 bytes")
                    .arg(info.sourceSize)
                    .arg(info.targetSize)
             << Qt::endl;
    }

    awaitingAnswer_ = true;
    printPrompt();
    waitForInput();
}

void ConsoleController::onInputReady()
{
    if (!awaitingAnswer_) {
        return;
    }
    if (inputNotifier_) {
        inputNotifier_->setEnabled(false);
    }

    if (!inputNotifier_ && input_->isSequential() && !input_->canReadLine() && input_->isOpen()
        && !input_->atEnd()) {
        // Partial line; wait for the rest.
        return;
    }

    ConflictResolution resolution = ConflictResolution::Cancel;
    const QByteArray line = input_->readLine();
    if (line.isEmpty()) {
        // End of input: nobody left to ask.
        qInfo() << "ConsoleController: No answer on input, cancelling job" << job_.id();
    } else if (!parseAnswer(QString::fromLocal8Bit(line), &resolution)) {
        printPrompt();
        waitForInput();
        return;
    }

    awaitingAnswer_ = false;
    LOG_VERBOSE() << "ConsoleController: Answering" << conflictResolutionToString(resolution);
    if (!engine_->respondToConflict(job_, resolution)) {
        qWarning() << "ConsoleController: Job" << job_.id() << "no longer waiting for an answer";
    }
}

void ConsoleController::printPrompt()
{
    out_ << tr("[s]kip, [o]verwrite, [r]ename (upper case for all), [c]ancel? ") << Qt::flush;
}

void ConsoleController::waitForInput()
{
    // Lines already buffered never wake the notifier again.
    if (input_->canReadLine()) {
        QMetaObject::invokeMethod(this, &ConsoleController::onInputReady, Qt::QueuedConnection);
    } else if (inputNotifier_) {
        inputNotifier_->setEnabled(true);
    } else if (!input_->isSequential()) {
        // Everything there is to read is already there.
        QMetaObject::invokeMethod(this, &ConsoleController::onInputReady, Qt::QueuedConnection);
    }
    // Other sequential devices report new lines through readyRead().
}

void ConsoleController::onJobFinished(quint64 jobId, JobState state)
{
    if (!isOurJob(jobId)) {
        return;
    }

    awaitingAnswer_ = false;
    if (inputNotifier_) {
        inputNotifier_->setEnabled(false);
    }

    const ProgressSnapshot snapshot = engine_->progress(job_);
    out_ << tr("%1: %2/%3 files, %4/%5 bytes")
                .arg(QString::fromLatin1(jobStateToString(state)))
                .arg(snapshot.filesDone)
                .arg(snapshot.filesTotal)
                .arg(snapshot.bytesDone)
                .arg(snapshot.bytesTotal)
         << Qt::endl;

    if (state == JobState::Failed) {
        errorHandler_->handleJobFailed(jobId, static_cast<int>(engine_->errors(job_).size()));
    }

    exitCode_ = exitCodeForState(state);
    emit finished(exitCode_);
}

void ConsoleController::onStatusMessage(const QString &message, int timeout)
{
    Q_UNUSED(timeout)
    out_ << message << Qt::endl;
}
