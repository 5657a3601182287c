/**
 * @file consolecontroller.h
 * @brief Command line front end driving a single transfer job.
 */

#ifndef CONSOLECONTROLLER_H
#define CONSOLECONTROLLER_H

#include <QObject>
#include <QTextStream>

#include "models/transferjob.h"
#include "models/transferrequest.h"

class QIODevice;
class QSocketNotifier;
class TransferEngine;
class ErrorHandler;

/**
 * @brief Submits one request, reports its progress and answers conflicts.
 *
 * Plays the part of the pane UI for the twinfm executable: it owns the
 * user-facing text, asks conflict questions on the input device and turns
 * the job's terminal state into a process exit code.
 *
 * Answers are read only once a full line is available (a socket notifier
 * watches file descriptors such as stdin), so the event loop keeps printing
 * progress while a question is open.
 */
class ConsoleController : public QObject
{
    Q_OBJECT

public:
    enum ExitCode {
        ExitCompleted = 0,
        ExitFailed = 1,
        ExitCancelled = 2,
        ExitValidationError = 3,
        ExitUsageError = 64
    };

    /**
     * @brief Constructs a controller.
     * @param engine Engine that runs the job. Not owned.
     * @param input Device answers are read from (usually stdin).
     * @param output Device progress and prompts are written to (usually stdout).
     * @param parent Optional parent QObject for memory management.
     */
    ConsoleController(TransferEngine *engine, QIODevice *input, QIODevice *output,
                      QObject *parent = nullptr);

    /**
     * @brief Submits @p request.
     * @return False if the engine rejected it; exitCode() is then set.
     */
    bool start(const TransferRequest &request);

    [[nodiscard]] int exitCode() const { return exitCode_; }
    [[nodiscard]] JobHandle job() const { return job_; }

    [[nodiscard]] static int exitCodeForState(JobState state);

    /**
     * @brief Maps a prompt answer to a resolution.
     *
     * Lower case letters answer once, upper case ones for the rest of the
     * job: s/S skip, o/O overwrite, r/R rename, c cancel.
     * @return False if @p answer is not recognized.
     */
    static bool parseAnswer(const QString &answer, ConflictResolution *resolution);

signals:
    /**
     * @brief Emitted once the job has reached a terminal state.
     */
    void finished(int exitCode);

private slots:
    void onJobProgress(const ProgressSnapshot &snapshot);
    void onConflict(quint64 jobId, const ConflictInfo &info);
    void onJobFinished(quint64 jobId, JobState state);
    void onStatusMessage(const QString &message, int timeout);
    void onInputReady();

private:
    void printPrompt();
    void waitForInput();

    [[nodiscard]] bool isOurJob(quint64 jobId) const { return job_.isValid() && job_.id() == jobId; }

    TransferEngine *engine_;
    ErrorHandler *errorHandler_;
    QIODevice *input_;
    QSocketNotifier *inputNotifier_ = nullptr;
    QTextStream out_;

    JobHandle job_;
    int exitCode_ = ExitCompleted;
    int lastPercent_ = -1;
    int lastFilesDone_ = -1;
    bool awaitingAnswer_ = false;
};

#endif // CONSOLECONTROLLER_H
