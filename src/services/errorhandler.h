/**
 * @file errorhandler.h
 * @brief Centralized error handling service for consistent error reporting.
 *
 * This service standardizes how transfer errors are categorized, logged and
 * handed to the presentation layer, whichever front end is attached.
 */

#ifndef ERRORHANDLER_H
#define ERRORHANDLER_H

#include <QObject>
#include <QString>

#include "models/transfererror.h"

/**
 * @brief Categories of errors for appropriate handling.
 */
enum class ErrorCategory {
    Validation,  ///< Request rejected at submission
    Conflict,    ///< Destination conflict that could not be resolved
    IO,          ///< Read, write, delete or rename failure
    System       ///< General system/application errors
};

/**
 * @brief Severity levels determining how errors are displayed.
 */
enum class ErrorSeverity {
    Info,      ///< Informational - status line only, short timeout
    Warning,   ///< Warning - status line, longer timeout
    Critical   ///< Critical - status line + criticalError() for a prompt
};

/**
 * @brief Centralized error handling service.
 *
 * ErrorHandler provides consistent error reporting across the application:
 * - Categorizes errors for appropriate handling
 * - Maps severities to status line timeouts
 * - Forwards critical errors to whoever presents them
 * - Logs errors for debugging
 *
 * @par Example usage:
 * @code
 * ErrorHandler *handler = new ErrorHandler(this);
 *
 * connect(engine, &TransferEngine::itemFailed,
 *         handler, &ErrorHandler::handleTransferError);
 *
 * ValidationError error;
 * if (!engine->submit(request, &error).isValid()) {
 *     handler->handleValidationError(error);
 * }
 * @endcode
 */
class ErrorHandler : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructs an error handler.
     * @param parent Optional parent QObject for memory management.
     */
    explicit ErrorHandler(QObject *parent = nullptr);

    /**
     * @brief Destructor.
     */
    ~ErrorHandler() override = default;

    /**
     * @brief Handles an error with specified category and severity.
     * @param category The error category.
     * @param severity The error severity.
     * @param title Short error title/summary.
     * @param details Detailed error message.
     */
    void handleError(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details = QString());

public slots:
    /// @name Convenience Methods for Common Error Sources
    /// @{

    /**
     * @brief Handles a rejected submission (critical severity).
     * @param error The validation error returned by TransferEngine::submit().
     */
    void handleValidationError(const ValidationError &error);

    /**
     * @brief Handles a per-item failure of a running job (warning severity).
     * @param jobId The job the item belongs to.
     * @param error The recorded error.
     */
    void handleTransferError(quint64 jobId, const TransferError &error);

    /**
     * @brief Handles a job that ended in the Failed state (warning severity).
     * @param jobId The failed job.
     * @param errorCount Number of errors the job recorded.
     */
    void handleJobFailed(quint64 jobId, int errorCount);
    /// @}

signals:
    /**
     * @brief Emitted to display a status line message.
     * @param message The message text.
     * @param timeout Display timeout in milliseconds (0 for no timeout).
     */
    void statusMessage(const QString &message, int timeout);

    /**
     * @brief Emitted for critical errors that need the user's attention.
     * @param title The error title.
     * @param message The message to present.
     */
    void criticalError(const QString &title, const QString &message);

    /**
     * @brief Emitted when an error is logged (for debugging/monitoring).
     */
    void errorLogged(ErrorCategory category,
                     ErrorSeverity severity,
                     const QString &title,
                     const QString &details);

private:
    void logError(ErrorCategory category,
                  ErrorSeverity severity,
                  const QString &title,
                  const QString &details);

    /**
     * @brief Gets the status line timeout for a severity level.
     * @param severity The error severity.
     * @return Timeout in milliseconds.
     */
    [[nodiscard]] static int timeoutForSeverity(ErrorSeverity severity);

    [[nodiscard]] static QString categoryToString(ErrorCategory category);
    [[nodiscard]] static QString severityToString(ErrorSeverity severity);
};

#endif // ERRORHANDLER_H
