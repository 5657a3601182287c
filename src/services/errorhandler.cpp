#include "errorhandler.h"

#include <QDebug>

ErrorHandler::ErrorHandler(QObject *parent)
    : QObject(parent)
{
}

void ErrorHandler::handleError(ErrorCategory category,
                               ErrorSeverity severity,
                               const QString &title,
                               const QString &details)
{
    logError(category, severity, title, details);

    QString message = title;
    if (!details.isEmpty() && details != title) {
        message = QString("%1: %2").arg(title, details);
    }

    // Always show on the status line
    emit statusMessage(message, timeoutForSeverity(severity));

    if (severity == ErrorSeverity::Critical) {
        emit criticalError(title, details.isEmpty() ? title : details);
    }
}

void ErrorHandler::handleValidationError(const ValidationError &error)
{
    if (!error.isError()) {
        return;
    }
    handleError(ErrorCategory::Validation,
                ErrorSeverity::Critical,
                tr("Cannot start operation"),
                error.message);
}

void ErrorHandler::handleTransferError(quint64 jobId, const TransferError &error)
{
    const ErrorCategory category = error.kind == TransferError::Kind::Conflict
        ? ErrorCategory::Conflict
        : ErrorCategory::IO;
    handleError(category,
                ErrorSeverity::Warning,
                tr("Job %1").arg(jobId),
                error.message);
}

void ErrorHandler::handleJobFailed(quint64 jobId, int errorCount)
{
    handleError(ErrorCategory::IO,
                ErrorSeverity::Warning,
                tr("Job %1 failed").arg(jobId),
                tr("%n item(s) could not be processed", nullptr, errorCount));
}

void ErrorHandler::logError(ErrorCategory category,
                            ErrorSeverity severity,
                            const QString &title,
                            const QString &details)
{
    QString logMessage = QString("[%1/%2] %3")
        .arg(categoryToString(category),
             severityToString(severity),
             title);

    if (!details.isEmpty() && details != title) {
        logMessage += QString(": %1").arg(details);
    }

    switch (severity) {
    case ErrorSeverity::Info:
        qInfo().noquote() << logMessage;
        break;
    case ErrorSeverity::Warning:
        qWarning().noquote() << logMessage;
        break;
    case ErrorSeverity::Critical:
        qCritical().noquote() << logMessage;
        break;
    }

    emit errorLogged(category, severity, title, details);
}

int ErrorHandler::timeoutForSeverity(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return 3000;
    case ErrorSeverity::Warning:
        return 5000;
    case ErrorSeverity::Critical:
        return 0;     // Stays until replaced
    }
    return 5000;
}

QString ErrorHandler::categoryToString(ErrorCategory category)
{
    switch (category) {
    case ErrorCategory::Validation:
        return QStringLiteral("Validation");
    case ErrorCategory::Conflict:
        return QStringLiteral("Conflict");
    case ErrorCategory::IO:
        return QStringLiteral("IO");
    case ErrorCategory::System:
        return QStringLiteral("System");
    }
    return QStringLiteral("Unknown");
}

QString ErrorHandler::severityToString(ErrorSeverity severity)
{
    switch (severity) {
    case ErrorSeverity::Info:
        return QStringLiteral("INFO");
    case ErrorSeverity::Warning:
        return QStringLiteral("WARN");
    case ErrorSeverity::Critical:
        return QStringLiteral("CRIT");
    }
    return QStringLiteral("UNKNOWN");
}
