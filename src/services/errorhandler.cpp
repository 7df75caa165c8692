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

    emit statusMessage(message, timeoutForSeverity(severity));
}

void ErrorHandler::handleRejectedRequest(SubmitError error, const QString &message)
{
    QString title;
    switch (error) {
    case SubmitError::NotConfigured:
        title = tr("Not configured");
        break;
    case SubmitError::NotFound:
        title = tr("Not found");
        break;
    case SubmitError::SizeExceeded:
        title = tr("Too large");
        break;
    case SubmitError::Validation:
    case SubmitError::None:
        title = tr("Invalid request");
        break;
    }

    handleError(ErrorCategory::Validation, ErrorSeverity::Warning, title, message);
}

void ErrorHandler::handleTaskFailed(TaskId id, const QString &message)
{
    handleError(ErrorCategory::Transfer,
                ErrorSeverity::Warning,
                tr("Task %1 failed").arg(id),
                message);
}

void ErrorHandler::handleConnectionError(const QString &message)
{
    handleError(ErrorCategory::Connection,
                ErrorSeverity::Critical,
                tr("Connection Error"),
                message);
}

void ErrorHandler::handleConfigErrors(const QStringList &errors)
{
    for (const QString &error : errors) {
        handleError(ErrorCategory::Validation,
                    ErrorSeverity::Critical,
                    tr("Configuration error"),
                    error);
    }
}

int ErrorHandler::countFor(ErrorCategory category) const
{
    return categoryCounts_[static_cast<int>(category)];
}

void ErrorHandler::resetCounters()
{
    errorCount_ = 0;
    criticalCount_ = 0;
    for (int &count : categoryCounts_) {
        count = 0;
    }
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
        ++criticalCount_;
        break;
    }

    if (severity != ErrorSeverity::Info) {
        ++errorCount_;
        ++categoryCounts_[static_cast<int>(category)];
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
    case ErrorCategory::Transfer:
        return QStringLiteral("Transfer");
    case ErrorCategory::Connection:
        return QStringLiteral("Connection");
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
