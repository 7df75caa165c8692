#include "retrypolicy.h"

#include <QObject>

RetryDecision RetryPolicy::decide(ErrorClass errorClass, int attempt) const
{
    RetryDecision decision;

    if (errorClass == ErrorClass::DiskFull) {
        decision.reason = QObject::tr("Disk full, cannot retry");
        return decision;
    }

    if (attempt >= maxAttempts(errorClass)) {
        decision.reason = QObject::tr("Max retries exceeded");
        return decision;
    }

    decision.retry = true;
    switch (errorClass) {
    case ErrorClass::Timeout:
        decision.delayMs = limits_.timeoutBaseDelayMs * attempt;
        break;
    case ErrorClass::Connection:
        decision.delayMs = limits_.connectionBaseDelayMs * attempt;
        break;
    case ErrorClass::DiskFull:
    case ErrorClass::Other:
        decision.delayMs = limits_.otherDelayMs;
        break;
    }
    return decision;
}

int RetryPolicy::maxAttempts(ErrorClass errorClass) const
{
    switch (errorClass) {
    case ErrorClass::Timeout:
        return limits_.timeoutMaxAttempts;
    case ErrorClass::Connection:
        return limits_.connectionMaxAttempts;
    case ErrorClass::DiskFull:
        return 1;
    case ErrorClass::Other:
        return limits_.otherMaxAttempts;
    }
    return 1;
}

ErrorClass RetryPolicy::classify(int exitCode, const QString &errorText)
{
    const QString text = errorText.toLower();

    if (text.contains(QLatin1String("timeout")) || text.contains(QLatin1String("timed out"))) {
        return ErrorClass::Timeout;
    }
    if (text.contains(QLatin1String("connection")) || text.contains(QLatin1String("network"))) {
        return ErrorClass::Connection;
    }
    if (text.contains(QLatin1String("disk full")) || text.contains(QLatin1String("no space"))) {
        return ErrorClass::DiskFull;
    }

    switch (exitCode) {
    case 30:  // timeout in data send/receive
    case 35:  // timeout waiting for daemon connection
        return ErrorClass::Timeout;
    case 10:  // error in socket I/O
    case 12:  // error in rsync protocol data stream
    case 255: // ssh could not connect
        return ErrorClass::Connection;
    default:
        return ErrorClass::Other;
    }
}
