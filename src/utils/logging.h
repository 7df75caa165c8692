/**
 * @file logging.h
 * @brief Runtime switch for chatty diagnostics.
 *
 * Regular progress goes through qInfo()/qWarning() with a "Component:"
 * prefix. LOG_VERBOSE() is reserved for per-line rsync output, command
 * lines and admission decisions, which are only useful when debugging.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>
#include <QtGlobal>

namespace rsyncq {

/// Set from --verbose or the RSYNCQ_VERBOSE environment variable
inline bool verboseLogging = false;

/// Enables verbose output when requested on the command line or when
/// RSYNCQ_VERBOSE is set to a non-zero value.
inline bool initVerboseLogging(bool requested)
{
    bool envOk = false;
    const int envValue = qEnvironmentVariableIntValue("RSYNCQ_VERBOSE", &envOk);
    verboseLogging = requested || (envOk && envValue != 0);
    return verboseLogging;
}

} // namespace rsyncq

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (rsyncq::verboseLogging) qDebug()

#endif // LOGGING_H
