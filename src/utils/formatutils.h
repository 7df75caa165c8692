/**
 * @file formatutils.h
 * @brief Human-readable formatting of sizes, speeds and durations.
 */

#ifndef FORMATUTILS_H
#define FORMATUTILS_H

#include <QString>
#include <QtGlobal>

namespace rsyncq {

/// Formats a byte count as "12.3 MB" (1024-based units, one decimal).
[[nodiscard]] inline QString formatFileSize(qint64 bytes)
{
    if (bytes <= 0) {
        return QStringLiteral("0 B");
    }

    static const char *units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        ++unit;
    }
    return QStringLiteral("%1 %2").arg(size, 0, 'f', 1).arg(QLatin1String(units[unit]));
}

/// Formats a transfer rate in bytes per second as "1.5 MB/s".
[[nodiscard]] inline QString formatSpeed(double bytesPerSecond)
{
    return formatFileSize(static_cast<qint64>(bytesPerSecond)) + QStringLiteral("/s");
}

/// Formats milliseconds as "850 ms", "12.4 s" or "3m 05s".
[[nodiscard]] inline QString formatDuration(qint64 ms)
{
    if (ms < 1000) {
        return QStringLiteral("%1 ms").arg(ms);
    }
    if (ms < 60000) {
        return QStringLiteral("%1 s").arg(static_cast<double>(ms) / 1000.0, 0, 'f', 1);
    }
    const qint64 seconds = ms / 1000;
    return QStringLiteral("%1m %2s").arg(seconds / 60).arg(seconds % 60, 2, 10, QLatin1Char('0'));
}

} // namespace rsyncq

#endif // FORMATUTILS_H
