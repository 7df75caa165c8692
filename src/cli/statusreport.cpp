#include "statusreport.h"
#include "utils/formatutils.h"

#include <QStringList>

using rsyncq::formatDuration;
using rsyncq::formatFileSize;
using rsyncq::formatSpeed;

QString StatusReport::formatParams(const AdaptiveParams &params)
{
    return QStringLiteral("concurrency %1, compression %2, timeout %3, batch size %4")
        .arg(params.maxConcurrency)
        .arg(params.compressionEnabled ? QStringLiteral("on") : QStringLiteral("off"))
        .arg(formatDuration(params.timeoutMs))
        .arg(params.batchSize);
}

QString StatusReport::formatTask(const TransferTask &task)
{
    QString line = QStringLiteral("  #%1 %2 %3 [%4]")
        .arg(task.id)
        .arg(QLatin1String(directionToString(task.direction)),
             task.displayName(),
             QLatin1String(taskStatusToString(task.status)));

    if (task.attempts > 1) {
        line += QStringLiteral(" attempt %1").arg(task.attempts);
    }
    if (task.awaitingRetry) {
        line += QStringLiteral(" (waiting to retry)");
    }
    return line;
}

QString StatusReport::formatRecord(const TransferRecord &record)
{
    QString line = QStringLiteral("  [%1] %2 %3")
        .arg(QLatin1String(taskStatusToString(record.status)),
             QLatin1String(directionToString(record.direction)),
             record.path);

    if (record.status == TaskStatus::Completed) {
        line += QStringLiteral(" %1 in %2")
            .arg(formatFileSize(record.bytesTransferred), formatDuration(record.durationMs()));
    } else if (!record.message.isEmpty()) {
        line += QStringLiteral(": ") + record.message;
    }
    return line;
}

QString StatusReport::formatHistory(const QList<TransferRecord> &records)
{
    QStringList lines;
    for (const TransferRecord &record : records) {
        lines << formatRecord(record);
    }
    return lines.join('\n');
}

QString StatusReport::format(const PoolStatus &status)
{
    QStringList lines;
    lines << QStringLiteral("Transfer status");
    lines << QStringLiteral("  Running:        %1").arg(status.running);
    lines << QStringLiteral("  Pending:        %1").arg(status.pending);
    lines << QStringLiteral("  Completed:      %1").arg(status.completed);
    lines << QStringLiteral("  Failed:         %1").arg(status.failed);
    lines << QStringLiteral("  Cancelled:      %1").arg(status.cancelled);
    lines << QStringLiteral("  Success rate:   %1%").arg(status.metrics.successRate, 0, 'f', 1);
    lines << QStringLiteral("  Average speed:  %1").arg(formatSpeed(status.metrics.averageSpeed));
    lines << QStringLiteral("  Transferred:    %1").arg(formatFileSize(status.metrics.totalBytes));
    lines << QStringLiteral("  Parameters:     %1").arg(formatParams(status.params));

    if (!status.activeTasks.isEmpty()) {
        lines << QStringLiteral("Active tasks");
        for (const TransferTask &task : status.activeTasks) {
            lines << formatTask(task);
        }
    }
    return lines.join('\n');
}
