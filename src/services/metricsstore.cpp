#include "metricsstore.h"

#include <QDebug>
#include <algorithm>

MetricsStore::MetricsStore(QObject *parent)
    : QObject(parent)
{
}

MetricsStore::~MetricsStore() = default;

void MetricsStore::append(const TransferRecord &record)
{
    if (!isTerminalStatus(record.status)) {
        qWarning() << "MetricsStore: ignoring record for task" << record.taskId
                   << "in non-terminal state" << taskStatusToString(record.status);
        return;
    }

    switch (record.status) {
    case TaskStatus::Completed: {
        ++completed_;
        totalBytes_ += record.bytesTransferred;
        const qint64 ms = record.durationMs();
        const double speed = ms > 0
            ? static_cast<double>(record.bytesTransferred) * 1000.0 / static_cast<double>(ms)
            : 0.0;
        speed_.addSample(speed);
        break;
    }
    case TaskStatus::Failed:
        ++failed_;
        break;
    case TaskStatus::Cancelled:
        ++cancelled_;
        break;
    case TaskStatus::Pending:
    case TaskStatus::Running:
        break;
    }

    history_.append(record);
    while (history_.size() > historyLimit_) {
        history_.removeFirst();
    }

    emit recordAppended(record);
}

PoolMetrics MetricsStore::metrics() const
{
    PoolMetrics m;
    m.recorded = history_.size();
    m.completed = completed_;
    m.failed = failed_;
    m.cancelled = cancelled_;
    m.totalBytes = totalBytes_;
    m.averageSpeed = speed_.value();

    if (!history_.isEmpty()) {
        const auto successful = std::count_if(history_.cbegin(), history_.cend(),
            [](const TransferRecord &r) { return r.status == TaskStatus::Completed; });
        m.successRate = 100.0 * static_cast<double>(successful) / static_cast<double>(history_.size());
    }
    return m;
}

QList<TransferRecord> MetricsStore::recent(int count) const
{
    if (count <= 0) {
        return {};
    }
    if (count >= history_.size()) {
        return history_;
    }
    return history_.mid(history_.size() - count);
}

void MetricsStore::setHistoryLimit(int limit)
{
    historyLimit_ = std::max(limit, 1);
    while (history_.size() > historyLimit_) {
        history_.removeFirst();
    }
}

void MetricsStore::clear()
{
    history_.clear();
    completed_ = 0;
    failed_ = 0;
    cancelled_ = 0;
    totalBytes_ = 0;
    speed_.clear();
}
