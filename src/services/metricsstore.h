/**
 * @file metricsstore.h
 * @brief Rolling history of finished transfers and derived statistics.
 */

#ifndef METRICSSTORE_H
#define METRICSSTORE_H

#include <QDateTime>
#include <QList>
#include <QObject>
#include <QString>

#include "models/transfertask.h"
#include "utils/rollingstats.h"

/**
 * @brief History entry written once when a task reaches a terminal state.
 */
struct TransferRecord {
    TaskId taskId = 0;
    QString path;            ///< Subject path, or a batch description
    TaskKind kind = TaskKind::SingleFile;
    int fileCount = 1;
    TransferDirection direction = TransferDirection::Upload;
    QDateTime startedAt;
    QDateTime finishedAt;
    TaskStatus status = TaskStatus::Completed;
    qint64 bytesTransferred = 0;
    QString message;

    [[nodiscard]] qint64 durationMs() const
    {
        if (!startedAt.isValid() || !finishedAt.isValid()) {
            return 0;
        }
        return startedAt.msecsTo(finishedAt);
    }
};

/**
 * @brief Aggregate statistics over the recorded transfers.
 */
struct PoolMetrics {
    int recorded = 0;          ///< Records currently kept in history
    int completed = 0;         ///< Lifetime count of completed transfers
    int failed = 0;            ///< Lifetime count of failed transfers
    int cancelled = 0;         ///< Lifetime count of cancelled transfers
    double successRate = 0.0;  ///< Percent of kept records that completed
    double averageSpeed = 0.0; ///< Smoothed bytes per second of completed transfers
    qint64 totalBytes = 0;     ///< Lifetime bytes of completed transfers
};

/**
 * @brief Owns the transfer history; read by status and reporting code.
 *
 * Records are appended by the task pool only and are never modified once
 * stored. The oldest records are dropped beyond the history limit.
 *
 * @par Example usage:
 * @code
 * MetricsStore *store = new MetricsStore(this);
 * store->append(record);
 * PoolMetrics m = store->metrics();
 * qInfo() << "success rate" << m.successRate;
 * @endcode
 */
class MetricsStore : public QObject
{
    Q_OBJECT

public:
    static constexpr int DefaultHistoryLimit = 1000;
    static constexpr double SpeedSmoothingFactor = 0.1;

    explicit MetricsStore(QObject *parent = nullptr);
    ~MetricsStore() override;

    /**
     * @brief Appends a terminal-state record.
     * @param record The record; records with a non-terminal status are ignored.
     */
    void append(const TransferRecord &record);

    [[nodiscard]] const QList<TransferRecord> &history() const { return history_; }
    [[nodiscard]] PoolMetrics metrics() const;

    /// @brief Most recent records, newest last.
    [[nodiscard]] QList<TransferRecord> recent(int count) const;

    void setHistoryLimit(int limit);
    [[nodiscard]] int historyLimit() const { return historyLimit_; }

    /// @brief Drops history and counters.
    void clear();

signals:
    void recordAppended(const TransferRecord &record);

private:
    QList<TransferRecord> history_;
    int historyLimit_ = DefaultHistoryLimit;
    int completed_ = 0;
    int failed_ = 0;
    int cancelled_ = 0;
    qint64 totalBytes_ = 0;
    SmoothedAverage speed_{SpeedSmoothingFactor};
};

Q_DECLARE_METATYPE(TransferRecord)

#endif // METRICSSTORE_H
