/**
 * @file statusreport.h
 * @brief Plain-text rendering of pool status and transfer history.
 */

#ifndef STATUSREPORT_H
#define STATUSREPORT_H

#include <QList>
#include <QString>

#include "models/taskpool.h"

/**
 * @brief Formats status snapshots for terminal output.
 */
class StatusReport
{
public:
    /**
     * @brief Full report: counters, metrics, parameters and active tasks.
     */
    [[nodiscard]] static QString format(const PoolStatus &status);

    /// One line per record, e.g. "  [completed] upload src/a.cpp 1.2 KB in 340 ms".
    [[nodiscard]] static QString formatHistory(const QList<TransferRecord> &records);

    [[nodiscard]] static QString formatRecord(const TransferRecord &record);
    [[nodiscard]] static QString formatTask(const TransferTask &task);
    [[nodiscard]] static QString formatParams(const AdaptiveParams &params);
};

#endif // STATUSREPORT_H
