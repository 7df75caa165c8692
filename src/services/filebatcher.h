/**
 * @file filebatcher.h
 * @brief Partitions the files of one priority tier into bounded batches.
 */

#ifndef FILEBATCHER_H
#define FILEBATCHER_H

#include <QList>
#include <QString>
#include <QStringList>

#include "fileclassifier.h"

/**
 * @brief A candidate file with the size known at classification time.
 */
struct BatchFile {
    QString path;
    qint64 size = 0;
};

/**
 * @brief A materialized group of files sharing one priority tier.
 *
 * Formed once and never re-split: the batch becomes the subject of exactly
 * one executor invocation.
 */
struct FileBatch {
    FileCategory category = FileCategory::Small;
    QList<BatchFile> files;
    qint64 totalBytes = 0;

    [[nodiscard]] int fileCount() const { return files.size(); }
    [[nodiscard]] QStringList paths() const;
};

/**
 * @brief Splits a list of files into batches bounded by count and bytes.
 *
 * Files are consumed in input order. A batch is closed before adding a file
 * that would push it past either cap; a single file larger than the byte cap
 * still forms a batch of its own.
 */
class FileBatcher
{
public:
    /// Safety cap on the cumulative size of one batch (50 MiB).
    static constexpr qint64 MaxBatchBytes = 50LL * 1024 * 1024;

    /**
     * @brief Partitions @p files into batches.
     * @param files Files of a single batchable category, in submission order.
     * @param category Category recorded on every produced batch.
     * @param batchSize Maximum file count per batch (values below 1 act as 1).
     * @param maxBytes Maximum cumulative size per batch.
     * @return Ordered batches; empty when @p files is empty.
     */
    [[nodiscard]] static QList<FileBatch> partition(const QList<BatchFile> &files,
                                                    FileCategory category,
                                                    int batchSize,
                                                    qint64 maxBytes = MaxBatchBytes);
};

#endif // FILEBATCHER_H
