#include "filebatcher.h"

#include <algorithm>

QStringList FileBatch::paths() const
{
    QStringList result;
    result.reserve(files.size());
    for (const BatchFile &file : files) {
        result.append(file.path);
    }
    return result;
}

QList<FileBatch> FileBatcher::partition(const QList<BatchFile> &files,
                                        FileCategory category,
                                        int batchSize,
                                        qint64 maxBytes)
{
    QList<FileBatch> batches;
    const int countCap = std::max(batchSize, 1);

    FileBatch current;
    current.category = category;

    for (const BatchFile &file : files) {
        const bool countExceeded = current.files.size() + 1 > countCap;
        const bool sizeExceeded = current.totalBytes + file.size > maxBytes;

        if (!current.files.isEmpty() && (countExceeded || sizeExceeded)) {
            batches.append(current);
            current = FileBatch();
            current.category = category;
        }

        current.files.append(file);
        current.totalBytes += file.size;
    }

    if (!current.files.isEmpty()) {
        batches.append(current);
    }

    return batches;
}
