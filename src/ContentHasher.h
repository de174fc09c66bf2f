#pragma once

#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#include <functional>

#include "CoreTypes.h"

struct HashFailure {
    QString path;
    OperationError error;
};

struct HashBatchResult {
    QVector<HashResult> results;
    QVector<HashFailure> failures;
};

struct JobProgress;

/**
 * @brief Memory-bounded content fingerprinting of files.
 *
 * Full hashes stream the file through SHA-256 in 64 KiB chunks. Quick hashes
 * only read the first chunk (and the last one for large files) and are used
 * to discard files that cannot be identical before paying for a full hash.
 */
class ContentHasher
{
public:
    using ProgressCallback = std::function<void(int completed, int total)>;
    using JobProgressCallback = std::function<void(const JobProgress &progress)>;

    ContentHasher() = default;

    QString algorithm() const;
    qint64 chunkSize() const;

    bool fullHash(const QString &path, HashResult *result, OperationError *error = nullptr) const;
    bool quickHash(const QString &path, QString *hash, OperationError *error = nullptr) const;
    bool areFilesIdentical(const QString &left, const QString &right, OperationError *error = nullptr) const;

    HashBatchResult hashBatch(const QStringList &paths, const ProgressCallback &onProgress = nullptr) const;
    QVector<DuplicateGroup> twoPhaseDuplicates(const QStringList &paths,
                                               const JobProgressCallback &onProgress = nullptr) const;
};
