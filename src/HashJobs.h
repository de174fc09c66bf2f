#pragma once

#include <QHash>
#include <QString>
#include <QStringList>
#include <QVector>

#include "ContentHasher.h"
#include "CoreTypes.h"

enum class JobPhase {
    QuickScan,
    FullHash,
    Done
};

QString jobPhaseName(JobPhase phase);

struct JobProgress {
    JobPhase phase = JobPhase::Done;
    int completed = 0;
    int total = 0;
    QString currentPath;
};

/**
 * @brief Cooperative full-hash batch: each step() hashes exactly one file.
 *
 * The caller drives the loop, so it decides when to yield, report progress
 * or stop. Failures are collected per path and never end the batch early.
 */
class HashBatchJob
{
public:
    HashBatchJob(const ContentHasher &hasher, const QStringList &paths);

    bool atEnd() const;
    JobProgress step();
    void cancel();
    bool isCancelled() const;

    int total() const;
    int completed() const;
    const HashBatchResult &result() const;

private:
    const ContentHasher &m_hasher;
    QStringList m_paths;
    int m_next = 0;
    bool m_cancelled = false;
    HashBatchResult m_result;
};

/**
 * @brief Cooperative two-phase duplicate search.
 *
 * Phase one quick-hashes every path and buckets them. Phase two fully hashes
 * only the paths whose bucket has more than one member. Files that cannot be
 * read in either phase are skipped and reported in failures().
 */
class TwoPhaseDuplicateJob
{
public:
    TwoPhaseDuplicateJob(const ContentHasher &hasher, const QStringList &paths);

    bool atEnd() const;
    JobProgress step();
    void cancel();
    bool isCancelled() const;

    JobPhase phase() const;
    int fileCount() const;
    int candidateCount() const;
    QStringList candidates() const;
    const QVector<HashResult> &fullHashes() const;
    const QVector<HashFailure> &failures() const;
    QVector<DuplicateGroup> groups() const;

private:
    JobProgress stepQuickScan();
    JobProgress stepFullHash();
    void beginFullHashPhase();

    const ContentHasher &m_hasher;
    QStringList m_paths;
    JobPhase m_phase = JobPhase::QuickScan;
    int m_next = 0;
    bool m_cancelled = false;
    QHash<QString, QString> m_quickHashByPath;
    QHash<QString, int> m_bucketSizes;
    QStringList m_candidates;
    QVector<HashResult> m_fullHashes;
    QVector<HashFailure> m_failures;
};
