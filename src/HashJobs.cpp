/************************************************************************\

    PhotoDedup - Duplicate photo detection core
    Copyright (C) 2026 Jango73

    This program is free software: you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation, either version 3 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program.  If not, see <https://www.gnu.org/licenses/>.

\************************************************************************/

#include "HashJobs.h"

#include <QSet>

#include "DuplicateGrouper.h"
#include "LoggingUtils.h"
#include "PathUtils.h"

QString jobPhaseName(JobPhase phase)
{
    switch (phase) {
    case JobPhase::QuickScan:
        return QStringLiteral("Quick scan");
    case JobPhase::FullHash:
        return QStringLiteral("Full hash");
    case JobPhase::Done:
        return QStringLiteral("Done");
    }
    return QString();
}

HashBatchJob::HashBatchJob(const ContentHasher &hasher, const QStringList &paths)
    : m_hasher(hasher)
    , m_paths(paths)
{
}

bool HashBatchJob::atEnd() const
{
    return m_cancelled || m_next >= m_paths.size();
}

/**
 * @brief Hashes the next file of the batch.
 * @return Progress after this file; completed never decreases.
 */
JobProgress HashBatchJob::step()
{
    JobProgress progress;
    progress.phase = JobPhase::FullHash;
    progress.total = m_paths.size();
    if (atEnd()) {
        progress.completed = m_next;
        return progress;
    }

    const QString &path = m_paths.at(m_next);
    HashResult result;
    OperationError error;
    if (m_hasher.fullHash(path, &result, &error)) {
        m_result.results.append(result);
    } else {
        m_result.failures.append({path, error});
    }

    m_next += 1;
    progress.completed = m_next;
    progress.currentPath = path;
    return progress;
}

void HashBatchJob::cancel()
{
    m_cancelled = true;
}

bool HashBatchJob::isCancelled() const
{
    return m_cancelled;
}

int HashBatchJob::total() const
{
    return m_paths.size();
}

int HashBatchJob::completed() const
{
    return m_next;
}

const HashBatchResult &HashBatchJob::result() const
{
    return m_result;
}

/**
 * @brief Prepares a search over paths; a file listed twice, under any spelling, is searched once.
 */
TwoPhaseDuplicateJob::TwoPhaseDuplicateJob(const ContentHasher &hasher, const QStringList &paths)
    : m_hasher(hasher)
{
    QSet<QString> seen;
    for (const QString &path : paths) {
        const QString normalized = PathUtils::normalizePath(path);
        if (normalized.isEmpty() || seen.contains(normalized)) {
            continue;
        }
        seen.insert(normalized);
        m_paths.append(normalized);
    }
    if (m_paths.isEmpty()) {
        m_phase = JobPhase::Done;
    }
}

bool TwoPhaseDuplicateJob::atEnd() const
{
    return m_cancelled || m_phase == JobPhase::Done;
}

JobProgress TwoPhaseDuplicateJob::step()
{
    if (atEnd()) {
        JobProgress progress;
        progress.phase = JobPhase::Done;
        return progress;
    }
    if (m_phase == JobPhase::QuickScan) {
        return stepQuickScan();
    }
    return stepFullHash();
}

JobProgress TwoPhaseDuplicateJob::stepQuickScan()
{
    const QString &path = m_paths.at(m_next);
    QString quick;
    OperationError error;
    if (m_hasher.quickHash(path, &quick, &error)) {
        m_quickHashByPath.insert(path, quick);
        m_bucketSizes[quick] += 1;
    } else {
        m_failures.append({path, error});
        qCDebug(lcHasher) << "Skipping unreadable file in quick scan:" << path << error.message;
    }

    m_next += 1;
    JobProgress progress;
    progress.phase = JobPhase::QuickScan;
    progress.completed = m_next;
    progress.total = m_paths.size();
    progress.currentPath = path;

    if (m_next >= m_paths.size()) {
        beginFullHashPhase();
    }
    return progress;
}

/**
 * @brief Selects the candidates sharing a quick hash, keeping input order.
 */
void TwoPhaseDuplicateJob::beginFullHashPhase()
{
    m_candidates.clear();
    const QStringList &paths = m_paths;
    for (const QString &path : paths) {
        const auto it = m_quickHashByPath.constFind(path);
        if (it == m_quickHashByPath.constEnd()) {
            continue;
        }
        if (m_bucketSizes.value(it.value()) > 1) {
            m_candidates.append(path);
        }
    }
    qCInfo(lcHasher) << "Quick scan done:" << m_paths.size() << "files," << m_candidates.size() << "candidates";

    m_next = 0;
    m_phase = m_candidates.isEmpty() ? JobPhase::Done : JobPhase::FullHash;
}

JobProgress TwoPhaseDuplicateJob::stepFullHash()
{
    const QString &path = m_candidates.at(m_next);
    HashResult result;
    OperationError error;
    if (m_hasher.fullHash(path, &result, &error)) {
        m_fullHashes.append(result);
    } else {
        m_failures.append({path, error});
        qCDebug(lcHasher) << "Skipping unreadable file in full hash:" << path << error.message;
    }

    m_next += 1;
    JobProgress progress;
    progress.phase = JobPhase::FullHash;
    progress.completed = m_next;
    progress.total = m_candidates.size();
    progress.currentPath = path;

    if (m_next >= m_candidates.size()) {
        m_phase = JobPhase::Done;
    }
    return progress;
}

void TwoPhaseDuplicateJob::cancel()
{
    m_cancelled = true;
}

bool TwoPhaseDuplicateJob::isCancelled() const
{
    return m_cancelled;
}

JobPhase TwoPhaseDuplicateJob::phase() const
{
    return m_phase;
}

int TwoPhaseDuplicateJob::fileCount() const
{
    return m_paths.size();
}

int TwoPhaseDuplicateJob::candidateCount() const
{
    return m_candidates.size();
}

QStringList TwoPhaseDuplicateJob::candidates() const
{
    return m_candidates;
}

const QVector<HashResult> &TwoPhaseDuplicateJob::fullHashes() const
{
    return m_fullHashes;
}

const QVector<HashFailure> &TwoPhaseDuplicateJob::failures() const
{
    return m_failures;
}

QVector<DuplicateGroup> TwoPhaseDuplicateJob::groups() const
{
    return DuplicateGrouper::findDuplicates(m_fullHashes);
}
