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

#include "DuplicateScanWorker.h"

#include <QVariantList>

#include "ContentHasher.h"
#include "DuplicateGrouper.h"
#include "HashJobs.h"
#include "LoggingUtils.h"

namespace {
struct DuplicateScanWorkerConstants {
    static constexpr int notCancelled = 0;
    static constexpr int cancelled = 1;
};
} // namespace

DuplicateScanWorker::DuplicateScanWorker(const ContentHasher &hasher, const QStringList &paths, QObject *parent)
    : QObject(parent)
    , m_hasher(hasher)
    , m_paths(paths)
{
}

void DuplicateScanWorker::cancel()
{
    m_cancelled.storeRelaxed(DuplicateScanWorkerConstants::cancelled);
}

bool DuplicateScanWorker::isCancelled() const
{
    return m_cancelled.loadRelaxed() != DuplicateScanWorkerConstants::notCancelled;
}

void DuplicateScanWorker::start()
{
    TwoPhaseDuplicateJob job(m_hasher, m_paths);
    while (!job.atEnd()) {
        if (isCancelled()) {
            job.cancel();
            break;
        }
        const JobProgress step = job.step();
        emit progress(jobPhaseName(step.phase), step.completed, step.total, step.currentPath);
    }

    QVariantMap result;
    const bool cancelled = job.isCancelled();
    result.insert("ok", !cancelled);
    if (cancelled) {
        result.insert("cancelled", true);
        result.insert("error", tr("Duplicate scan cancelled"));
        qCInfo(lcHasher) << "Duplicate scan cancelled in phase" << jobPhaseName(job.phase());
        emit finished(result);
        return;
    }

    const QVector<DuplicateGroup> groups = job.groups();
    QVariantList groupList;
    for (const DuplicateGroup &group : groups) {
        groupList.append(toVariantMap(group));
    }
    QVariantList failures;
    for (const HashFailure &failure : job.failures()) {
        QVariantMap entry;
        entry.insert("path", failure.path);
        entry.insert("error", failure.error.message);
        failures.append(entry);
    }

    const DuplicateSpace space = DuplicateGrouper::calculateDuplicateSpace(groups);
    result.insert("groups", groupList);
    result.insert("failures", failures);
    result.insert("filesScanned", job.fileCount());
    result.insert("candidates", job.candidateCount());
    result.insert("totalWastedBytes", space.totalWastedBytes);
    result.insert("totalDuplicateFiles", space.totalDuplicateFiles);
    emit finished(result);
}
