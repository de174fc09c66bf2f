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

#include "TrashWorker.h"

#include "DeletionCoordinator.h"
#include "LoggingUtils.h"

namespace {
struct TrashWorkerConstants {
    static constexpr int emptyCount = 0;
    static constexpr int notCancelled = 0;
    static constexpr int cancelled = 1;
};
} // namespace

/**
 * @brief Creates a worker trashing paths, or every path but one when keepIndex is set.
 * @param coordinator Coordinator doing the moves; must outlive the worker.
 * @param paths Paths to trash, or the members of a duplicate group.
 * @param keepIndex Index of the member to keep, or noKeepIndex to trash every path.
 * @param parent Parent QObject for ownership.
 */
TrashWorker::TrashWorker(const DeletionCoordinator &coordinator, const QStringList &paths, int keepIndex,
                         QObject *parent)
    : QObject(parent)
    , m_coordinator(coordinator)
    , m_paths(paths)
    , m_keepIndex(keepIndex)
{
}

void TrashWorker::cancel()
{
    m_cancelled.storeRelaxed(TrashWorkerConstants::cancelled);
}

bool TrashWorker::isCancelled() const
{
    return m_cancelled.loadRelaxed() != TrashWorkerConstants::notCancelled;
}

void TrashWorker::start()
{
    QVariantMap result;
    result.insert("ok", false);

    if (m_paths.size() <= TrashWorkerConstants::emptyCount) {
        result.insert("error", tr("Nothing to delete"));
        emit finished(result);
        return;
    }

    QStringList targets = m_paths;
    QString keptPath;
    if (m_keepIndex != noKeepIndex) {
        OperationError error;
        if (!DeletionCoordinator::validateKeepIndex(m_paths, m_keepIndex, &error)) {
            result.insert("error", error.message);
            emit finished(result);
            return;
        }
        keptPath = m_paths.at(m_keepIndex);
        targets = DeletionCoordinator::pathsToTrash(m_paths, m_keepIndex);
        result.insert("kept", keptPath);
    }

    TrashJob job(m_coordinator, targets, keptPath);
    emit progress(job.completed(), job.total());
    while (!job.atEnd()) {
        if (isCancelled()) {
            job.cancel();
            break;
        }
        job.step();
        emit progress(job.completed(), job.total());
    }

    const TrashBatchResult &batch = job.result();
    result.insert(toVariantMap(batch));
    if (!batch.failed.isEmpty()) {
        result.insert("error", batch.failed.first().error.message);
    }
    const bool cancelled = job.isCancelled();
    if (cancelled) {
        result.insert("cancelled", true);
        qCInfo(lcTrash) << "Trash batch cancelled after" << batch.totalProcessed << "of" << job.total();
    }
    result.insert("ok", batch.failed.isEmpty() && !cancelled);

    emit finished(result);
}
