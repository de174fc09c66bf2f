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

#include "DeletionCoordinator.h"

#include <QCoreApplication>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QVariantList>

#include "LoggingUtils.h"
#include "PathUtils.h"

namespace {

struct DeletionConstants {
    static constexpr int sizeBase = 1024;
    static constexpr int sizeDecimals = 2;
};

QString tr(const char *text)
{
    return QCoreApplication::translate("DeletionCoordinator", text);
}

bool pathExists(const QFileInfo &info)
{
    return info.exists() || info.isSymLink();
}

} // namespace

bool SystemTrashBackend::moveToTrash(const QString &path, QString *error)
{
    if (QFile::moveToTrash(path)) {
        return true;
    }
    if (error) {
        *error = tr("Failed to move to trash");
    }
    return false;
}

QVariantMap toVariantMap(const TrashResult &result)
{
    QVariantMap map;
    map.insert("path", result.path);
    map.insert("success", result.success);
    if (!result.success) {
        map.insert("error", result.error.message);
        map.insert("code", errorCodeName(result.error.code));
    }
    return map;
}

QVariantMap toVariantMap(const TrashBatchResult &result)
{
    QVariantList failed;
    for (const TrashResult &failure : result.failed) {
        QVariantMap entry;
        entry.insert("path", failure.path);
        entry.insert("error", failure.error.message);
        failed.append(entry);
    }
    QVariantMap map;
    map.insert("successful", result.successful);
    map.insert("failed", failed);
    map.insert("totalProcessed", result.totalProcessed);
    return map;
}

QVariantMap toVariantMap(const TrashFileInfo &info)
{
    QVariantMap map;
    map.insert("path", info.path);
    map.insert("exists", info.exists);
    if (info.exists) {
        map.insert("name", info.name);
        map.insert("size", info.size);
        map.insert("isDirectory", info.isDirectory);
    }
    return map;
}

/**
 * @brief Creates a batch over paths.
 * @param protectedPath Path that must never be trashed, typically the kept copy of a group.
 */
TrashJob::TrashJob(const DeletionCoordinator &coordinator, const QStringList &paths, const QString &protectedPath)
    : m_coordinator(coordinator)
    , m_paths(paths)
    , m_protectedPath(protectedPath.isEmpty() ? QString() : PathUtils::normalizePath(protectedPath))
{
}

bool TrashJob::atEnd() const
{
    return m_cancelled || m_next >= m_paths.size();
}

TrashResult TrashJob::step()
{
    TrashResult outcome;
    if (atEnd()) {
        return outcome;
    }

    const QString &path = m_paths.at(m_next);
    m_next += 1;
    if (!m_protectedPath.isEmpty() && PathUtils::normalizePath(path) == m_protectedPath) {
        outcome.path = path;
        setError(&outcome.error, ErrorCode::InvalidArgument, tr("Path is the copy to keep"));
    } else {
        outcome = m_coordinator.trashFile(path);
    }

    if (outcome.success) {
        m_result.successful.append(path);
    } else {
        m_result.failed.append(outcome);
    }
    m_result.totalProcessed = m_next;
    return outcome;
}

void TrashJob::cancel()
{
    m_cancelled = true;
}

bool TrashJob::isCancelled() const
{
    return m_cancelled;
}

int TrashJob::total() const
{
    return m_paths.size();
}

int TrashJob::completed() const
{
    return m_next;
}

const TrashBatchResult &TrashJob::result() const
{
    return m_result;
}

DeletionCoordinator::DeletionCoordinator(TrashBackend &backend)
    : m_backend(backend)
{
}

/**
 * @brief Moves one file to the trash.
 * @return Outcome with FileNotFound when the path is missing, IoError when the trash refuses it.
 */
TrashResult DeletionCoordinator::trashFile(const QString &path) const
{
    TrashResult result;
    result.path = path;
    if (path.isEmpty()) {
        setError(&result.error, ErrorCode::InvalidArgument, tr("Path is empty"));
        return result;
    }
    if (!pathExists(QFileInfo(path))) {
        setError(&result.error, ErrorCode::FileNotFound, tr("File not found"));
        return result;
    }
    return moveToTrash(path);
}

TrashResult DeletionCoordinator::trashDirectory(const QString &path) const
{
    TrashResult result;
    result.path = path;
    const QFileInfo info(path);
    if (!info.exists()) {
        setError(&result.error, ErrorCode::FileNotFound, tr("Directory not found"));
        return result;
    }
    if (!info.isDir()) {
        setError(&result.error, ErrorCode::InvalidArgument, tr("Not a directory"));
        return result;
    }
    return moveToTrash(path);
}

/**
 * @brief Trashes every path in order, continuing past failures.
 * @param paths Paths to trash.
 * @param onProgress Optional callback receiving (completed, total) after each path.
 */
TrashBatchResult DeletionCoordinator::trashFiles(const QStringList &paths, const ProgressCallback &onProgress) const
{
    TrashJob job(*this, paths);
    while (!job.atEnd()) {
        job.step();
        if (onProgress) {
            onProgress(job.completed(), job.total());
        }
    }
    const TrashBatchResult &result = job.result();
    qCInfo(lcTrash) << "Trashed" << result.successful.size() << "of" << paths.size() << "paths,"
                    << result.failed.size() << "failed";
    return result;
}

/**
 * @brief Trashes every member of a duplicate group except the one to keep.
 *
 * The keep index is checked before any file system access. A path equal to
 * the kept one (the same file listed twice) is reported as failed and left in place.
 *
 * @param files Group members.
 * @param keepIndex Index of the member to keep, in [0, files.size()).
 * @param result Output batch result.
 * @param onProgress Optional callback receiving (completed, total).
 * @param error Optional error output; InvalidArgument for a bad keep index.
 * @return False only when the request was rejected.
 */
bool DeletionCoordinator::trashDuplicates(const QStringList &files, int keepIndex, TrashBatchResult *result,
                                          const ProgressCallback &onProgress, OperationError *error) const
{
    if (!validateKeepIndex(files, keepIndex, error)) {
        return false;
    }

    TrashJob job(*this, pathsToTrash(files, keepIndex), files.at(keepIndex));
    while (!job.atEnd()) {
        job.step();
        if (onProgress) {
            onProgress(job.completed(), job.total());
        }
    }
    qCInfo(lcTrash) << "Kept" << files.at(keepIndex) << "and trashed" << job.result().successful.size()
                    << "duplicates," << job.result().failed.size() << "failed";
    if (result) {
        *result = job.result();
    }
    return true;
}

bool DeletionCoordinator::validateKeepIndex(const QStringList &files, int keepIndex, OperationError *error)
{
    if (keepIndex < 0 || keepIndex >= files.size()) {
        setError(error, ErrorCode::InvalidArgument, tr("Invalid keepIndex"));
        return false;
    }
    return true;
}

QStringList DeletionCoordinator::pathsToTrash(const QStringList &files, int keepIndex)
{
    QStringList paths;
    for (int i = 0; i < files.size(); ++i) {
        if (i != keepIndex) {
            paths.append(files.at(i));
        }
    }
    return paths;
}

/**
 * @brief Checks whether a path exists and is readable and writable. Never mutates anything.
 */
bool DeletionCoordinator::canTrash(const QString &path, QString *reason) const
{
    const QFileInfo info(path);
    if (!info.exists()) {
        if (reason) {
            *reason = tr("File not found");
        }
        return false;
    }
    if (!info.isReadable() || !info.isWritable()) {
        if (reason) {
            *reason = tr("Permission denied");
        }
        return false;
    }
    return true;
}

TrashFileInfo DeletionCoordinator::getFileInfo(const QString &path) const
{
    TrashFileInfo result;
    result.path = path;
    const QFileInfo info(path);
    result.exists = info.exists();
    if (!result.exists) {
        return result;
    }
    result.name = info.fileName();
    result.isDirectory = info.isDir();
    result.size = result.isDirectory ? calculateTotalSize({path}) : info.size();
    return result;
}

/**
 * @brief Sums the sizes of files, descending into directories. Missing paths count as zero.
 */
qint64 DeletionCoordinator::calculateTotalSize(const QStringList &paths)
{
    qint64 total = 0;
    for (const QString &path : paths) {
        const QFileInfo info(path);
        if (info.isFile()) {
            total += info.size();
        } else if (info.isDir()) {
            QDirIterator it(path, QDir::Files | QDir::Hidden | QDir::System | QDir::NoSymLinks,
                            QDirIterator::Subdirectories);
            while (it.hasNext()) {
                it.next();
                total += it.fileInfo().size();
            }
        }
    }
    return total;
}

/**
 * @brief Formats a byte count with binary units, at most two decimals ("1.5 KB").
 */
QString DeletionCoordinator::formatSize(qint64 bytes)
{
    static const char *const units[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr int unitCount = sizeof(units) / sizeof(units[0]);
    if (bytes <= 0) {
        return QStringLiteral("0 B");
    }

    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= DeletionConstants::sizeBase && unit < unitCount - 1) {
        value /= DeletionConstants::sizeBase;
        unit += 1;
    }

    QString number = QString::number(value, 'f', DeletionConstants::sizeDecimals);
    while (number.endsWith(QLatin1Char('0'))) {
        number.chop(1);
    }
    if (number.endsWith(QLatin1Char('.'))) {
        number.chop(1);
    }
    return number + QLatin1Char(' ') + QLatin1String(units[unit]);
}

TrashResult DeletionCoordinator::moveToTrash(const QString &path) const
{
    TrashResult result;
    result.path = path;
    QString message;
    if (!m_backend.moveToTrash(path, &message)) {
        setError(&result.error, ErrorCode::IoError, message.isEmpty() ? tr("Failed to move to trash") : message);
        qCWarning(lcTrash) << "Failed to trash" << path << message;
        return result;
    }
    result.success = true;
    qCDebug(lcTrash) << "Moved to trash:" << path;
    return result;
}
