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

#include "LibraryCommands.h"

#include <QCoreApplication>
#include <QVariantList>

#include "DeletionCoordinator.h"
#include "DirectoryScanner.h"
#include "DuplicateGrouper.h"
#include "HashJobs.h"
#include "LibraryIndexer.h"
#include "LoggingUtils.h"
#include "PathUtils.h"
#include "ScanLock.h"

namespace {

QString tr(const char *text)
{
    return QCoreApplication::translate("LibraryCommands", text);
}

QVariantList groupList(const QVector<DuplicateGroup> &groups)
{
    QVariantList list;
    for (const DuplicateGroup &group : groups) {
        list.append(toVariantMap(group));
    }
    return list;
}

QVariantList failureList(const QVector<HashFailure> &failures)
{
    QVariantList list;
    for (const HashFailure &failure : failures) {
        QVariantMap entry;
        entry.insert("path", failure.path);
        entry.insert("error", failure.error.message);
        list.append(entry);
    }
    return list;
}

QVariantMap duplicateReport(const QVector<DuplicateGroup> &groups)
{
    const DuplicateSpace space = DuplicateGrouper::calculateDuplicateSpace(groups);
    QVariantMap data;
    data.insert("groups", groupList(groups));
    data.insert("totalGroups", space.totalGroups);
    data.insert("totalDuplicateFiles", space.totalDuplicateFiles);
    data.insert("totalWastedBytes", space.totalWastedBytes);
    return data;
}

} // namespace

LibraryCommands::LibraryCommands(DirectoryScanner &scanner, const ContentHasher &hasher, DuplicateGrouper &grouper,
                                 const DeletionCoordinator &deletion, LibraryIndexer &indexer, RootScanRegistry &scans)
    : m_scanner(scanner)
    , m_hasher(hasher)
    , m_grouper(grouper)
    , m_deletion(deletion)
    , m_indexer(indexer)
    , m_scans(scans)
{
}

QVariantMap LibraryCommands::success(const QVariant &data)
{
    QVariantMap response;
    response.insert("success", true);
    if (data.isValid()) {
        response.insert("data", data);
    }
    return response;
}

QVariantMap LibraryCommands::failure(const OperationError &error)
{
    QVariantMap response;
    response.insert("success", false);
    response.insert("error", error.message);
    response.insert("code", errorCodeName(error.code));
    qCInfo(lcCommands) << "Command failed:" << errorCodeName(error.code) << error.message;
    return response;
}

QVariantMap LibraryCommands::setRoot(const QString &path)
{
    QString reason;
    if (!m_scanner.setRoot(path, &reason)) {
        OperationError error;
        setError(&error, ErrorCode::InvalidDirectory, reason);
        return failure(error);
    }
    return success(toVariantMap(m_scanner.rootInfo()));
}

QVariantMap LibraryCommands::useTemporaryRoot(const QString &path)
{
    QString reason;
    if (!m_scanner.useTemporaryRoot(path, &reason)) {
        OperationError error;
        setError(&error, ErrorCode::InvalidDirectory, reason);
        return failure(error);
    }
    return success(toVariantMap(m_scanner.rootInfo()));
}

QVariantMap LibraryCommands::getRoot() const
{
    if (m_scanner.rootDirectory().isEmpty()) {
        return success();
    }
    return success(toVariantMap(m_scanner.rootInfo()));
}

QVariantMap LibraryCommands::clearRoot()
{
    m_scanner.clearRoot();
    return success(true);
}

QVariantMap LibraryCommands::scanDirectory(const QString &path, bool recursive)
{
    ScanStats stats;
    OperationError error;
    if (!m_scanner.scan(path, recursive, &stats, &error)) {
        return failure(error);
    }
    return success(toVariantMap(stats));
}

QVariantMap LibraryCommands::getDirectoryContents(const QString &path) const
{
    OperationError error;
    const QVector<FileEntry> entries = m_scanner.getDirectoryContents(path, &error);
    if (error.code != ErrorCode::None) {
        return failure(error);
    }
    QVariantList list;
    for (const FileEntry &entry : entries) {
        list.append(toVariantMap(entry));
    }
    return success(list);
}

QVariantMap LibraryCommands::startWatching()
{
    if (!m_scanner.watch()) {
        OperationError error;
        setError(&error, ErrorCode::InvalidDirectory, tr("No accessible root directory to watch"));
        return failure(error);
    }
    return success(true);
}

QVariantMap LibraryCommands::stopWatching()
{
    m_scanner.unwatch();
    return success(true);
}

QVariantMap LibraryCommands::isWatching() const
{
    return success(m_scanner.isWatching());
}

QVariantMap LibraryCommands::hashFile(const QString &path) const
{
    OperationError error;
    if (!checkAccess({path}, &error)) {
        return failure(error);
    }
    HashResult result;
    if (!m_hasher.fullHash(path, &result, &error)) {
        return failure(error);
    }
    return success(toVariantMap(result));
}

QVariantMap LibraryCommands::hashFiles(const QStringList &paths) const
{
    OperationError error;
    if (!checkAccess(paths, &error)) {
        return failure(error);
    }
    const HashBatchResult batch = m_hasher.hashBatch(paths);
    QVariantList results;
    for (const HashResult &result : batch.results) {
        results.append(toVariantMap(result));
    }
    QVariantMap data;
    data.insert("results", results);
    data.insert("errors", failureList(batch.failures));
    return success(data);
}

/**
 * @brief Runs the two-phase search over explicit paths, holding the root scan token.
 */
QVariantMap LibraryCommands::findDuplicates(const QStringList &paths)
{
    OperationError error;
    if (!checkAccess(paths, &error)) {
        return failure(error);
    }
    ScanToken token = m_scans.tryAcquire(m_scanner.rootDirectory(), &error);
    if (!token.isValid()) {
        return failure(error);
    }
    return success(duplicateReport(m_hasher.twoPhaseDuplicates(paths)));
}

/**
 * @brief Enumerates the images of a directory and runs the two-phase search on them.
 * @param directory Directory inside the root. The scan holds the root's token.
 * @param recursive Whether to include subdirectories.
 * @param onProgress Optional callback receiving every job step.
 */
QVariantMap LibraryCommands::scanDuplicates(const QString &directory, bool recursive,
                                            const ContentHasher::JobProgressCallback &onProgress)
{
    OperationError error;
    if (!checkAccess({directory}, &error)) {
        return failure(error);
    }
    ScanToken token = m_scans.tryAcquire(m_scanner.rootDirectory(), &error);
    if (!token.isValid()) {
        return failure(error);
    }

    const QStringList files = m_scanner.enumerateFiles(directory, recursive, true, &error);
    if (error.code != ErrorCode::None) {
        return failure(error);
    }

    TwoPhaseDuplicateJob job(m_hasher, files);
    while (!job.atEnd()) {
        const JobProgress progress = job.step();
        if (onProgress) {
            onProgress(progress);
        }
    }

    QVariantMap data = duplicateReport(job.groups());
    data.insert("filesScanned", job.fileCount());
    data.insert("candidates", job.candidateCount());
    data.insert("errors", failureList(job.failures()));
    return success(data);
}

QVariantMap LibraryCommands::indexLibrary()
{
    OperationError error;
    const QString root = m_scanner.rootDirectory();
    if (root.isEmpty()) {
        setError(&error, ErrorCode::InvalidDirectory, tr("No root directory configured"));
        return failure(error);
    }
    ScanToken token = m_scans.tryAcquire(root, &error);
    if (!token.isValid()) {
        return failure(error);
    }
    IndexStats stats;
    if (!m_indexer.indexRoot(root, &stats, nullptr, &error)) {
        return failure(error);
    }
    return success(toVariantMap(stats));
}

QVariantMap LibraryCommands::duplicateStats() const
{
    OperationError error;
    const DuplicateStats stats = m_grouper.getStats(&error);
    if (error.code != ErrorCode::None) {
        return failure(error);
    }
    return success(toVariantMap(stats));
}

QVariantMap LibraryCommands::duplicateGroups(int limit, int offset) const
{
    OperationError error;
    const QVector<DuplicateGroupRecord> groups = m_grouper.allGroups(limit, offset, &error);
    if (error.code != ErrorCode::None) {
        return failure(error);
    }
    QVariantList list;
    for (const DuplicateGroupRecord &group : groups) {
        QVariantMap entry = toVariantMap(group);
        QStringList paths;
        const QVector<ImageRecord> members = m_grouper.members(group.id, &error);
        for (const ImageRecord &member : members) {
            paths.append(member.path);
        }
        entry.insert("files", paths);
        list.append(entry);
    }
    if (error.code != ErrorCode::None) {
        return failure(error);
    }
    return success(list);
}

QVariantMap LibraryCommands::rebuildDuplicates()
{
    OperationError error;
    ScanToken token;
    const QString root = m_scanner.rootDirectory();
    if (!root.isEmpty()) {
        token = m_scans.tryAcquire(root, &error);
        if (!token.isValid()) {
            return failure(error);
        }
    }
    RebuildResult result;
    if (!m_grouper.rebuildAll(&result, &error)) {
        return failure(error);
    }
    QVariantMap data;
    data.insert("groupsCreated", result.groupsCreated);
    data.insert("itemsCreated", result.itemsCreated);
    return success(data);
}

QVariantMap LibraryCommands::trashFile(const QString &path)
{
    OperationError error;
    if (!checkAccess({path}, &error)) {
        return failure(error);
    }
    const TrashResult result = m_deletion.trashFile(path);
    if (!result.success) {
        return failure(result.error);
    }
    forgetTrashed({path});
    return success(toVariantMap(result));
}

QVariantMap LibraryCommands::trashFiles(const QStringList &paths)
{
    OperationError error;
    if (!checkAccess(paths, &error)) {
        return failure(error);
    }
    const TrashBatchResult result = m_deletion.trashFiles(paths);
    forgetTrashed(result.successful);
    return success(toVariantMap(result));
}

QVariantMap LibraryCommands::trashDuplicates(const QStringList &files, int keepIndex)
{
    OperationError error;
    if (!DeletionCoordinator::validateKeepIndex(files, keepIndex, &error) || !checkAccess(files, &error)) {
        return failure(error);
    }
    TrashBatchResult result;
    if (!m_deletion.trashDuplicates(files, keepIndex, &result, nullptr, &error)) {
        return failure(error);
    }
    forgetTrashed(result.successful);
    return success(toVariantMap(result));
}

QVariantMap LibraryCommands::canTrash(const QString &path) const
{
    OperationError error;
    if (!checkAccess({path}, &error)) {
        return failure(error);
    }
    QString reason;
    const bool allowed = m_deletion.canTrash(path, &reason);
    QVariantMap data;
    data.insert("canTrash", allowed);
    if (!allowed) {
        data.insert("reason", reason);
    }
    return success(data);
}

QVariantMap LibraryCommands::trashFileInfo(const QString &path) const
{
    OperationError error;
    if (!checkAccess({path}, &error)) {
        return failure(error);
    }
    return success(toVariantMap(m_deletion.getFileInfo(path)));
}

/**
 * @brief Requires a configured root containing every path.
 */
bool LibraryCommands::checkAccess(const QStringList &paths, OperationError *error) const
{
    const QString root = m_scanner.rootDirectory();
    if (root.isEmpty()) {
        setError(error, ErrorCode::AccessDenied, tr("No root directory configured"));
        return false;
    }
    if (!PathUtils::areAllWithin(paths, root)) {
        setError(error, ErrorCode::AccessDenied, tr("Access denied: path outside the root directory"));
        qCWarning(lcCommands) << "Rejected paths outside root" << root << paths;
        return false;
    }
    return true;
}

/**
 * @brief Drops library records of trashed files so duplicate groups stay consistent.
 */
void LibraryCommands::forgetTrashed(const QStringList &paths)
{
    for (const QString &path : paths) {
        OperationError error;
        if (!m_indexer.forgetFile(PathUtils::normalizePath(path), &error)) {
            qCWarning(lcCommands) << "Trashed file still recorded in library" << path << error.message;
        }
    }
}
