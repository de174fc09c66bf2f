#pragma once

#include <QString>
#include <QStringList>
#include <QVariant>
#include <QVariantMap>

#include "ContentHasher.h"
#include "CoreTypes.h"

class DeletionCoordinator;
class DirectoryScanner;
class DuplicateGrouper;
class LibraryIndexer;
class RootScanRegistry;

/**
 * @brief Caller-facing operations of the duplicate finder.
 *
 * Every operation answers {success: bool, data?: value, error?: string, code?: string}
 * and never lets a failure escape. Paths handed to hashing, duplicate search and
 * trash operations must lie inside the configured root (AccessDenied otherwise).
 */
class LibraryCommands
{
public:
    LibraryCommands(DirectoryScanner &scanner, const ContentHasher &hasher, DuplicateGrouper &grouper,
                    const DeletionCoordinator &deletion, LibraryIndexer &indexer, RootScanRegistry &scans);

    QVariantMap setRoot(const QString &path);
    QVariantMap useTemporaryRoot(const QString &path);
    QVariantMap getRoot() const;
    QVariantMap clearRoot();

    QVariantMap scanDirectory(const QString &path = QString(), bool recursive = true);
    QVariantMap getDirectoryContents(const QString &path) const;

    QVariantMap startWatching();
    QVariantMap stopWatching();
    QVariantMap isWatching() const;

    QVariantMap hashFile(const QString &path) const;
    QVariantMap hashFiles(const QStringList &paths) const;
    QVariantMap findDuplicates(const QStringList &paths);
    QVariantMap scanDuplicates(const QString &directory, bool recursive,
                               const ContentHasher::JobProgressCallback &onProgress = nullptr);

    QVariantMap indexLibrary();
    QVariantMap duplicateStats() const;
    QVariantMap duplicateGroups(int limit = -1, int offset = 0) const;
    QVariantMap rebuildDuplicates();

    QVariantMap trashFile(const QString &path);
    QVariantMap trashFiles(const QStringList &paths);
    QVariantMap trashDuplicates(const QStringList &files, int keepIndex);
    QVariantMap canTrash(const QString &path) const;
    QVariantMap trashFileInfo(const QString &path) const;

    static QVariantMap success(const QVariant &data = QVariant());
    static QVariantMap failure(const OperationError &error);

private:
    bool checkAccess(const QStringList &paths, OperationError *error) const;
    void forgetTrashed(const QStringList &paths);

    DirectoryScanner &m_scanner;
    const ContentHasher &m_hasher;
    DuplicateGrouper &m_grouper;
    const DeletionCoordinator &m_deletion;
    LibraryIndexer &m_indexer;
    RootScanRegistry &m_scans;
};
