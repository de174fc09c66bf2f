#pragma once

#include <QString>
#include <QVariantMap>

#include <functional>

#include "CoreTypes.h"
#include "WatchEventQueue.h"

class ContentHasher;
class DirectoryScanner;
class DuplicateGrouper;
class ImageRepository;

struct IndexStats {
    int filesSeen = 0;
    int filesHashed = 0;
    int filesSkipped = 0;
    int recordsRemoved = 0;
    int failures = 0;
    int groupsCreated = 0;
};

QVariantMap toVariantMap(const IndexStats &stats);

/**
 * @brief Keeps the image records and duplicate groups in step with the files on disk.
 *
 * indexRoot() is the full pass: enumerate, hash what changed, forget what
 * disappeared, rebuild groups. handleEvent() is the incremental pass for a
 * single watch event.
 */
class LibraryIndexer
{
public:
    using ProgressCallback = std::function<void(int completed, int total)>;

    LibraryIndexer(DirectoryScanner &scanner, const ContentHasher &hasher,
                   ImageRepository &images, DuplicateGrouper &grouper);

    bool indexRoot(const QString &root, IndexStats *stats = nullptr,
                   const ProgressCallback &onProgress = nullptr, OperationError *error = nullptr);
    bool indexFile(const QString &path, OperationError *error = nullptr);
    bool forgetFile(const QString &path, OperationError *error = nullptr);
    bool forgetDirectory(const QString &path, int *removed = nullptr, OperationError *error = nullptr);

    bool handleEvent(const WatchEvent &event, OperationError *error = nullptr);
    bool processPendingEvents(WatchEventQueue &queue, int *handled = nullptr, OperationError *error = nullptr);

private:
    bool storeFile(const QString &path, const HashResult &hash, qint64 *imageId, OperationError *error);
    bool forgetImage(qint64 imageId, OperationError *error);

    DirectoryScanner &m_scanner;
    const ContentHasher &m_hasher;
    ImageRepository &m_images;
    DuplicateGrouper &m_grouper;
};
