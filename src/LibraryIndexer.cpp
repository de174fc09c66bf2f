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

#include "LibraryIndexer.h"

#include <QFileInfo>
#include <QHash>
#include <QSet>

#include "ContentHasher.h"
#include "DirectoryScanner.h"
#include "DuplicateGrouper.h"
#include "ImageMetadataUtils.h"
#include "ImageRepository.h"
#include "LoggingUtils.h"
#include "PathUtils.h"

QVariantMap toVariantMap(const IndexStats &stats)
{
    QVariantMap map;
    map.insert("filesSeen", stats.filesSeen);
    map.insert("filesHashed", stats.filesHashed);
    map.insert("filesSkipped", stats.filesSkipped);
    map.insert("recordsRemoved", stats.recordsRemoved);
    map.insert("failures", stats.failures);
    map.insert("groupsCreated", stats.groupsCreated);
    return map;
}

LibraryIndexer::LibraryIndexer(DirectoryScanner &scanner, const ContentHasher &hasher,
                               ImageRepository &images, DuplicateGrouper &grouper)
    : m_scanner(scanner)
    , m_hasher(hasher)
    , m_images(images)
    , m_grouper(grouper)
{
}

/**
 * @brief Brings the library in line with every image under a root.
 *
 * Files whose size and modification time match their stored record are not
 * hashed again. Records of files that are gone are removed, then the
 * duplicate groups are rebuilt from scratch.
 *
 * @param root Directory to index.
 * @param stats Optional output counters.
 * @param onProgress Optional callback receiving (completed, total) after each file.
 * @param error Optional error output for an invalid root or a database failure.
 * @return True when the pass completed; per-file failures are only counted.
 */
bool LibraryIndexer::indexRoot(const QString &root, IndexStats *stats, const ProgressCallback &onProgress,
                               OperationError *error)
{
    QString reason;
    if (!PathUtils::isAccessibleDirectory(root, &reason)) {
        setError(error, ErrorCode::InvalidDirectory, QStringLiteral("%1: %2").arg(reason, root));
        return false;
    }

    const QString normalizedRoot = PathUtils::normalizePath(root);
    const QStringList files = m_scanner.enumerateFiles(normalizedRoot, true, true, error);

    OperationError lookupError;
    const QVector<ImageRecord> stored = m_images.findUnderDirectory(normalizedRoot, &lookupError);
    if (lookupError.code != ErrorCode::None) {
        setError(error, lookupError.code, lookupError.message);
        return false;
    }
    QHash<QString, ImageRecord> storedByPath;
    for (const ImageRecord &record : stored) {
        storedByPath.insert(record.path, record);
    }

    IndexStats result;
    result.filesSeen = files.size();
    const QSet<QString> seen(files.cbegin(), files.cend());
    int completed = 0;
    for (const QString &path : files) {
        const QFileInfo info(path);
        const auto existing = storedByPath.constFind(path);
        if (existing != storedByPath.constEnd()
            && existing.value().size == info.size()
            && existing.value().fileModified == info.lastModified().toMSecsSinceEpoch()) {
            result.filesSkipped += 1;
        } else {
            HashResult hash;
            OperationError fileError;
            qint64 imageId = 0;
            if (m_hasher.fullHash(path, &hash, &fileError) && storeFile(path, hash, &imageId, &fileError)) {
                result.filesHashed += 1;
            } else {
                result.failures += 1;
                qCWarning(lcIndexer) << "Could not index" << path << fileError.message;
                if (fileError.code == ErrorCode::DatabaseError) {
                    setError(error, fileError.code, fileError.message);
                    return false;
                }
            }
        }
        completed += 1;
        if (onProgress) {
            onProgress(completed, files.size());
        }
    }

    for (const ImageRecord &record : stored) {
        if (seen.contains(record.path)) {
            continue;
        }
        if (!forgetImage(record.id, error)) {
            return false;
        }
        result.recordsRemoved += 1;
    }

    RebuildResult rebuild;
    if (!m_grouper.rebuildAll(&rebuild, error)) {
        return false;
    }
    result.groupsCreated = rebuild.groupsCreated;

    qCInfo(lcIndexer) << "Indexed" << normalizedRoot << ":" << result.filesSeen << "seen," << result.filesHashed
                      << "hashed," << result.filesSkipped << "unchanged," << result.recordsRemoved << "removed,"
                      << result.failures << "failed";
    if (stats) {
        *stats = result;
    }
    return true;
}

/**
 * @brief Hashes one image, stores its record and files it under its duplicate group.
 *
 * A file that vanished before it could be hashed is forgotten instead.
 */
bool LibraryIndexer::indexFile(const QString &path, OperationError *error)
{
    if (!DirectoryScanner::isImageFile(path)) {
        return true;
    }

    HashResult hash;
    OperationError hashError;
    if (!m_hasher.fullHash(path, &hash, &hashError)) {
        if (hashError.code == ErrorCode::FileNotFound) {
            return forgetFile(path, error);
        }
        setError(error, hashError.code, hashError.message);
        return false;
    }

    qint64 imageId = 0;
    if (!storeFile(path, hash, &imageId, error)) {
        return false;
    }
    DuplicateGroupRecord group;
    if (!m_grouper.upsertGroup(hash.hash, imageId, &group, error)) {
        return false;
    }
    if (group.id != 0) {
        qCDebug(lcIndexer) << path << "is in duplicate group" << group.id << "with" << group.count << "members";
    }
    return true;
}

bool LibraryIndexer::forgetFile(const QString &path, OperationError *error)
{
    ImageRecord record;
    OperationError lookupError;
    if (!m_images.findByPath(path, &record, &lookupError)) {
        if (lookupError.code == ErrorCode::DatabaseError) {
            setError(error, lookupError.code, lookupError.message);
            return false;
        }
        return true;
    }
    return forgetImage(record.id, error);
}

bool LibraryIndexer::forgetDirectory(const QString &path, int *removed, OperationError *error)
{
    OperationError lookupError;
    const QVector<ImageRecord> records = m_images.findUnderDirectory(path, &lookupError);
    if (lookupError.code != ErrorCode::None) {
        setError(error, lookupError.code, lookupError.message);
        return false;
    }
    int count = 0;
    for (const ImageRecord &record : records) {
        if (!forgetImage(record.id, error)) {
            return false;
        }
        count += 1;
    }
    if (removed) {
        *removed = count;
    }
    return true;
}

/**
 * @brief Applies one watch event to the library.
 * @return False when the event could not be applied; events outside the root are ignored.
 */
bool LibraryIndexer::handleEvent(const WatchEvent &event, OperationError *error)
{
    const QString root = m_scanner.rootDirectory();
    if (event.type != WatchEventType::WatcherError && !root.isEmpty() && !PathUtils::isWithin(event.path, root)) {
        qCDebug(lcIndexer) << "Ignoring event outside root" << event.path;
        return true;
    }

    switch (event.type) {
    case WatchEventType::FileAdded:
    case WatchEventType::FileChanged:
        return indexFile(event.path, error);
    case WatchEventType::FileRemoved:
        return forgetFile(event.path, error);
    case WatchEventType::DirectoryAdded: {
        const QStringList files = m_scanner.enumerateFiles(event.path, true, true);
        bool ok = true;
        for (const QString &file : files) {
            OperationError fileError;
            if (!indexFile(file, &fileError)) {
                qCWarning(lcIndexer) << "Could not index" << file << fileError.message;
                setError(error, fileError.code, fileError.message);
                ok = false;
            }
        }
        return ok;
    }
    case WatchEventType::DirectoryRemoved:
        return forgetDirectory(event.path, nullptr, error);
    case WatchEventType::WatcherError:
        qCWarning(lcIndexer) << "Watcher error on" << event.path << event.message;
        return true;
    }
    return true;
}

/**
 * @brief Applies every queued event, or runs a full index when events were dropped.
 * @param queue Queue to drain.
 * @param handled Optional output with the number of events applied.
 * @param error Optional error output of the last failure.
 * @return True when every event was applied.
 */
bool LibraryIndexer::processPendingEvents(WatchEventQueue &queue, int *handled, OperationError *error)
{
    if (queue.droppedCount() > 0) {
        const quint64 dropped = queue.droppedCount();
        queue.clear();
        qCWarning(lcIndexer) << dropped << "watch events were dropped, running a full index";
        if (handled) {
            *handled = 0;
        }
        return indexRoot(m_scanner.rootDirectory(), nullptr, nullptr, error);
    }

    const QVector<WatchEvent> events = queue.drain();
    bool ok = true;
    for (const WatchEvent &event : events) {
        OperationError eventError;
        if (!handleEvent(event, &eventError)) {
            qCWarning(lcIndexer) << "Could not apply" << watchEventTypeName(event.type) << event.path
                                 << eventError.message;
            setError(error, eventError.code, eventError.message);
            ok = false;
        }
    }
    if (handled) {
        *handled = events.size();
    }
    return ok;
}

bool LibraryIndexer::storeFile(const QString &path, const HashResult &hash, qint64 *imageId, OperationError *error)
{
    const QFileInfo info(path);
    ImageRecord record;
    record.path = path;
    record.filename = info.fileName();
    record.directory = info.absolutePath();
    record.hash = hash.hash;
    record.size = hash.size;
    record.fileModified = info.lastModified().toMSecsSinceEpoch();

    const ImageMetadataUtils::ImageSizeResult dimensions = ImageMetadataUtils::readImageSize(path);
    if (dimensions.valid) {
        record.width = dimensions.size.width();
        record.height = dimensions.size.height();
        record.format = dimensions.format;
    } else {
        record.format = info.suffix().toLower();
    }
    return m_images.upsert(record, imageId, error);
}

/**
 * @brief Removes an image from its group before deleting its record, so the group count stays right.
 */
bool LibraryIndexer::forgetImage(qint64 imageId, OperationError *error)
{
    if (!m_grouper.removeImage(imageId, error)) {
        return false;
    }
    return m_images.deleteById(imageId, error);
}
