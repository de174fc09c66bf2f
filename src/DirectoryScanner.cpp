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

#include "DirectoryScanner.h"

#include <QDir>
#include <QFileInfo>

#include "ImageMetadataUtils.h"
#include "LoggingUtils.h"
#include "PathUtils.h"
#include "ScannerPreferences.h"

namespace {

struct DirectoryScannerConstants {
    static constexpr int watchDepth = 3;
    static constexpr int rootDepth = 0;
    static constexpr int singleLevel = 0;
};

const QDir::Filters scanFilters = QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System | QDir::NoSymLinks;

QString childPath(const QString &parent, const QString &name)
{
    return parent.endsWith(QLatin1Char('/')) ? parent + name : parent + QLatin1Char('/') + name;
}

bool isUnder(const QString &path, const QString &directory)
{
    return path == directory || path.startsWith(directory + QLatin1Char('/'));
}

} // namespace

QVariantMap toVariantMap(const RootInfo &info)
{
    QVariantMap map;
    map.insert("path", info.path);
    map.insert("name", info.name);
    map.insert("isValid", info.isValid);
    if (info.lastAccessed.isValid()) {
        map.insert("lastAccessed", info.lastAccessed.toMSecsSinceEpoch());
    }
    return map;
}

/**
 * @brief Creates a scanner and restores the persisted root when it is still accessible.
 * @param preferences Settings store; must outlive the scanner.
 * @param parent Parent QObject for ownership.
 */
DirectoryScanner::DirectoryScanner(ScannerPreferences &preferences, QObject *parent)
    : QObject(parent)
    , m_preferences(preferences)
    , m_excludePatterns(preferences.excludePatterns())
    , m_scanDepth(preferences.scanDepth())
{
    connect(&m_watcher, &QFileSystemWatcher::directoryChanged, this, &DirectoryScanner::onDirectoryChanged);
    connect(&m_watcher, &QFileSystemWatcher::fileChanged, this, &DirectoryScanner::onFileChanged);

    const QString stored = m_preferences.rootDirectory();
    if (stored.isEmpty()) {
        return;
    }
    QString reason;
    if (!PathUtils::isAccessibleDirectory(stored, &reason)) {
        qCWarning(lcScanner) << "Stored root directory is no longer accessible:" << stored << reason;
        return;
    }
    m_rootPath = PathUtils::normalizePath(stored);
    if (m_preferences.watchEnabled()) {
        watch();
    }
}

DirectoryScanner::~DirectoryScanner()
{
    unwatch();
}

/**
 * @brief Selects a new root directory.
 *
 * The candidate is only checked for being an accessible directory; it does
 * not have to lie inside a previous root, and no previous root is needed.
 *
 * @param path Candidate root directory.
 * @param reason Optional output describing why the path was rejected.
 * @return True when the root was changed.
 */
bool DirectoryScanner::setRoot(const QString &path, QString *reason)
{
    if (!PathUtils::isAccessibleDirectory(path, reason)) {
        qCInfo(lcScanner) << "Rejected root directory" << path;
        return false;
    }

    unwatch();
    m_rootPath = PathUtils::normalizePath(path);
    m_preferences.setRootDirectory(m_rootPath);
    qCInfo(lcScanner) << "Root directory set to" << m_rootPath;

    if (m_preferences.watchEnabled()) {
        watch();
    }
    emit rootDirectoryChanged(m_rootPath);
    return true;
}

/**
 * @brief Selects a root for this scanner only, leaving the saved root and the watcher alone.
 */
bool DirectoryScanner::useTemporaryRoot(const QString &path, QString *reason)
{
    if (!PathUtils::isAccessibleDirectory(path, reason)) {
        qCInfo(lcScanner) << "Rejected temporary root directory" << path;
        return false;
    }

    unwatch();
    m_rootPath = PathUtils::normalizePath(path);
    qCInfo(lcScanner) << "Using temporary root directory" << m_rootPath;
    emit rootDirectoryChanged(m_rootPath);
    return true;
}

QString DirectoryScanner::rootDirectory() const
{
    return m_rootPath;
}

RootInfo DirectoryScanner::rootInfo() const
{
    RootInfo info;
    if (m_rootPath.isEmpty()) {
        return info;
    }
    info.path = m_rootPath;
    info.name = QFileInfo(m_rootPath).fileName();
    const qint64 accessed = m_preferences.lastAccessed();
    if (accessed > 0) {
        info.lastAccessed = QDateTime::fromMSecsSinceEpoch(accessed);
    }
    info.isValid = PathUtils::isAccessibleDirectory(m_rootPath);
    return info;
}

void DirectoryScanner::clearRoot()
{
    unwatch();
    m_rootPath.clear();
    m_preferences.clearRootDirectory();
    qCInfo(lcScanner) << "Root directory cleared";
    emit rootDirectoryChanged(QString());
}

/**
 * @brief Walks a directory and accumulates file, size, image and directory counts.
 *
 * Unreadable entries are skipped. The statistics are also stored as the last
 * scan statistics.
 *
 * @param path Directory to scan; empty for the current root.
 * @param recursive When false only the direct entries are counted.
 * @param stats Output statistics.
 * @param error Optional error output; only InvalidDirectory is reported.
 * @return True when the directory could be scanned.
 */
bool DirectoryScanner::scan(const QString &path, bool recursive, ScanStats *stats, OperationError *error)
{
    const QString target = path.isEmpty() ? m_rootPath : path;
    if (target.isEmpty()) {
        setError(error, ErrorCode::InvalidDirectory, tr("No root directory configured"));
        return false;
    }
    QString reason;
    if (!PathUtils::isAccessibleDirectory(target, &reason)) {
        setError(error, ErrorCode::InvalidDirectory, QStringLiteral("%1: %2").arg(reason, target));
        return false;
    }

    ScanStats result;
    const int maxDepth = recursive ? m_scanDepth : DirectoryScannerConstants::singleLevel;
    scanRecursive(PathUtils::normalizePath(target), DirectoryScannerConstants::rootDepth, maxDepth, result);
    result.lastScanned = QDateTime::currentDateTime();
    m_preferences.setLastScanStats(result);

    qCInfo(lcScanner) << "Scanned" << target << ":" << result.totalFiles << "files," << result.imageFiles
                      << "images," << result.directories << "directories";
    if (stats) {
        *stats = result;
    }
    return true;
}

ScanStats DirectoryScanner::lastScanStats() const
{
    return m_preferences.lastScanStats();
}

void DirectoryScanner::scanRecursive(const QString &path, int depth, int maxDepth, ScanStats &stats) const
{
    if (depth > maxDepth) {
        return;
    }
    const QFileInfoList entries = QDir(path).entryInfoList(scanFilters, QDir::Name);
    for (const QFileInfo &info : entries) {
        if (PathUtils::matchesExcludePattern(info.fileName(), m_excludePatterns)) {
            continue;
        }
        if (info.isDir()) {
            stats.directories += 1;
            scanRecursive(info.absoluteFilePath(), depth + 1, maxDepth, stats);
        } else if (info.isFile()) {
            stats.totalFiles += 1;
            stats.totalSize += info.size();
            if (isImageFile(info.fileName())) {
                stats.imageFiles += 1;
            }
        }
    }
}

/**
 * @brief Lists the files (not folders) of one directory, sorted by name.
 */
QVector<FileEntry> DirectoryScanner::getDirectoryContents(const QString &path, OperationError *error) const
{
    QVector<FileEntry> entries;
    QString reason;
    if (!PathUtils::isAccessibleDirectory(path, &reason)) {
        setError(error, ErrorCode::InvalidDirectory, QStringLiteral("%1: %2").arg(reason, path));
        return entries;
    }

    const QFileInfoList infos = QDir(path).entryInfoList(QDir::Files | QDir::Hidden | QDir::System, QDir::Name);
    entries.reserve(infos.size());
    for (const QFileInfo &info : infos) {
        FileEntry entry;
        entry.path = info.absoluteFilePath();
        entry.name = info.fileName();
        entry.extension = info.suffix().isEmpty() ? QString() : QLatin1Char('.') + info.suffix().toLower();
        entry.size = info.size();
        entry.modified = info.lastModified();
        entry.isImage = isImageFile(entry.name);
        entries.append(entry);
    }
    return entries;
}

/**
 * @brief Lists the visible child directories of a directory as sorted absolute paths.
 */
QStringList DirectoryScanner::getSubdirectories(const QString &path, OperationError *error) const
{
    QStringList directories;
    QString reason;
    if (!PathUtils::isAccessibleDirectory(path, &reason)) {
        setError(error, ErrorCode::InvalidDirectory, QStringLiteral("%1: %2").arg(reason, path));
        return directories;
    }
    const QFileInfoList infos = QDir(path).entryInfoList(QDir::Dirs | QDir::NoDotAndDotDot, QDir::Name);
    for (const QFileInfo &info : infos) {
        if (!PathUtils::isHiddenName(info.fileName())) {
            directories.append(info.absoluteFilePath());
        }
    }
    return directories;
}

/**
 * @brief Collects the files to hash under a directory.
 *
 * Dot-prefixed and excluded names are skipped, symbolic links are not
 * followed and the scan depth applies when recursive.
 *
 * @param path Directory to enumerate.
 * @param recursive Whether to descend into subdirectories.
 * @param imagesOnly Whether to keep image files only.
 * @param error Optional error output for an invalid directory.
 * @return Absolute file paths in a stable order.
 */
QStringList DirectoryScanner::enumerateFiles(const QString &path, bool recursive, bool imagesOnly,
                                             OperationError *error) const
{
    QStringList files;
    QString reason;
    if (!PathUtils::isAccessibleDirectory(path, &reason)) {
        setError(error, ErrorCode::InvalidDirectory, QStringLiteral("%1: %2").arg(reason, path));
        return files;
    }
    const int maxDepth = recursive ? m_scanDepth : DirectoryScannerConstants::singleLevel;
    collectFiles(PathUtils::normalizePath(path), DirectoryScannerConstants::rootDepth, maxDepth, imagesOnly, files);
    return files;
}

void DirectoryScanner::collectFiles(const QString &path, int depth, int maxDepth, bool imagesOnly,
                                    QStringList &files) const
{
    if (depth > maxDepth) {
        return;
    }
    const QFileInfoList entries = QDir(path).entryInfoList(scanFilters, QDir::Name);
    for (const QFileInfo &info : entries) {
        if (isIgnoredName(info.fileName())) {
            continue;
        }
        if (info.isDir()) {
            collectFiles(info.absoluteFilePath(), depth + 1, maxDepth, imagesOnly, files);
        } else if (info.isFile() && (!imagesOnly || isImageFile(info.fileName()))) {
            files.append(info.absoluteFilePath());
        }
    }
}

bool DirectoryScanner::isImageFile(const QString &fileName)
{
    return ImageMetadataUtils::isImageFile(fileName);
}

bool DirectoryScanner::isIgnoredName(const QString &name) const
{
    return PathUtils::isHiddenName(name) || PathUtils::matchesExcludePattern(name, m_excludePatterns);
}

/**
 * @brief Starts watching the root directory.
 * @return False when no accessible root is configured.
 */
bool DirectoryScanner::watch()
{
    if (m_rootPath.isEmpty() || !PathUtils::isAccessibleDirectory(m_rootPath)) {
        qCWarning(lcScanner) << "Cannot watch without an accessible root directory";
        return false;
    }
    unwatch();
    m_watching = true;
    watchDirectory(m_rootPath, DirectoryScannerConstants::rootDepth);
    qCInfo(lcScanner) << "Watching" << m_rootPath << "(" << m_watcher.directories().size() << "directories,"
                      << m_watcher.files().size() << "files)";
    return true;
}

/**
 * @brief Stops watching. Events already queued stay available to the consumer.
 */
void DirectoryScanner::unwatch()
{
    if (!m_watching) {
        return;
    }
    const QStringList directories = m_watcher.directories();
    if (!directories.isEmpty()) {
        m_watcher.removePaths(directories);
    }
    const QStringList files = m_watcher.files();
    if (!files.isEmpty()) {
        m_watcher.removePaths(files);
    }
    m_snapshots.clear();
    m_watching = false;
    qCInfo(lcScanner) << "File watcher stopped";
}

bool DirectoryScanner::isWatching() const
{
    return m_watching;
}

bool DirectoryScanner::isWatchEnabled() const
{
    return m_preferences.watchEnabled();
}

void DirectoryScanner::setWatchEnabled(bool enabled)
{
    m_preferences.setWatchEnabled(enabled);
    if (enabled && !m_rootPath.isEmpty()) {
        watch();
    } else if (!enabled) {
        unwatch();
    }
}

int DirectoryScanner::watchDepth()
{
    return DirectoryScannerConstants::watchDepth;
}

int DirectoryScanner::scanDepth() const
{
    return m_scanDepth;
}

void DirectoryScanner::setScanDepth(int depth)
{
    m_scanDepth = ScannerPreferences::clampScanDepth(depth);
    m_preferences.setScanDepth(m_scanDepth);
}

QStringList DirectoryScanner::excludePatterns() const
{
    return m_excludePatterns;
}

void DirectoryScanner::setExcludePatterns(const QStringList &patterns)
{
    m_preferences.setExcludePatterns(patterns);
    m_excludePatterns = m_preferences.excludePatterns();
}

QString DirectoryScanner::relativePath(const QString &fullPath) const
{
    if (m_rootPath.isEmpty()) {
        return fullPath;
    }
    return QDir(m_rootPath).relativeFilePath(fullPath);
}

/**
 * @brief Resolves a path relative to the root.
 * @return Absolute path, or an empty string when there is no root or the result escapes it.
 */
QString DirectoryScanner::fullPath(const QString &relativePath, OperationError *error) const
{
    if (m_rootPath.isEmpty()) {
        setError(error, ErrorCode::InvalidDirectory, tr("No root directory configured"));
        return QString();
    }
    const QString resolved = PathUtils::normalizePath(QDir(m_rootPath).filePath(relativePath));
    if (!PathUtils::isWithin(resolved, m_rootPath)) {
        setError(error, ErrorCode::AccessDenied, tr("Path is outside the root directory: %1").arg(relativePath));
        return QString();
    }
    return resolved;
}

WatchEventQueue &DirectoryScanner::events()
{
    return m_events;
}

void DirectoryScanner::watchDirectory(const QString &path, int depth)
{
    if (depth > DirectoryScannerConstants::watchDepth) {
        return;
    }
    if (!m_watcher.directories().contains(path) && !m_watcher.addPath(path)) {
        qCWarning(lcScanner) << "Cannot watch directory" << path;
        enqueue(WatchEventType::WatcherError, path, tr("Cannot watch directory"));
        return;
    }

    const DirectorySnapshot snapshot = snapshotOf(path);
    m_snapshots.insert(path, snapshot);

    QStringList imageFiles;
    for (auto it = snapshot.constBegin(); it != snapshot.constEnd(); ++it) {
        const QString child = childPath(path, it.key());
        if (it.value().isDir) {
            watchDirectory(child, depth + 1);
        } else if (isImageFile(it.key())) {
            imageFiles.append(child);
        }
    }
    if (imageFiles.isEmpty()) {
        return;
    }
    const QStringList failed = m_watcher.addPaths(imageFiles);
    for (const QString &file : failed) {
        enqueue(WatchEventType::WatcherError, file, tr("Cannot watch file"));
    }
}

void DirectoryScanner::forgetDirectory(const QString &path)
{
    for (auto it = m_snapshots.begin(); it != m_snapshots.end();) {
        if (isUnder(it.key(), path)) {
            it = m_snapshots.erase(it);
        } else {
            ++it;
        }
    }

    QStringList stale;
    const QStringList directories = m_watcher.directories();
    for (const QString &directory : directories) {
        if (isUnder(directory, path)) {
            stale.append(directory);
        }
    }
    const QStringList files = m_watcher.files();
    for (const QString &file : files) {
        if (isUnder(file, path)) {
            stale.append(file);
        }
    }
    if (!stale.isEmpty()) {
        m_watcher.removePaths(stale);
    }
}

DirectoryScanner::DirectorySnapshot DirectoryScanner::snapshotOf(const QString &path) const
{
    DirectorySnapshot snapshot;
    const QFileInfoList entries = QDir(path).entryInfoList(scanFilters, QDir::Name);
    for (const QFileInfo &info : entries) {
        if (isIgnoredName(info.fileName())) {
            continue;
        }
        EntryState state;
        state.isDir = info.isDir();
        state.size = state.isDir ? 0 : info.size();
        state.modified = info.lastModified().toMSecsSinceEpoch();
        snapshot.insert(info.fileName(), state);
    }
    return snapshot;
}

int DirectoryScanner::depthBelowRoot(const QString &path) const
{
    if (path == m_rootPath) {
        return DirectoryScannerConstants::rootDepth;
    }
    return QDir(m_rootPath).relativeFilePath(path).count(QLatin1Char('/')) + 1;
}

/**
 * @brief Diffs a watched directory against its snapshot and queues the differences.
 */
void DirectoryScanner::onDirectoryChanged(const QString &path)
{
    if (!m_watching || !m_snapshots.contains(path)) {
        return;
    }

    if (!QFileInfo(path).isDir()) {
        if (path == m_rootPath) {
            enqueue(WatchEventType::WatcherError, path, tr("Root directory was removed"));
        }
        // The parent's diff reports the removal of a non-root directory.
        forgetDirectory(path);
        return;
    }

    const DirectorySnapshot previous = m_snapshots.value(path);
    const DirectorySnapshot current = snapshotOf(path);
    m_snapshots.insert(path, current);

    for (auto it = previous.constBegin(); it != previous.constEnd(); ++it) {
        const QString child = childPath(path, it.key());
        const auto now = current.constFind(it.key());
        const bool gone = now == current.constEnd() || now.value().isDir != it.value().isDir;
        if (gone) {
            if (it.value().isDir) {
                forgetDirectory(child);
                enqueue(WatchEventType::DirectoryRemoved, child);
            } else if (isImageFile(it.key())) {
                enqueue(WatchEventType::FileRemoved, child);
            }
            continue;
        }
        if (!it.value().isDir && isImageFile(it.key())
            && (now.value().size != it.value().size || now.value().modified != it.value().modified)) {
            enqueue(WatchEventType::FileChanged, child);
            watchFile(child);
        }
    }

    for (auto it = current.constBegin(); it != current.constEnd(); ++it) {
        const auto before = previous.constFind(it.key());
        if (before != previous.constEnd() && before.value().isDir == it.value().isDir) {
            continue;
        }
        const QString child = childPath(path, it.key());
        if (it.value().isDir) {
            enqueue(WatchEventType::DirectoryAdded, child);
            watchDirectory(child, depthBelowRoot(child));
        } else if (isImageFile(it.key())) {
            enqueue(WatchEventType::FileAdded, child);
            watchFile(child);
        }
    }
}

/**
 * @brief Queues a change for a watched image whose content or timestamp moved.
 *
 * Removals are left to the directory diff so that they are reported once.
 */
void DirectoryScanner::onFileChanged(const QString &path)
{
    if (!m_watching) {
        return;
    }
    const QFileInfo info(path);
    if (!info.isFile()) {
        return;
    }

    const QString parent = info.absolutePath();
    auto snapshot = m_snapshots.find(parent);
    if (snapshot != m_snapshots.end()) {
        EntryState state;
        state.size = info.size();
        state.modified = info.lastModified().toMSecsSinceEpoch();
        const auto previous = snapshot.value().constFind(info.fileName());
        const bool changed = previous == snapshot.value().constEnd()
            || previous.value().size != state.size
            || previous.value().modified != state.modified;
        snapshot.value().insert(info.fileName(), state);
        if (!changed) {
            return;
        }
    }

    enqueue(WatchEventType::FileChanged, path);
    watchFile(path);
}

void DirectoryScanner::watchFile(const QString &path)
{
    if (m_watcher.files().contains(path)) {
        return;
    }
    if (!m_watcher.addPath(path)) {
        qCDebug(lcScanner) << "Could not watch file" << path;
    }
}

void DirectoryScanner::enqueue(WatchEventType type, const QString &path, const QString &message)
{
    if (type != WatchEventType::WatcherError && PathUtils::isHiddenName(QFileInfo(path).fileName())) {
        return;
    }

    WatchEvent event;
    event.type = type;
    event.path = path;
    event.message = message;

    bool wasEmpty = false;
    if (!m_events.push(event, &wasEmpty)) {
        qCWarning(lcScanner) << "Watch event queue full, dropped" << watchEventTypeName(type) << path;
        return;
    }
    qCDebug(lcScanner) << "Watch event" << watchEventTypeName(type) << path;
    if (wasEmpty) {
        emit eventsAvailable();
    }
}
