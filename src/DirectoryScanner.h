#pragma once

#include <QDateTime>
#include <QFileSystemWatcher>
#include <QHash>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QVector>

#include "CoreTypes.h"
#include "WatchEventQueue.h"

class ScannerPreferences;

struct RootInfo {
    QString path;
    QString name;
    QDateTime lastAccessed;
    bool isValid = false;
};

QVariantMap toVariantMap(const RootInfo &info);

/**
 * @brief Enumerates files under the configured root and watches it for changes.
 *
 * Scanning walks up to scanDepth() levels and skips entries whose name
 * contains an exclusion pattern. Per-entry failures are skipped; only an
 * invalid directory argument is reported as an error.
 *
 * Watching covers a shallow part of the tree (three levels below the root).
 * Changes are turned into typed WatchEvent values pushed into events(), and
 * eventsAvailable() is emitted when that queue stops being empty.
 */
class DirectoryScanner : public QObject
{
    Q_OBJECT

public:
    explicit DirectoryScanner(ScannerPreferences &preferences, QObject *parent = nullptr);
    ~DirectoryScanner() override;

    bool setRoot(const QString &path, QString *reason = nullptr);
    bool useTemporaryRoot(const QString &path, QString *reason = nullptr);
    QString rootDirectory() const;
    RootInfo rootInfo() const;
    void clearRoot();

    bool scan(const QString &path, bool recursive, ScanStats *stats, OperationError *error = nullptr);
    ScanStats lastScanStats() const;

    QVector<FileEntry> getDirectoryContents(const QString &path, OperationError *error = nullptr) const;
    QStringList getSubdirectories(const QString &path, OperationError *error = nullptr) const;
    QStringList enumerateFiles(const QString &path, bool recursive, bool imagesOnly = true,
                               OperationError *error = nullptr) const;
    static bool isImageFile(const QString &fileName);

    bool watch();
    void unwatch();
    bool isWatching() const;
    bool isWatchEnabled() const;
    void setWatchEnabled(bool enabled);
    static int watchDepth();

    int scanDepth() const;
    void setScanDepth(int depth);
    QStringList excludePatterns() const;
    void setExcludePatterns(const QStringList &patterns);

    QString relativePath(const QString &fullPath) const;
    QString fullPath(const QString &relativePath, OperationError *error = nullptr) const;

    WatchEventQueue &events();

signals:
    void rootDirectoryChanged(const QString &path);
    void eventsAvailable();

private:
    struct EntryState {
        bool isDir = false;
        qint64 size = 0;
        qint64 modified = 0;
    };
    using DirectorySnapshot = QHash<QString, EntryState>;

    void scanRecursive(const QString &path, int depth, int maxDepth, ScanStats &stats) const;
    void collectFiles(const QString &path, int depth, int maxDepth, bool imagesOnly, QStringList &files) const;
    bool isIgnoredName(const QString &name) const;

    void watchDirectory(const QString &path, int depth);
    void watchFile(const QString &path);
    void forgetDirectory(const QString &path);
    DirectorySnapshot snapshotOf(const QString &path) const;
    int depthBelowRoot(const QString &path) const;
    void onDirectoryChanged(const QString &path);
    void onFileChanged(const QString &path);
    void enqueue(WatchEventType type, const QString &path, const QString &message = QString());

    ScannerPreferences &m_preferences;
    QString m_rootPath;
    QStringList m_excludePatterns;
    int m_scanDepth = 0;
    QFileSystemWatcher m_watcher;
    QHash<QString, DirectorySnapshot> m_snapshots;
    WatchEventQueue m_events;
    bool m_watching = false;
};
