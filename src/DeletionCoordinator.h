#pragma once

#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QVector>
#include <QtGlobal>

#include <functional>

#include "CoreTypes.h"

/**
 * @brief Moves one path to a recoverable trash.
 */
class TrashBackend
{
public:
    virtual ~TrashBackend() = default;
    virtual bool moveToTrash(const QString &path, QString *error) = 0;
};

/**
 * @brief Trash of the desktop session, through QFile::moveToTrash.
 *
 * Never falls back to a permanent delete.
 */
class SystemTrashBackend : public TrashBackend
{
public:
    bool moveToTrash(const QString &path, QString *error) override;
};

struct TrashResult {
    QString path;
    bool success = false;
    OperationError error;
};

struct TrashBatchResult {
    QStringList successful;
    QVector<TrashResult> failed;
    int totalProcessed = 0;
};

struct TrashFileInfo {
    QString path;
    QString name;
    bool exists = false;
    bool isDirectory = false;
    qint64 size = 0;
};

QVariantMap toVariantMap(const TrashResult &result);
QVariantMap toVariantMap(const TrashBatchResult &result);
QVariantMap toVariantMap(const TrashFileInfo &info);

class DeletionCoordinator;

/**
 * @brief Cooperative trash batch: each step() handles exactly one path.
 */
class TrashJob
{
public:
    TrashJob(const DeletionCoordinator &coordinator, const QStringList &paths, const QString &protectedPath = QString());

    bool atEnd() const;
    TrashResult step();
    void cancel();
    bool isCancelled() const;

    int total() const;
    int completed() const;
    const TrashBatchResult &result() const;

private:
    const DeletionCoordinator &m_coordinator;
    QStringList m_paths;
    QString m_protectedPath;
    int m_next = 0;
    bool m_cancelled = false;
    TrashBatchResult m_result;
};

/**
 * @brief Turns a duplicate group into trash operations without losing the kept copy.
 *
 * Every batch tries every path and reports each outcome; one failure never
 * stops the others and succeeded moves are not rolled back.
 */
class DeletionCoordinator
{
public:
    using ProgressCallback = std::function<void(int completed, int total)>;

    explicit DeletionCoordinator(TrashBackend &backend);

    TrashResult trashFile(const QString &path) const;
    TrashResult trashDirectory(const QString &path) const;
    TrashBatchResult trashFiles(const QStringList &paths, const ProgressCallback &onProgress = nullptr) const;
    bool trashDuplicates(const QStringList &files, int keepIndex, TrashBatchResult *result,
                         const ProgressCallback &onProgress = nullptr, OperationError *error = nullptr) const;

    static bool validateKeepIndex(const QStringList &files, int keepIndex, OperationError *error = nullptr);
    static QStringList pathsToTrash(const QStringList &files, int keepIndex);

    bool canTrash(const QString &path, QString *reason = nullptr) const;
    TrashFileInfo getFileInfo(const QString &path) const;

    static qint64 calculateTotalSize(const QStringList &paths);
    static QString formatSize(qint64 bytes);

private:
    TrashResult moveToTrash(const QString &path) const;

    TrashBackend &m_backend;
};
