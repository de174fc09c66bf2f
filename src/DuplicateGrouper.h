#pragma once

#include <QDateTime>
#include <QString>
#include <QVariantMap>
#include <QVector>
#include <QtGlobal>

#include "CoreTypes.h"
#include "ImageRepository.h"

class LibraryDatabase;

struct DuplicateGroupRecord {
    qint64 id = 0;
    QString hash;
    int count = 0;
    qint64 totalSize = 0;
    QDateTime createdAt;
    QDateTime updatedAt;
};

struct DuplicateStats {
    int totalGroups = 0;
    int totalDuplicateImages = 0;
    int largestGroupSize = 0;
    qint64 potentialSpaceSaved = 0;
};

struct RebuildResult {
    int groupsCreated = 0;
    int itemsCreated = 0;
};

QVariantMap toVariantMap(const DuplicateGroupRecord &group);
QVariantMap toVariantMap(const DuplicateStats &stats);

/**
 * @brief Turns full-hash collisions into duplicate groups.
 *
 * The static functions work on in-memory hash results. The instance functions
 * maintain the duplicate_groups and duplicate_items tables, where a group
 * always has count == number of member rows and count >= 2. Every mutation
 * runs in a single transaction.
 */
class DuplicateGrouper
{
public:
    explicit DuplicateGrouper(LibraryDatabase &database);

    static QVector<DuplicateGroup> findDuplicates(const QVector<HashResult> &results);
    static DuplicateSpace calculateDuplicateSpace(const QVector<DuplicateGroup> &groups);

    bool rebuildAll(RebuildResult *result = nullptr, OperationError *error = nullptr);
    bool upsertGroup(const QString &hash, qint64 imageId,
                     DuplicateGroupRecord *group = nullptr, OperationError *error = nullptr);
    bool removeImageFromGroup(qint64 groupId, qint64 imageId, OperationError *error = nullptr);
    bool removeImage(qint64 imageId, OperationError *error = nullptr);
    bool deleteGroup(qint64 groupId, OperationError *error = nullptr);

    bool findGroupById(qint64 groupId, DuplicateGroupRecord *group, OperationError *error = nullptr) const;
    bool findGroupByHash(const QString &hash, DuplicateGroupRecord *group, OperationError *error = nullptr) const;
    bool findGroupForImage(qint64 imageId, DuplicateGroupRecord *group, OperationError *error = nullptr) const;
    QVector<ImageRecord> members(qint64 groupId, OperationError *error = nullptr) const;
    QVector<DuplicateGroupRecord> allGroups(int limit = -1, int offset = 0, OperationError *error = nullptr) const;

    DuplicateStats getStats(OperationError *error = nullptr) const;
    bool verifyCounts(QString *problem = nullptr) const;

private:
    bool findGroupWhere(const QString &condition, const QVariant &value,
                        DuplicateGroupRecord *group, OperationError *error) const;
    bool detachImage(qint64 imageId, qint64 keepGroupId, OperationError *error);
    bool attachImage(qint64 groupId, qint64 imageId, OperationError *error);
    bool refreshGroup(qint64 groupId, bool *deleted, OperationError *error);
    bool insertGroup(const QString &hash, qint64 *groupId, OperationError *error);

    LibraryDatabase &m_database;
};
