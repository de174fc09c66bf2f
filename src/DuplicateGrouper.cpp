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

#include "DuplicateGrouper.h"

#include <QHash>
#include <QSqlQuery>
#include <QVariant>

#include <algorithm>

#include "LibraryDatabase.h"
#include "LoggingUtils.h"

namespace {

struct DuplicateGrouperConstants {
    static constexpr int minimumGroupSize = 2;
};

const char *const groupColumns =
    "SELECT id, hash, count, total_size, created_at, updated_at FROM duplicate_groups";

DuplicateGroupRecord readGroup(const QSqlQuery &query)
{
    DuplicateGroupRecord group;
    group.id = query.value(0).toLongLong();
    group.hash = query.value(1).toString();
    group.count = query.value(2).toInt();
    group.totalSize = query.value(3).toLongLong();
    group.createdAt = LibraryDatabase::parseTimestamp(query.value(4));
    group.updatedAt = LibraryDatabase::parseTimestamp(query.value(5));
    return group;
}

bool requireTransaction(const Transaction &transaction, OperationError *error)
{
    if (transaction.isActive()) {
        return true;
    }
    setError(error, ErrorCode::DatabaseError, QStringLiteral("Could not begin transaction"));
    return false;
}

} // namespace

QVariantMap toVariantMap(const DuplicateGroupRecord &group)
{
    QVariantMap map;
    map.insert("id", group.id);
    map.insert("hash", group.hash);
    map.insert("count", group.count);
    map.insert("totalSize", group.totalSize);
    if (group.createdAt.isValid()) {
        map.insert("createdAt", group.createdAt.toString(Qt::ISODate));
    }
    if (group.updatedAt.isValid()) {
        map.insert("updatedAt", group.updatedAt.toString(Qt::ISODate));
    }
    return map;
}

QVariantMap toVariantMap(const DuplicateStats &stats)
{
    QVariantMap map;
    map.insert("totalGroups", stats.totalGroups);
    map.insert("totalDuplicateImages", stats.totalDuplicateImages);
    map.insert("largestGroupSize", stats.largestGroupSize);
    map.insert("potentialSpaceSaved", stats.potentialSpaceSaved);
    return map;
}

DuplicateGrouper::DuplicateGrouper(LibraryDatabase &database)
    : m_database(database)
{
}

/**
 * @brief Groups hash results sharing a full hash.
 * @param results Hash results, in any order.
 * @return Groups with at least two files, most duplicated first. Groups of equal
 *         size keep the order in which their hash first appeared.
 */
QVector<DuplicateGroup> DuplicateGrouper::findDuplicates(const QVector<HashResult> &results)
{
    QVector<DuplicateGroup> buckets;
    QHash<QString, int> indexByHash;
    for (const HashResult &result : results) {
        auto it = indexByHash.constFind(result.hash);
        if (it == indexByHash.constEnd()) {
            DuplicateGroup group;
            group.hash = result.hash;
            group.fileSize = result.size;
            buckets.append(group);
            it = indexByHash.insert(result.hash, buckets.size() - 1);
        }
        buckets[it.value()].files.append(result.path);
    }

    QVector<DuplicateGroup> groups;
    for (const DuplicateGroup &group : buckets) {
        if (group.files.size() >= DuplicateGrouperConstants::minimumGroupSize) {
            groups.append(group);
        }
    }
    std::stable_sort(groups.begin(), groups.end(), [](const DuplicateGroup &left, const DuplicateGroup &right) {
        return left.files.size() > right.files.size();
    });
    return groups;
}

/**
 * @brief Sums the bytes that removing every copy but one would free.
 */
DuplicateSpace DuplicateGrouper::calculateDuplicateSpace(const QVector<DuplicateGroup> &groups)
{
    DuplicateSpace space;
    for (const DuplicateGroup &group : groups) {
        const int copies = group.files.size() - 1;
        space.totalWastedBytes += group.fileSize * copies;
        space.totalDuplicateFiles += copies;
        space.totalGroups += 1;
    }
    return space;
}

/**
 * @brief Drops every persisted group and derives them again from the images table.
 * @param result Optional output with the number of groups and member rows created.
 * @param error Optional error output.
 * @return True on success. On failure the previous groups are left untouched.
 */
bool DuplicateGrouper::rebuildAll(RebuildResult *result, OperationError *error)
{
    Transaction transaction(m_database);
    if (!requireTransaction(transaction, error)) {
        return false;
    }

    if (!m_database.exec(QStringLiteral("DELETE FROM duplicate_items"), "clear duplicate items", error)
        || !m_database.exec(QStringLiteral("DELETE FROM duplicate_groups"), "clear duplicate groups", error)) {
        return false;
    }

    OperationError queryError;
    const QStringList duplicateHashes = ImageRepository(m_database).findDuplicateHashes(&queryError);
    if (queryError.code != ErrorCode::None) {
        if (error) {
            *error = queryError;
        }
        return false;
    }

    RebuildResult created;
    for (const QString &hash : duplicateHashes) {
        qint64 groupId = 0;
        if (!insertGroup(hash, &groupId, error)) {
            return false;
        }
        QSqlQuery items(m_database.database());
        items.prepare(QStringLiteral(
            "INSERT INTO duplicate_items (group_id, image_id) SELECT ?, id FROM images WHERE hash = ?"));
        items.addBindValue(groupId);
        items.addBindValue(hash);
        if (!m_database.exec(items, "insert duplicate items", error)) {
            return false;
        }
        created.itemsCreated += items.numRowsAffected();

        bool deleted = false;
        if (!refreshGroup(groupId, &deleted, error)) {
            return false;
        }
        created.groupsCreated += 1;
    }

    if (!transaction.commit(error)) {
        return false;
    }
    qCInfo(lcDuplicates) << "Rebuilt duplicate groups:" << created.groupsCreated << "groups,"
                         << created.itemsCreated << "items";
    if (result) {
        *result = created;
    }
    return true;
}

/**
 * @brief Adds one image to the group of its hash, creating the group when needed.
 *
 * A group is only created when at least two images carry the hash; every image
 * with that hash then becomes a member. An image that was filed under another
 * hash is moved out of its old group first.
 *
 * @param hash Full hash of the image.
 * @param imageId Image row id; the stored image must carry the same hash.
 * @param group Optional output, left with id 0 when no group exists for the hash.
 * @param error Optional error output.
 * @return True on success.
 */
bool DuplicateGrouper::upsertGroup(const QString &hash, qint64 imageId,
                                   DuplicateGroupRecord *group, OperationError *error)
{
    Transaction transaction(m_database);
    if (!requireTransaction(transaction, error)) {
        return false;
    }

    QSqlQuery image(m_database.database());
    image.prepare(QStringLiteral("SELECT hash FROM images WHERE id = ?"));
    image.addBindValue(imageId);
    if (!m_database.exec(image, "find image hash", error)) {
        return false;
    }
    if (!image.next()) {
        setError(error, ErrorCode::InvalidArgument, QStringLiteral("Unknown image id %1").arg(imageId));
        return false;
    }
    if (image.value(0).toString() != hash) {
        setError(error, ErrorCode::InvalidArgument,
                 QStringLiteral("Image %1 does not carry hash %2").arg(imageId).arg(hash));
        return false;
    }

    DuplicateGroupRecord existing;
    OperationError lookupError;
    const bool hasGroup = findGroupByHash(hash, &existing, &lookupError);
    if (!hasGroup && lookupError.code == ErrorCode::DatabaseError) {
        setError(error, lookupError.code, lookupError.message);
        return false;
    }

    qint64 groupId = existing.id;
    if (hasGroup) {
        if (!detachImage(imageId, groupId, error) || !attachImage(groupId, imageId, error)) {
            return false;
        }
    } else {
        QSqlQuery carriers(m_database.database());
        carriers.prepare(QStringLiteral("SELECT id FROM images WHERE hash = ? ORDER BY id"));
        carriers.addBindValue(hash);
        if (!m_database.exec(carriers, "find images by hash", error)) {
            return false;
        }
        QVector<qint64> imageIds;
        while (carriers.next()) {
            imageIds.append(carriers.value(0).toLongLong());
        }

        if (!detachImage(imageId, 0, error)) {
            return false;
        }
        if (imageIds.size() < DuplicateGrouperConstants::minimumGroupSize) {
            if (!transaction.commit(error)) {
                return false;
            }
            if (group) {
                *group = DuplicateGroupRecord();
            }
            return true;
        }

        if (!insertGroup(hash, &groupId, error)) {
            return false;
        }
        for (qint64 memberId : imageIds) {
            if (!detachImage(memberId, groupId, error) || !attachImage(groupId, memberId, error)) {
                return false;
            }
        }
        qCDebug(lcDuplicates) << "Created duplicate group" << groupId << "for" << imageIds.size() << "images";
    }

    bool deleted = false;
    if (!refreshGroup(groupId, &deleted, error) || !transaction.commit(error)) {
        return false;
    }

    if (group) {
        *group = DuplicateGroupRecord();
        if (!deleted && !findGroupById(groupId, group, error)) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Removes one membership; the group is deleted when one member or less remains.
 */
bool DuplicateGrouper::removeImageFromGroup(qint64 groupId, qint64 imageId, OperationError *error)
{
    Transaction transaction(m_database);
    if (!requireTransaction(transaction, error)) {
        return false;
    }

    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral("DELETE FROM duplicate_items WHERE group_id = ? AND image_id = ?"));
    query.addBindValue(groupId);
    query.addBindValue(imageId);
    if (!m_database.exec(query, "remove duplicate item", error)) {
        return false;
    }

    bool deleted = false;
    if (!refreshGroup(groupId, &deleted, error)) {
        return false;
    }
    if (deleted) {
        qCDebug(lcDuplicates) << "Deleted duplicate group" << groupId << "after removing image" << imageId;
    }
    return transaction.commit(error);
}

/**
 * @brief Removes an image from whatever group holds it. No-op when it is in none.
 */
bool DuplicateGrouper::removeImage(qint64 imageId, OperationError *error)
{
    Transaction transaction(m_database);
    if (!requireTransaction(transaction, error)) {
        return false;
    }
    if (!detachImage(imageId, 0, error)) {
        return false;
    }
    return transaction.commit(error);
}

bool DuplicateGrouper::deleteGroup(qint64 groupId, OperationError *error)
{
    Transaction transaction(m_database);
    if (!requireTransaction(transaction, error)) {
        return false;
    }

    QSqlQuery items(m_database.database());
    items.prepare(QStringLiteral("DELETE FROM duplicate_items WHERE group_id = ?"));
    items.addBindValue(groupId);
    QSqlQuery group(m_database.database());
    group.prepare(QStringLiteral("DELETE FROM duplicate_groups WHERE id = ?"));
    group.addBindValue(groupId);
    if (!m_database.exec(items, "delete group items", error) || !m_database.exec(group, "delete group", error)) {
        return false;
    }
    return transaction.commit(error);
}

bool DuplicateGrouper::findGroupById(qint64 groupId, DuplicateGroupRecord *group, OperationError *error) const
{
    return findGroupWhere(QStringLiteral("id = ?"), groupId, group, error);
}

bool DuplicateGrouper::findGroupByHash(const QString &hash, DuplicateGroupRecord *group, OperationError *error) const
{
    return findGroupWhere(QStringLiteral("hash = ?"), hash, group, error);
}

bool DuplicateGrouper::findGroupForImage(qint64 imageId, DuplicateGroupRecord *group, OperationError *error) const
{
    return findGroupWhere(QStringLiteral("id = (SELECT group_id FROM duplicate_items WHERE image_id = ?)"),
                          imageId, group, error);
}

QVector<ImageRecord> DuplicateGrouper::members(qint64 groupId, OperationError *error) const
{
    QVector<ImageRecord> records;
    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral(
        "SELECT d.image_id FROM duplicate_items d JOIN images i ON i.id = d.image_id"
        " WHERE d.group_id = ? ORDER BY i.path"));
    query.addBindValue(groupId);
    if (!m_database.exec(query, "list group members", error)) {
        return records;
    }

    QVector<qint64> imageIds;
    while (query.next()) {
        imageIds.append(query.value(0).toLongLong());
    }
    ImageRepository images(m_database);
    for (qint64 imageId : imageIds) {
        ImageRecord record;
        if (images.findById(imageId, &record, error)) {
            records.append(record);
        }
    }
    return records;
}

/**
 * @brief Lists persisted groups, largest first and most recently updated first among equals.
 * @param limit Maximum number of groups, or a negative value for all of them.
 * @param offset Number of groups to skip.
 */
QVector<DuplicateGroupRecord> DuplicateGrouper::allGroups(int limit, int offset, OperationError *error) const
{
    QVector<DuplicateGroupRecord> groups;
    QSqlQuery query(m_database.database());
    query.prepare(QLatin1String(groupColumns)
                  + QStringLiteral(" ORDER BY count DESC, updated_at DESC, id LIMIT ? OFFSET ?"));
    query.addBindValue(limit < 0 ? -1 : limit);
    query.addBindValue(qMax(0, offset));
    if (!m_database.exec(query, "list duplicate groups", error)) {
        return groups;
    }
    while (query.next()) {
        groups.append(readGroup(query));
    }
    return groups;
}

/**
 * @brief Aggregates the persisted groups.
 *
 * potentialSpaceSaved counts size * (count - 1) for each group, that is the
 * bytes freed by keeping a single copy of every group.
 */
DuplicateStats DuplicateGrouper::getStats(OperationError *error) const
{
    DuplicateStats stats;
    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral(
        "SELECT COUNT(*),"
        " COALESCE(SUM(count - 1), 0),"
        " COALESCE(MAX(count), 0),"
        " COALESCE(SUM(total_size * (count - 1) / count), 0)"
        " FROM duplicate_groups WHERE count > 0"));
    if (!m_database.exec(query, "duplicate stats", error) || !query.next()) {
        return stats;
    }
    stats.totalGroups = query.value(0).toInt();
    stats.totalDuplicateImages = query.value(1).toInt();
    stats.largestGroupSize = query.value(2).toInt();
    stats.potentialSpaceSaved = query.value(3).toLongLong();
    return stats;
}

/**
 * @brief Checks that every group has count == members >= 2.
 * @param problem Optional description of the first violation found.
 * @return True when every persisted group is consistent.
 */
bool DuplicateGrouper::verifyCounts(QString *problem) const
{
    QSqlQuery query(m_database.database());
    const bool ok = query.exec(QStringLiteral(
        "SELECT g.id, g.count, (SELECT COUNT(*) FROM duplicate_items d WHERE d.group_id = g.id)"
        " FROM duplicate_groups g"));
    if (!ok) {
        if (problem) {
            *problem = QStringLiteral("Could not read duplicate groups");
        }
        return false;
    }
    while (query.next()) {
        const qint64 id = query.value(0).toLongLong();
        const int count = query.value(1).toInt();
        const int actual = query.value(2).toInt();
        if (count != actual || count < DuplicateGrouperConstants::minimumGroupSize) {
            if (problem) {
                *problem = QStringLiteral("Group %1 has count %2 and %3 members").arg(id).arg(count).arg(actual);
            }
            return false;
        }
    }
    return true;
}

bool DuplicateGrouper::findGroupWhere(const QString &condition, const QVariant &value,
                                      DuplicateGroupRecord *group, OperationError *error) const
{
    QSqlQuery query(m_database.database());
    query.prepare(QLatin1String(groupColumns) + QStringLiteral(" WHERE ") + condition);
    query.addBindValue(value);
    if (!m_database.exec(query, "find duplicate group", error)) {
        return false;
    }
    if (!query.next()) {
        setError(error, ErrorCode::FileNotFound, QStringLiteral("Duplicate group not found"));
        return false;
    }
    if (group) {
        *group = readGroup(query);
    }
    return true;
}

/**
 * @brief Removes an image from its current group unless that group is keepGroupId.
 *
 * Must run inside a transaction. The old group is refreshed and deleted when
 * it drops below two members.
 */
bool DuplicateGrouper::detachImage(qint64 imageId, qint64 keepGroupId, OperationError *error)
{
    QSqlQuery current(m_database.database());
    current.prepare(QStringLiteral("SELECT group_id FROM duplicate_items WHERE image_id = ?"));
    current.addBindValue(imageId);
    if (!m_database.exec(current, "find image group", error)) {
        return false;
    }
    if (!current.next()) {
        return true;
    }
    const qint64 groupId = current.value(0).toLongLong();
    if (groupId == keepGroupId) {
        return true;
    }

    QSqlQuery remove(m_database.database());
    remove.prepare(QStringLiteral("DELETE FROM duplicate_items WHERE image_id = ?"));
    remove.addBindValue(imageId);
    if (!m_database.exec(remove, "detach image", error)) {
        return false;
    }
    bool deleted = false;
    if (!refreshGroup(groupId, &deleted, error)) {
        return false;
    }
    qCDebug(lcDuplicates) << "Image" << imageId << "left group" << groupId << (deleted ? "(group deleted)" : "");
    return true;
}

bool DuplicateGrouper::attachImage(qint64 groupId, qint64 imageId, OperationError *error)
{
    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral("INSERT OR IGNORE INTO duplicate_items (group_id, image_id) VALUES (?, ?)"));
    query.addBindValue(groupId);
    query.addBindValue(imageId);
    return m_database.exec(query, "attach image", error);
}

/**
 * @brief Recomputes count and total_size from the member rows.
 *
 * Must run inside a transaction. A group left with fewer than two members is deleted.
 */
bool DuplicateGrouper::refreshGroup(qint64 groupId, bool *deleted, OperationError *error)
{
    *deleted = false;
    QSqlQuery update(m_database.database());
    update.prepare(QStringLiteral(
        "UPDATE duplicate_groups SET"
        " count = (SELECT COUNT(*) FROM duplicate_items WHERE group_id = ?),"
        " total_size = (SELECT COALESCE(SUM(i.size), 0) FROM duplicate_items d"
        " JOIN images i ON i.id = d.image_id WHERE d.group_id = ?),"
        " updated_at = CURRENT_TIMESTAMP"
        " WHERE id = ?"));
    update.addBindValue(groupId);
    update.addBindValue(groupId);
    update.addBindValue(groupId);
    if (!m_database.exec(update, "refresh duplicate group", error)) {
        return false;
    }

    QSqlQuery count(m_database.database());
    count.prepare(QStringLiteral("SELECT count FROM duplicate_groups WHERE id = ?"));
    count.addBindValue(groupId);
    if (!m_database.exec(count, "read group count", error)) {
        return false;
    }
    if (!count.next() || count.value(0).toInt() >= DuplicateGrouperConstants::minimumGroupSize) {
        return true;
    }

    QSqlQuery items(m_database.database());
    items.prepare(QStringLiteral("DELETE FROM duplicate_items WHERE group_id = ?"));
    items.addBindValue(groupId);
    QSqlQuery group(m_database.database());
    group.prepare(QStringLiteral("DELETE FROM duplicate_groups WHERE id = ?"));
    group.addBindValue(groupId);
    if (!m_database.exec(items, "delete small group items", error)
        || !m_database.exec(group, "delete small group", error)) {
        return false;
    }
    *deleted = true;
    return true;
}

bool DuplicateGrouper::insertGroup(const QString &hash, qint64 *groupId, OperationError *error)
{
    QSqlQuery query(m_database.database());
    query.prepare(QStringLiteral("INSERT INTO duplicate_groups (hash, count, total_size) VALUES (?, 0, 0)"));
    query.addBindValue(hash);
    if (!m_database.exec(query, "insert duplicate group", error)) {
        return false;
    }
    *groupId = query.lastInsertId().toLongLong();
    return true;
}
