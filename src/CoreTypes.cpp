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

#include "CoreTypes.h"

/**
 * @brief Returns a stable name for an error code, used by the command layer.
 * @param code Error code to name.
 * @return Name of the error code.
 */
QString errorCodeName(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:
        return QStringLiteral("None");
    case ErrorCode::InvalidDirectory:
        return QStringLiteral("InvalidDirectory");
    case ErrorCode::FileNotFound:
        return QStringLiteral("FileNotFound");
    case ErrorCode::IoError:
        return QStringLiteral("IoError");
    case ErrorCode::InvalidArgument:
        return QStringLiteral("InvalidArgument");
    case ErrorCode::AccessDenied:
        return QStringLiteral("AccessDenied");
    case ErrorCode::DatabaseError:
        return QStringLiteral("DatabaseError");
    case ErrorCode::Busy:
        return QStringLiteral("Busy");
    }
    return QStringLiteral("Unknown");
}

/**
 * @brief Fills an optional error output.
 * @param error Error output, may be null.
 * @param code Error code to store.
 * @param message Human-readable message to store.
 */
void setError(OperationError *error, ErrorCode code, const QString &message)
{
    if (!error) {
        return;
    }
    error->code = code;
    error->message = message;
}

QVariantMap toVariantMap(const FileEntry &entry)
{
    QVariantMap map;
    map.insert("path", entry.path);
    map.insert("name", entry.name);
    map.insert("extension", entry.extension);
    map.insert("size", entry.size);
    map.insert("modified", entry.modified.toMSecsSinceEpoch());
    map.insert("isImage", entry.isImage);
    return map;
}

QVariantMap toVariantMap(const HashResult &result)
{
    QVariantMap map;
    map.insert("filepath", result.path);
    map.insert("hash", result.hash);
    map.insert("algorithm", result.algorithm);
    map.insert("filesize", result.size);
    return map;
}

QVariantMap toVariantMap(const DuplicateGroup &group)
{
    QVariantMap map;
    map.insert("hash", group.hash);
    map.insert("filesize", group.fileSize);
    map.insert("files", group.files);
    return map;
}

QVariantMap toVariantMap(const ScanStats &stats)
{
    QVariantMap map;
    map.insert("totalFiles", stats.totalFiles);
    map.insert("totalSize", stats.totalSize);
    map.insert("imageFiles", stats.imageFiles);
    map.insert("directories", stats.directories);
    if (stats.lastScanned.isValid()) {
        map.insert("lastScanned", stats.lastScanned.toMSecsSinceEpoch());
    }
    return map;
}
