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

#include "PathUtils.h"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>

namespace PathUtils {

namespace {

void setReason(QString *reason, const char *text)
{
    if (reason) {
        *reason = QCoreApplication::translate("PathUtils", text);
    }
}

} // namespace

/**
 * @brief Normalizes a path for consistent comparisons.
 * @param path Input path to normalize.
 * @return Clean absolute path using forward slashes, or an empty string for empty input.
 */
QString normalizePath(const QString &path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty()) {
        return QString();
    }
    const QString fromNative = QDir::fromNativeSeparators(trimmed);
    return QDir::cleanPath(QDir(fromNative).absolutePath());
}

/**
 * @brief Checks that a path is an existing, readable directory.
 *
 * This check does not depend on any configured root, so it is the one used
 * when a new root directory is selected.
 *
 * @param path Candidate directory path.
 * @param reason Optional output describing why the path was rejected.
 * @return True when the directory exists and is readable, false otherwise.
 */
bool isAccessibleDirectory(const QString &path, QString *reason)
{
    if (path.trimmed().isEmpty()) {
        setReason(reason, "Path is empty");
        return false;
    }
    const QFileInfo info(path);
    if (!info.exists()) {
        setReason(reason, "Directory does not exist");
        return false;
    }
    if (!info.isDir()) {
        setReason(reason, "Not a directory");
        return false;
    }
    if (!info.isReadable()) {
        setReason(reason, "Directory is not readable");
        return false;
    }
    return true;
}

/**
 * @brief Checks whether a path lies inside an established root.
 * @param path Path to check.
 * @param root Root directory; an empty root contains nothing.
 * @return True when the path equals the root or is below it.
 */
bool isWithin(const QString &path, const QString &root)
{
    const QString normalizedRoot = normalizePath(root);
    const QString normalizedPath = normalizePath(path);
    if (normalizedRoot.isEmpty() || normalizedPath.isEmpty()) {
        return false;
    }
    if (normalizedPath == normalizedRoot) {
        return true;
    }
    const QString prefix = normalizedRoot.endsWith(QLatin1Char('/'))
        ? normalizedRoot
        : normalizedRoot + QLatin1Char('/');
    return normalizedPath.startsWith(prefix);
}

bool areAllWithin(const QStringList &paths, const QString &root)
{
    for (const QString &path : paths) {
        if (!isWithin(path, root)) {
            return false;
        }
    }
    return true;
}

bool isHiddenName(const QString &name)
{
    return name.startsWith(QLatin1Char('.'));
}

/**
 * @brief Checks an entry name against exclusion substrings.
 * @param name File or folder name (not a full path).
 * @param patterns Substrings; a name containing any of them is excluded.
 * @return True when the name is excluded.
 */
bool matchesExcludePattern(const QString &name, const QStringList &patterns)
{
    for (const QString &pattern : patterns) {
        if (!pattern.isEmpty() && name.contains(pattern)) {
            return true;
        }
    }
    return false;
}

} // namespace PathUtils
