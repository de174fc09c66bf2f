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

#include "ScannerPreferences.h"

#include <QDateTime>
#include <QSettings>

namespace {
constexpr char directoryGroup[] = "directory";
constexpr char rootDirectoryKey[] = "rootDirectory";
constexpr char lastAccessedKey[] = "lastAccessed";
constexpr char watchEnabledKey[] = "watchEnabled";
constexpr char scanDepthKey[] = "scanDepth";
constexpr char excludePatternsKey[] = "excludePatterns";
constexpr char lastScanStatsGroup[] = "lastScanStats";

struct ScannerPreferencesConstants {
    static constexpr int defaultScanDepth = 10;
    static constexpr int minimumScanDepth = 1;
    static constexpr int maximumScanDepth = 20;
};
}

ScannerPreferences::ScannerPreferences(const QString &iniFilePath)
    : m_iniFilePath(iniFilePath)
{
}

int ScannerPreferences::defaultScanDepth()
{
    return ScannerPreferencesConstants::defaultScanDepth;
}

int ScannerPreferences::clampScanDepth(int depth)
{
    return qBound(ScannerPreferencesConstants::minimumScanDepth, depth, ScannerPreferencesConstants::maximumScanDepth);
}

QStringList ScannerPreferences::defaultExcludePatterns()
{
    return {
        QStringLiteral("node_modules"),
        QStringLiteral(".git"),
        QStringLiteral(".DS_Store"),
        QStringLiteral("Thumbs.db"),
        QStringLiteral(".thumbnails")
    };
}

QString ScannerPreferences::rootDirectory() const
{
    const auto settings = openSettings();
    return settings->value(QLatin1String(rootDirectoryKey)).toString();
}

qint64 ScannerPreferences::lastAccessed() const
{
    const auto settings = openSettings();
    return settings->value(QLatin1String(lastAccessedKey), 0).toLongLong();
}

/**
 * @brief Stores the root directory and stamps the access time.
 */
void ScannerPreferences::setRootDirectory(const QString &path)
{
    const auto settings = openSettings();
    settings->setValue(QLatin1String(rootDirectoryKey), path);
    settings->setValue(QLatin1String(lastAccessedKey), QDateTime::currentMSecsSinceEpoch());
    settings->sync();
}

void ScannerPreferences::clearRootDirectory()
{
    const auto settings = openSettings();
    settings->remove(QLatin1String(rootDirectoryKey));
    settings->remove(QLatin1String(lastAccessedKey));
    settings->sync();
}

bool ScannerPreferences::watchEnabled() const
{
    const auto settings = openSettings();
    return settings->value(QLatin1String(watchEnabledKey), true).toBool();
}

void ScannerPreferences::setWatchEnabled(bool enabled)
{
    const auto settings = openSettings();
    settings->setValue(QLatin1String(watchEnabledKey), enabled);
    settings->sync();
}

int ScannerPreferences::scanDepth() const
{
    const auto settings = openSettings();
    bool ok = false;
    const int depth = settings->value(QLatin1String(scanDepthKey), defaultScanDepth()).toInt(&ok);
    return ok ? clampScanDepth(depth) : defaultScanDepth();
}

void ScannerPreferences::setScanDepth(int depth)
{
    const auto settings = openSettings();
    settings->setValue(QLatin1String(scanDepthKey), clampScanDepth(depth));
    settings->sync();
}

QStringList ScannerPreferences::excludePatterns() const
{
    const auto settings = openSettings();
    if (!settings->contains(QLatin1String(excludePatternsKey))) {
        return defaultExcludePatterns();
    }
    return settings->value(QLatin1String(excludePatternsKey)).toStringList();
}

void ScannerPreferences::setExcludePatterns(const QStringList &patterns)
{
    QStringList cleaned;
    for (const QString &pattern : patterns) {
        const QString trimmed = pattern.trimmed();
        if (!trimmed.isEmpty() && !cleaned.contains(trimmed)) {
            cleaned.append(trimmed);
        }
    }
    const auto settings = openSettings();
    settings->setValue(QLatin1String(excludePatternsKey), cleaned);
    settings->sync();
}

ScanStats ScannerPreferences::lastScanStats() const
{
    ScanStats stats;
    const auto settings = openSettings();
    settings->beginGroup(QLatin1String(lastScanStatsGroup));
    stats.totalFiles = settings->value(QStringLiteral("totalFiles"), 0).toInt();
    stats.totalSize = settings->value(QStringLiteral("totalSize"), 0).toLongLong();
    stats.imageFiles = settings->value(QStringLiteral("imageFiles"), 0).toInt();
    stats.directories = settings->value(QStringLiteral("directories"), 0).toInt();
    const qint64 scanned = settings->value(QStringLiteral("lastScanned"), 0).toLongLong();
    if (scanned > 0) {
        stats.lastScanned = QDateTime::fromMSecsSinceEpoch(scanned);
    }
    settings->endGroup();
    return stats;
}

void ScannerPreferences::setLastScanStats(const ScanStats &stats)
{
    const auto settings = openSettings();
    settings->beginGroup(QLatin1String(lastScanStatsGroup));
    settings->setValue(QStringLiteral("totalFiles"), stats.totalFiles);
    settings->setValue(QStringLiteral("totalSize"), stats.totalSize);
    settings->setValue(QStringLiteral("imageFiles"), stats.imageFiles);
    settings->setValue(QStringLiteral("directories"), stats.directories);
    settings->setValue(QStringLiteral("lastScanned"),
                       stats.lastScanned.isValid() ? stats.lastScanned.toMSecsSinceEpoch() : 0);
    settings->endGroup();
    settings->sync();
}

QString ScannerPreferences::fileName() const
{
    return openSettings()->fileName();
}

std::unique_ptr<QSettings> ScannerPreferences::openSettings() const
{
    std::unique_ptr<QSettings> settings;
    if (m_iniFilePath.isEmpty()) {
        settings = std::make_unique<QSettings>(QSettings::IniFormat, QSettings::UserScope, "PhotoDedup", "PhotoDedup");
    } else {
        settings = std::make_unique<QSettings>(m_iniFilePath, QSettings::IniFormat);
    }
    settings->beginGroup(QLatin1String(directoryGroup));
    return settings;
}
