#pragma once

#include <QString>
#include <QStringList>
#include <QtGlobal>

#include <memory>

#include "CoreTypes.h"

class QSettings;

/**
 * @brief Persistent scanner settings: root directory, watch flag, depth and exclusions.
 *
 * Uses the user-scope INI settings of the application, or an explicit INI file
 * when one is given (tests use a temporary file).
 */
class ScannerPreferences
{
public:
    explicit ScannerPreferences(const QString &iniFilePath = QString());

    static int defaultScanDepth();
    static int clampScanDepth(int depth);
    static QStringList defaultExcludePatterns();

    QString rootDirectory() const;
    qint64 lastAccessed() const;
    void setRootDirectory(const QString &path);
    void clearRootDirectory();

    bool watchEnabled() const;
    void setWatchEnabled(bool enabled);

    int scanDepth() const;
    void setScanDepth(int depth);

    QStringList excludePatterns() const;
    void setExcludePatterns(const QStringList &patterns);

    ScanStats lastScanStats() const;
    void setLastScanStats(const ScanStats &stats);

    QString fileName() const;

private:
    std::unique_ptr<QSettings> openSettings() const;

    QString m_iniFilePath;
};
