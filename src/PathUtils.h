#pragma once

#include <QString>
#include <QStringList>

namespace PathUtils {

QString normalizePath(const QString &path);
bool isAccessibleDirectory(const QString &path, QString *reason = nullptr);
bool isWithin(const QString &path, const QString &root);
bool areAllWithin(const QStringList &paths, const QString &root);
bool isHiddenName(const QString &name);
bool matchesExcludePattern(const QString &name, const QStringList &patterns);

} // namespace PathUtils
