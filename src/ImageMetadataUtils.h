#pragma once

#include <QSet>
#include <QSize>
#include <QString>

namespace ImageMetadataUtils {

struct ImageSizeResult {
    bool valid = false;
    QSize size;
    QString format;
};

const QSet<QString> &imageExtensions();
bool isImageFile(const QString &fileName);
ImageSizeResult readImageSize(const QString &path);

} // namespace ImageMetadataUtils
