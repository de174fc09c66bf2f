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

#include "ImageMetadataUtils.h"

#include <QFileInfo>
#include <QImageReader>

namespace ImageMetadataUtils {

/**
 * @brief Returns the fixed set of image file extensions, lowercase and without dot.
 * @return Set of image extensions.
 */
const QSet<QString> &imageExtensions()
{
    static const QSet<QString> extensions = {
        QStringLiteral("jpg"), QStringLiteral("jpeg"), QStringLiteral("png"),
        QStringLiteral("gif"), QStringLiteral("bmp"), QStringLiteral("tiff"),
        QStringLiteral("tif"), QStringLiteral("webp"), QStringLiteral("svg"),
        QStringLiteral("ico"), QStringLiteral("heic"), QStringLiteral("heif"),
        QStringLiteral("raw"), QStringLiteral("dng")
    };
    return extensions;
}

/**
 * @brief Classifies a file name or path by its extension.
 * @param fileName File name or full path.
 * @return True when the extension is in the image allowlist.
 */
bool isImageFile(const QString &fileName)
{
    const QString suffix = QFileInfo(fileName).suffix().toLower();
    if (suffix.isEmpty()) {
        return false;
    }
    return imageExtensions().contains(suffix);
}

/**
 * @brief Reads image dimensions from the file header without decoding pixels.
 * @param path Image file path.
 * @return Size result; invalid when the format is not readable by Qt.
 */
ImageSizeResult readImageSize(const QString &path)
{
    ImageSizeResult result;
    QImageReader reader(path);
    reader.setAutoTransform(true);
    const QSize size = reader.size();
    if (!size.isValid()) {
        return result;
    }
    result.valid = true;
    result.size = size;
    result.format = QString::fromLatin1(reader.format()).toLower();
    return result;
}

} // namespace ImageMetadataUtils
