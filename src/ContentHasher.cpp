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

#include "ContentHasher.h"

#include <QByteArray>
#include <QByteArrayView>
#include <QCoreApplication>
#include <QCryptographicHash>
#include <QFile>
#include <QFileInfo>

#include "HashJobs.h"
#include "LoggingUtils.h"

namespace {

struct ContentHasherConstants {
    static constexpr qint64 chunkSize = 64 * 1024;
    static constexpr QCryptographicHash::Algorithm algorithm = QCryptographicHash::Sha256;
    static constexpr char algorithmName[] = "sha256";
    static constexpr char emptyQuickHash[] = "empty";
};

QString tr(const char *text)
{
    return QCoreApplication::translate("ContentHasher", text);
}

/**
 * @brief Checks that a path names an existing regular file.
 * @param path Path to check.
 * @param info Output file info of the path.
 * @param error Optional error output.
 * @return True when the path is a regular file.
 */
bool checkRegularFile(const QString &path, QFileInfo *info, OperationError *error)
{
    *info = QFileInfo(path);
    if (!info->exists()) {
        setError(error, ErrorCode::FileNotFound, tr("File not found: %1").arg(path));
        return false;
    }
    if (!info->isFile()) {
        setError(error, ErrorCode::InvalidArgument, tr("Not a file: %1").arg(path));
        return false;
    }
    return true;
}

bool openForReading(QFile &file, OperationError *error)
{
    if (file.open(QIODevice::ReadOnly)) {
        return true;
    }
    const ErrorCode code = file.exists() ? ErrorCode::IoError : ErrorCode::FileNotFound;
    setError(error, code, tr("Cannot open %1: %2").arg(file.fileName(), file.errorString()));
    return false;
}

/**
 * @brief Reads up to length bytes at the current position into the digest.
 * @return Number of bytes read, or -1 on read failure.
 */
qint64 addChunk(QFile &file, QByteArray &buffer, qint64 length, QCryptographicHash &hash)
{
    const qint64 bytesRead = file.read(buffer.data(), length);
    if (bytesRead > 0) {
        hash.addData(QByteArrayView(buffer.constData(), bytesRead));
    }
    return bytesRead;
}

} // namespace

QString ContentHasher::algorithm() const
{
    return QLatin1String(ContentHasherConstants::algorithmName);
}

qint64 ContentHasher::chunkSize() const
{
    return ContentHasherConstants::chunkSize;
}

/**
 * @brief Computes the SHA-256 digest of a file, streaming it chunk by chunk.
 * @param path File to hash.
 * @param result Output hash result with path, hex digest, algorithm and size.
 * @param error Optional error output (FileNotFound, InvalidArgument or IoError).
 * @return True on success.
 */
bool ContentHasher::fullHash(const QString &path, HashResult *result, OperationError *error) const
{
    QFileInfo info;
    if (!checkRegularFile(path, &info, error)) {
        return false;
    }

    QFile file(path);
    if (!openForReading(file, error)) {
        return false;
    }

    QCryptographicHash hash(ContentHasherConstants::algorithm);
    QByteArray buffer(static_cast<int>(ContentHasherConstants::chunkSize), Qt::Uninitialized);
    qint64 total = 0;
    while (true) {
        const qint64 bytesRead = addChunk(file, buffer, ContentHasherConstants::chunkSize, hash);
        if (bytesRead < 0) {
            setError(error, ErrorCode::IoError, tr("Read failed for %1: %2").arg(path, file.errorString()));
            qCWarning(lcHasher) << "Read failed while hashing" << path << file.errorString();
            return false;
        }
        if (bytesRead == 0) {
            break;
        }
        total += bytesRead;
    }

    if (result) {
        result->path = path;
        result->hash = QString::fromLatin1(hash.result().toHex());
        result->algorithm = algorithm();
        result->size = total;
    }
    return true;
}

/**
 * @brief Computes the pre-filter fingerprint of a file.
 *
 * The digest covers the decimal file size, the first chunk and, for files
 * larger than two chunks, the last chunk. Identical files always share it.
 *
 * @param path File to fingerprint.
 * @param hash Output hex digest, or "empty" for zero-byte files.
 * @param error Optional error output.
 * @return True on success.
 */
bool ContentHasher::quickHash(const QString &path, QString *hash, OperationError *error) const
{
    QFileInfo info;
    if (!checkRegularFile(path, &info, error)) {
        return false;
    }

    const qint64 fileSize = info.size();
    if (fileSize == 0) {
        if (hash) {
            *hash = QLatin1String(ContentHasherConstants::emptyQuickHash);
        }
        return true;
    }

    QFile file(path);
    if (!openForReading(file, error)) {
        return false;
    }

    const qint64 chunk = ContentHasherConstants::chunkSize;
    QCryptographicHash digest(ContentHasherConstants::algorithm);
    digest.addData(QByteArray::number(fileSize));

    QByteArray buffer(static_cast<int>(chunk), Qt::Uninitialized);
    if (addChunk(file, buffer, qMin(chunk, fileSize), digest) < 0) {
        setError(error, ErrorCode::IoError, tr("Read failed for %1: %2").arg(path, file.errorString()));
        return false;
    }

    if (fileSize > chunk * 2) {
        if (!file.seek(fileSize - chunk) || addChunk(file, buffer, chunk, digest) < 0) {
            setError(error, ErrorCode::IoError, tr("Read failed for %1: %2").arg(path, file.errorString()));
            return false;
        }
    }

    if (hash) {
        *hash = QString::fromLatin1(digest.result().toHex());
    }
    return true;
}

/**
 * @brief Compares two files by content, checking sizes before hashing.
 * @return True when both files hash to the same digest; false when they differ or on error.
 */
bool ContentHasher::areFilesIdentical(const QString &left, const QString &right, OperationError *error) const
{
    QFileInfo leftInfo;
    QFileInfo rightInfo;
    if (!checkRegularFile(left, &leftInfo, error) || !checkRegularFile(right, &rightInfo, error)) {
        return false;
    }
    if (leftInfo.size() != rightInfo.size()) {
        return false;
    }

    HashResult leftHash;
    HashResult rightHash;
    if (!fullHash(left, &leftHash, error) || !fullHash(right, &rightHash, error)) {
        return false;
    }
    return leftHash.hash == rightHash.hash;
}

/**
 * @brief Fully hashes a list of files one after the other.
 *
 * A failing file is recorded in the failures list and the batch continues.
 *
 * @param paths Files to hash, processed in order.
 * @param onProgress Optional callback receiving (completed, total) after each file.
 * @return Successful results and per-path failures.
 */
HashBatchResult ContentHasher::hashBatch(const QStringList &paths, const ProgressCallback &onProgress) const
{
    HashBatchJob job(*this, paths);
    while (!job.atEnd()) {
        const JobProgress progress = job.step();
        if (onProgress) {
            onProgress(progress.completed, progress.total);
        }
    }
    if (!job.result().failures.isEmpty()) {
        qCInfo(lcHasher) << "Hash batch finished with" << job.result().failures.size() << "failures out of" << paths.size();
    }
    return job.result();
}

/**
 * @brief Finds duplicate files with a quick pre-filter followed by full hashing of candidates.
 * @param paths Files to compare.
 * @param onProgress Optional callback receiving the progress of each processed file.
 * @return Duplicate groups ordered by descending member count.
 */
QVector<DuplicateGroup> ContentHasher::twoPhaseDuplicates(const QStringList &paths,
                                                          const JobProgressCallback &onProgress) const
{
    TwoPhaseDuplicateJob job(*this, paths);
    while (!job.atEnd()) {
        const JobProgress progress = job.step();
        if (onProgress) {
            onProgress(progress);
        }
    }
    return job.groups();
}
