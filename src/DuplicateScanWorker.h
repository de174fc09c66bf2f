#pragma once

#include <QObject>
#include <QAtomicInt>
#include <QString>
#include <QStringList>
#include <QVariantMap>

class ContentHasher;

/**
 * @brief Runs a two-phase duplicate search on a worker thread.
 *
 * Move the worker to a QThread and invoke start(). cancel() may be called from
 * any thread; the search stops before the next file.
 */
class DuplicateScanWorker : public QObject
{
    Q_OBJECT

public:
    DuplicateScanWorker(const ContentHasher &hasher, const QStringList &paths, QObject *parent = nullptr);

public slots:
    void start();
    void cancel();

signals:
    void progress(const QString &phase, int completed, int total, const QString &currentPath);
    void finished(QVariantMap result);

private:
    bool isCancelled() const;

    const ContentHasher &m_hasher;
    QStringList m_paths;
    QAtomicInt m_cancelled = 0;
};
