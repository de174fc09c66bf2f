#pragma once

#include <QObject>
#include <QAtomicInt>
#include <QVariantMap>
#include <QStringList>

class DeletionCoordinator;

class TrashWorker : public QObject
{
    Q_OBJECT

public:
    static constexpr int noKeepIndex = -1;

    TrashWorker(const DeletionCoordinator &coordinator, const QStringList &paths, int keepIndex = noKeepIndex,
                QObject *parent = nullptr);

public slots:
    void start();
    void cancel();

signals:
    void progress(int completed, int total);
    void finished(QVariantMap result);

private:
    bool isCancelled() const;

    const DeletionCoordinator &m_coordinator;
    QStringList m_paths;
    int m_keepIndex = noKeepIndex;
    QAtomicInt m_cancelled = 0;
};
