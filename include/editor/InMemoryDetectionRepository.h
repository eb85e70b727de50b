#ifndef INMEMORYDETECTIONREPOSITORY_H
#define INMEMORYDETECTIONREPOSITORY_H

#include <QHash>

#include "detection/IDetectionRepository.h"

/**
 * @brief Process-local repository used by the demo application.
 *
 * Applies change sets to a per-image list and reports the result on the
 * next event loop iteration, like a network-backed repository would.
 */
class InMemoryDetectionRepository : public IDetectionRepository
{
    Q_OBJECT

public:
    explicit InMemoryDetectionRepository(QObject* parent = nullptr);

    QVector<Detection> loadDetections(const QString& uploadId) override;
    void saveDetections(const QString& uploadId,
                        const DetectionChangeSet& changes,
                        const SaveCallback& callback) override;

    void setDetections(const QString& uploadId, const QVector<Detection>& detections);
    int saveCount() const { return m_saveCount; }

signals:
    void detectionsSaved(const QString& uploadId, int changeCount);

private:
    bool applyChanges(const QString& uploadId, const DetectionChangeSet& changes, QString* error);

    QHash<QString, QVector<Detection>> m_detections;
    int m_saveCount = 0;
};

#endif // INMEMORYDETECTIONREPOSITORY_H
