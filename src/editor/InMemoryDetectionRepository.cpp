#include "editor/InMemoryDetectionRepository.h"

#include <QDateTime>
#include <QDebug>
#include <QTimer>

InMemoryDetectionRepository::InMemoryDetectionRepository(QObject* parent)
    : IDetectionRepository(parent)
{
}

QVector<Detection> InMemoryDetectionRepository::loadDetections(const QString& uploadId)
{
    return m_detections.value(uploadId);
}

void InMemoryDetectionRepository::setDetections(const QString& uploadId, const QVector<Detection>& detections)
{
    m_detections.insert(uploadId, detections);
}

bool InMemoryDetectionRepository::applyChanges(const QString& uploadId,
                                               const DetectionChangeSet& changes,
                                               QString* error)
{
    QVector<Detection> stored = m_detections.value(uploadId);
    const QDateTime now = QDateTime::currentDateTimeUtc();

    auto findIndex = [&stored](const QString& id) {
        for (int i = 0; i < stored.size(); ++i) {
            if (stored[i].id == id) {
                return i;
            }
        }
        return -1;
    };

    for (const Detection& detection : changes.modified) {
        const int index = findIndex(detection.id);
        if (index < 0) {
            *error = QStringLiteral("Detection %1 not found").arg(detection.id);
            return false;
        }
        stored[index] = detection;
    }

    for (const QString& id : changes.deleted) {
        const int index = findIndex(id);
        if (index < 0) {
            *error = QStringLiteral("Detection %1 not found").arg(id);
            return false;
        }
        stored.removeAt(index);
    }

    for (const Detection& detection : changes.added) {
        if (findIndex(detection.id) >= 0) {
            *error = QStringLiteral("Detection %1 already exists").arg(detection.id);
            return false;
        }
        Detection created = detection;
        if (!created.createdAt.isValid()) {
            created.createdAt = now;
        }
        stored.push_back(created);
    }

    m_detections.insert(uploadId, stored);
    return true;
}

void InMemoryDetectionRepository::saveDetections(const QString& uploadId,
                                                 const DetectionChangeSet& changes,
                                                 const SaveCallback& callback)
{
    QString error;
    const bool success = applyChanges(uploadId, changes, &error);
    if (success) {
        ++m_saveCount;
        qDebug() << "InMemoryDetectionRepository: Saved" << changes.size() << "changes for" << uploadId;
        emit detectionsSaved(uploadId, changes.size());
    } else {
        qWarning() << "InMemoryDetectionRepository: Save failed:" << error;
    }

    QTimer::singleShot(0, this, [callback, success, error]() {
        if (callback) {
            callback(success, error);
        }
    });
}
