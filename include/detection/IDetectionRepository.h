#ifndef IDETECTIONREPOSITORY_H
#define IDETECTIONREPOSITORY_H

#include <QObject>
#include <QString>
#include <QVector>
#include <functional>

#include "detection/Detection.h"
#include "detection/DetectionChangeSet.h"

// Callback type for async save results
using SaveCallback = std::function<void(bool success, const QString& error)>;

/**
 * @brief Abstract interface for the persistence collaborator.
 *
 * The editing engine never stores detections itself; it loads the list for
 * an image once and hands back change sets on save.
 */
class IDetectionRepository : public QObject
{
    Q_OBJECT

public:
    explicit IDetectionRepository(QObject* parent = nullptr) : QObject(parent) {}
    virtual ~IDetectionRepository() = default;

    virtual QVector<Detection> loadDetections(const QString& uploadId) = 0;

    /**
     * @brief Persist a change set.
     *
     * The callback is invoked exactly once, possibly asynchronously. Failures
     * are reported through it rather than thrown.
     */
    virtual void saveDetections(const QString& uploadId,
                                const DetectionChangeSet& changes,
                                const SaveCallback& callback) = 0;
};

#endif // IDETECTIONREPOSITORY_H
