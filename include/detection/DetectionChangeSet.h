#ifndef DETECTIONCHANGESET_H
#define DETECTIONCHANGESET_H

#include <QStringList>
#include <QVector>

#include "detection/Detection.h"

/**
 * @brief Difference between the live detections and the loaded baseline.
 *
 * This is what the persistence collaborator receives on save:
 * - added: ids the baseline does not know (originalLabel/originalConfidence
 *   are seeded from the current values)
 * - modified: same id, label/confidence/coordinates/status differ
 * - deleted: baseline ids that are gone or soft-deleted
 */
struct DetectionChangeSet
{
    QVector<Detection> added;
    QVector<Detection> modified;
    QStringList deleted;

    bool isEmpty() const { return added.isEmpty() && modified.isEmpty() && deleted.isEmpty(); }
    int size() const { return added.size() + modified.size() + deleted.size(); }

    static DetectionChangeSet calculate(const QVector<Detection>& current,
                                        const QVector<Detection>& original,
                                        const QString& uploadId);

    // Fields the persistence layer stores for an existing detection
    static bool hasPersistedFieldChanges(const Detection& current, const Detection& original);
};

#endif // DETECTIONCHANGESET_H
