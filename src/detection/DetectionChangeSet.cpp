#include "detection/DetectionChangeSet.h"

#include <QHash>
#include <QSet>

bool DetectionChangeSet::hasPersistedFieldChanges(const Detection& current, const Detection& original)
{
    return current.label != original.label
        || current.confidence != original.confidence
        || current.xMin != original.xMin
        || current.yMin != original.yMin
        || current.xMax != original.xMax
        || current.yMax != original.yMax
        || current.status != original.status;
}

DetectionChangeSet DetectionChangeSet::calculate(const QVector<Detection>& current,
                                                 const QVector<Detection>& original,
                                                 const QString& uploadId)
{
    DetectionChangeSet changes;

    QHash<QString, int> originalIndex;
    originalIndex.reserve(original.size());
    for (int i = 0; i < original.size(); ++i) {
        originalIndex.insert(original[i].id, i);
    }

    QSet<QString> liveIds;
    for (const Detection& detection : current) {
        const auto it = originalIndex.constFind(detection.id);
        if (it == originalIndex.constEnd()) {
            // Drawn and deleted before it was ever saved
            if (detection.isDeleted()) {
                continue;
            }
            Detection added = detection;
            added.uploadId = uploadId;
            added.originalLabel = detection.label;
            added.originalConfidence = detection.confidence;
            changes.added.push_back(added);
            continue;
        }

        if (detection.isDeleted()) {
            continue;
        }

        liveIds.insert(detection.id);
        if (hasPersistedFieldChanges(detection, original[it.value()])) {
            changes.modified.push_back(detection);
        }
    }

    for (const Detection& detection : original) {
        if (!detection.isDeleted() && !liveIds.contains(detection.id)) {
            changes.deleted.push_back(detection.id);
        }
    }

    return changes;
}
