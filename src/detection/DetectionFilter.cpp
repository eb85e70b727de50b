#include "detection/DetectionFilter.h"

QSet<QString> DetectionFilter::allClasses()
{
    const QStringList labels = DetectionLabels::all();
    return QSet<QString>(labels.cbegin(), labels.cend());
}

bool DetectionFilter::coversAllClasses(const QSet<QString>& classes)
{
    const QStringList labels = DetectionLabels::all();
    for (const QString& label : labels) {
        if (!classes.contains(label)) {
            return false;
        }
    }
    return true;
}

bool DetectionFilter::matchesDisplayFilter(const Detection& detection, DisplayFilter filter)
{
    switch (filter) {
    case DisplayFilter::All:
        return true;
    case DisplayFilter::Verified:
        return detection.isVerified();
    case DisplayFilter::Unverified:
        return !detection.isVerified();
    }
    return true;
}

QVector<Detection> DetectionFilter::apply(const QVector<Detection>& detections, const Criteria& criteria)
{
    QVector<Detection> visible;

    if (criteria.viewMode != ViewMode::Normal || criteria.classes.isEmpty()) {
        return visible;
    }

    const bool filterByClass = !coversAllClasses(criteria.classes);

    visible.reserve(detections.size());
    for (const Detection& detection : detections) {
        if (detection.isDeleted()) {
            continue;
        }
        if (filterByClass && !criteria.classes.contains(detection.label)) {
            continue;
        }
        if (!matchesDisplayFilter(detection, criteria.display)) {
            continue;
        }
        visible.push_back(detection);
    }
    return visible;
}
