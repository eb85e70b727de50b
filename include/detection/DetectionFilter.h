#ifndef DETECTIONFILTER_H
#define DETECTIONFILTER_H

#include <QSet>
#include <QString>
#include <QVector>

#include "detection/Detection.h"

/**
 * @brief Derived view over the live detection list.
 *
 * Filtering never mutates the store. Deleted detections are never visible.
 */
class DetectionFilter
{
public:
    enum class DisplayFilter {
        All,
        Verified,
        Unverified
    };

    enum class ViewMode {
        Normal,
        ImageOnly,  // Image without boxes
        None        // Nothing rendered
    };

    struct Criteria {
        DisplayFilter display = DisplayFilter::All;
        QSet<QString> classes = allClasses();
        ViewMode viewMode = ViewMode::Normal;
    };

    static QVector<Detection> apply(const QVector<Detection>& detections, const Criteria& criteria);

    static bool matchesDisplayFilter(const Detection& detection, DisplayFilter filter);

    // A class filter naming every known label disables class filtering
    static bool coversAllClasses(const QSet<QString>& classes);
    static QSet<QString> allClasses();

private:
    DetectionFilter() = delete;
};

#endif // DETECTIONFILTER_H
