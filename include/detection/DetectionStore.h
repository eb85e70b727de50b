#ifndef DETECTIONSTORE_H
#define DETECTIONSTORE_H

#include <QObject>
#include <QSet>
#include <QSizeF>
#include <QString>
#include <QVector>
#include <optional>

#include "detection/Detection.h"
#include "detection/DetectionFilter.h"

/**
 * @brief Live detection list of one editing session.
 *
 * Holds the detections of the active image, the baseline snapshot taken at
 * load time, the single selection and the mode flags the gesture
 * controllers consult. Invalid operations return false and leave the store
 * unchanged.
 */
class DetectionStore : public QObject
{
    Q_OBJECT

public:
    explicit DetectionStore(QObject* parent = nullptr);

    // Bulk load; also replaces the baseline and clears the selection
    void setAll(const QVector<Detection>& detections);
    void clear();

    QVector<Detection> detections() const { return m_detections; }
    QVector<Detection> baseline() const { return m_baseline; }
    std::optional<Detection> detection(const QString& id) const;
    bool contains(const QString& id) const { return indexOf(id) >= 0; }
    int count() const { return m_detections.size(); }

    // Not counting soft-deleted detections
    int activeCount() const;

    // True when the id is part of the baseline snapshot
    bool isPersisted(const QString& id) const;

    /**
     * @brief Append a detection and select it.
     *
     * An empty id is replaced by a generated UUID. Returns the id, or an
     * empty string if the id is taken or the rectangle is invalid.
     */
    QString add(const Detection& detection);
    bool update(const QString& id, const DetectionPatch& patch);

    // Soft delete: status deleted, deletedAt stamped
    bool remove(const QString& id);

    // Hard removal, only for detections that were never persisted
    bool purge(const QString& id);

    // Selection
    bool select(const QString& id);
    void clearSelection();
    QString selectedId() const { return m_selectedId; }
    bool hasSelection() const { return !m_selectedId.isEmpty(); }
    std::optional<Detection> selectedDetection() const;

    // Every non-deleted detection becomes user_confirmed; returns how many changed
    int verifyAll();

    void resetToBaseline();
    void commitBaseline();
    // Baseline becomes the given snapshot; live edits made after it was taken stay unsaved
    void commitBaseline(const QVector<Detection>& saved);
    bool hasUnsavedChanges() const;

    // Modes
    void setLocked(bool locked);
    bool isLocked() const { return m_locked; }
    void setDrawMode(bool enabled);
    bool isDrawMode() const { return m_drawMode; }
    void setSelectMode(bool enabled);
    bool isSelectMode() const { return m_selectMode; }

    // Natural image size; when known, committed rectangles must lie inside it
    void setImageSize(const QSizeF& size) { m_imageSize = size; }
    QSizeF imageSize() const { return m_imageSize; }

    // Filtering (derived view only)
    void setFilterCriteria(const DetectionFilter::Criteria& criteria);
    DetectionFilter::Criteria filterCriteria() const { return m_criteria; }
    void setDisplayFilter(DetectionFilter::DisplayFilter filter);
    void setClassFilter(const QSet<QString>& classes);
    void setViewMode(DetectionFilter::ViewMode mode);
    QVector<Detection> visibleDetections() const;

signals:
    void detectionsReset();
    void detectionAdded(const QString& id);
    void detectionUpdated(const QString& id);
    void detectionRemoved(const QString& id);
    void detectionsChanged();
    void selectionChanged(const QString& id);
    void drawModeChanged(bool enabled);
    void selectModeChanged(bool enabled);
    void lockedChanged(bool locked);
    void filterChanged();
    void baselineChanged();

private:
    int indexOf(const QString& id) const;
    bool isAcceptableRect(const BoxRect& rect) const;
    void applySelection(const QString& id);

    QVector<Detection> m_detections;
    QVector<Detection> m_baseline;
    QString m_selectedId;
    QSizeF m_imageSize;
    DetectionFilter::Criteria m_criteria;
    bool m_locked = false;
    bool m_drawMode = false;
    bool m_selectMode = false;
};

#endif // DETECTIONSTORE_H
