#ifndef RESIZECONTROLLER_H
#define RESIZECONTROLLER_H

#include <QObject>
#include <QPointF>
#include <QString>

#include "detection/StatusPromotionPolicy.h"
#include "region/BoxGeometry.h"
#include "utils/CoordinateHelper.h"

class DetectionStore;

/**
 * @brief State machine for resizing the selected detection by one of eight handles.
 *
 * Each handle owns one or two edges. The owned edges follow the pointer
 * (clamped to the image) while the opposite edges stay fixed. An edge that
 * would come closer than the minimum size to its opposite edge is held in
 * place; dragging it past the opposite edge by at least the minimum size
 * flips the box and the active handle with it.
 */
class ResizeController : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Resizing
    };
    Q_ENUM(State)

    struct Result {
        BoxRect rect;
        ResizeHandle handle = ResizeHandle::None;
    };

    explicit ResizeController(DetectionStore* store, QObject* parent = nullptr);

    bool start(ResizeHandle handle, const QPointF& clientPos,
               const QString& detectionId, const ViewGeometry& view);
    void move(const QPointF& clientPos);

    // Returns true if the detection geometry changed
    bool end();
    void cancel();

    State state() const { return m_state; }
    bool isActive() const { return m_state == State::Resizing; }
    QString detectionId() const { return m_detectionId; }

    // Handle currently being dragged (changes when the box flips)
    ResizeHandle activeHandle() const { return m_activeHandle; }

    void setMinimumBoxSize(qreal screenPixels) { m_minBoxSize = screenPixels; }
    qreal minimumBoxSize() const { return m_minBoxSize; }
    void setStatusPromotionPolicy(const StatusPromotionPolicy& policy);

    /**
     * @brief Apply one pointer position to a rectangle.
     * @param rect Current rectangle (image pixels)
     * @param handle Handle being dragged
     * @param imagePos Pointer in image pixels
     * @param minSize Minimum edge distance in image pixels
     * @param bounds Natural image size
     */
    static Result resizedRect(const BoxRect& rect, ResizeHandle handle, const QPointF& imagePos,
                              qreal minSize, const QSizeF& bounds);

signals:
    void stateChanged(ResizeController::State state);
    void activeHandleChanged(ResizeHandle handle);
    void detectionResized(const QString& id);

private:
    void reset();

    DetectionStore* m_store;
    State m_state = State::Idle;
    StatusPromotionPolicy m_policy;
    qreal m_minBoxSize;

    QString m_detectionId;
    ViewGeometry m_view;
    ResizeHandle m_activeHandle = ResizeHandle::None;
    BoxRect m_startRect;
    BoxRect m_currentRect;
};

#endif // RESIZECONTROLLER_H
