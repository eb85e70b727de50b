#ifndef DRAGCONTROLLER_H
#define DRAGCONTROLLER_H

#include <QObject>
#include <QPointF>
#include <QString>

#include "detection/StatusPromotionPolicy.h"
#include "region/BoxGeometry.h"
#include "utils/CoordinateHelper.h"

class DetectionStore;

/**
 * @brief State machine for moving the selected detection.
 *
 * Each move translates the rectangle captured at gesture start by the total
 * pointer delta, so rounding never accumulates. The box slides along the
 * image boundary instead of shrinking.
 */
class DragController : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Dragging
    };
    Q_ENUM(State)

    explicit DragController(DetectionStore* store, QObject* parent = nullptr);

    bool start(const QPointF& clientPos, const QString& detectionId, const ViewGeometry& view);
    void move(const QPointF& clientPos);

    // Returns true if the detection geometry changed
    bool end();
    void cancel();

    State state() const { return m_state; }
    bool isActive() const { return m_state == State::Dragging; }
    QString detectionId() const { return m_detectionId; }

    void setStatusPromotionPolicy(const StatusPromotionPolicy& policy);

signals:
    void stateChanged(DragController::State state);
    void detectionMoved(const QString& id);

private:
    void reset();

    DetectionStore* m_store;
    State m_state = State::Idle;
    StatusPromotionPolicy m_policy;

    QString m_detectionId;
    ViewGeometry m_view;
    QPointF m_startPointer;
    BoxRect m_startRect;
};

#endif // DRAGCONTROLLER_H
