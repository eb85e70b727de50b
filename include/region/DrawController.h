#ifndef DRAWCONTROLLER_H
#define DRAWCONTROLLER_H

#include <QObject>
#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <optional>

#include "region/BoxGeometry.h"
#include "region/DelayedFlag.h"
#include "utils/CoordinateHelper.h"

class DetectionStore;

/**
 * @brief State machine for drawing a new detection with the pointer.
 *
 * Idle -> Drawing -> Idle. The gesture is tracked in container-local screen
 * pixels so the minimum size is zoom-independent; the committed rectangle is
 * mapped into image pixels and clamped to the image.
 */
class DrawController : public QObject
{
    Q_OBJECT

public:
    enum class State {
        Idle,
        Drawing
    };
    Q_ENUM(State)

    explicit DrawController(DetectionStore* store, QObject* parent = nullptr);

    // Returns false (and stays Idle) when preconditions are not met
    bool start(const QPointF& clientPos, const ViewGeometry& view);
    void move(const QPointF& clientPos);

    // Id of the committed detection, if any
    std::optional<QString> end(const QPointF& clientPos);
    void cancel();

    State state() const { return m_state; }
    bool isActive() const { return m_state == State::Drawing; }

    // Container-local rectangle of the gesture in progress
    QRectF previewRect() const;

    // True for a short time after a successful draw
    bool justFinishedDrawing() const { return m_justFinished.isSet(); }

    void setMinimumBoxSize(qreal screenPixels) { m_minBoxSize = screenPixels; }
    qreal minimumBoxSize() const { return m_minBoxSize; }
    void setDefaultLabel(const QString& label) { m_defaultLabel = label; }
    QString defaultLabel() const { return m_defaultLabel; }
    void setSuppressionDelayMs(int ms) { m_suppressionDelayMs = ms; }
    int suppressionDelayMs() const { return m_suppressionDelayMs; }
    void setUploadId(const QString& uploadId) { m_uploadId = uploadId; }

    // Container-local rectangle -> clamped image rectangle
    static BoxRect containerRectToImage(const QRectF& containerRect, const ViewGeometry& view);

signals:
    void stateChanged(DrawController::State state);
    void previewChanged(const QRectF& containerRect);
    void detectionDrawn(const QString& id);
    void justFinishedCleared();

private:
    void setState(State state);

    DetectionStore* m_store;
    State m_state = State::Idle;
    ViewGeometry m_view;
    QPointF m_startPoint;
    QPointF m_currentPoint;

    qreal m_minBoxSize;
    QString m_defaultLabel;
    int m_suppressionDelayMs;
    QString m_uploadId;
    DelayedFlag m_justFinished;
};

#endif // DRAWCONTROLLER_H
