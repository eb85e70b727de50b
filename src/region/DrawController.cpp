#include "region/DrawController.h"
#include "detection/Detection.h"
#include "detection/DetectionStore.h"
#include "Constants.h"

#include <QDateTime>
#include <QDebug>

DrawController::DrawController(DetectionStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_minBoxSize(BoxEdit::Interaction::kMinBoxSize)
    , m_defaultLabel(DetectionLabels::defaultDrawLabel())
    , m_suppressionDelayMs(BoxEdit::Timer::kDrawClickSuppression)
{
    connect(&m_justFinished, &DelayedFlag::cleared, this, &DrawController::justFinishedCleared);
}

bool DrawController::start(const QPointF& clientPos, const ViewGeometry& view)
{
    if (!m_store || !m_store->isDrawMode() || m_store->isLocked()) {
        qDebug() << "DrawController: Draw start ignored, draw mode off or store locked";
        return false;
    }
    if (!view.isValid()) {
        qDebug() << "DrawController: Draw start ignored, image geometry unknown";
        return false;
    }

    m_justFinished.cancel();
    m_view = view;
    m_startPoint = CoordinateHelper::clientToContainer(clientPos, view);
    m_currentPoint = m_startPoint;
    setState(State::Drawing);
    emit previewChanged(previewRect());
    return true;
}

void DrawController::move(const QPointF& clientPos)
{
    if (m_state != State::Drawing) {
        return;
    }
    m_currentPoint = CoordinateHelper::clientToContainer(clientPos, m_view);
    emit previewChanged(previewRect());
}

std::optional<QString> DrawController::end(const QPointF& clientPos)
{
    if (m_state != State::Drawing) {
        return std::nullopt;
    }

    m_currentPoint = CoordinateHelper::clientToContainer(clientPos, m_view);
    const QRectF containerRect = previewRect();
    setState(State::Idle);
    emit previewChanged(QRectF());

    if (containerRect.width() < m_minBoxSize || containerRect.height() < m_minBoxSize) {
        qDebug() << "DrawController: Box below minimum size discarded" << containerRect.size();
        return std::nullopt;
    }

    const BoxRect imageRect = containerRectToImage(containerRect, m_view);
    if (!imageRect.isValid()) {
        qDebug() << "DrawController: Box outside the image discarded";
        return std::nullopt;
    }

    const QDateTime now = QDateTime::currentDateTimeUtc();
    const QString label = DetectionLabels::isKnown(m_defaultLabel)
        ? m_defaultLabel : DetectionLabels::defaultDrawLabel();

    Detection detection;
    detection.uploadId = m_uploadId;
    detection.label = label;
    detection.originalLabel = label;
    detection.status = DetectionStatus::UserConfirmed;
    detection.setRect(imageRect);
    detection.createdAt = now;
    detection.updatedAt = now;

    const QString id = m_store->add(detection);
    if (id.isEmpty()) {
        return std::nullopt;
    }

    m_justFinished.arm(m_suppressionDelayMs);
    emit detectionDrawn(id);
    return id;
}

void DrawController::cancel()
{
    if (m_state != State::Drawing) {
        return;
    }
    setState(State::Idle);
    emit previewChanged(QRectF());
}

QRectF DrawController::previewRect() const
{
    if (m_state != State::Drawing) {
        return QRectF();
    }
    return QRectF(m_startPoint, m_currentPoint).normalized();
}

BoxRect DrawController::containerRectToImage(const QRectF& containerRect, const ViewGeometry& view)
{
    const QPointF topLeft = CoordinateHelper::containerToImage(containerRect.topLeft(), view);
    const QPointF bottomRight = CoordinateHelper::containerToImage(containerRect.bottomRight(), view);
    return BoxGeometry::clampedToBounds(BoxRect::fromPoints(topLeft, bottomRight), view.naturalSize);
}

void DrawController::setState(State state)
{
    if (m_state == state) {
        return;
    }
    m_state = state;
    emit stateChanged(m_state);
}
