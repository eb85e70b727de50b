#include "region/DragController.h"
#include "detection/DetectionStore.h"

#include <QDebug>

DragController::DragController(DetectionStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_policy(StatusPromotion::keepStatus())
{
}

void DragController::setStatusPromotionPolicy(const StatusPromotionPolicy& policy)
{
    m_policy = policy ? policy : StatusPromotion::keepStatus();
}

bool DragController::start(const QPointF& clientPos, const QString& detectionId, const ViewGeometry& view)
{
    if (!m_store || m_store->isLocked()) {
        qDebug() << "DragController: Drag start ignored, store locked";
        return false;
    }
    if (detectionId.isEmpty() || m_store->selectedId() != detectionId) {
        qDebug() << "DragController: Drag start ignored, detection not selected" << detectionId;
        return false;
    }
    if (!view.isValid()) {
        qDebug() << "DragController: Drag start ignored, image geometry unknown";
        return false;
    }

    const auto detection = m_store->detection(detectionId);
    if (!detection || detection->isDeleted()) {
        return false;
    }

    m_detectionId = detectionId;
    m_view = view;
    m_startPointer = clientPos;
    m_startRect = detection->rect();
    m_state = State::Dragging;
    emit stateChanged(m_state);
    return true;
}

void DragController::move(const QPointF& clientPos)
{
    if (m_state != State::Dragging) {
        return;
    }

    const QPointF delta = CoordinateHelper::screenDeltaToImage(clientPos - m_startPointer, m_view);
    const BoxRect moved = BoxGeometry::translatedWithin(m_startRect, delta, m_view.naturalSize);

    DetectionPatch patch;
    patch.rect = moved;
    m_store->update(m_detectionId, patch);
}

bool DragController::end()
{
    if (m_state != State::Dragging) {
        return false;
    }

    const QString id = m_detectionId;
    const auto detection = m_store->detection(id);
    const bool changed = detection && detection->rect() != m_startRect;

    if (changed) {
        const DetectionStatus promoted = m_policy(detection->status, EditKind::Move);
        if (promoted != detection->status) {
            DetectionPatch patch;
            patch.status = promoted;
            m_store->update(id, patch);
        }
    }

    reset();
    if (changed) {
        emit detectionMoved(id);
    }
    return changed;
}

void DragController::cancel()
{
    if (m_state != State::Dragging) {
        return;
    }

    DetectionPatch patch;
    patch.rect = m_startRect;
    m_store->update(m_detectionId, patch);
    reset();
}

void DragController::reset()
{
    m_detectionId.clear();
    m_state = State::Idle;
    emit stateChanged(m_state);
}
