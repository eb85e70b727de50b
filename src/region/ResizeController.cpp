#include "region/ResizeController.h"
#include "detection/DetectionStore.h"
#include "Constants.h"

#include <QDebug>

namespace {

enum class AxisMove {
    Pin,
    Follow,
    Flip
};

// Where the owned edge may go given the fixed opposite edge
AxisMove classifyAxis(qreal pointer, qreal opposite, qreal minSize, bool ownedIsMin)
{
    const qreal distance = ownedIsMin ? (opposite - pointer) : (pointer - opposite);
    if (distance >= minSize) {
        return AxisMove::Follow;
    }
    if (-distance >= minSize) {
        return AxisMove::Flip;
    }
    return AxisMove::Pin;
}

// Owned edge resolved against the fixed opposite edge; inside the band it stops at the band limit
qreal resolveEdge(AxisMove move, qreal pointer, qreal opposite, qreal minSize,
                  bool ownedIsMin, qreal upperBound)
{
    if (move != AxisMove::Pin) {
        return pointer;
    }
    return ownedIsMin ? qMax(0.0, opposite - minSize)
                      : qMin(upperBound, opposite + minSize);
}

} // namespace

ResizeController::ResizeController(DetectionStore* store, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_policy(StatusPromotion::keepStatus())
    , m_minBoxSize(BoxEdit::Interaction::kMinBoxSize)
{
}

void ResizeController::setStatusPromotionPolicy(const StatusPromotionPolicy& policy)
{
    m_policy = policy ? policy : StatusPromotion::keepStatus();
}

bool ResizeController::start(ResizeHandle handle, const QPointF& clientPos,
                             const QString& detectionId, const ViewGeometry& view)
{
    Q_UNUSED(clientPos);

    if (handle == ResizeHandle::None) {
        return false;
    }
    if (!m_store || m_store->isLocked()) {
        qDebug() << "ResizeController: Resize start ignored, store locked";
        return false;
    }
    if (detectionId.isEmpty() || m_store->selectedId() != detectionId) {
        qDebug() << "ResizeController: Resize start ignored, detection not selected" << detectionId;
        return false;
    }
    if (!view.isValid()) {
        qDebug() << "ResizeController: Resize start ignored, image geometry unknown";
        return false;
    }

    const auto detection = m_store->detection(detectionId);
    if (!detection || detection->isDeleted()) {
        return false;
    }

    m_detectionId = detectionId;
    m_view = view;
    m_activeHandle = handle;
    m_startRect = detection->rect();
    m_currentRect = m_startRect;
    m_state = State::Resizing;
    emit stateChanged(m_state);
    emit activeHandleChanged(m_activeHandle);
    return true;
}

void ResizeController::move(const QPointF& clientPos)
{
    if (m_state != State::Resizing) {
        return;
    }

    const QPointF imagePos = CoordinateHelper::screenToImage(clientPos, m_view);
    const qreal minSize = CoordinateHelper::screenLengthToZoomed(m_minBoxSize, m_view.transform.scale);
    const Result result = resizedRect(m_currentRect, m_activeHandle, imagePos, minSize, m_view.naturalSize);

    if (result.rect != m_currentRect) {
        DetectionPatch patch;
        patch.rect = result.rect;
        if (!m_store->update(m_detectionId, patch)) {
            return;
        }
        m_currentRect = result.rect;
    }

    if (result.handle != m_activeHandle) {
        m_activeHandle = result.handle;
        emit activeHandleChanged(m_activeHandle);
    }
}

bool ResizeController::end()
{
    if (m_state != State::Resizing) {
        return false;
    }

    const QString id = m_detectionId;
    const auto detection = m_store->detection(id);
    const bool changed = detection && detection->rect() != m_startRect;

    if (changed) {
        const DetectionStatus promoted = m_policy(detection->status, EditKind::Resize);
        if (promoted != detection->status) {
            DetectionPatch patch;
            patch.status = promoted;
            m_store->update(id, patch);
        }
    }

    reset();
    if (changed) {
        emit detectionResized(id);
    }
    return changed;
}

void ResizeController::cancel()
{
    if (m_state != State::Resizing) {
        return;
    }

    DetectionPatch patch;
    patch.rect = m_startRect;
    m_store->update(m_detectionId, patch);
    reset();
}

void ResizeController::reset()
{
    m_detectionId.clear();
    m_activeHandle = ResizeHandle::None;
    m_state = State::Idle;
    emit stateChanged(m_state);
}

ResizeController::Result ResizeController::resizedRect(const BoxRect& rect, ResizeHandle handle,
                                                       const QPointF& imagePos, qreal minSize,
                                                       const QSizeF& bounds)
{
    const QPointF p = CoordinateHelper::clampToImage(imagePos, bounds);
    const int edges = BoxGeometry::edgesForHandle(handle);

    BoxRect next = rect;
    bool flipX = false;
    bool flipY = false;

    if (edges & BoxGeometry::LeftEdge) {
        const AxisMove m = classifyAxis(p.x(), rect.xMax, minSize, true);
        next.xMin = resolveEdge(m, p.x(), rect.xMax, minSize, true, bounds.width());
        flipX = (m == AxisMove::Flip);
    } else if (edges & BoxGeometry::RightEdge) {
        const AxisMove m = classifyAxis(p.x(), rect.xMin, minSize, false);
        next.xMax = resolveEdge(m, p.x(), rect.xMin, minSize, false, bounds.width());
        flipX = (m == AxisMove::Flip);
    }

    if (edges & BoxGeometry::TopEdge) {
        const AxisMove m = classifyAxis(p.y(), rect.yMax, minSize, true);
        next.yMin = resolveEdge(m, p.y(), rect.yMax, minSize, true, bounds.height());
        flipY = (m == AxisMove::Flip);
    } else if (edges & BoxGeometry::BottomEdge) {
        const AxisMove m = classifyAxis(p.y(), rect.yMin, minSize, false);
        next.yMax = resolveEdge(m, p.y(), rect.yMin, minSize, false, bounds.height());
        flipY = (m == AxisMove::Flip);
    }

    Result result;
    result.rect = BoxGeometry::normalized(next);
    result.handle = BoxGeometry::flippedHandle(handle, flipX, flipY);
    return result;
}
