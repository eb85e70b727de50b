#include "editor/AnnotationCanvas.h"
#include "editor/AnnotationEditorSession.h"
#include "detection/DetectionStore.h"
#include "input/PointerInput.h"
#include "region/DrawController.h"
#include "region/BoxGeometry.h"
#include "Constants.h"

#include <QKeyEvent>
#include <QMouseEvent>
#include <QPainter>
#include <QResizeEvent>
#include <QTouchEvent>
#include <QWheelEvent>

namespace {

Qt::CursorShape cursorForHandle(ResizeHandle handle)
{
    switch (handle) {
    case ResizeHandle::TopLeft:
    case ResizeHandle::BottomRight:
        return Qt::SizeFDiagCursor;
    case ResizeHandle::TopRight:
    case ResizeHandle::BottomLeft:
        return Qt::SizeBDiagCursor;
    case ResizeHandle::Top:
    case ResizeHandle::Bottom:
        return Qt::SizeVerCursor;
    case ResizeHandle::Left:
    case ResizeHandle::Right:
        return Qt::SizeHorCursor;
    case ResizeHandle::None:
        break;
    }
    return Qt::ArrowCursor;
}

} // namespace

AnnotationCanvas::AnnotationCanvas(AnnotationEditorSession* session, QWidget* parent)
    : QWidget(parent)
    , m_session(session)
{
    setAttribute(Qt::WA_AcceptTouchEvents);
    setMouseTracking(true);
    setFocusPolicy(Qt::StrongFocus);
    setMinimumSize(320, 240);

    DetectionStore* store = m_session->store();
    auto repaint = [this]() {
        refreshStatus();
        update();
    };
    connect(store, &DetectionStore::detectionsChanged, this, repaint);
    connect(store, &DetectionStore::selectionChanged, this, repaint);
    connect(store, &DetectionStore::drawModeChanged, this, repaint);
    connect(store, &DetectionStore::lockedChanged, this, repaint);
    connect(store, &DetectionStore::filterChanged, this, repaint);
    connect(store, &DetectionStore::baselineChanged, this, repaint);
    connect(m_session, &AnnotationEditorSession::savingChanged, this, repaint);
    connect(m_session->drawController(), &DrawController::previewChanged,
            this, QOverload<>::of(&QWidget::update));
}

void AnnotationCanvas::setImage(const QImage& image)
{
    m_image = image;
    resetView();
    updateRenderedGeometry();
    refreshStatus();
}

void AnnotationCanvas::resetView()
{
    m_transform = ViewTransform();
    applyTransform();
}

void AnnotationCanvas::applyTransform()
{
    m_session->setViewTransform(m_transform);
    update();
}

void AnnotationCanvas::updateRenderedGeometry()
{
    RenderedImageGeometry rendered;
    if (!m_image.isNull() && width() > 0 && height() > 0) {
        const qreal fit = qMin(static_cast<qreal>(width()) / m_image.width(),
                               static_cast<qreal>(height()) / m_image.height());
        rendered.width = m_image.width() * fit;
        rendered.height = m_image.height() * fit;
        rendered.left = (width() - rendered.width) / 2.0;
        rendered.top = (height() - rendered.height) / 2.0;
    }
    m_session->setRenderedImageGeometry(rendered);
    update();
}

void AnnotationCanvas::resizeEvent(QResizeEvent* event)
{
    QWidget::resizeEvent(event);
    updateRenderedGeometry();
}

void AnnotationCanvas::paintEvent(QPaintEvent*)
{
    QPainter painter(this);
    painter.fillRect(rect(), BoxEdit::Colors::kCanvasBackground);

    const ViewGeometry view = m_session->viewGeometry();
    DetectionStore* store = m_session->store();
    if (m_image.isNull() || !view.isValid()
        || store->filterCriteria().viewMode == DetectionFilter::ViewMode::None) {
        return;
    }

    painter.setRenderHint(QPainter::SmoothPixmapTransform);
    painter.save();
    painter.translate(view.effectiveOrigin());
    painter.scale(view.transform.scale, view.transform.scale);
    painter.drawImage(QRectF(view.rendered.left, view.rendered.top,
                             view.rendered.width, view.rendered.height), m_image);
    painter.restore();

    painter.setRenderHint(QPainter::Antialiasing);
    const QString selectedId = store->selectedId();
    const QVector<Detection> visible = store->visibleDetections();
    for (const Detection& detection : visible) {
        const QRectF screenRect = CoordinateHelper::imageToScreen(detection.rect().toRectF(), view);
        QColor color = detection.isVerified() ? BoxEdit::Colors::kVerifiedBox
                                              : BoxEdit::Colors::kUnverifiedBox;
        if (detection.id == selectedId) {
            color = BoxEdit::Colors::kSelectedBox;
        }

        painter.setPen(QPen(color, 2));
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(screenRect);
        painter.drawText(screenRect.topLeft() + QPointF(4, -4), detection.label);

        if (detection.id == selectedId && !store->isLocked()) {
            const qreal half = BoxEdit::Interaction::kHandleDrawSize / 2.0;
            painter.setBrush(BoxEdit::Colors::kHandleFill);
            for (const char* id : {"tl", "t", "tr", "l", "r", "bl", "b", "br"}) {
                const QPointF anchor = BoxGeometry::handlePosition(
                    screenRect, BoxGeometry::handleFromString(QLatin1String(id)));
                painter.drawRect(QRectF(anchor.x() - half, anchor.y() - half,
                                        half * 2.0, half * 2.0));
            }
        }
    }

    const QRectF preview = m_session->drawController()->previewRect();
    if (!preview.isNull()) {
        const QRectF clientPreview(CoordinateHelper::containerToClient(preview.topLeft(), view),
                                   CoordinateHelper::containerToClient(preview.bottomRight(), view));
        painter.setPen(QPen(BoxEdit::Colors::kDrawPreview, 2, Qt::DashLine));
        painter.setBrush(Qt::NoBrush);
        painter.drawRect(clientPreview);
    }
}

QString AnnotationCanvas::detectionAt(const QPointF& pos) const
{
    const ViewGeometry view = m_session->viewGeometry();
    const QVector<Detection> visible = m_session->store()->visibleDetections();

    // Topmost (last painted) wins
    for (int i = visible.size() - 1; i >= 0; --i) {
        const QRectF screenRect = CoordinateHelper::imageToScreen(visible[i].rect().toRectF(), view);
        if (screenRect.contains(pos)) {
            return visible[i].id;
        }
    }
    return QString();
}

void AnnotationCanvas::pointerPressed(const PointerPosition& pointer)
{
    DetectionStore* store = m_session->store();

    if (store->isDrawMode()) {
        if (m_session->onDrawStart(pointer)) {
            m_gesture = Gesture::Draw;
        }
        return;
    }

    const auto selected = store->selectedDetection();
    if (selected) {
        const QRectF screenRect = CoordinateHelper::imageToScreen(selected->rect().toRectF(),
                                                                  m_session->viewGeometry());
        const ResizeHandle handle = BoxGeometry::hitTestHandle(screenRect, pointer.pos,
                                                               m_session->handleHitSize());
        if (handle != ResizeHandle::None
            && m_session->onResizeStart(BoxGeometry::handleToString(handle), pointer, selected->id)) {
            m_gesture = Gesture::Resize;
            return;
        }
    }

    const QString hit = detectionAt(pointer.pos);
    if (!hit.isEmpty()) {
        if (store->select(hit) && m_session->onDragStart(pointer, hit)) {
            m_gesture = Gesture::Drag;
        }
        return;
    }

    m_session->onBackgroundClick();
}

void AnnotationCanvas::pointerMoved(const PointerPosition& pointer)
{
    switch (m_gesture) {
    case Gesture::Draw:
        m_session->onDrawMove(pointer);
        break;
    case Gesture::Drag:
        m_session->onDragMove(pointer);
        break;
    case Gesture::Resize:
        m_session->onResizeMove(pointer);
        break;
    case Gesture::Pan:
        m_transform.panX = m_panStartTransform.panX + (pointer.pos.x() - m_panStart.x());
        m_transform.panY = m_panStartTransform.panY + (pointer.pos.y() - m_panStart.y());
        applyTransform();
        break;
    case Gesture::None:
        updateCursor(pointer.pos);
        break;
    }
}

void AnnotationCanvas::pointerReleased(const PointerPosition& pointer)
{
    const Gesture gesture = m_gesture;
    m_gesture = Gesture::None;

    switch (gesture) {
    case Gesture::Draw:
        m_session->onDrawEnd(pointer);
        // The release doubles as a click; it is swallowed after a successful draw
        m_session->onBackgroundClick();
        break;
    case Gesture::Drag:
        m_session->onDragEnd();
        break;
    case Gesture::Resize:
        m_session->onResizeEnd();
        break;
    case Gesture::Pan:
    case Gesture::None:
        break;
    }
    updateCursor(pointer.pos);
}

void AnnotationCanvas::updateCursor(const QPointF& pos)
{
    DetectionStore* store = m_session->store();
    if (store->isLocked()) {
        setCursor(Qt::ArrowCursor);
        return;
    }
    if (store->isDrawMode()) {
        setCursor(Qt::CrossCursor);
        return;
    }

    const auto selected = store->selectedDetection();
    if (selected) {
        const QRectF screenRect = CoordinateHelper::imageToScreen(selected->rect().toRectF(),
                                                                  m_session->viewGeometry());
        const ResizeHandle handle = BoxGeometry::hitTestHandle(screenRect, pos, m_session->handleHitSize());
        if (handle != ResizeHandle::None) {
            setCursor(cursorForHandle(handle));
            return;
        }
    }

    setCursor(detectionAt(pos).isEmpty() ? Qt::ArrowCursor : Qt::SizeAllCursor);
}

bool AnnotationCanvas::event(QEvent* event)
{
    switch (event->type()) {
    case QEvent::TouchBegin:
    case QEvent::TouchUpdate:
    case QEvent::TouchEnd: {
        const auto pointer = PointerInput::fromTouchEvent(static_cast<QTouchEvent*>(event));
        if (pointer) {
            if (event->type() == QEvent::TouchBegin) {
                pointerPressed(*pointer);
            } else if (event->type() == QEvent::TouchUpdate) {
                pointerMoved(*pointer);
            } else {
                pointerReleased(*pointer);
            }
        }
        event->accept();
        return true;
    }
    case QEvent::TouchCancel:
        m_session->cancelGesture();
        m_gesture = Gesture::None;
        event->accept();
        return true;
    default:
        break;
    }
    return QWidget::event(event);
}

void AnnotationCanvas::mousePressEvent(QMouseEvent* event)
{
    const auto pointer = PointerInput::fromMouseEvent(event);
    if (!pointer || m_gesture != Gesture::None) {
        return;
    }

    if (event->button() == Qt::MiddleButton) {
        m_gesture = Gesture::Pan;
        m_panStart = pointer->pos;
        m_panStartTransform = m_transform;
        setCursor(Qt::ClosedHandCursor);
    } else if (event->button() == Qt::LeftButton) {
        pointerPressed(*pointer);
    }
}

void AnnotationCanvas::mouseMoveEvent(QMouseEvent* event)
{
    const auto pointer = PointerInput::fromMouseEvent(event);
    if (pointer) {
        pointerMoved(*pointer);
    }
}

void AnnotationCanvas::mouseReleaseEvent(QMouseEvent* event)
{
    const auto pointer = PointerInput::fromMouseEvent(event);
    if (!pointer) {
        return;
    }

    const bool pan = (m_gesture == Gesture::Pan);
    if ((pan && event->button() == Qt::MiddleButton) || (!pan && event->button() == Qt::LeftButton)) {
        pointerReleased(*pointer);
    }
}

void AnnotationCanvas::wheelEvent(QWheelEvent* event)
{
    if (m_gesture != Gesture::None) {
        event->accept();
        return;
    }

    const qreal oldScale = m_transform.scale;
    const qreal newScale = (event->angleDelta().y() > 0)
                           ? oldScale * BoxEdit::Interaction::kZoomStep
                           : oldScale / BoxEdit::Interaction::kZoomStep;
    const qreal bounded = qBound(BoxEdit::Interaction::kMinZoom, newScale, BoxEdit::Interaction::kMaxZoom);
    if (qFuzzyCompare(oldScale, bounded)) {
        event->accept();
        return;
    }

    // Keep the point under the cursor fixed
    const QPointF cursor = event->position();
    const QPointF pan(m_transform.panX, m_transform.panY);
    const QPointF newPan = cursor - (cursor - pan) * (bounded / oldScale);
    m_transform.scale = bounded;
    m_transform.panX = newPan.x();
    m_transform.panY = newPan.y();
    applyTransform();
    event->accept();
}

void AnnotationCanvas::keyPressEvent(QKeyEvent* event)
{
    DetectionStore* store = m_session->store();

    if (event->matches(QKeySequence::Save)) {
        m_session->save();
    } else if (event->key() == Qt::Key_0 && (event->modifiers() & Qt::ControlModifier)) {
        resetView();
    } else if (event->key() == Qt::Key_Escape) {
        if (m_session->isGestureActive()) {
            m_session->cancelGesture();
            m_gesture = Gesture::None;
        } else if (store->isDrawMode()) {
            store->setDrawMode(false);
        } else {
            store->clearSelection();
        }
    } else if (event->key() == Qt::Key_Delete || event->key() == Qt::Key_Backspace) {
        m_session->deleteSelected();
    } else if (event->key() == Qt::Key_D) {
        store->setDrawMode(!store->isDrawMode());
    } else if (event->key() == Qt::Key_S) {
        store->setSelectMode(!store->isSelectMode());
    } else if (event->key() == Qt::Key_L) {
        if (!m_session->isSaving()) {
            store->setLocked(!store->isLocked());
        }
    } else if (event->key() == Qt::Key_V) {
        if (!store->isLocked() && !m_session->isSaving()) {
            store->verifyAll();
        }
    } else if (event->key() == Qt::Key_F) {
        const auto current = store->filterCriteria().display;
        const auto next = current == DetectionFilter::DisplayFilter::All
            ? DetectionFilter::DisplayFilter::Verified
            : current == DetectionFilter::DisplayFilter::Verified
                ? DetectionFilter::DisplayFilter::Unverified
                : DetectionFilter::DisplayFilter::All;
        store->setDisplayFilter(next);
    } else if (event->key() >= Qt::Key_1 && event->key() <= Qt::Key_5) {
        const QStringList labels = DetectionLabels::all();
        const int index = event->key() - Qt::Key_1;
        if (store->hasSelection() && !store->isLocked() && !m_session->isSaving()
            && index < labels.size()) {
            DetectionPatch patch;
            patch.label = labels[index];
            store->update(store->selectedId(), patch);
        }
    } else {
        QWidget::keyPressEvent(event);
    }
}

void AnnotationCanvas::refreshStatus()
{
    DetectionStore* store = m_session->store();
    const VerificationSummary summary = m_session->verificationSummary();

    QString mode = store->isLocked() ? tr("Locked")
                 : store->isDrawMode() ? tr("Draw")
                 : tr("Select");
    QString message = tr("%1 | %2 of %3 verified | %4")
                          .arg(summary.displayLabel())
                          .arg(summary.verified)
                          .arg(summary.total)
                          .arg(mode);
    if (m_session->isSaving()) {
        message += tr(" | Saving...");
    } else if (m_session->hasUnsavedChanges()) {
        message += tr(" | Unsaved changes");
    }
    emit statusMessageChanged(message);
}
