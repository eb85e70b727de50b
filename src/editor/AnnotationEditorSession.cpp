#include "editor/AnnotationEditorSession.h"
#include "detection/DetectionStore.h"
#include "navigation/NavigationGuard.h"
#include "region/DragController.h"
#include "region/DrawController.h"
#include "region/ResizeController.h"
#include "settings/AnnotationEditorSettingsManager.h"
#include "Constants.h"

#include <QDebug>
#include <QPointer>

AnnotationEditorSession::AnnotationEditorSession(IDetectionRepository* repository, QObject* parent)
    : QObject(parent)
    , m_repository(repository)
    , m_store(new DetectionStore(this))
    , m_drawController(new DrawController(m_store, this))
    , m_dragController(new DragController(m_store, this))
    , m_resizeController(new ResizeController(m_store, this))
    , m_navigationGuard(new NavigationGuard(m_store, this))
    , m_handleHitSize(BoxEdit::Interaction::kHandleHitSize)
{
    m_navigationGuard->setSaveOperation([this](const SaveCallback& done) {
        if (!save(done)) {
            done(false, QStringLiteral("A save is already in progress"));
        }
    });
}

AnnotationEditorSession::~AnnotationEditorSession() = default;

bool AnnotationEditorSession::loadImage(const QString& uploadId, const QSizeF& naturalSize)
{
    if (uploadId.isEmpty() || naturalSize.width() <= 0.0 || naturalSize.height() <= 0.0) {
        qWarning() << "AnnotationEditorSession: Invalid image" << uploadId << naturalSize;
        return false;
    }
    if (m_saving) {
        qWarning() << "AnnotationEditorSession: Cannot switch images while saving";
        return false;
    }

    cancelGesture();

    const QVector<Detection> detections = m_repository
        ? m_repository->loadDetections(uploadId) : QVector<Detection>();

    m_uploadId = uploadId;
    m_view.naturalSize = naturalSize;
    m_store->setImageSize(naturalSize);
    m_store->setAll(detections);
    m_drawController->setUploadId(uploadId);

    emit imageLoaded(uploadId);
    emit viewGeometryChanged();
    return true;
}

void AnnotationEditorSession::setViewGeometry(const ViewGeometry& view)
{
    m_view = view;
    emit viewGeometryChanged();
}

void AnnotationEditorSession::setRenderedImageGeometry(const RenderedImageGeometry& rendered)
{
    if (m_view.rendered == rendered) {
        return;
    }
    m_view.rendered = rendered;
    emit viewGeometryChanged();
}

void AnnotationEditorSession::setViewTransform(const ViewTransform& transform)
{
    m_view.transform = transform;
    emit viewGeometryChanged();
}

void AnnotationEditorSession::loadSettings()
{
    const auto& settings = AnnotationEditorSettingsManager::instance();

    const qreal minBoxSize = settings.loadMinBoxSize();
    m_drawController->setMinimumBoxSize(minBoxSize);
    m_resizeController->setMinimumBoxSize(minBoxSize);
    m_drawController->setSuppressionDelayMs(settings.loadDrawSuppressionMs());
    m_drawController->setDefaultLabel(settings.loadDefaultDrawLabel());
    m_handleHitSize = settings.loadHandleHitSize();
    setStatusPromotionPolicy(StatusPromotion::forMode(settings.loadStatusPromotionMode()));
    m_navigationGuard->setNavigateOnSave(settings.loadNavigateOnSave());
}

void AnnotationEditorSession::setStatusPromotionPolicy(const StatusPromotionPolicy& policy)
{
    m_dragController->setStatusPromotionPolicy(policy);
    m_resizeController->setStatusPromotionPolicy(policy);
}

bool AnnotationEditorSession::isGestureActive() const
{
    return m_drawController->isActive()
        || m_dragController->isActive()
        || m_resizeController->isActive();
}

bool AnnotationEditorSession::canStartGesture() const
{
    if (m_saving) {
        qDebug() << "AnnotationEditorSession: Gesture ignored while saving";
        return false;
    }
    if (isGestureActive()) {
        qDebug() << "AnnotationEditorSession: Gesture ignored, another gesture is active";
        return false;
    }
    return true;
}

// Draw

bool AnnotationEditorSession::onDrawStart(const PointerPosition& pointer)
{
    if (!canStartGesture()) {
        return false;
    }
    return m_drawController->start(pointer.pos, m_view);
}

void AnnotationEditorSession::onDrawMove(const PointerPosition& pointer)
{
    m_drawController->move(pointer.pos);
}

std::optional<QString> AnnotationEditorSession::onDrawEnd(const PointerPosition& pointer)
{
    return m_drawController->end(pointer.pos);
}

// Drag

bool AnnotationEditorSession::onDragStart(const PointerPosition& pointer, const QString& detectionId)
{
    if (!canStartGesture()) {
        return false;
    }
    return m_dragController->start(pointer.pos, detectionId, m_view);
}

void AnnotationEditorSession::onDragMove(const PointerPosition& pointer)
{
    m_dragController->move(pointer.pos);
}

bool AnnotationEditorSession::onDragEnd()
{
    return m_dragController->end();
}

// Resize

bool AnnotationEditorSession::onResizeStart(const QString& handleId, const PointerPosition& pointer,
                                            const QString& detectionId)
{
    if (!canStartGesture()) {
        return false;
    }

    const ResizeHandle handle = BoxGeometry::handleFromString(handleId);
    if (handle == ResizeHandle::None) {
        qDebug() << "AnnotationEditorSession: Unknown resize handle" << handleId;
        return false;
    }
    return m_resizeController->start(handle, pointer.pos, detectionId, m_view);
}

void AnnotationEditorSession::onResizeMove(const PointerPosition& pointer)
{
    m_resizeController->move(pointer.pos);
}

bool AnnotationEditorSession::onResizeEnd()
{
    return m_resizeController->end();
}

void AnnotationEditorSession::cancelGesture()
{
    m_drawController->cancel();
    m_dragController->cancel();
    m_resizeController->cancel();
}

bool AnnotationEditorSession::onBackgroundClick()
{
    if (m_drawController->justFinishedDrawing()) {
        return false;
    }
    if (isGestureActive() || !m_store->hasSelection()) {
        return false;
    }
    m_store->clearSelection();
    return true;
}

bool AnnotationEditorSession::deleteSelected()
{
    if (m_saving || isGestureActive() || m_store->isLocked()) {
        return false;
    }

    const QString id = m_store->selectedId();
    if (id.isEmpty()) {
        return false;
    }
    // Boxes that never reached the repository leave no trace
    if (!m_store->isPersisted(id)) {
        return m_store->purge(id);
    }
    return m_store->remove(id);
}

// Save

DetectionChangeSet AnnotationEditorSession::pendingChanges() const
{
    return DetectionChangeSet::calculate(m_store->detections(), m_store->baseline(), m_uploadId);
}

bool AnnotationEditorSession::save(const SaveCallback& callback)
{
    if (m_saving) {
        qWarning() << "AnnotationEditorSession: Save already in progress";
        return false;
    }

    cancelGesture();
    m_savingSnapshot = m_store->detections();
    const DetectionChangeSet changes =
        DetectionChangeSet::calculate(m_savingSnapshot, m_store->baseline(), m_uploadId);
    if (changes.isEmpty()) {
        // Differences the repository does not track are settled without a round-trip
        m_store->commitBaseline(m_savingSnapshot);
        m_savingSnapshot.clear();
        emit saveFinished(true, QString());
        if (callback) {
            callback(true, QString());
        }
        return true;
    }

    if (!m_repository) {
        onSaveResult(false, QStringLiteral("No detection repository"), callback);
        return true;
    }

    m_saving = true;
    emit savingChanged(true);

    QPointer<AnnotationEditorSession> self(this);
    m_repository->saveDetections(m_uploadId, changes,
        [self, callback](bool success, const QString& error) {
            if (self) {
                self->onSaveResult(success, error, callback);
            } else if (callback) {
                callback(success, error);
            }
        });
    return true;
}

void AnnotationEditorSession::onSaveResult(bool success, const QString& error, const SaveCallback& callback)
{
    if (m_saving) {
        m_saving = false;
        emit savingChanged(false);
    }

    if (success) {
        m_store->commitBaseline(m_savingSnapshot);
    } else {
        qWarning() << "AnnotationEditorSession: Failed to save detections for" << m_uploadId << ":" << error;
    }
    m_savingSnapshot.clear();

    emit saveFinished(success, error);
    if (callback) {
        callback(success, error);
    }
}

bool AnnotationEditorSession::hasUnsavedChanges() const
{
    return m_navigationGuard->hasUnsavedChanges();
}

VerificationSummary AnnotationEditorSession::verificationSummary() const
{
    return VerificationAggregator::summarize(m_store->detections());
}
