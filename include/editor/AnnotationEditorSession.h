#ifndef ANNOTATIONEDITORSESSION_H
#define ANNOTATIONEDITORSESSION_H

#include <QObject>
#include <QSizeF>
#include <QString>
#include <optional>

#include "detection/DetectionChangeSet.h"
#include "detection/IDetectionRepository.h"
#include "detection/StatusPromotionPolicy.h"
#include "detection/VerificationAggregator.h"
#include "input/PointerInput.h"
#include "utils/CoordinateHelper.h"

class DetectionStore;
class DrawController;
class DragController;
class ResizeController;
class NavigationGuard;

/**
 * @brief One image being edited.
 *
 * Owns the detection store, the three gesture controllers and the navigation
 * guard, routes pointer events from the view layer to the right controller
 * and drives the save round-trip through the repository.
 *
 * Only one gesture may be active at a time. Gestures and deletions are
 * refused while a save is in flight.
 */
class AnnotationEditorSession : public QObject
{
    Q_OBJECT

public:
    explicit AnnotationEditorSession(IDetectionRepository* repository, QObject* parent = nullptr);
    ~AnnotationEditorSession() override;

    DetectionStore* store() const { return m_store; }
    DrawController* drawController() const { return m_drawController; }
    DragController* dragController() const { return m_dragController; }
    ResizeController* resizeController() const { return m_resizeController; }
    NavigationGuard* navigationGuard() const { return m_navigationGuard; }

    // Seeds the store and its baseline from the repository
    bool loadImage(const QString& uploadId, const QSizeF& naturalSize);
    QString uploadId() const { return m_uploadId; }

    void setViewGeometry(const ViewGeometry& view);
    void setRenderedImageGeometry(const RenderedImageGeometry& rendered);
    void setViewTransform(const ViewTransform& transform);
    ViewGeometry viewGeometry() const { return m_view; }

    // Applies AnnotationEditorSettingsManager values to the controllers
    void loadSettings();
    void setStatusPromotionPolicy(const StatusPromotionPolicy& policy);
    int handleHitSize() const { return m_handleHitSize; }

    // Pointer routing
    bool onDrawStart(const PointerPosition& pointer);
    void onDrawMove(const PointerPosition& pointer);
    std::optional<QString> onDrawEnd(const PointerPosition& pointer);

    bool onDragStart(const PointerPosition& pointer, const QString& detectionId);
    void onDragMove(const PointerPosition& pointer);
    bool onDragEnd();

    bool onResizeStart(const QString& handleId, const PointerPosition& pointer, const QString& detectionId);
    void onResizeMove(const PointerPosition& pointer);
    bool onResizeEnd();

    void cancelGesture();
    bool isGestureActive() const;

    // Click on empty canvas; swallowed right after a draw. Returns true if it cleared the selection
    bool onBackgroundClick();

    bool deleteSelected();

    /**
     * @brief Persist the pending change set.
     *
     * Returns false if a save is already running. An empty change set
     * completes immediately without calling the repository.
     */
    bool save(const SaveCallback& callback = nullptr);
    bool isSaving() const { return m_saving; }

    bool hasUnsavedChanges() const;
    DetectionChangeSet pendingChanges() const;
    VerificationSummary verificationSummary() const;

signals:
    void imageLoaded(const QString& uploadId);
    void viewGeometryChanged();
    void savingChanged(bool saving);
    void saveFinished(bool success, const QString& error);

private:
    void onSaveResult(bool success, const QString& error, const SaveCallback& callback);
    bool canStartGesture() const;

    IDetectionRepository* m_repository;
    DetectionStore* m_store;
    DrawController* m_drawController;
    DragController* m_dragController;
    ResizeController* m_resizeController;
    NavigationGuard* m_navigationGuard;

    QString m_uploadId;
    ViewGeometry m_view;
    int m_handleHitSize;
    bool m_saving = false;
    // Live list the in-flight change set was computed from
    QVector<Detection> m_savingSnapshot;
};

#endif // ANNOTATIONEDITORSESSION_H
