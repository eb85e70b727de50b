#ifndef ANNOTATIONCANVAS_H
#define ANNOTATIONCANVAS_H

#include <QImage>
#include <QPointF>
#include <QWidget>

#include "utils/CoordinateHelper.h"

class AnnotationEditorSession;
struct PointerPosition;

/**
 * @brief Widget that shows one image with its detections and forwards
 *        pointer input to an AnnotationEditorSession.
 *
 * Mouse: left button draws (in draw mode), selects, drags or resizes;
 * middle button pans; wheel zooms around the cursor. Touch follows the
 * left-button path.
 *
 * Keys: D draw mode, S select mode, L lock, V verify all, 1-5 label of the
 * selection, F display filter, Delete removes the selection, Escape cancels,
 * Ctrl+S saves, Ctrl+0 resets the view.
 */
class AnnotationCanvas : public QWidget
{
    Q_OBJECT

public:
    explicit AnnotationCanvas(AnnotationEditorSession* session, QWidget* parent = nullptr);

    void setImage(const QImage& image);
    void resetView();

signals:
    void statusMessageChanged(const QString& message);

protected:
    bool event(QEvent* event) override;
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;

private:
    enum class Gesture {
        None,
        Draw,
        Drag,
        Resize,
        Pan
    };

    void pointerPressed(const PointerPosition& pointer);
    void pointerMoved(const PointerPosition& pointer);
    void pointerReleased(const PointerPosition& pointer);

    void updateRenderedGeometry();
    void applyTransform();
    QString detectionAt(const QPointF& pos) const;
    void updateCursor(const QPointF& pos);
    void refreshStatus();

    AnnotationEditorSession* m_session;
    QImage m_image;
    ViewTransform m_transform;
    Gesture m_gesture = Gesture::None;
    QPointF m_panStart;
    ViewTransform m_panStartTransform;
};

#endif // ANNOTATIONCANVAS_H
