#ifndef COORDINATEHELPER_H
#define COORDINATEHELPER_H

#include <QPointF>
#include <QRectF>
#include <QSizeF>

/**
 * @brief On-screen placement of the image inside its container, before zoom.
 *
 * Matches the rendered-image style reported by the view layer: the image is
 * drawn at (left, top) with size (width, height) in un-zoomed container space.
 */
struct RenderedImageGeometry
{
    qreal width = 0.0;
    qreal height = 0.0;
    qreal top = 0.0;
    qreal left = 0.0;

    bool isValid() const { return width > 0.0 && height > 0.0; }
    bool operator==(const RenderedImageGeometry& other) const;
    bool operator!=(const RenderedImageGeometry& other) const { return !(*this == other); }
};

/**
 * @brief Zoom/pan transform owned by the view layer.
 */
struct ViewTransform
{
    qreal scale = 1.0;
    qreal panX = 0.0;
    qreal panY = 0.0;
};

/**
 * @brief Everything needed to map a pointer position into image pixels.
 *
 * containerOrigin is the container's bounding-rect origin in client
 * coordinates, without the pan offset.
 */
struct ViewGeometry
{
    QSizeF naturalSize;
    RenderedImageGeometry rendered;
    QPointF containerOrigin;
    ViewTransform transform;

    // Interaction is only meaningful once both sizes are known
    bool isValid() const;

    QPointF effectiveOrigin() const
    {
        return containerOrigin + QPointF(transform.panX, transform.panY);
    }
};

/**
 * CoordinateHelper - Conversions between client (pointer) space and image-pixel space
 *
 * Forward chain: client -> container-local (subtract origin) -> un-zoomed
 * (divide by scale) -> un-offset (subtract rendered top-left) -> image pixels
 * (multiply by natural / rendered size). imageToScreen is the exact inverse.
 *
 * Degenerate geometry never raises: a step whose divisor is zero is skipped.
 */
class CoordinateHelper {
public:
    CoordinateHelper() = delete;

    // Client to container-local (screen pixels relative to the container)
    static QPointF clientToContainer(const QPointF& client, const ViewGeometry& view);
    static QPointF containerToClient(const QPointF& local, const ViewGeometry& view);

    // Container-local to image pixels and back
    static QPointF containerToImage(const QPointF& local, const ViewGeometry& view);
    static QPointF imageToContainer(const QPointF& image, const ViewGeometry& view);

    // Full chain
    static QPointF screenToImage(const QPointF& client, const ViewGeometry& view);
    static QPointF imageToScreen(const QPointF& image, const ViewGeometry& view);

    // Rectangles are normalized after mapping
    static QRectF screenToImage(const QRectF& client, const ViewGeometry& view);
    static QRectF imageToScreen(const QRectF& image, const ViewGeometry& view);

    // A pointer delta in screen pixels expressed in image pixels
    static QPointF screenDeltaToImage(const QPointF& delta, const ViewGeometry& view);

    // Screen length divided by zoom; used for zoom-independent thresholds
    static qreal screenLengthToZoomed(qreal length, qreal scale);

    // Clamp into [0, width] x [0, height]
    static QPointF clampToImage(const QPointF& point, const QSizeF& imageSize);

    // Scale factors natural / rendered (1.0 when rendered size is unknown)
    static qreal imageScaleX(const ViewGeometry& view);
    static qreal imageScaleY(const ViewGeometry& view);
};

#endif // COORDINATEHELPER_H
