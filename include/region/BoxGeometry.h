#ifndef BOXGEOMETRY_H
#define BOXGEOMETRY_H

#include <QPointF>
#include <QRectF>
#include <QSizeF>
#include <QString>

/**
 * @brief Axis-aligned box stored by its four edges.
 *
 * Edges are kept explicitly (rather than origin + size) so clamped edges
 * land exactly on the image boundary.
 */
struct BoxRect
{
    qreal xMin = 0.0;
    qreal yMin = 0.0;
    qreal xMax = 0.0;
    qreal yMax = 0.0;

    qreal width() const { return xMax - xMin; }
    qreal height() const { return yMax - yMin; }
    bool isValid() const { return xMin < xMax && yMin < yMax; }

    QRectF toRectF() const { return QRectF(QPointF(xMin, yMin), QPointF(xMax, yMax)); }
    static BoxRect fromRectF(const QRectF& rect);
    static BoxRect fromPoints(const QPointF& a, const QPointF& b);

    bool operator==(const BoxRect& other) const;
    bool operator!=(const BoxRect& other) const { return !(*this == other); }
};

enum class ResizeHandle {
    None,
    TopLeft, Top, TopRight,
    Left, Right,
    BottomLeft, Bottom, BottomRight
};

/**
 * @brief Pure geometry helpers shared by the draw/drag/resize controllers.
 */
class BoxGeometry
{
public:
    enum Edge {
        NoEdge = 0x0,
        LeftEdge = 0x1,
        TopEdge = 0x2,
        RightEdge = 0x4,
        BottomEdge = 0x8
    };

    // Handle ids used by the view layer: tl, tr, bl, br, t, r, b, l
    static ResizeHandle handleFromString(const QString& id);
    static QString handleToString(ResizeHandle handle);

    // Edges a handle moves (corner = two, edge = one)
    static int edgesForHandle(ResizeHandle handle);

    // Mirror a handle across the vertical and/or horizontal axis
    static ResizeHandle flippedHandle(ResizeHandle handle, bool flipX, bool flipY);

    // {min(x0,x1), min(y0,y1), max(x0,x1), max(y0,y1)}
    static BoxRect normalized(const BoxRect& rect);

    // Clamp every edge into [0, width] x [0, height]
    static BoxRect clampedToBounds(const BoxRect& rect, const QSizeF& bounds);

    /**
     * @brief Translate a box, sliding it along the bounds instead of shrinking it.
     *
     * Width and height are preserved; an edge that would leave the bounds is
     * pinned to it and the opposite edge follows.
     */
    static BoxRect translatedWithin(const BoxRect& rect, const QPointF& delta, const QSizeF& bounds);

    static bool meetsMinimumSize(const BoxRect& rect, qreal minWidth, qreal minHeight);
    static bool isInsideBounds(const BoxRect& rect, const QSizeF& bounds);

    // Handle anchor point on a (screen-space) rectangle
    static QPointF handlePosition(const QRectF& rect, ResizeHandle handle);

    // Corners are tested before edges
    static ResizeHandle hitTestHandle(const QRectF& rect, const QPointF& pos, qreal handleSize = 16.0);

private:
    BoxGeometry() = delete;
};

#endif // BOXGEOMETRY_H
