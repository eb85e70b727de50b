#include "region/BoxGeometry.h"

#include <QtGlobal>
#include <array>

BoxRect BoxRect::fromRectF(const QRectF& rect)
{
    const QRectF r = rect.normalized();
    return BoxRect{r.left(), r.top(), r.right(), r.bottom()};
}

BoxRect BoxRect::fromPoints(const QPointF& a, const QPointF& b)
{
    return BoxRect{qMin(a.x(), b.x()), qMin(a.y(), b.y()),
                   qMax(a.x(), b.x()), qMax(a.y(), b.y())};
}

bool BoxRect::operator==(const BoxRect& other) const
{
    return xMin == other.xMin && yMin == other.yMin
        && xMax == other.xMax && yMax == other.yMax;
}

ResizeHandle BoxGeometry::handleFromString(const QString& id)
{
    if (id == QLatin1String("tl")) return ResizeHandle::TopLeft;
    if (id == QLatin1String("tr")) return ResizeHandle::TopRight;
    if (id == QLatin1String("bl")) return ResizeHandle::BottomLeft;
    if (id == QLatin1String("br")) return ResizeHandle::BottomRight;
    if (id == QLatin1String("t")) return ResizeHandle::Top;
    if (id == QLatin1String("r")) return ResizeHandle::Right;
    if (id == QLatin1String("b")) return ResizeHandle::Bottom;
    if (id == QLatin1String("l")) return ResizeHandle::Left;
    return ResizeHandle::None;
}

QString BoxGeometry::handleToString(ResizeHandle handle)
{
    switch (handle) {
    case ResizeHandle::TopLeft:     return QStringLiteral("tl");
    case ResizeHandle::TopRight:    return QStringLiteral("tr");
    case ResizeHandle::BottomLeft:  return QStringLiteral("bl");
    case ResizeHandle::BottomRight: return QStringLiteral("br");
    case ResizeHandle::Top:         return QStringLiteral("t");
    case ResizeHandle::Right:       return QStringLiteral("r");
    case ResizeHandle::Bottom:      return QStringLiteral("b");
    case ResizeHandle::Left:        return QStringLiteral("l");
    case ResizeHandle::None:
        break;
    }
    return QString();
}

int BoxGeometry::edgesForHandle(ResizeHandle handle)
{
    switch (handle) {
    case ResizeHandle::TopLeft:     return TopEdge | LeftEdge;
    case ResizeHandle::Top:         return TopEdge;
    case ResizeHandle::TopRight:    return TopEdge | RightEdge;
    case ResizeHandle::Left:        return LeftEdge;
    case ResizeHandle::Right:       return RightEdge;
    case ResizeHandle::BottomLeft:  return BottomEdge | LeftEdge;
    case ResizeHandle::Bottom:      return BottomEdge;
    case ResizeHandle::BottomRight: return BottomEdge | RightEdge;
    case ResizeHandle::None:
        break;
    }
    return NoEdge;
}

ResizeHandle BoxGeometry::flippedHandle(ResizeHandle handle, bool flipX, bool flipY)
{
    int edges = edgesForHandle(handle);
    if (flipX && (edges & (LeftEdge | RightEdge))) {
        edges ^= (LeftEdge | RightEdge);
    }
    if (flipY && (edges & (TopEdge | BottomEdge))) {
        edges ^= (TopEdge | BottomEdge);
    }

    switch (edges) {
    case TopEdge | LeftEdge:     return ResizeHandle::TopLeft;
    case TopEdge:                return ResizeHandle::Top;
    case TopEdge | RightEdge:    return ResizeHandle::TopRight;
    case LeftEdge:               return ResizeHandle::Left;
    case RightEdge:              return ResizeHandle::Right;
    case BottomEdge | LeftEdge:  return ResizeHandle::BottomLeft;
    case BottomEdge:             return ResizeHandle::Bottom;
    case BottomEdge | RightEdge: return ResizeHandle::BottomRight;
    default:
        break;
    }
    return ResizeHandle::None;
}

BoxRect BoxGeometry::normalized(const BoxRect& rect)
{
    return BoxRect{qMin(rect.xMin, rect.xMax), qMin(rect.yMin, rect.yMax),
                   qMax(rect.xMin, rect.xMax), qMax(rect.yMin, rect.yMax)};
}

BoxRect BoxGeometry::clampedToBounds(const BoxRect& rect, const QSizeF& bounds)
{
    const qreal w = qMax(0.0, bounds.width());
    const qreal h = qMax(0.0, bounds.height());
    return BoxRect{qBound(0.0, rect.xMin, w), qBound(0.0, rect.yMin, h),
                   qBound(0.0, rect.xMax, w), qBound(0.0, rect.yMax, h)};
}

BoxRect BoxGeometry::translatedWithin(const BoxRect& rect, const QPointF& delta, const QSizeF& bounds)
{
    const qreal boxWidth = rect.width();
    const qreal boxHeight = rect.height();

    BoxRect moved{rect.xMin + delta.x(), rect.yMin + delta.y(),
                  rect.xMax + delta.x(), rect.yMax + delta.y()};

    if (moved.xMin < 0.0) {
        moved.xMin = 0.0;
        moved.xMax = boxWidth;
    }
    if (moved.yMin < 0.0) {
        moved.yMin = 0.0;
        moved.yMax = boxHeight;
    }
    if (moved.xMax > bounds.width()) {
        moved.xMax = bounds.width();
        moved.xMin = qMax(0.0, bounds.width() - boxWidth);
    }
    if (moved.yMax > bounds.height()) {
        moved.yMax = bounds.height();
        moved.yMin = qMax(0.0, bounds.height() - boxHeight);
    }
    return moved;
}

bool BoxGeometry::meetsMinimumSize(const BoxRect& rect, qreal minWidth, qreal minHeight)
{
    return rect.width() >= minWidth && rect.height() >= minHeight;
}

bool BoxGeometry::isInsideBounds(const BoxRect& rect, const QSizeF& bounds)
{
    return rect.isValid()
        && rect.xMin >= 0.0 && rect.yMin >= 0.0
        && rect.xMax <= bounds.width() && rect.yMax <= bounds.height();
}

QPointF BoxGeometry::handlePosition(const QRectF& rect, ResizeHandle handle)
{
    const QRectF r = rect.normalized();
    const QPointF c = r.center();

    switch (handle) {
    case ResizeHandle::TopLeft:     return r.topLeft();
    case ResizeHandle::Top:         return QPointF(c.x(), r.top());
    case ResizeHandle::TopRight:    return r.topRight();
    case ResizeHandle::Left:        return QPointF(r.left(), c.y());
    case ResizeHandle::Right:       return QPointF(r.right(), c.y());
    case ResizeHandle::BottomLeft:  return r.bottomLeft();
    case ResizeHandle::Bottom:      return QPointF(c.x(), r.bottom());
    case ResizeHandle::BottomRight: return r.bottomRight();
    case ResizeHandle::None:
        break;
    }
    return c;
}

ResizeHandle BoxGeometry::hitTestHandle(const QRectF& rect, const QPointF& pos, qreal handleSize)
{
    const QRectF r = rect.normalized();
    if (r.isEmpty()) {
        return ResizeHandle::None;
    }

    const qreal half = handleSize / 2.0;

    // Corners first (higher priority), then edges
    static constexpr std::array<ResizeHandle, 8> kOrder = {
        ResizeHandle::TopLeft, ResizeHandle::TopRight,
        ResizeHandle::BottomLeft, ResizeHandle::BottomRight,
        ResizeHandle::Top, ResizeHandle::Bottom,
        ResizeHandle::Left, ResizeHandle::Right
    };

    for (ResizeHandle handle : kOrder) {
        const QPointF anchor = handlePosition(r, handle);
        const QRectF hitArea(anchor.x() - half, anchor.y() - half, handleSize, handleSize);
        if (hitArea.contains(pos)) {
            return handle;
        }
    }
    return ResizeHandle::None;
}
