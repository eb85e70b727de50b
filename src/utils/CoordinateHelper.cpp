#include "utils/CoordinateHelper.h"

#include <QtGlobal>

bool RenderedImageGeometry::operator==(const RenderedImageGeometry& other) const
{
    return qFuzzyCompare(1.0 + width, 1.0 + other.width)
        && qFuzzyCompare(1.0 + height, 1.0 + other.height)
        && qFuzzyCompare(1.0 + top, 1.0 + other.top)
        && qFuzzyCompare(1.0 + left, 1.0 + other.left);
}

bool ViewGeometry::isValid() const
{
    return naturalSize.width() > 0.0
        && naturalSize.height() > 0.0
        && rendered.isValid()
        && transform.scale > 0.0;
}

// Client <-> container

QPointF CoordinateHelper::clientToContainer(const QPointF& client, const ViewGeometry& view)
{
    return client - view.effectiveOrigin();
}

QPointF CoordinateHelper::containerToClient(const QPointF& local, const ViewGeometry& view)
{
    return local + view.effectiveOrigin();
}

// Container <-> image

qreal CoordinateHelper::imageScaleX(const ViewGeometry& view)
{
    if (view.rendered.width <= 0.0 || view.naturalSize.width() <= 0.0) {
        return 1.0;
    }
    return view.naturalSize.width() / view.rendered.width;
}

qreal CoordinateHelper::imageScaleY(const ViewGeometry& view)
{
    if (view.rendered.height <= 0.0 || view.naturalSize.height() <= 0.0) {
        return 1.0;
    }
    return view.naturalSize.height() / view.rendered.height;
}

QPointF CoordinateHelper::containerToImage(const QPointF& local, const ViewGeometry& view)
{
    QPointF p = local;

    const qreal scale = view.transform.scale;
    if (!qFuzzyIsNull(scale)) {
        p /= scale;
    }

    p -= QPointF(view.rendered.left, view.rendered.top);

    return QPointF(p.x() * imageScaleX(view), p.y() * imageScaleY(view));
}

QPointF CoordinateHelper::imageToContainer(const QPointF& image, const ViewGeometry& view)
{
    QPointF p(image.x() / imageScaleX(view), image.y() / imageScaleY(view));

    p += QPointF(view.rendered.left, view.rendered.top);

    const qreal scale = view.transform.scale;
    if (!qFuzzyIsNull(scale)) {
        p *= scale;
    }
    return p;
}

// Full chain

QPointF CoordinateHelper::screenToImage(const QPointF& client, const ViewGeometry& view)
{
    return containerToImage(clientToContainer(client, view), view);
}

QPointF CoordinateHelper::imageToScreen(const QPointF& image, const ViewGeometry& view)
{
    return containerToClient(imageToContainer(image, view), view);
}

QRectF CoordinateHelper::screenToImage(const QRectF& client, const ViewGeometry& view)
{
    const QPointF topLeft = screenToImage(client.topLeft(), view);
    const QPointF bottomRight = screenToImage(client.bottomRight(), view);
    return QRectF(topLeft, bottomRight).normalized();
}

QRectF CoordinateHelper::imageToScreen(const QRectF& image, const ViewGeometry& view)
{
    const QPointF topLeft = imageToScreen(image.topLeft(), view);
    const QPointF bottomRight = imageToScreen(image.bottomRight(), view);
    return QRectF(topLeft, bottomRight).normalized();
}

QPointF CoordinateHelper::screenDeltaToImage(const QPointF& delta, const ViewGeometry& view)
{
    const qreal scale = view.transform.scale;
    if (qFuzzyIsNull(scale)) {
        return QPointF();
    }
    return QPointF(delta.x() / scale * imageScaleX(view),
                   delta.y() / scale * imageScaleY(view));
}

qreal CoordinateHelper::screenLengthToZoomed(qreal length, qreal scale)
{
    if (qFuzzyIsNull(scale)) {
        return length;
    }
    return length / scale;
}

QPointF CoordinateHelper::clampToImage(const QPointF& point, const QSizeF& imageSize)
{
    return QPointF(qBound(0.0, point.x(), qMax(0.0, imageSize.width())),
                   qBound(0.0, point.y(), qMax(0.0, imageSize.height())));
}
