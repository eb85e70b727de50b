#include <QtTest>
#include "utils/CoordinateHelper.h"

namespace {

ViewGeometry makeView(const QSizeF& natural, const RenderedImageGeometry& rendered,
                      qreal scale = 1.0, const QPointF& origin = QPointF(),
                      qreal panX = 0.0, qreal panY = 0.0)
{
    ViewGeometry view;
    view.naturalSize = natural;
    view.rendered = rendered;
    view.containerOrigin = origin;
    view.transform.scale = scale;
    view.transform.panX = panX;
    view.transform.panY = panY;
    return view;
}

RenderedImageGeometry rendered(qreal width, qreal height, qreal top = 0.0, qreal left = 0.0)
{
    RenderedImageGeometry geometry;
    geometry.width = width;
    geometry.height = height;
    geometry.top = top;
    geometry.left = left;
    return geometry;
}

bool nearlyEqual(const QPointF& a, const QPointF& b)
{
    return qAbs(a.x() - b.x()) < 1e-9 && qAbs(a.y() - b.y()) < 1e-9;
}

} // namespace

class tst_CoordinateHelper : public QObject
{
    Q_OBJECT

private slots:
    // View validity
    void testViewValidity();
    void testViewInvalid_ZeroScale();

    // Forward mapping
    void testScreenToImage_Identity();
    void testScreenToImage_ScaledAndOffset();
    void testScreenToImage_ContainerOriginAndPan();
    void testScreenToImage_NaturalLargerThanRendered();

    // Inverse mapping
    void testImageToScreen_ScaledAndOffset();
    void testRoundTrip_data();
    void testRoundTrip();

    // Rectangles
    void testRectMapping_Normalized();

    // Deltas and lengths
    void testScreenDeltaToImage();
    void testScreenDeltaToImage_ZeroScale();
    void testScreenLengthToZoomed();

    // Degenerate inputs
    void testImageScale_UnknownRenderedSize();
    void testScreenToImage_ZeroScaleDoesNotDivide();

    // Clamping
    void testClampToImage();
};

void tst_CoordinateHelper::testViewValidity()
{
    ViewGeometry view;
    QVERIFY(!view.isValid());

    view = makeView(QSizeF(1000, 800), rendered(500, 400));
    QVERIFY(view.isValid());

    view.naturalSize = QSizeF();
    QVERIFY(!view.isValid());
}

void tst_CoordinateHelper::testViewInvalid_ZeroScale()
{
    ViewGeometry view = makeView(QSizeF(1000, 800), rendered(500, 400), 0.0);
    QVERIFY(!view.isValid());
}

void tst_CoordinateHelper::testScreenToImage_Identity()
{
    const ViewGeometry view = makeView(QSizeF(1000, 1000), rendered(1000, 1000));
    QCOMPARE(CoordinateHelper::screenToImage(QPointF(123, 456), view), QPointF(123, 456));
}

void tst_CoordinateHelper::testScreenToImage_ScaledAndOffset()
{
    // 1000x1000 image rendered at 500x500 with a 50px offset, zoomed 2x
    const ViewGeometry view = makeView(QSizeF(1000, 1000), rendered(500, 500, 50, 50), 2.0);

    QCOMPARE(CoordinateHelper::screenToImage(QPointF(200, 200), view), QPointF(100, 100));
    QCOMPARE(CoordinateHelper::screenToImage(QPointF(400, 400), view), QPointF(300, 300));
}

void tst_CoordinateHelper::testScreenToImage_ContainerOriginAndPan()
{
    const ViewGeometry view = makeView(QSizeF(1000, 1000), rendered(1000, 1000),
                                       1.0, QPointF(10, 20), 5.0, 5.0);

    QCOMPARE(CoordinateHelper::clientToContainer(QPointF(15, 25), view), QPointF(0, 0));
    QCOMPARE(CoordinateHelper::screenToImage(QPointF(115, 225), view), QPointF(100, 200));
}

void tst_CoordinateHelper::testScreenToImage_NaturalLargerThanRendered()
{
    // Non-uniform scale factors are applied per axis
    const ViewGeometry view = makeView(QSizeF(2000, 600), rendered(500, 300));

    QCOMPARE(CoordinateHelper::imageScaleX(view), 4.0);
    QCOMPARE(CoordinateHelper::imageScaleY(view), 2.0);
    QCOMPARE(CoordinateHelper::screenToImage(QPointF(100, 100), view), QPointF(400, 200));
}

void tst_CoordinateHelper::testImageToScreen_ScaledAndOffset()
{
    const ViewGeometry view = makeView(QSizeF(1000, 1000), rendered(500, 500, 50, 50), 2.0);

    QCOMPARE(CoordinateHelper::imageToScreen(QPointF(100, 100), view), QPointF(200, 200));
    QCOMPARE(CoordinateHelper::imageToScreen(QPointF(300, 300), view), QPointF(400, 400));
}

void tst_CoordinateHelper::testRoundTrip_data()
{
    QTest::addColumn<qreal>("scale");
    QTest::addColumn<QPointF>("origin");
    QTest::addColumn<QPointF>("pan");
    QTest::addColumn<QPointF>("point");

    QTest::newRow("identity") << 1.0 << QPointF() << QPointF() << QPointF(17, 33);
    QTest::newRow("zoom in") << 3.5 << QPointF(40, 12) << QPointF(-80, 25) << QPointF(640.25, 12.5);
    QTest::newRow("zoom out") << 0.3 << QPointF(0, 100) << QPointF(7, 9) << QPointF(3, 999);
}

void tst_CoordinateHelper::testRoundTrip()
{
    QFETCH(qreal, scale);
    QFETCH(QPointF, origin);
    QFETCH(QPointF, pan);
    QFETCH(QPointF, point);

    const ViewGeometry view = makeView(QSizeF(1920, 1080), rendered(960, 540, 30, 15),
                                       scale, origin, pan.x(), pan.y());

    const QPointF image = CoordinateHelper::screenToImage(point, view);
    QVERIFY(nearlyEqual(CoordinateHelper::imageToScreen(image, view), point));
}

void tst_CoordinateHelper::testRectMapping_Normalized()
{
    const ViewGeometry view = makeView(QSizeF(1000, 1000), rendered(500, 500, 50, 50), 2.0);

    // Bottom-right to top-left input still yields a positive rectangle
    const QRectF image = CoordinateHelper::screenToImage(QRectF(QPointF(400, 400), QPointF(200, 200)), view);
    QCOMPARE(image, QRectF(100, 100, 200, 200));

    const QRectF screen = CoordinateHelper::imageToScreen(QRectF(100, 100, 200, 200), view);
    QCOMPARE(screen, QRectF(200, 200, 200, 200));
}

void tst_CoordinateHelper::testScreenDeltaToImage()
{
    const ViewGeometry view = makeView(QSizeF(1000, 1000), rendered(500, 500, 50, 50), 2.0);

    // Divide by zoom, multiply by natural / rendered: net factor 1
    QCOMPARE(CoordinateHelper::screenDeltaToImage(QPointF(10, -6), view), QPointF(10, -6));

    const ViewGeometry zoomed = makeView(QSizeF(1000, 1000), rendered(1000, 1000), 4.0);
    QCOMPARE(CoordinateHelper::screenDeltaToImage(QPointF(100, 40), zoomed), QPointF(25, 10));
}

void tst_CoordinateHelper::testScreenDeltaToImage_ZeroScale()
{
    const ViewGeometry view = makeView(QSizeF(1000, 1000), rendered(1000, 1000), 0.0);
    QCOMPARE(CoordinateHelper::screenDeltaToImage(QPointF(10, 10), view), QPointF(0, 0));
}

void tst_CoordinateHelper::testScreenLengthToZoomed()
{
    QCOMPARE(CoordinateHelper::screenLengthToZoomed(20.0, 2.0), 10.0);
    QCOMPARE(CoordinateHelper::screenLengthToZoomed(20.0, 0.5), 40.0);
    QCOMPARE(CoordinateHelper::screenLengthToZoomed(20.0, 0.0), 20.0);
}

void tst_CoordinateHelper::testImageScale_UnknownRenderedSize()
{
    const ViewGeometry view = makeView(QSizeF(1000, 1000), rendered(0, 0));
    QCOMPARE(CoordinateHelper::imageScaleX(view), 1.0);
    QCOMPARE(CoordinateHelper::imageScaleY(view), 1.0);
    QCOMPARE(CoordinateHelper::screenToImage(QPointF(12, 34), view), QPointF(12, 34));
}

void tst_CoordinateHelper::testScreenToImage_ZeroScaleDoesNotDivide()
{
    const ViewGeometry view = makeView(QSizeF(1000, 1000), rendered(1000, 1000), 0.0);
    QCOMPARE(CoordinateHelper::screenToImage(QPointF(50, 60), view), QPointF(50, 60));
}

void tst_CoordinateHelper::testClampToImage()
{
    const QSizeF size(640, 480);
    QCOMPARE(CoordinateHelper::clampToImage(QPointF(-5, 10), size), QPointF(0, 10));
    QCOMPARE(CoordinateHelper::clampToImage(QPointF(700, 500), size), QPointF(640, 480));
    QCOMPARE(CoordinateHelper::clampToImage(QPointF(320, 240), size), QPointF(320, 240));
}

QTEST_GUILESS_MAIN(tst_CoordinateHelper)
#include "tst_CoordinateHelper.moc"
