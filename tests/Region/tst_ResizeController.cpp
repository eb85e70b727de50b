#include <QtTest>
#include <QSignalSpy>
#include "region/ResizeController.h"
#include "detection/DetectionStore.h"

namespace {

ViewGeometry makeView(qreal scale = 1.0)
{
    ViewGeometry view;
    view.naturalSize = QSizeF(1000, 1000);
    view.rendered.width = 1000;
    view.rendered.height = 1000;
    view.transform.scale = scale;
    return view;
}

Detection makeDetection(const QString& id, const BoxRect& rect,
                        DetectionStatus status = DetectionStatus::UserConfirmed)
{
    Detection detection;
    detection.id = id;
    detection.label = "instar_2";
    detection.originalLabel = "instar_2";
    detection.setRect(rect);
    detection.status = status;
    return detection;
}

} // namespace

/**
 * @brief Tests for handle-based resizing, including the minimum-size band
 *        and the continuous flip when an edge crosses its opposite edge.
 */
class tst_ResizeController : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // Preconditions
    void testStart_RequiresHandle();
    void testStart_RequiresSelection();
    void testStart_RejectedWhenLocked();

    // Edge movement
    void testMove_BottomRight();
    void testMove_TopLeft();
    void testMove_TopOnlyMovesTop();
    void testMove_ClampedToImage();

    // Minimum size
    void testMove_StopsAtMinimumBand();
    void testMove_StopsAtMinimumBandOnFastDrag();
    void testMove_MinimumSizeScalesWithZoom();

    // Flipping
    void testMove_FlipsHorizontally();
    void testMove_FlipsBothAxes();
    void testMove_ContinuesAfterFlip();

    // Pure geometry
    void testResizedRect_Static();

    // Invariants
    void testMove_InvariantsHold();

    // Finishing
    void testEnd_AppliesPolicy();
    void testEnd_NoChange();
    void testCancel_RestoresStartRect();

    // Signals
    void testActiveHandleChangedSignal();

private:
    DetectionStore* m_store;
    ResizeController* m_controller;
};

void tst_ResizeController::init()
{
    m_store = new DetectionStore();
    m_store->setImageSize(QSizeF(1000, 1000));
    m_store->setAll({makeDetection("a", BoxRect{100, 100, 300, 300}),
                     makeDetection("b", BoxRect{600, 600, 700, 700})});
    m_store->select("a");
    m_controller = new ResizeController(m_store);
}

void tst_ResizeController::cleanup()
{
    delete m_controller;
    m_controller = nullptr;
    delete m_store;
    m_store = nullptr;
}

void tst_ResizeController::testStart_RequiresHandle()
{
    QVERIFY(!m_controller->start(ResizeHandle::None, QPointF(300, 300), "a", makeView()));
    QCOMPARE(m_controller->state(), ResizeController::State::Idle);
}

void tst_ResizeController::testStart_RequiresSelection()
{
    QVERIFY(!m_controller->start(ResizeHandle::BottomRight, QPointF(700, 700), "b", makeView()));
    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
    QCOMPARE(m_controller->activeHandle(), ResizeHandle::BottomRight);
}

void tst_ResizeController::testStart_RejectedWhenLocked()
{
    m_store->setLocked(true);
    QVERIFY(!m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
}

void tst_ResizeController::testMove_BottomRight()
{
    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
    m_controller->move(QPointF(400, 350));

    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{100, 100, 400, 350}));
}

void tst_ResizeController::testMove_TopLeft()
{
    QVERIFY(m_controller->start(ResizeHandle::TopLeft, QPointF(100, 100), "a", makeView()));
    m_controller->move(QPointF(50, 60));

    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{50, 60, 300, 300}));
}

void tst_ResizeController::testMove_TopOnlyMovesTop()
{
    QVERIFY(m_controller->start(ResizeHandle::Top, QPointF(200, 100), "a", makeView()));
    m_controller->move(QPointF(900, 40));

    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{100, 40, 300, 300}));
}

void tst_ResizeController::testMove_ClampedToImage()
{
    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
    m_controller->move(QPointF(1500, 1200));

    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{100, 100, 1000, 1000}));
}

void tst_ResizeController::testMove_StopsAtMinimumBand()
{
    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
    m_controller->move(QPointF(400, 350));

    // 10px from the left edge: x stops at the band limit, y still follows
    m_controller->move(QPointF(110, 250));
    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{100, 100, 120, 250}));
    QCOMPARE(m_controller->activeHandle(), ResizeHandle::BottomRight);

    // Exactly the minimum size is allowed
    m_controller->move(QPointF(120, 250));
    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{100, 100, 120, 250}));

    // Slightly inside the band on the other side of the fixed edge does not flip
    m_controller->move(QPointF(95, 250));
    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{100, 100, 120, 250}));
    QCOMPARE(m_controller->activeHandle(), ResizeHandle::BottomRight);
}

void tst_ResizeController::testMove_StopsAtMinimumBandOnFastDrag()
{
    QVERIFY(m_controller->start(ResizeHandle::TopLeft, QPointF(100, 100), "a", makeView()));

    // A single jump from far outside straight into the band
    m_controller->move(QPointF(295, 290));
    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{280, 280, 300, 300}));
    QCOMPARE(m_controller->activeHandle(), ResizeHandle::TopLeft);

    // Near the image edge the band limit is clamped to the image
    const ResizeController::Result result = ResizeController::resizedRect(
        BoxRect{2, 100, 10, 300}, ResizeHandle::Left, QPointF(5, 200), 20.0, QSizeF(1000, 1000));
    QCOMPARE(result.rect, (BoxRect{0, 100, 10, 300}));
    QCOMPARE(result.handle, ResizeHandle::Left);
}

void tst_ResizeController::testMove_MinimumSizeScalesWithZoom()
{
    // At 2x zoom the 20px screen threshold is 10 image pixels
    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(600, 600), "a", makeView(2.0)));

    m_controller->move(QPointF(210, 700));
    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{100, 100, 110, 350}));

    m_controller->move(QPointF(230, 700));
    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{100, 100, 115, 350}));
}

void tst_ResizeController::testMove_FlipsHorizontally()
{
    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
    m_controller->move(QPointF(50, 350));

    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{50, 100, 100, 350}));
    QCOMPARE(m_controller->activeHandle(), ResizeHandle::BottomLeft);
}

void tst_ResizeController::testMove_FlipsBothAxes()
{
    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
    m_controller->move(QPointF(40, 30));

    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{40, 30, 100, 100}));
    QCOMPARE(m_controller->activeHandle(), ResizeHandle::TopLeft);
}

void tst_ResizeController::testMove_ContinuesAfterFlip()
{
    QVERIFY(m_controller->start(ResizeHandle::Right, QPointF(300, 200), "a", makeView()));
    m_controller->move(QPointF(20, 200));
    QCOMPARE(m_controller->activeHandle(), ResizeHandle::Left);
    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{20, 100, 100, 300}));

    // The flipped handle now owns the left edge; the old left edge stays fixed
    m_controller->move(QPointF(60, 200));
    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{60, 100, 100, 300}));

    // And crossing back flips again
    m_controller->move(QPointF(250, 200));
    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{100, 100, 250, 300}));
    QCOMPARE(m_controller->activeHandle(), ResizeHandle::Right);
}

void tst_ResizeController::testResizedRect_Static()
{
    const ResizeController::Result result = ResizeController::resizedRect(
        BoxRect{100, 100, 300, 300}, ResizeHandle::TopRight, QPointF(500, 350), 20.0, QSizeF(1000, 1000));

    QCOMPARE(result.rect, (BoxRect{100, 300, 500, 350}));
    QCOMPARE(result.handle, ResizeHandle::BottomRight);
}

void tst_ResizeController::testMove_InvariantsHold()
{
    QVERIFY(m_controller->start(ResizeHandle::TopLeft, QPointF(100, 100), "a", makeView(1.5)));

    for (int i = 0; i < 60; ++i) {
        const qreal x = -200.0 + (i * 137) % 1900;
        const qreal y = -150.0 + (i * 71) % 1800;
        m_controller->move(QPointF(x, y));

        const BoxRect rect = m_store->detection("a")->rect();
        QVERIFY(rect.xMin >= 0.0);
        QVERIFY(rect.yMin >= 0.0);
        QVERIFY(rect.xMax <= 1000.0);
        QVERIFY(rect.yMax <= 1000.0);
        QVERIFY(rect.xMin < rect.xMax);
        QVERIFY(rect.yMin < rect.yMax);
    }
}

void tst_ResizeController::testEnd_AppliesPolicy()
{
    m_controller->setStatusPromotionPolicy([](DetectionStatus, EditKind kind) {
        return kind == EditKind::Resize ? DetectionStatus::UserEdited : DetectionStatus::Deleted;
    });

    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
    m_controller->move(QPointF(400, 400));
    QVERIFY(m_controller->end());

    QCOMPARE(m_store->detection("a")->status, DetectionStatus::UserEdited);
    QCOMPARE(m_controller->state(), ResizeController::State::Idle);
    QCOMPARE(m_controller->activeHandle(), ResizeHandle::None);
}

void tst_ResizeController::testEnd_NoChange()
{
    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
    m_controller->move(QPointF(300, 300));
    QVERIFY(!m_controller->end());
    QCOMPARE(m_store->detection("a")->status, DetectionStatus::UserConfirmed);
}

void tst_ResizeController::testCancel_RestoresStartRect()
{
    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
    m_controller->move(QPointF(50, 50));
    m_controller->cancel();

    QCOMPARE(m_store->detection("a")->rect(), (BoxRect{100, 100, 300, 300}));
    QCOMPARE(m_controller->state(), ResizeController::State::Idle);
    QVERIFY(!m_store->hasUnsavedChanges());
}

void tst_ResizeController::testActiveHandleChangedSignal()
{
    QSignalSpy spy(m_controller, &ResizeController::activeHandleChanged);

    QVERIFY(m_controller->start(ResizeHandle::BottomRight, QPointF(300, 300), "a", makeView()));
    QCOMPARE(spy.count(), 1);

    m_controller->move(QPointF(400, 400));
    QCOMPARE(spy.count(), 1);

    m_controller->move(QPointF(50, 400));
    QCOMPARE(spy.count(), 2);
}

QTEST_GUILESS_MAIN(tst_ResizeController)
#include "tst_ResizeController.moc"
