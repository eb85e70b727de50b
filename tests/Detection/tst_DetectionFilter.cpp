#include <QtTest>
#include "detection/DetectionFilter.h"

namespace {

Detection makeDetection(const QString& id, const QString& label, DetectionStatus status)
{
    Detection detection;
    detection.id = id;
    detection.label = label;
    detection.originalLabel = label;
    detection.setRect(BoxRect{0, 0, 10, 10});
    detection.status = status;
    return detection;
}

QVector<Detection> sampleDetections()
{
    return {
        makeDetection("m1", "instar_1", DetectionStatus::ModelGenerated),
        makeDetection("c1", "instar_1", DetectionStatus::UserConfirmed),
        makeDetection("e1", "pupa", DetectionStatus::UserEdited),
        makeDetection("ec1", "adult", DetectionStatus::UserEditedConfirmed),
        makeDetection("x1", "adult", DetectionStatus::Deleted)
    };
}

QStringList idsOf(const QVector<Detection>& detections)
{
    QStringList ids;
    for (const Detection& detection : detections) {
        ids << detection.id;
    }
    return ids;
}

} // namespace

class tst_DetectionFilter : public QObject
{
    Q_OBJECT

private slots:
    void testDefaultCriteria_ShowsAllActive();
    void testDisplayFilter_Verified();
    void testDisplayFilter_Unverified();
    void testClassFilter_Subset();
    void testClassFilter_AllClassesDisablesFiltering();
    void testClassFilter_EmptyShowsNothing();
    void testClassFilter_CombinedWithDisplay();
    void testViewMode_HidesEverything();
    void testPreservesOrder();
    void testCoversAllClasses();
};

void tst_DetectionFilter::testDefaultCriteria_ShowsAllActive()
{
    const DetectionFilter::Criteria criteria;
    QCOMPARE(idsOf(DetectionFilter::apply(sampleDetections(), criteria)),
             QStringList({"m1", "c1", "e1", "ec1"}));
}

void tst_DetectionFilter::testDisplayFilter_Verified()
{
    DetectionFilter::Criteria criteria;
    criteria.display = DetectionFilter::DisplayFilter::Verified;
    QCOMPARE(idsOf(DetectionFilter::apply(sampleDetections(), criteria)),
             QStringList({"c1", "ec1"}));
}

void tst_DetectionFilter::testDisplayFilter_Unverified()
{
    DetectionFilter::Criteria criteria;
    criteria.display = DetectionFilter::DisplayFilter::Unverified;
    QCOMPARE(idsOf(DetectionFilter::apply(sampleDetections(), criteria)),
             QStringList({"m1", "e1"}));
}

void tst_DetectionFilter::testClassFilter_Subset()
{
    DetectionFilter::Criteria criteria;
    criteria.classes = {"adult", "pupa"};
    QCOMPARE(idsOf(DetectionFilter::apply(sampleDetections(), criteria)),
             QStringList({"e1", "ec1"}));
}

void tst_DetectionFilter::testClassFilter_AllClassesDisablesFiltering()
{
    QVector<Detection> detections = sampleDetections();
    detections << makeDetection("odd", "beetle", DetectionStatus::ModelGenerated);

    DetectionFilter::Criteria criteria;
    criteria.classes = DetectionFilter::allClasses();
    QVERIFY(idsOf(DetectionFilter::apply(detections, criteria)).contains("odd"));

    criteria.classes.remove("adult");
    QVERIFY(!idsOf(DetectionFilter::apply(detections, criteria)).contains("odd"));
}

void tst_DetectionFilter::testClassFilter_EmptyShowsNothing()
{
    DetectionFilter::Criteria criteria;
    criteria.classes.clear();
    QVERIFY(DetectionFilter::apply(sampleDetections(), criteria).isEmpty());
}

void tst_DetectionFilter::testClassFilter_CombinedWithDisplay()
{
    DetectionFilter::Criteria criteria;
    criteria.classes = {"instar_1"};
    criteria.display = DetectionFilter::DisplayFilter::Verified;
    QCOMPARE(idsOf(DetectionFilter::apply(sampleDetections(), criteria)),
             QStringList({"c1"}));
}

void tst_DetectionFilter::testViewMode_HidesEverything()
{
    DetectionFilter::Criteria criteria;
    criteria.viewMode = DetectionFilter::ViewMode::ImageOnly;
    QVERIFY(DetectionFilter::apply(sampleDetections(), criteria).isEmpty());

    criteria.viewMode = DetectionFilter::ViewMode::None;
    QVERIFY(DetectionFilter::apply(sampleDetections(), criteria).isEmpty());
}

void tst_DetectionFilter::testPreservesOrder()
{
    QVector<Detection> detections;
    for (int i = 9; i >= 0; --i) {
        detections << makeDetection(QString::number(i), "pupa", DetectionStatus::ModelGenerated);
    }

    const QVector<Detection> visible = DetectionFilter::apply(detections, DetectionFilter::Criteria());
    QCOMPARE(visible.size(), 10);
    QCOMPARE(visible.first().id, QString("9"));
    QCOMPARE(visible.last().id, QString("0"));
}

void tst_DetectionFilter::testCoversAllClasses()
{
    QVERIFY(DetectionFilter::coversAllClasses(DetectionFilter::allClasses()));

    QSet<QString> extra = DetectionFilter::allClasses();
    extra.insert("beetle");
    QVERIFY(DetectionFilter::coversAllClasses(extra));

    QVERIFY(!DetectionFilter::coversAllClasses({"instar_1", "instar_2"}));
    QVERIFY(!DetectionFilter::coversAllClasses(QSet<QString>()));
}

QTEST_GUILESS_MAIN(tst_DetectionFilter)
#include "tst_DetectionFilter.moc"
