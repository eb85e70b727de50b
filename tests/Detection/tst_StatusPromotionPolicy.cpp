#include <QtTest>
#include "detection/StatusPromotionPolicy.h"

Q_DECLARE_METATYPE(DetectionStatus)

class tst_StatusPromotionPolicy : public QObject
{
    Q_OBJECT

private slots:
    void testKeepStatus_data();
    void testKeepStatus();
    void testPromoteOnEdit_data();
    void testPromoteOnEdit();
    void testForMode();
};

void tst_StatusPromotionPolicy::testKeepStatus_data()
{
    QTest::addColumn<DetectionStatus>("status");

    QTest::newRow("model") << DetectionStatus::ModelGenerated;
    QTest::newRow("created") << DetectionStatus::UserCreated;
    QTest::newRow("confirmed") << DetectionStatus::UserConfirmed;
    QTest::newRow("edited") << DetectionStatus::UserEdited;
    QTest::newRow("edited confirmed") << DetectionStatus::UserEditedConfirmed;
}

void tst_StatusPromotionPolicy::testKeepStatus()
{
    QFETCH(DetectionStatus, status);

    const StatusPromotionPolicy policy = StatusPromotion::keepStatus();
    QCOMPARE(policy(status, EditKind::Move), status);
    QCOMPARE(policy(status, EditKind::Resize), status);
}

void tst_StatusPromotionPolicy::testPromoteOnEdit_data()
{
    QTest::addColumn<DetectionStatus>("status");
    QTest::addColumn<DetectionStatus>("expected");

    QTest::newRow("model") << DetectionStatus::ModelGenerated << DetectionStatus::UserEditedConfirmed;
    QTest::newRow("confirmed") << DetectionStatus::UserConfirmed << DetectionStatus::UserEditedConfirmed;
    QTest::newRow("created") << DetectionStatus::UserCreated << DetectionStatus::UserCreated;
    QTest::newRow("edited") << DetectionStatus::UserEdited << DetectionStatus::UserEdited;
    QTest::newRow("edited confirmed") << DetectionStatus::UserEditedConfirmed
                                      << DetectionStatus::UserEditedConfirmed;
}

void tst_StatusPromotionPolicy::testPromoteOnEdit()
{
    QFETCH(DetectionStatus, status);
    QFETCH(DetectionStatus, expected);

    const StatusPromotionPolicy policy = StatusPromotion::promoteOnEdit();
    QCOMPARE(policy(status, EditKind::Move), expected);
    QCOMPARE(policy(status, EditKind::Resize), expected);
}

void tst_StatusPromotionPolicy::testForMode()
{
    const StatusPromotionPolicy keep = StatusPromotion::forMode(StatusPromotion::Mode::KeepStatus);
    QCOMPARE(keep(DetectionStatus::ModelGenerated, EditKind::Move), DetectionStatus::ModelGenerated);

    const StatusPromotionPolicy promote = StatusPromotion::forMode(StatusPromotion::Mode::PromoteOnEdit);
    QCOMPARE(promote(DetectionStatus::ModelGenerated, EditKind::Resize), DetectionStatus::UserEditedConfirmed);
}

QTEST_GUILESS_MAIN(tst_StatusPromotionPolicy)
#include "tst_StatusPromotionPolicy.moc"
