#include <QtTest>
#include <QSignalSpy>

#include "pipeline/OperationController.h"

class tst_OperationController : public QObject
{
    Q_OBJECT

private slots:
    void testStart_SetsRunningState();
    void testStart_RejectedWhileActive();
    void testStart_AfterFinishAllowed();
    void testUpdate_PartialFields();
    void testUpdate_IgnoredWhenIdle();
    void testFinish_Idempotent();
    void testCancel_NotCancellable();
    void testCancel_SetsFlagAndToken();
    void testCancel_FreshTokenPerOperation();
    void testCancel_NotifierInvokedLater();
    void testCancel_NotifierFailureIgnored();
    void testComputePercent_data();
    void testComputePercent();
    void testPercent_FromOperation();
};

void tst_OperationController::testStart_SetsRunningState()
{
    OperationController controller;
    QSignalSpy started(&controller, &OperationController::operationStarted);

    QVERIFY(controller.start(OperationType::ProcessAllPages, true, 3));
    QVERIFY(controller.isActive());
    QCOMPARE(controller.operation()->type, OperationType::ProcessAllPages);
    QCOMPARE(controller.operation()->total, 3);
    QVERIFY(controller.operation()->cancellable);
    QVERIFY(!controller.isCancelRequested());
    QCOMPARE(started.count(), 1);
}

void tst_OperationController::testStart_RejectedWhileActive()
{
    OperationController controller;
    QVERIFY(controller.start(OperationType::ProcessCurrentPage, true, 4));
    QVERIFY(!controller.start(OperationType::LoadProject, false));
    QCOMPARE(controller.operation()->type, OperationType::ProcessCurrentPage);
}

void tst_OperationController::testStart_AfterFinishAllowed()
{
    OperationController controller;
    QVERIFY(controller.start(OperationType::LoadProject, false));
    controller.finish();
    QVERIFY(controller.start(OperationType::SaveProject, false));
    QCOMPARE(controller.operation()->type, OperationType::SaveProject);
}

void tst_OperationController::testUpdate_PartialFields()
{
    OperationController controller;
    controller.start(OperationType::ProcessAllPages, true, 5);

    OperationUpdate update;
    update.step = QString("Detecting text");
    update.current = 2;
    controller.update(update);

    OperationUpdate second;
    second.stageIndex = 1;
    controller.update(second);

    const Operation op = *controller.operation();
    QCOMPARE(op.step, QString("Detecting text"));
    QCOMPARE(op.current, 2);
    QCOMPARE(op.total, 5);
    QCOMPARE(op.stageIndex, 1);
}

void tst_OperationController::testUpdate_IgnoredWhenIdle()
{
    OperationController controller;
    QSignalSpy updated(&controller, &OperationController::operationUpdated);
    OperationUpdate update;
    update.current = 1;
    controller.update(update);
    QCOMPARE(updated.count(), 0);
    QVERIFY(!controller.isActive());
}

void tst_OperationController::testFinish_Idempotent()
{
    OperationController controller;
    QSignalSpy finished(&controller, &OperationController::operationFinished);

    controller.finish();
    QCOMPARE(finished.count(), 0);

    controller.start(OperationType::ProcessCurrentPage, true);
    controller.finish();
    controller.finish();
    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.first().at(1).toBool(), false);
    QVERIFY(!controller.isActive());
}

void tst_OperationController::testCancel_NotCancellable()
{
    OperationController controller;
    QVERIFY(!controller.cancel());

    controller.start(OperationType::SaveProject, false);
    QVERIFY(!controller.cancel());
    QVERIFY(!controller.isCancelRequested());
}

void tst_OperationController::testCancel_SetsFlagAndToken()
{
    OperationController controller;
    QSignalSpy requested(&controller, &OperationController::cancelRequested);
    QSignalSpy finished(&controller, &OperationController::operationFinished);

    controller.start(OperationType::ProcessAllPages, true, 2);
    const CancellationToken token = controller.cancellationToken();
    QVERIFY(token.canBeCancelled());
    QVERIFY(!token.isCancelled());

    QVERIFY(controller.cancel());
    QVERIFY(controller.isCancelRequested());
    QVERIFY(token.isCancelled());
    QCOMPARE(requested.count(), 1);

    // Cancel does not end the operation.
    QVERIFY(controller.isActive());
    QCOMPARE(finished.count(), 0);

    controller.finish();
    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.first().at(1).toBool(), true);
}

void tst_OperationController::testCancel_FreshTokenPerOperation()
{
    OperationController controller;
    controller.start(OperationType::ProcessCurrentPage, true);
    const CancellationToken first = controller.cancellationToken();
    controller.cancel();
    controller.finish();

    controller.start(OperationType::ProcessCurrentPage, true);
    QVERIFY(first.isCancelled());
    QVERIFY(!controller.cancellationToken().isCancelled());
}

void tst_OperationController::testCancel_NotifierInvokedLater()
{
    OperationController controller;
    int calls = 0;
    controller.setCancelNotifier([&calls](QString*) {
        ++calls;
        return true;
    });

    controller.start(OperationType::ProcessAllPages, true);
    controller.cancel();
    QCOMPARE(calls, 0);
    QTRY_COMPARE(calls, 1);

    // A second cancel on the same operation does not notify again.
    controller.cancel();
    QCoreApplication::processEvents();
    QCOMPARE(calls, 1);
}

void tst_OperationController::testCancel_NotifierFailureIgnored()
{
    OperationController controller;
    bool called = false;
    controller.setCancelNotifier([&called](QString* error) {
        called = true;
        *error = "adapter unavailable";
        return false;
    });

    controller.start(OperationType::ProcessAllPages, true);
    QVERIFY(controller.cancel());
    QTRY_VERIFY(called);
    QVERIFY(controller.isActive());
    QVERIFY(controller.isCancelRequested());
}

void tst_OperationController::testComputePercent_data()
{
    QTest::addColumn<int>("page");
    QTest::addColumn<int>("pages");
    QTest::addColumn<int>("stage");
    QTest::addColumn<int>("stages");
    QTest::addColumn<int>("expected");

    QTest::newRow("start") << 0 << 2 << 0 << 4 << 0;
    QTest::newRow("first page half") << 0 << 2 << 2 << 4 << 25;
    QTest::newRow("second page start") << 1 << 2 << 0 << 4 << 50;
    QTest::newRow("done") << 2 << 2 << 0 << 4 << 100;
    QTest::newRow("no pages") << 0 << 0 << 0 << 4 << 0;
    QTest::newRow("no stages") << 1 << 2 << 0 << 0 << 0;
    QTest::newRow("thirds") << 0 << 3 << 1 << 1 << 33;
}

void tst_OperationController::testComputePercent()
{
    QFETCH(int, page);
    QFETCH(int, pages);
    QFETCH(int, stage);
    QFETCH(int, stages);
    QFETCH(int, expected);
    QCOMPARE(OperationController::computePercent(page, pages, stage, stages), expected);
}

void tst_OperationController::testPercent_FromOperation()
{
    OperationController controller;
    QCOMPARE(controller.percent(), 0);

    controller.start(OperationType::ProcessCurrentPage, true, 4);
    OperationUpdate update;
    update.current = 3;
    controller.update(update);
    QCOMPARE(controller.percent(), 75);
    controller.finish();

    controller.start(OperationType::ProcessAllPages, true, 2);
    OperationUpdate pages;
    pages.current = 1;
    pages.stageIndex = 1;
    pages.stageCount = 4;
    controller.update(pages);
    QCOMPARE(controller.percent(), 63);
}

QTEST_GUILESS_MAIN(tst_OperationController)
#include "tst_OperationController.moc"
