#include <QtTest>
#include <QSignalSpy>

#include "EditorContext.h"
#include "document/DocumentStore.h"
#include "pipeline/InferenceSession.h"
#include "pipeline/OperationController.h"
#include "pipeline/PipelineRunner.h"
#include "../mocks/MockInferenceAdapters.h"

namespace {

Document makePage(const QString& name)
{
    QImage image(120, 80, QImage::Format_RGB32);
    image.fill(Qt::white);
    return Document(QString("%1.png").arg(name), image);
}

DetectResult detectionWithOneBlock()
{
    TextBlock block;
    block.x = 10;
    block.y = 10;
    block.width = 40;
    block.height = 20;
    block.confidence = 0.9f;

    DetectResult result;
    result.success = true;
    result.blocks = {block};
    result.segmentationMask = QImage(120, 80, QImage::Format_Grayscale8);
    result.segmentationMask.fill(0);
    for (int y = 15; y < 25; ++y) {
        for (int x = 15; x < 45; ++x) {
            result.segmentationMask.setPixel(x, y, qRgb(255, 255, 255));
        }
    }
    return result;
}

} // namespace

class tst_PipelineRunner : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testProcessCurrentPage_AllStages();
    void testProcessAllPages_StageOrder();
    void testProcessCurrentPage_NoDocument();
    void testProcess_NoStages();
    void testProcess_RejectedWhileRunning();
    void testProgress_Monotonic();
    void testFailure_StopsRun();
    void testCancel_DiscardsResultAndStops();
    void testCancel_ForwardedToAdapters();
    void testCancel_LeavesUserCommandRunning();
    void testStageLabels();

private:
    EditorContext* m_context = nullptr;
    MockDetectAdapter* m_detect = nullptr;
    MockOcrAdapter* m_ocr = nullptr;
    MockInpaintAdapter* m_inpaint = nullptr;
    MockTranslateAdapter* m_translate = nullptr;
};

void tst_PipelineRunner::initTestCase()
{
    qRegisterMetaType<PipelineStage>();
    qRegisterMetaType<PipelineRunner::RunStatus>();
}

void tst_PipelineRunner::init()
{
    m_context = new EditorContext(this);

    auto detect = std::make_unique<MockDetectAdapter>();
    auto ocr = std::make_unique<MockOcrAdapter>();
    auto inpaint = std::make_unique<MockInpaintAdapter>();
    auto translate = std::make_unique<MockTranslateAdapter>();
    m_detect = detect.get();
    m_ocr = ocr.get();
    m_inpaint = inpaint.get();
    m_translate = translate.get();
    m_detect->setResult(detectionWithOneBlock());

    InferenceSession* session = m_context->inference();
    session->setDetectAdapter(std::move(detect));
    session->setOcrAdapter(std::move(ocr));
    session->setInpaintAdapter(std::move(inpaint));
    session->setTranslateAdapter(std::move(translate));
}

void tst_PipelineRunner::cleanup()
{
    delete m_context;
    m_context = nullptr;
}

void tst_PipelineRunner::testProcessCurrentPage_AllStages()
{
    m_context->documents()->setDocuments({makePage("a"), makePage("b")});
    m_context->documents()->setCurrentIndex(1);
    QSignalSpy finished(m_context->runner(), &PipelineRunner::runFinished);

    QVERIFY(m_context->runner()->processCurrentPage(PipelineRunner::Options()));

    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.first().at(0).value<PipelineRunner::RunStatus>(),
             PipelineRunner::RunStatus::Completed);
    QVERIFY(!m_context->operations()->isActive());
    QVERIFY(!m_context->runner()->isRunning());

    const Document* processed = m_context->documents()->document(1);
    QCOMPARE(processed->textBlocks().size(), 1);
    QCOMPARE(processed->textBlocks().first().text.value_or(QString()), QString("text 1"));
    QCOMPARE(processed->textBlocks().first().translation.value_or(QString()), QString("[tr] text 1"));
    QVERIFY(!processed->inpainted().isNull());
    QCOMPARE(QColor(processed->inpainted().pixel(20, 20)), QColor(Qt::green));

    // Only the current page is touched.
    QVERIFY(m_context->documents()->document(0)->textBlocks().isEmpty());
}

void tst_PipelineRunner::testProcessAllPages_StageOrder()
{
    m_context->documents()->setDocuments({makePage("a"), makePage("b")});
    QSignalSpy stages(m_context->runner(), &PipelineRunner::stageStarted);
    QSignalSpy started(m_context->runner(), &PipelineRunner::runStarted);

    PipelineRunner::Options options;
    options.stages = {PipelineStage::Detect, PipelineStage::Ocr};
    QVERIFY(m_context->runner()->processAllPages(options));

    QCOMPARE(started.count(), 1);
    QCOMPARE(started.first().at(0).toInt(), 2);
    QCOMPARE(started.first().at(1).toInt(), 2);

    QCOMPARE(stages.count(), 4);
    const QVector<QPair<int, PipelineStage>> expected{
        {0, PipelineStage::Detect}, {0, PipelineStage::Ocr},
        {1, PipelineStage::Detect}, {1, PipelineStage::Ocr}};
    for (int i = 0; i < expected.size(); ++i) {
        QCOMPARE(stages.at(i).at(0).toInt(), expected.at(i).first);
        QCOMPARE(stages.at(i).at(1).value<PipelineStage>(), expected.at(i).second);
    }
    QCOMPARE(m_inpaint->callCount(), 0);
    QCOMPARE(m_translate->callCount(), 0);
    QCOMPARE(m_context->documents()->document(1)->textBlocks().first().text.value_or(QString()),
             QString("text 2"));
}

void tst_PipelineRunner::testProcessCurrentPage_NoDocument()
{
    QVERIFY(!m_context->runner()->processCurrentPage(PipelineRunner::Options()));
    QVERIFY(!m_context->runner()->processAllPages(PipelineRunner::Options()));
    QVERIFY(!m_context->operations()->isActive());
}

void tst_PipelineRunner::testProcess_NoStages()
{
    m_context->documents()->setDocuments({makePage("a")});
    PipelineRunner::Options options;
    options.stages.clear();
    QVERIFY(!m_context->runner()->processCurrentPage(options));
    QVERIFY(!m_context->operations()->isActive());
}

void tst_PipelineRunner::testProcess_RejectedWhileRunning()
{
    m_context->documents()->setDocuments({makePage("a")});
    m_detect->setDelivery(MockDelivery::Manual);

    QVERIFY(m_context->runner()->processCurrentPage(PipelineRunner::Options()));
    QVERIFY(m_context->runner()->isRunning());
    QVERIFY(!m_context->runner()->processAllPages(PipelineRunner::Options()));

    // Another operation holding the controller also blocks a run.
    m_detect->releaseAll();
    QVERIFY(!m_context->runner()->isRunning());
    QVERIFY(m_context->operations()->start(OperationType::SaveProject, false));
    QVERIFY(!m_context->runner()->processCurrentPage(PipelineRunner::Options()));
    m_context->operations()->finish();
}

void tst_PipelineRunner::testProgress_Monotonic()
{
    m_context->documents()->setDocuments({makePage("a"), makePage("b"), makePage("c")});
    OperationController* operations = m_context->operations();
    QVector<int> percents;
    connect(operations, &OperationController::operationUpdated, this, [&percents, operations]() {
        percents << operations->percent();
    });

    QVERIFY(m_context->runner()->processAllPages(PipelineRunner::Options()));

    QVERIFY(!percents.isEmpty());
    for (int i = 1; i < percents.size(); ++i) {
        QVERIFY2(percents.at(i) >= percents.at(i - 1),
                 qPrintable(QString("%1 -> %2").arg(percents.at(i - 1)).arg(percents.at(i))));
    }
    QCOMPARE(percents.last(), 100);
}

void tst_PipelineRunner::testFailure_StopsRun()
{
    m_context->documents()->setDocuments({makePage("a"), makePage("b")});
    m_ocr->setHandler([](const OcrRequest&) {
        OcrResult result;
        result.error = "Recognition failed";
        return result;
    });
    QSignalSpy failed(m_context->runner(), &PipelineRunner::runFailed);
    QSignalSpy finished(m_context->runner(), &PipelineRunner::runFinished);

    QVERIFY(m_context->runner()->processAllPages(PipelineRunner::Options()));

    QCOMPARE(failed.count(), 1);
    QCOMPARE(failed.first().at(0).toString(), QString("Recognition failed"));
    QCOMPARE(finished.first().at(0).value<PipelineRunner::RunStatus>(),
             PipelineRunner::RunStatus::Failed);
    QCOMPARE(m_detect->callCount(), 1);
    QCOMPARE(m_inpaint->callCount(), 0);
    QVERIFY(!m_context->operations()->isActive());
}

void tst_PipelineRunner::testCancel_DiscardsResultAndStops()
{
    m_context->documents()->setDocuments({makePage("a"), makePage("b")});
    m_detect->setDelivery(MockDelivery::Manual);
    QSignalSpy finished(m_context->runner(), &PipelineRunner::runFinished);
    QSignalSpy operationFinished(m_context->operations(), &OperationController::operationFinished);

    QVERIFY(m_context->runner()->processAllPages(PipelineRunner::Options()));
    QVERIFY(m_context->operations()->cancel());
    QCOMPARE(finished.count(), 0);

    m_detect->releaseAll();

    QCOMPARE(finished.count(), 1);
    QCOMPARE(finished.first().at(0).value<PipelineRunner::RunStatus>(),
             PipelineRunner::RunStatus::Cancelled);
    QCOMPARE(operationFinished.count(), 1);
    QCOMPARE(operationFinished.first().at(1).toBool(), true);
    QCOMPARE(m_detect->callCount(), 1);
    QCOMPARE(m_ocr->callCount(), 0);
    QVERIFY(m_context->documents()->document(0)->textBlocks().isEmpty());
}

void tst_PipelineRunner::testCancel_ForwardedToAdapters()
{
    m_context->documents()->setDocuments({makePage("a")});
    m_detect->setDelivery(MockDelivery::Manual);

    QVERIFY(m_context->runner()->processCurrentPage(PipelineRunner::Options()));
    m_context->operations()->cancel();
    QCOMPARE(m_detect->cancelCount(), 0);
    QTRY_COMPARE(m_detect->cancelCount(), 1);
    // Only the adapter serving the cancelled run is interrupted.
    QCOMPARE(m_translate->cancelCount(), 0);
    QCOMPARE(m_ocr->cancelCount(), 0);

    m_detect->releaseAll();
    QVERIFY(!m_context->runner()->isRunning());
}

void tst_PipelineRunner::testCancel_LeavesUserCommandRunning()
{
    m_context->documents()->setDocuments({makePage("a"), makePage("b")});
    DetectResult detection = detectionWithOneBlock();
    detection.blocks[0].text = QStringLiteral("hello");
    const QString firstId = m_context->documents()->document(0)->id();
    QVERIFY(m_context->documents()->replaceDetection(firstId, detection.blocks,
                                                     detection.segmentationMask));
    m_translate->setDelivery(MockDelivery::Manual);

    bool translated = false;
    QVERIFY(m_context->commands()->translate([&translated](const StageResult& result) {
        translated = result.success;
    }));
    QCOMPARE(m_translate->heldCount(), 1);

    m_context->documents()->setCurrentIndex(1);
    QSignalSpy finished(m_context->runner(), &PipelineRunner::runFinished);
    QVERIFY(m_context->runner()->processCurrentPage(PipelineRunner::Options()));
    QVERIFY(m_context->operations()->cancel());
    QCoreApplication::processEvents();

    // The held translation belongs to no operation.
    QCOMPARE(m_translate->cancelCount(), 0);
    QCOMPARE(m_detect->cancelCount(), 0);

    m_translate->releaseAll();

    QVERIFY(translated);
    QCOMPARE(m_context->documents()->document(0)->textBlocks().first().translation.value_or(QString()),
             QString("[tr] hello"));
    QTRY_COMPARE(finished.count(), 1);
    QCOMPARE(finished.first().at(0).value<PipelineRunner::RunStatus>(),
             PipelineRunner::RunStatus::Cancelled);
    // Detection was cancelled while waiting for the gate and never reached the adapter.
    QCOMPARE(m_detect->callCount(), 0);
    QVERIFY(!m_context->inference()->hasCallInFlight());
}

void tst_PipelineRunner::testStageLabels()
{
    QCOMPARE(PipelineRunner::stageLabel(PipelineStage::Detect), QString("Detecting text"));
    QCOMPARE(PipelineRunner::stageLabel(PipelineStage::Translate), QString("Translating"));
    QCOMPARE(pipelineStageName(PipelineStage::Inpaint), QString("inpaint"));
    QCOMPARE(pipelineStageFromName(" OCR ").value(), PipelineStage::Ocr);
    QVERIFY(!pipelineStageFromName("render").has_value());
}

QTEST_MAIN(tst_PipelineRunner)
#include "tst_PipelineRunner.moc"
