#include <QtTest>

#include "inference/TesseractOcrAdapter.h"

class tst_TesseractOcrAdapter : public QObject
{
    Q_OBJECT

private slots:
    void testLanguage_DefaultsToEnglish();
    void testRecognize_NullImage();
    void testRecognize_TinyImage();
    void testRecognize_MissingLanguageData();
    void testRecognize_AsyncReportsFailure();
};

void tst_TesseractOcrAdapter::testLanguage_DefaultsToEnglish()
{
    TesseractOcrAdapter adapter(QString(), QString());
    QCOMPARE(adapter.language(), QString("eng"));

    TesseractOcrAdapter japanese("jpn+eng");
    QCOMPARE(japanese.language(), QString("jpn+eng"));
}

void tst_TesseractOcrAdapter::testRecognize_NullImage()
{
    TesseractOcrAdapter adapter;
    const OcrResult result = adapter.recognizeSync(OcrRequest());
    QVERIFY(!result.success);
    QCOMPARE(result.error, QString("Invalid image"));
}

void tst_TesseractOcrAdapter::testRecognize_TinyImage()
{
    TesseractOcrAdapter adapter;
    OcrRequest request;
    request.image = QImage(1, 1, QImage::Format_RGB32);
    QVERIFY(!adapter.recognizeSync(request).success);
}

void tst_TesseractOcrAdapter::testRecognize_MissingLanguageData()
{
    TesseractOcrAdapter adapter("eng", "/nonexistent/tessdata");
    OcrRequest request;
    request.image = QImage(40, 20, QImage::Format_RGB32);
    request.image.fill(Qt::white);

    const OcrResult first = adapter.recognizeSync(request);
    QVERIFY(!first.success);
    QCOMPARE(first.error, QString("Tesseract failed to load language 'eng'"));

    // The failed init is remembered rather than retried.
    const OcrResult second = adapter.recognizeSync(request);
    QCOMPARE(second.error, first.error);
}

void tst_TesseractOcrAdapter::testRecognize_AsyncReportsFailure()
{
    TesseractOcrAdapter adapter("eng", "/nonexistent/tessdata");
    OcrRequest request;
    request.image = QImage(40, 20, QImage::Format_RGB32);
    request.image.fill(Qt::white);

    bool called = false;
    OcrResult received;
    adapter.recognize(request, [&](const OcrResult& result) {
        called = true;
        received = result;
    });
    QTRY_VERIFY_WITH_TIMEOUT(called, 10000);
    QVERIFY(!received.success);
}

QTEST_GUILESS_MAIN(tst_TesseractOcrAdapter)
#include "tst_TesseractOcrAdapter.moc"
