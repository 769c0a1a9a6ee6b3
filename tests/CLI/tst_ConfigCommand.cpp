#include <QtTest>

#include "cli/CLIHandler.h"
#include "cli/commands/ConfigCommand.h"
#include "settings/PipelineSettingsManager.h"
#include "settings/TranslationSettingsManager.h"

using Inkwell::CLI::CLIHandler;
using Inkwell::CLI::CLIResult;
using Inkwell::CLI::ConfigCommand;

class tst_ConfigCommand : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testKnownKeys_MatchCurrentValues();
    void testList_Default();
    void testGet_Value();
    void testGet_UnknownKey();
    void testSet_DetectThreshold();
    void testSet_ValueClamped();
    void testSet_HugeNumberClamped();
    void testSet_InvalidNumber();
    void testSet_UnknownKey();
    void testSet_MissingSeparator();
    void testSet_ApiKeyMasked();
    void testSet_OcrLanguage();
    void testReset();

private:
    CLIResult run(const QStringList& args);
};

void tst_ConfigCommand::init()
{
    PipelineSettingsManager::instance().resetToDefaults();
    TranslationSettingsManager::instance().resetToDefaults();
}

void tst_ConfigCommand::cleanup()
{
    init();
}

CLIResult tst_ConfigCommand::run(const QStringList& args)
{
    CLIHandler handler;
    return handler.process(QStringList{"inkwell", "config"} + args);
}

void tst_ConfigCommand::testKnownKeys_MatchCurrentValues()
{
    QStringList keys = ConfigCommand::knownKeys();
    QStringList current = ConfigCommand::currentValues().keys();
    keys.sort();
    current.sort();
    QCOMPARE(keys, current);
}

void tst_ConfigCommand::testList_Default()
{
    const CLIResult listed = run({"--list"});
    QVERIFY(listed.isSuccess());
    QVERIFY(listed.message.startsWith("Current settings:"));
    QVERIFY(listed.message.contains("detect.confThreshold = 0.5"));
    QVERIFY(listed.message.contains("ocr.language = eng"));

    QCOMPARE(run({}).message, listed.message);
}

void tst_ConfigCommand::testGet_Value()
{
    const CLIResult result = run({"--get", "inpaint.dilateKernelSize"});
    QVERIFY(result.isSuccess());
    QCOMPARE(result.message, QString("5"));
}

void tst_ConfigCommand::testGet_UnknownKey()
{
    const CLIResult result = run({"--get", "detect.nope"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QCOMPARE(result.message, QString("Setting not found: detect.nope"));
}

void tst_ConfigCommand::testSet_DetectThreshold()
{
    const CLIResult result = run({"--set", "detect.confThreshold=0.7"});
    QVERIFY2(result.isSuccess(), qPrintable(result.message));
    QCOMPARE(result.message, QString("Set detect.confThreshold = 0.7"));
    QCOMPARE(PipelineSettingsManager::instance().loadDetectConfig().confThreshold, 0.7f);
}

void tst_ConfigCommand::testSet_ValueClamped()
{
    QVERIFY(run({"--set", "inpaint.erodeDistance=99"}).isSuccess());
    QCOMPARE(PipelineSettingsManager::instance().loadInpaintConfig().erodeDistance,
             PipelineSettingsManager::kMaxErodeDistance);
}

void tst_ConfigCommand::testSet_HugeNumberClamped()
{
    QVERIFY(run({"--set", "brush.size=1e20"}).isSuccess());
    QCOMPARE(PipelineSettingsManager::instance().loadBrushConfig().size,
             PipelineSettingsManager::kMaxBrushSize);
    QVERIFY(run({"--set", "inpaint.dilateKernelSize=-1e20"}).isSuccess());
    QCOMPARE(PipelineSettingsManager::instance().loadInpaintConfig().dilateKernelSize,
             PipelineSettingsManager::kMinDilateKernelSize);
}

void tst_ConfigCommand::testSet_InvalidNumber()
{
    const CLIResult result = run({"--set", "brush.size=big"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QCOMPARE(result.message, QString("Invalid value for brush.size: big"));
}

void tst_ConfigCommand::testSet_UnknownKey()
{
    QString error;
    QVERIFY(!ConfigCommand::applySetting("detect.speed", "1", &error));
    QCOMPARE(error, QString("Unknown setting: detect.speed"));
    QVERIFY(!ConfigCommand::applySetting("render.font", "x", &error));
    QCOMPARE(error, QString("Unknown setting: render.font"));
}

void tst_ConfigCommand::testSet_MissingSeparator()
{
    const CLIResult result = run({"--set", "brush.size"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
}

void tst_ConfigCommand::testSet_ApiKeyMasked()
{
    QVERIFY(run({"--set", "translation.apiKey=sk-secret-abcd"}).isSuccess());
    QCOMPARE(run({"--get", "translation.apiKey"}).message, QString("****abcd"));
    QCOMPARE(ConfigCommand::currentValues(false).value("translation.apiKey"), QString("sk-secret-abcd"));
    QCOMPARE(TranslationSettingsManager::instance().load().apiKey, QString("sk-secret-abcd"));
}

void tst_ConfigCommand::testSet_OcrLanguage()
{
    QVERIFY(run({"--set", "ocr.language=jpn+eng"}).isSuccess());
    QCOMPARE(PipelineSettingsManager::instance().loadOcrConfig().language, QString("jpn+eng"));
}

void tst_ConfigCommand::testReset()
{
    QVERIFY(run({"--set", "brush.size=90"}).isSuccess());
    QVERIFY(run({"--set", "translation.model=llama3"}).isSuccess());

    const CLIResult result = run({"--reset"});
    QVERIFY(result.isSuccess());
    QCOMPARE(PipelineSettingsManager::instance().loadBrushConfig().size, 36);
    QVERIFY(TranslationSettingsManager::instance().load().model.isEmpty());
}

QTEST_GUILESS_MAIN(tst_ConfigCommand)
#include "tst_ConfigCommand.moc"
