#include <QtTest>

#include "settings/PipelineSettingsManager.h"
#include "settings/Settings.h"

#include <limits>

class tst_PipelineSettingsManager : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testDefaults();
    void testDetectConfig_Roundtrip();
    void testDetectConfig_ClampedOnLoad();
    void testDetectConfig_NonFiniteFallsBack();
    void testInpaintConfig_ClampedOnSave();
    void testBrushConfig_Clamped();
    void testOcrConfig_Roundtrip();
    void testOcrConfig_EmptyLanguageFallsBack();
    void testResetToDefaults();
};

void tst_PipelineSettingsManager::init()
{
    PipelineSettingsManager::instance().resetToDefaults();
}

void tst_PipelineSettingsManager::cleanup()
{
    PipelineSettingsManager::instance().resetToDefaults();
}

void tst_PipelineSettingsManager::testDefaults()
{
    auto& manager = PipelineSettingsManager::instance();
    const DetectConfig detect = manager.loadDetectConfig();
    QCOMPARE(detect.confThreshold, 0.5f);
    QCOMPARE(detect.nmsThreshold, 0.4f);

    const InpaintConfig inpaint = manager.loadInpaintConfig();
    QCOMPARE(inpaint.dilateKernelSize, 5);
    QCOMPARE(inpaint.erodeDistance, 3);

    QCOMPARE(manager.loadBrushConfig().size, 36);
    QCOMPARE(manager.loadOcrConfig().language, QString("eng"));
    QVERIFY(manager.loadOcrConfig().dataPath.isEmpty());
}

void tst_PipelineSettingsManager::testDetectConfig_Roundtrip()
{
    auto& manager = PipelineSettingsManager::instance();
    manager.saveDetectConfig(DetectConfig{0.65f, 0.3f});
    const DetectConfig loaded = manager.loadDetectConfig();
    QCOMPARE(loaded.confThreshold, 0.65f);
    QCOMPARE(loaded.nmsThreshold, 0.3f);
}

void tst_PipelineSettingsManager::testDetectConfig_ClampedOnLoad()
{
    {
        auto settings = Inkwell::getSettings();
        settings.setValue(Inkwell::kSettingsKeyDetectConfThreshold, 3.0);
        settings.setValue(Inkwell::kSettingsKeyDetectNmsThreshold, -1.0);
        settings.sync();
    }
    const DetectConfig loaded = PipelineSettingsManager::instance().loadDetectConfig();
    QCOMPARE(loaded.confThreshold, 1.0f);
    QCOMPARE(loaded.nmsThreshold, 0.0f);
}

void tst_PipelineSettingsManager::testDetectConfig_NonFiniteFallsBack()
{
    DetectConfig config;
    config.confThreshold = std::numeric_limits<float>::quiet_NaN();
    config.nmsThreshold = std::numeric_limits<float>::infinity();
    const DetectConfig clean = PipelineSettingsManager::sanitized(config);
    QCOMPARE(clean.confThreshold, 0.5f);
    QCOMPARE(clean.nmsThreshold, 0.4f);
}

void tst_PipelineSettingsManager::testInpaintConfig_ClampedOnSave()
{
    auto& manager = PipelineSettingsManager::instance();
    manager.saveInpaintConfig(InpaintConfig{50, 0});
    const InpaintConfig loaded = manager.loadInpaintConfig();
    QCOMPARE(loaded.dilateKernelSize, PipelineSettingsManager::kMaxDilateKernelSize);
    QCOMPARE(loaded.erodeDistance, PipelineSettingsManager::kMinErodeDistance);
}

void tst_PipelineSettingsManager::testBrushConfig_Clamped()
{
    auto& manager = PipelineSettingsManager::instance();
    manager.saveBrushConfig(BrushConfig{2});
    QCOMPARE(manager.loadBrushConfig().size, PipelineSettingsManager::kMinBrushSize);
    manager.saveBrushConfig(BrushConfig{64});
    QCOMPARE(manager.loadBrushConfig().size, 64);
}

void tst_PipelineSettingsManager::testOcrConfig_Roundtrip()
{
    auto& manager = PipelineSettingsManager::instance();
    OcrConfig config;
    config.language = " jpn+eng ";
    config.dataPath = "/opt/tessdata";
    manager.saveOcrConfig(config);

    const OcrConfig loaded = manager.loadOcrConfig();
    QCOMPARE(loaded.language, QString("jpn+eng"));
    QCOMPARE(loaded.dataPath, QString("/opt/tessdata"));
}

void tst_PipelineSettingsManager::testOcrConfig_EmptyLanguageFallsBack()
{
    {
        auto settings = Inkwell::getSettings();
        settings.setValue(Inkwell::kSettingsKeyOcrLanguage, "   ");
        settings.sync();
    }
    QCOMPARE(PipelineSettingsManager::instance().loadOcrConfig().language, QString("eng"));
}

void tst_PipelineSettingsManager::testResetToDefaults()
{
    auto& manager = PipelineSettingsManager::instance();
    manager.saveDetectConfig(DetectConfig{0.9f, 0.9f});
    manager.saveBrushConfig(BrushConfig{100});
    manager.resetToDefaults();

    QCOMPARE(manager.loadDetectConfig().confThreshold, 0.5f);
    QCOMPARE(manager.loadBrushConfig().size, 36);

    auto settings = Inkwell::getSettings();
    QVERIFY(!settings.contains(Inkwell::kSettingsKeyDetectConfThreshold));
}

QTEST_GUILESS_MAIN(tst_PipelineSettingsManager)
#include "tst_PipelineSettingsManager.moc"
