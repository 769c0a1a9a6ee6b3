#include "settings/PipelineSettingsManager.h"
#include "settings/Settings.h"

#include <QDebug>
#include <QtGlobal>

PipelineSettingsManager& PipelineSettingsManager::instance()
{
    static PipelineSettingsManager instance;
    return instance;
}

DetectConfig PipelineSettingsManager::sanitized(DetectConfig config)
{
    if (!qIsFinite(config.confThreshold)) {
        config.confThreshold = DetectConfig().confThreshold;
    }
    if (!qIsFinite(config.nmsThreshold)) {
        config.nmsThreshold = DetectConfig().nmsThreshold;
    }
    config.confThreshold = qBound(0.0f, config.confThreshold, 1.0f);
    config.nmsThreshold = qBound(0.0f, config.nmsThreshold, 1.0f);
    return config;
}

InpaintConfig PipelineSettingsManager::sanitized(InpaintConfig config)
{
    config.dilateKernelSize = qBound(kMinDilateKernelSize, config.dilateKernelSize, kMaxDilateKernelSize);
    config.erodeDistance = qBound(kMinErodeDistance, config.erodeDistance, kMaxErodeDistance);
    return config;
}

BrushConfig PipelineSettingsManager::sanitized(BrushConfig config)
{
    config.size = qBound(kMinBrushSize, config.size, kMaxBrushSize);
    return config;
}

DetectConfig PipelineSettingsManager::loadDetectConfig() const
{
    auto settings = Inkwell::getSettings();
    const DetectConfig defaults;
    DetectConfig config;
    config.confThreshold = settings.value(Inkwell::kSettingsKeyDetectConfThreshold,
                                          defaults.confThreshold).toFloat();
    config.nmsThreshold = settings.value(Inkwell::kSettingsKeyDetectNmsThreshold,
                                         defaults.nmsThreshold).toFloat();
    return sanitized(config);
}

void PipelineSettingsManager::saveDetectConfig(const DetectConfig& config)
{
    const DetectConfig clean = sanitized(config);
    auto settings = Inkwell::getSettings();
    settings.setValue(Inkwell::kSettingsKeyDetectConfThreshold, clean.confThreshold);
    settings.setValue(Inkwell::kSettingsKeyDetectNmsThreshold, clean.nmsThreshold);
    qDebug() << "PipelineSettingsManager: Saved detect config conf:" << clean.confThreshold
             << "nms:" << clean.nmsThreshold;
}

InpaintConfig PipelineSettingsManager::loadInpaintConfig() const
{
    auto settings = Inkwell::getSettings();
    const InpaintConfig defaults;
    InpaintConfig config;
    config.dilateKernelSize = settings.value(Inkwell::kSettingsKeyInpaintDilateKernelSize,
                                             defaults.dilateKernelSize).toInt();
    config.erodeDistance = settings.value(Inkwell::kSettingsKeyInpaintErodeDistance,
                                          defaults.erodeDistance).toInt();
    return sanitized(config);
}

void PipelineSettingsManager::saveInpaintConfig(const InpaintConfig& config)
{
    const InpaintConfig clean = sanitized(config);
    auto settings = Inkwell::getSettings();
    settings.setValue(Inkwell::kSettingsKeyInpaintDilateKernelSize, clean.dilateKernelSize);
    settings.setValue(Inkwell::kSettingsKeyInpaintErodeDistance, clean.erodeDistance);
}

OcrConfig PipelineSettingsManager::loadOcrConfig() const
{
    auto settings = Inkwell::getSettings();
    OcrConfig config;
    config.language = settings.value(Inkwell::kSettingsKeyOcrLanguage, config.language).toString().trimmed();
    config.dataPath = settings.value(Inkwell::kSettingsKeyOcrDataPath).toString();
    if (config.language.isEmpty()) {
        config.language = OcrConfig().language;
    }
    return config;
}

void PipelineSettingsManager::saveOcrConfig(const OcrConfig& config)
{
    auto settings = Inkwell::getSettings();
    const QString language = config.language.trimmed();
    settings.setValue(Inkwell::kSettingsKeyOcrLanguage,
                      language.isEmpty() ? OcrConfig().language : language);
    settings.setValue(Inkwell::kSettingsKeyOcrDataPath, config.dataPath);
}

BrushConfig PipelineSettingsManager::loadBrushConfig() const
{
    auto settings = Inkwell::getSettings();
    BrushConfig config;
    config.size = settings.value(Inkwell::kSettingsKeyBrushSize, BrushConfig().size).toInt();
    return sanitized(config);
}

void PipelineSettingsManager::saveBrushConfig(const BrushConfig& config)
{
    auto settings = Inkwell::getSettings();
    settings.setValue(Inkwell::kSettingsKeyBrushSize, sanitized(config).size);
}

void PipelineSettingsManager::resetToDefaults()
{
    auto settings = Inkwell::getSettings();
    settings.remove(Inkwell::kSettingsKeyDetectConfThreshold);
    settings.remove(Inkwell::kSettingsKeyDetectNmsThreshold);
    settings.remove(Inkwell::kSettingsKeyInpaintDilateKernelSize);
    settings.remove(Inkwell::kSettingsKeyInpaintErodeDistance);
    settings.remove(Inkwell::kSettingsKeyOcrLanguage);
    settings.remove(Inkwell::kSettingsKeyOcrDataPath);
    settings.remove(Inkwell::kSettingsKeyBrushSize);
    settings.sync();
    qDebug() << "PipelineSettingsManager: Reset to defaults";
}
