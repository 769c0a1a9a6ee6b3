#pragma once

#include <QSettings>
#include <QString>
#include "version.h"

namespace Inkwell {

inline constexpr const char* kOrganizationName = INKWELL_ORGANIZATION;
inline constexpr const char* kApplicationName = INKWELL_APP_NAME;

// Pipeline settings keys
inline constexpr const char* kSettingsKeyDetectConfThreshold = "pipeline/detect/confThreshold";
inline constexpr const char* kSettingsKeyDetectNmsThreshold = "pipeline/detect/nmsThreshold";
inline constexpr const char* kSettingsKeyInpaintDilateKernelSize = "pipeline/inpaint/dilateKernelSize";
inline constexpr const char* kSettingsKeyInpaintErodeDistance = "pipeline/inpaint/erodeDistance";
inline constexpr const char* kSettingsKeyOcrLanguage = "pipeline/ocr/language";
inline constexpr const char* kSettingsKeyOcrDataPath = "pipeline/ocr/dataPath";
inline constexpr const char* kSettingsKeyBrushSize = "canvas/brushSize";

// Translation settings keys
inline constexpr const char* kSettingsKeyTranslationEndpoint = "translation/endpoint";
inline constexpr const char* kSettingsKeyTranslationApiKey = "translation/apiKey";
inline constexpr const char* kSettingsKeyTranslationModel = "translation/model";
inline constexpr const char* kSettingsKeyTranslationLanguage = "translation/language";
inline constexpr const char* kSettingsKeyTranslationPrompt = "translation/prompt";

inline bool isTestSettingsNamespace()
{
    return qEnvironmentVariableIsSet("INKWELL_TEST_SETTINGS");
}

inline QSettings getSettings()
{
    if (isTestSettingsNamespace()) {
        return QSettings(QString::fromLatin1(kOrganizationName),
                         QStringLiteral("%1-Test").arg(QString::fromLatin1(kApplicationName)));
    }
    return QSettings(QString::fromLatin1(kOrganizationName), QString::fromLatin1(kApplicationName));
}

} // namespace Inkwell
