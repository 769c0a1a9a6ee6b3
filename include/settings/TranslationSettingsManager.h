#ifndef TRANSLATIONSETTINGSMANAGER_H
#define TRANSLATIONSETTINGSMANAGER_H

#include <QString>

/**
 * @brief Connection and prompt settings for the OpenAI-compatible translator.
 */
struct TranslationConfig {
    QString endpoint;       ///< Empty means the public default endpoint
    QString apiKey;
    QString model;          ///< Empty means endpoint query or default model
    QString language = QStringLiteral("English");
    QString prompt;         ///< Empty means defaultPrompt(language)

    // Resolved system prompt with {language} substituted.
    QString systemPrompt() const;
};

/**
 * @brief Singleton manager for translation settings.
 */
class TranslationSettingsManager
{
public:
    static TranslationSettingsManager& instance();

    TranslationConfig load() const;
    void save(const TranslationConfig& config);
    void resetToDefaults();

    // A translator counts as configured once either field is filled in.
    static bool isConfigured(const TranslationConfig& config);

    static QString defaultPromptTemplate()
    {
        return QStringLiteral("Translate to {language}, do not add any explanations, "
                              "do not add or delete line breaks.");
    }
    static QString defaultLanguage() { return QStringLiteral("English"); }

private:
    TranslationSettingsManager() = default;
    TranslationSettingsManager(const TranslationSettingsManager&) = delete;
    TranslationSettingsManager& operator=(const TranslationSettingsManager&) = delete;
};

#endif // TRANSLATIONSETTINGSMANAGER_H
