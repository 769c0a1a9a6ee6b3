#include "settings/TranslationSettingsManager.h"
#include "settings/Settings.h"

#include <QDebug>

QString TranslationConfig::systemPrompt() const
{
    QString templ = prompt.trimmed();
    if (templ.isEmpty()) {
        templ = TranslationSettingsManager::defaultPromptTemplate();
    }
    const QString lang = language.trimmed().isEmpty()
        ? TranslationSettingsManager::defaultLanguage()
        : language.trimmed();
    return templ.replace(QStringLiteral("{language}"), lang);
}

TranslationSettingsManager& TranslationSettingsManager::instance()
{
    static TranslationSettingsManager instance;
    return instance;
}

TranslationConfig TranslationSettingsManager::load() const
{
    auto settings = Inkwell::getSettings();
    TranslationConfig config;
    config.endpoint = settings.value(Inkwell::kSettingsKeyTranslationEndpoint).toString().trimmed();
    config.apiKey = settings.value(Inkwell::kSettingsKeyTranslationApiKey).toString().trimmed();
    config.model = settings.value(Inkwell::kSettingsKeyTranslationModel).toString().trimmed();
    config.language = settings.value(Inkwell::kSettingsKeyTranslationLanguage,
                                     defaultLanguage()).toString().trimmed();
    if (config.language.isEmpty()) {
        config.language = defaultLanguage();
    }
    config.prompt = settings.value(Inkwell::kSettingsKeyTranslationPrompt).toString();
    return config;
}

void TranslationSettingsManager::save(const TranslationConfig& config)
{
    auto settings = Inkwell::getSettings();
    settings.setValue(Inkwell::kSettingsKeyTranslationEndpoint, config.endpoint.trimmed());
    settings.setValue(Inkwell::kSettingsKeyTranslationApiKey, config.apiKey.trimmed());
    settings.setValue(Inkwell::kSettingsKeyTranslationModel, config.model.trimmed());
    settings.setValue(Inkwell::kSettingsKeyTranslationLanguage, config.language.trimmed());
    settings.setValue(Inkwell::kSettingsKeyTranslationPrompt, config.prompt);
    qDebug() << "TranslationSettingsManager: Saved endpoint:"
             << (config.endpoint.isEmpty() ? QStringLiteral("<default>") : config.endpoint)
             << "model:" << config.model << "language:" << config.language;
}

void TranslationSettingsManager::resetToDefaults()
{
    auto settings = Inkwell::getSettings();
    settings.remove(Inkwell::kSettingsKeyTranslationEndpoint);
    settings.remove(Inkwell::kSettingsKeyTranslationApiKey);
    settings.remove(Inkwell::kSettingsKeyTranslationModel);
    settings.remove(Inkwell::kSettingsKeyTranslationLanguage);
    settings.remove(Inkwell::kSettingsKeyTranslationPrompt);
    settings.sync();
}

bool TranslationSettingsManager::isConfigured(const TranslationConfig& config)
{
    return !config.endpoint.trimmed().isEmpty() || !config.apiKey.trimmed().isEmpty();
}
