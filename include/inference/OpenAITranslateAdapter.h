#ifndef OPENAITRANSLATEADAPTER_H
#define OPENAITRANSLATEADAPTER_H

#include "inference/IInferenceAdapters.h"
#include "settings/TranslationSettingsManager.h"

#include <QByteArray>
#include <QHash>
#include <QObject>
#include <QString>
#include <QUrl>

class QNetworkAccessManager;
class QNetworkReply;

/**
 * @brief Translator speaking the OpenAI chat-completions protocol.
 *
 * Works against the public API and any compatible server. Configuration
 * errors are reported through the callback before any request is sent.
 */
class OpenAITranslateAdapter : public QObject, public ITranslateAdapter
{
    Q_OBJECT

public:
    static constexpr double kTemperature = 0.2;

    explicit OpenAITranslateAdapter(const TranslationConfig& config, QObject* parent = nullptr);

    QString name() const override { return QStringLiteral("openai-compatible"); }
    void translate(const TranslateRequest& request, const TranslateCallback& callback) override;
    void requestCancel() override;

    void setConfig(const TranslationConfig& config) { m_config = config; }
    TranslationConfig config() const { return m_config; }
    void setNetworkAccessManager(QNetworkAccessManager* manager);
    int pendingRequestCount() const { return m_pending.size(); }

    static QString defaultEndpoint() { return QStringLiteral("https://api.openai.com/v1/"); }
    static QString defaultModel() { return QStringLiteral("gpt-4o-mini"); }

    /**
     * @brief Resolve the request URL and model.
     *
     * The path is made to end in /chat/completions. A "model" query item
     * is removed from the URL and used as the model unless @p configModel
     * is set.
     */
    static QUrl normalizeEndpoint(const QString& endpoint, const QString& configModel = QString(),
                                  QString* resolvedModel = nullptr);
    static bool isDefaultEndpoint(const QString& endpoint);
    static bool validateConfig(const TranslationConfig& config, QString* errorMessage);
    static QByteArray buildRequestBody(const QString& model, const QString& systemPrompt,
                                       const QString& sourceText);
    static bool parseCompletionResponse(const QByteArray& data, QString* text,
                                        QString* errorMessage = nullptr);

private slots:
    void onReplyFinished();

private:
    TranslationConfig m_config;
    QNetworkAccessManager* m_networkManager = nullptr;
    QHash<QNetworkReply*, TranslateCallback> m_pending;
};

#endif // OPENAITRANSLATEADAPTER_H
