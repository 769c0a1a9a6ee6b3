#include "inference/OpenAITranslateAdapter.h"

#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrlQuery>

namespace {
constexpr const char* kCompletionsPath = "/chat/completions";
}

OpenAITranslateAdapter::OpenAITranslateAdapter(const TranslationConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_networkManager(new QNetworkAccessManager(this))
{
}

void OpenAITranslateAdapter::setNetworkAccessManager(QNetworkAccessManager* manager)
{
    if (manager) {
        m_networkManager = manager;
    }
}

QUrl OpenAITranslateAdapter::normalizeEndpoint(const QString& endpoint, const QString& configModel,
                                               QString* resolvedModel)
{
    const QString base = endpoint.trimmed().isEmpty() ? defaultEndpoint() : endpoint.trimmed();
    QUrl url(base);

    QUrlQuery query(url);
    const QString queryModel = query.queryItemValue(QStringLiteral("model")).trimmed();
    query.removeAllQueryItems(QStringLiteral("model"));
    url.setQuery(query.isEmpty() ? QString() : query.query());

    QString path = url.path();
    if (!path.endsWith(QLatin1String(kCompletionsPath))) {
        while (path.endsWith(QLatin1Char('/'))) {
            path.chop(1);
        }
        url.setPath(path + QLatin1String(kCompletionsPath));
    }

    if (resolvedModel) {
        if (!configModel.trimmed().isEmpty()) {
            *resolvedModel = configModel.trimmed();
        } else if (!queryModel.isEmpty()) {
            *resolvedModel = queryModel;
        } else {
            *resolvedModel = defaultModel();
        }
    }
    return url;
}

bool OpenAITranslateAdapter::isDefaultEndpoint(const QString& endpoint)
{
    if (endpoint.trimmed().isEmpty()) {
        return true;
    }
    return normalizeEndpoint(endpoint).host() == normalizeEndpoint(defaultEndpoint()).host();
}

bool OpenAITranslateAdapter::validateConfig(const TranslationConfig& config, QString* errorMessage)
{
    if (config.apiKey.trimmed().isEmpty() && isDefaultEndpoint(config.endpoint)) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("OpenAI compatible API key is required");
        }
        return false;
    }
    const QUrl url = normalizeEndpoint(config.endpoint);
    if (!url.isValid() || url.scheme().isEmpty() || url.host().isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid OpenAI compatible endpoint: %1").arg(config.endpoint);
        }
        return false;
    }
    return true;
}

QByteArray OpenAITranslateAdapter::buildRequestBody(const QString& model, const QString& systemPrompt,
                                                    const QString& sourceText)
{
    QJsonObject system;
    system["role"] = QStringLiteral("system");
    system["content"] = systemPrompt;

    QJsonObject user;
    user["role"] = QStringLiteral("user");
    user["content"] = sourceText;

    QJsonObject body;
    body["model"] = model;
    body["messages"] = QJsonArray{system, user};
    body["temperature"] = kTemperature;
    return QJsonDocument(body).toJson(QJsonDocument::Compact);
}

bool OpenAITranslateAdapter::parseCompletionResponse(const QByteArray& data, QString* text,
                                                     QString* errorMessage)
{
    if (text) {
        text->clear();
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid OpenAI compatible response");
        }
        return false;
    }

    const QJsonArray choices = doc.object().value("choices").toArray();
    const QJsonObject first = choices.isEmpty() ? QJsonObject() : choices.first().toObject();
    const QJsonValue content = first.value("message").toObject().value("content");

    QString value;
    if (content.isString()) {
        value = content.toString();
    } else if (first.value("text").isString()) {
        value = first.value("text").toString();
    } else {
        if (errorMessage) {
            *errorMessage = QStringLiteral("OpenAI compatible response missing content");
        }
        return false;
    }

    if (text) {
        *text = value.trimmed();
    }
    return true;
}

void OpenAITranslateAdapter::translate(const TranslateRequest& request, const TranslateCallback& callback)
{
    TranslateResult failure;
    if (!validateConfig(m_config, &failure.error)) {
        qWarning() << "OpenAITranslateAdapter:" << failure.error;
        if (callback) {
            callback(failure);
        }
        return;
    }

    QString model;
    const QUrl url = normalizeEndpoint(m_config.endpoint, m_config.model, &model);
    const QString systemPrompt = request.systemPrompt.isEmpty() ? m_config.systemPrompt()
                                                                : request.systemPrompt;

    QNetworkRequest networkRequest(url);
    networkRequest.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));
    const QString apiKey = m_config.apiKey.trimmed();
    if (!apiKey.isEmpty()) {
        networkRequest.setRawHeader("Authorization", "Bearer " + apiKey.toUtf8());
    }

    qDebug() << "OpenAITranslateAdapter: POST" << url.toString(QUrl::RemoveQuery)
             << "model:" << model << "chars:" << request.sourceText.size();

    QNetworkReply* reply = m_networkManager->post(networkRequest,
                                                  buildRequestBody(model, systemPrompt, request.sourceText));
    m_pending.insert(reply, callback);
    connect(reply, &QNetworkReply::finished, this, &OpenAITranslateAdapter::onReplyFinished);
}

void OpenAITranslateAdapter::requestCancel()
{
    const QList<QNetworkReply*> replies = m_pending.keys();
    for (QNetworkReply* reply : replies) {
        reply->abort();
    }
}

void OpenAITranslateAdapter::onReplyFinished()
{
    QNetworkReply* reply = qobject_cast<QNetworkReply*>(sender());
    if (!reply || !m_pending.contains(reply)) {
        return;
    }
    const TranslateCallback callback = m_pending.take(reply);
    reply->deleteLater();

    TranslateResult result;
    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    const QByteArray body = reply->readAll();

    if (result.statusCode >= 200 && result.statusCode < 300) {
        result.success = parseCompletionResponse(body, &result.text, &result.error);
    } else if (result.statusCode > 0) {
        result.error = QStringLiteral("OpenAI compatible request failed (%1): %2")
                           .arg(result.statusCode)
                           .arg(QString::fromUtf8(body));
    } else if (reply->error() == QNetworkReply::OperationCanceledError) {
        result.error = QStringLiteral("Request cancelled");
    } else {
        result.error = reply->errorString();
    }

    if (!result.success) {
        qWarning() << "OpenAITranslateAdapter:" << result.error;
    }
    if (callback) {
        callback(result);
    }
}
