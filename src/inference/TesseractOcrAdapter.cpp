#include "inference/TesseractOcrAdapter.h"

#include <QCoreApplication>
#include <QDebug>
#include <QMutex>
#include <QMutexLocker>
#include <QtConcurrent>

#include <tesseract/baseapi.h>

#include <memory>

class TesseractOcrAdapter::Private
{
public:
    QString language;
    QString dataPath;
    QMutex mutex;
    tesseract::TessBaseAPI api;
    bool initialized = false;
    bool initFailed = false;

    ~Private()
    {
        if (initialized) {
            api.End();
        }
    }

    // Caller holds the mutex.
    bool ensureInitialized(QString* errorMessage)
    {
        if (initialized) {
            return true;
        }
        if (initFailed) {
            *errorMessage = QStringLiteral("Tesseract failed to load language '%1'").arg(language);
            return false;
        }
        const QByteArray path = dataPath.toLocal8Bit();
        const QByteArray lang = language.toLatin1();
        if (api.Init(path.isEmpty() ? nullptr : path.constData(), lang.constData(),
                     tesseract::OEM_LSTM_ONLY) != 0) {
            initFailed = true;
            *errorMessage = QStringLiteral("Tesseract failed to load language '%1'").arg(language);
            qWarning() << "TesseractOcrAdapter:" << *errorMessage;
            return false;
        }
        api.SetPageSegMode(tesseract::PSM_SINGLE_BLOCK);
        api.SetVariable("user_defined_dpi", "300");
        initialized = true;
        qDebug() << "TesseractOcrAdapter: Initialized for" << language;
        return true;
    }

    OcrResult recognize(const OcrRequest& request)
    {
        OcrResult result;
        if (request.image.isNull() || request.image.width() < 2 || request.image.height() < 2) {
            result.error = QStringLiteral("Invalid image");
            return result;
        }

        const QImage rgb = request.image.convertToFormat(QImage::Format_RGB888);

        QMutexLocker locker(&mutex);
        if (!ensureInitialized(&result.error)) {
            return result;
        }

        api.SetImage(rgb.constBits(), rgb.width(), rgb.height(), 3, rgb.bytesPerLine());
        std::unique_ptr<char[]> text(api.GetUTF8Text());
        api.Clear();

        if (!text) {
            result.error = QStringLiteral("Tesseract returned no text");
            return result;
        }
        result.text = QString::fromUtf8(text.get()).trimmed();
        result.success = true;
        return result;
    }
};

TesseractOcrAdapter::TesseractOcrAdapter(const QString& language, const QString& dataPath,
                                         QObject* parent)
    : QObject(parent)
    , d(std::make_shared<Private>())
{
    d->language = language.isEmpty() ? QStringLiteral("eng") : language;
    d->dataPath = dataPath;
}

TesseractOcrAdapter::~TesseractOcrAdapter() = default;

QString TesseractOcrAdapter::language() const
{
    return d->language;
}

OcrResult TesseractOcrAdapter::recognizeSync(const OcrRequest& request)
{
    return d->recognize(request);
}

void TesseractOcrAdapter::recognize(const OcrRequest& request, const OcrCallback& callback)
{
    // The worker holds its own reference so the engine outlives the adapter.
    std::shared_ptr<Private> priv = d;
    (void)QtConcurrent::run([priv, request, callback]() {
        const OcrResult result = priv->recognize(request);
        QMetaObject::invokeMethod(qApp, [callback, result]() {
            if (callback) {
                callback(result);
            }
        }, Qt::QueuedConnection);
    });
}
