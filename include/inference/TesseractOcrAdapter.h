#ifndef TESSERACTOCRADAPTER_H
#define TESSERACTOCRADAPTER_H

#include "inference/IInferenceAdapters.h"

#include <QObject>
#include <QString>

#include <memory>

/**
 * @brief Block text recognition through the Tesseract API.
 *
 * The engine is initialized lazily on first use. One TessBaseAPI instance
 * is shared by all calls and guarded by a mutex.
 */
class TesseractOcrAdapter : public QObject, public IOcrAdapter
{
    Q_OBJECT

public:
    explicit TesseractOcrAdapter(const QString& language = QStringLiteral("eng"),
                                 const QString& dataPath = QString(),
                                 QObject* parent = nullptr);
    ~TesseractOcrAdapter() override;

    QString name() const override { return QStringLiteral("tesseract"); }
    void recognize(const OcrRequest& request, const OcrCallback& callback) override;

    OcrResult recognizeSync(const OcrRequest& request);

    QString language() const;

private:
    class Private;
    std::shared_ptr<Private> d;
};

#endif // TESSERACTOCRADAPTER_H
