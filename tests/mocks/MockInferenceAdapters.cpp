#include "MockInferenceAdapters.h"

#include <QCoreApplication>
#include <QTimer>

bool MockAdapterBase::releaseNext()
{
    if (m_held.isEmpty()) {
        return false;
    }
    std::function<void()> completion = m_held.takeFirst();
    completion();
    return true;
}

int MockAdapterBase::releaseAll()
{
    int released = 0;
    while (releaseNext()) {
        ++released;
    }
    return released;
}

void MockAdapterBase::deliver(std::function<void()> completion)
{
    switch (m_delivery) {
    case MockDelivery::Immediate:
        completion();
        break;
    case MockDelivery::Queued:
        QTimer::singleShot(0, qApp, completion);
        break;
    case MockDelivery::Manual:
        m_held.append(std::move(completion));
        break;
    }
}

void MockDetectAdapter::detect(const DetectRequest& request, const DetectCallback& callback)
{
    ++m_callCount;
    m_requests.append(request);

    DetectResult result = m_result;
    if (result.success && result.segmentationMask.isNull() && !request.image.isNull()) {
        result.segmentationMask = QImage(request.image.size(), QImage::Format_Grayscale8);
        result.segmentationMask.fill(0);
    }
    deliver([callback, result]() { callback(result); });
}

MockOcrAdapter::MockOcrAdapter()
{
    m_handler = [this](const OcrRequest&) {
        OcrResult result;
        result.success = true;
        result.text = QStringLiteral("text %1").arg(m_callCount);
        return result;
    };
}

void MockOcrAdapter::recognize(const OcrRequest& request, const OcrCallback& callback)
{
    ++m_callCount;
    m_requests.append(request);
    const OcrResult result = m_handler(request);
    deliver([callback, result]() { callback(result); });
}

void MockInpaintAdapter::inpaint(const InpaintRequest& request, const InpaintCallback& callback)
{
    ++m_callCount;
    m_requests.append(request);

    InpaintResult result;
    if (!m_failure.isEmpty()) {
        result.error = m_failure;
    } else {
        const QSize size = request.region ? request.region->size() : request.image.size();
        result.image = QImage(size, QImage::Format_RGB32);
        result.image.fill(m_fillColor);
        result.success = true;
    }
    deliver([callback, result]() { callback(result); });
}

MockTranslateAdapter::MockTranslateAdapter()
{
    m_handler = [](const TranslateRequest& request) {
        TranslateResult result;
        result.success = true;
        result.statusCode = 200;
        result.text = QStringLiteral("[tr] %1").arg(request.sourceText);
        return result;
    };
}

void MockTranslateAdapter::translate(const TranslateRequest& request, const TranslateCallback& callback)
{
    ++m_callCount;
    m_requests.append(request);
    const TranslateResult result = m_handler(request);
    deliver([callback, result]() { callback(result); });
}
