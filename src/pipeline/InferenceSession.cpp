#include "pipeline/InferenceSession.h"

#include "pipeline/SerialTaskQueue.h"

#include <QDebug>
#include <QPointer>

namespace {

const QString kSessionClosed = QStringLiteral("Inference session closed");
const QString kCancelled = QStringLiteral("Cancelled");

template <typename Result>
Result failure(const QString& error)
{
    Result result;
    result.error = error;
    return result;
}

} // anonymous namespace

InferenceSession::InferenceSession(QObject* parent)
    : QObject(parent)
    , m_gate(new SerialTaskQueue(this))
{
}

InferenceSession::~InferenceSession() = default;

void InferenceSession::setDetectAdapter(std::unique_ptr<IDetectAdapter> adapter)
{
    m_detect = std::move(adapter);
}

void InferenceSession::setOcrAdapter(std::unique_ptr<IOcrAdapter> adapter)
{
    m_ocr = std::move(adapter);
}

void InferenceSession::setInpaintAdapter(std::unique_ptr<IInpaintAdapter> adapter)
{
    m_inpaint = std::move(adapter);
}

void InferenceSession::setTranslateAdapter(std::unique_ptr<ITranslateAdapter> adapter)
{
    m_translate = std::move(adapter);
}

template <typename Result, typename Adapter, typename Request, typename Callback>
void InferenceSession::dispatch(std::unique_ptr<Adapter> InferenceSession::*slot,
                                void (Adapter::*call)(const Request&, const Callback&),
                                const QString& missingAdapterError, const Request& request,
                                const CancellationToken& token, const Callback& callback)
{
    QPointer<InferenceSession> guard(this);
    m_gate->push([guard, slot, call, missingAdapterError, request, token, callback](
                     const SerialTaskQueue::Done& done) {
        auto fail = [&callback, &done](const QString& error) {
            const Result result = failure<Result>(error);
            if (callback) {
                callback(result);
            }
            done(false, error);
        };

        if (!guard) {
            fail(kSessionClosed);
            return;
        }
        if (token.isCancelled()) {
            qDebug() << "InferenceSession: Skipping call cancelled while queued";
            fail(kCancelled);
            return;
        }
        Adapter* adapter = (guard.data()->*slot).get();
        if (!adapter) {
            fail(missingAdapterError);
            return;
        }

        const quint64 callId = ++guard->m_callCounter;
        guard->m_inFlight = InFlightCall{callId, token, [slot](InferenceSession* session) {
            if (Adapter* current = (session->*slot).get()) {
                current->requestCancel();
            }
        }};
        (adapter->*call)(request, [guard, callId, callback, done](const Result& result) {
            if (guard && guard->m_inFlight && guard->m_inFlight->id == callId) {
                guard->m_inFlight.reset();
            }
            if (callback) {
                callback(result);
            }
            done(result.success, result.error);
        });
    });
}

void InferenceSession::detect(const DetectRequest& request, const CancellationToken& token,
                              const DetectCallback& callback)
{
    dispatch<DetectResult>(&InferenceSession::m_detect, &IDetectAdapter::detect,
                           QStringLiteral("No detection adapter configured"), request, token,
                           callback);
}

void InferenceSession::recognize(const OcrRequest& request, const CancellationToken& token,
                                 const OcrCallback& callback)
{
    dispatch<OcrResult>(&InferenceSession::m_ocr, &IOcrAdapter::recognize,
                        QStringLiteral("No OCR adapter configured"), request, token, callback);
}

void InferenceSession::inpaint(const InpaintRequest& request, const CancellationToken& token,
                               const InpaintCallback& callback)
{
    dispatch<InpaintResult>(&InferenceSession::m_inpaint, &IInpaintAdapter::inpaint,
                            QStringLiteral("No inpainting adapter configured"), request, token,
                            callback);
}

void InferenceSession::translate(const TranslateRequest& request, const CancellationToken& token,
                                 const TranslateCallback& callback)
{
    dispatch<TranslateResult>(&InferenceSession::m_translate, &ITranslateAdapter::translate,
                              QStringLiteral("No translation adapter configured"), request, token,
                              callback);
}

void InferenceSession::requestCancel()
{
    if (!m_inFlight) {
        qDebug() << "InferenceSession: No call in flight to cancel";
        return;
    }
    if (!m_inFlight->token.isCancelled()) {
        qDebug() << "InferenceSession: Call in flight was not issued by the cancelled operation";
        return;
    }
    qDebug() << "InferenceSession: Cancelling call" << m_inFlight->id;
    // The adapter may complete, and clear m_inFlight, from inside requestCancel().
    const auto cancel = m_inFlight->cancel;
    cancel(this);
}
