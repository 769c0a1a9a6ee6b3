#ifndef INFERENCESESSION_H
#define INFERENCESESSION_H

#include "inference/IInferenceAdapters.h"
#include "pipeline/CancellationToken.h"

#include <QObject>

#include <functional>
#include <memory>
#include <optional>

class SerialTaskQueue;

/**
 * @brief Owns the adapters and lets one model invocation run at a time.
 *
 * Every call goes through a shared gate queue, whatever page or command
 * issued it. A call with no adapter installed completes immediately with
 * an error, and so does a call whose token was cancelled while it waited
 * in the gate.
 */
class InferenceSession : public QObject
{
    Q_OBJECT

public:
    explicit InferenceSession(QObject* parent = nullptr);
    ~InferenceSession() override;

    // Take ownership.
    void setDetectAdapter(std::unique_ptr<IDetectAdapter> adapter);
    void setOcrAdapter(std::unique_ptr<IOcrAdapter> adapter);
    void setInpaintAdapter(std::unique_ptr<IInpaintAdapter> adapter);
    void setTranslateAdapter(std::unique_ptr<ITranslateAdapter> adapter);

    IDetectAdapter* detectAdapter() const { return m_detect.get(); }
    IOcrAdapter* ocrAdapter() const { return m_ocr.get(); }
    IInpaintAdapter* inpaintAdapter() const { return m_inpaint.get(); }
    ITranslateAdapter* translateAdapter() const { return m_translate.get(); }

    void detect(const DetectRequest& request, const CancellationToken& token,
                const DetectCallback& callback);
    void recognize(const OcrRequest& request, const CancellationToken& token,
                   const OcrCallback& callback);
    void inpaint(const InpaintRequest& request, const CancellationToken& token,
                 const InpaintCallback& callback);
    void translate(const TranslateRequest& request, const CancellationToken& token,
                   const TranslateCallback& callback);

    /**
     * @brief Ask the adapter running the current call to stop.
     *
     * Only a call whose token has been cancelled is interrupted; calls
     * issued with another token keep running. Best effort: the adapter may
     * still complete normally.
     */
    void requestCancel();

    bool hasCallInFlight() const { return m_inFlight.has_value(); }

    SerialTaskQueue* gate() const { return m_gate; }

private:
    struct InFlightCall {
        quint64 id = 0;
        CancellationToken token;
        std::function<void(InferenceSession* session)> cancel;
    };

    template <typename Result, typename Adapter, typename Request, typename Callback>
    void dispatch(std::unique_ptr<Adapter> InferenceSession::*slot,
                  void (Adapter::*call)(const Request&, const Callback&),
                  const QString& missingAdapterError, const Request& request,
                  const CancellationToken& token, const Callback& callback);

    SerialTaskQueue* m_gate;
    std::unique_ptr<IDetectAdapter> m_detect;
    std::unique_ptr<IOcrAdapter> m_ocr;
    std::unique_ptr<IInpaintAdapter> m_inpaint;
    std::unique_ptr<ITranslateAdapter> m_translate;

    std::optional<InFlightCall> m_inFlight;
    quint64 m_callCounter = 0;
};

#endif // INFERENCESESSION_H
