#ifndef PIPELINECOMMANDS_H
#define PIPELINECOMMANDS_H

#include "pipeline/CancellationToken.h"
#include "settings/PipelineSettingsManager.h"

#include <QHash>
#include <QImage>
#include <QMetaType>
#include <QObject>
#include <QRect>
#include <QString>
#include <QVector>

#include <functional>
#include <memory>
#include <optional>

class DocumentStore;
class InferenceSession;
class SerialTaskQueue;

enum class PipelineStage {
    Detect,
    Ocr,
    Inpaint,
    Translate
};

QString pipelineStageName(PipelineStage stage);
std::optional<PipelineStage> pipelineStageFromName(const QString& name);

/**
 * @brief Outcome of one stage on one page. Cancellation is not a failure.
 */
struct StageResult {
    bool success = false;
    bool cancelled = false;
    QString error;

    static StageResult ok() { return {true, false, QString()}; }
    static StageResult failed(const QString& error) { return {false, false, error}; }
    static StageResult wasCancelled() { return {false, true, QString()}; }
};

using StageCallback = std::function<void(const StageResult& result)>;

struct PipelineOptions {
    DetectConfig detect;
    InpaintConfig inpaint;
    std::optional<QRect> inpaintRegion;     ///< Unset for the whole page
};

/**
 * @brief The detect, OCR, inpaint and translate commands.
 *
 * Commands run on a SerialTaskQueue bound to the target page, so repeated
 * clicks on one page queue up instead of racing. Results are written back
 * by document id and dropped when the token was cancelled meanwhile.
 */
class PipelineCommands : public QObject
{
    Q_OBJECT

public:
    PipelineCommands(DocumentStore* store, InferenceSession* session, QObject* parent = nullptr);
    ~PipelineCommands() override;

    // User commands on the current page. Return false (no-op) when the
    // store has no document.
    bool detect(float confThreshold, float nmsThreshold, const StageCallback& callback = StageCallback());
    bool ocr(const StageCallback& callback = StageCallback());
    bool inpaint(const std::optional<QRect>& region, int dilateKernelSize, int erodeDistance,
                 const StageCallback& callback = StageCallback());
    bool translate(const StageCallback& callback = StageCallback());

    /**
     * @brief Queue one stage for a page.
     *
     * The stage starts after everything already queued for that page.
     */
    void enqueueStage(const QString& documentId, PipelineStage stage, const PipelineOptions& options,
                      const CancellationToken& token, const StageCallback& callback);

    // Stage bodies; they do not queue. Callbacks fire exactly once.
    void runDetect(const QString& documentId, const DetectConfig& config,
                   const CancellationToken& token, const StageCallback& callback);
    void runOcr(const QString& documentId, const CancellationToken& token,
                const StageCallback& callback);
    void runInpaint(const QString& documentId, const std::optional<QRect>& region,
                    const InpaintConfig& config, const CancellationToken& token,
                    const StageCallback& callback);
    void runTranslate(const QString& documentId, const CancellationToken& token,
                      const StageCallback& callback);

    SerialTaskQueue* queueFor(const QString& documentId);
    bool hasQueue(const QString& documentId) const { return m_queues.contains(documentId); }

    /**
     * @brief Rebuild @p region of @p base from the patch and the source page.
     *
     * Inside the region, masked pixels come from @p patch (region-sized) and
     * unmasked pixels from @p original, so erased mask areas show the source
     * again. Pixels outside the region keep their base value. @p mask and
     * @p original are page-sized.
     */
    static QImage stitchPatch(const QImage& base, const QImage& original, const QImage& patch,
                              const QImage& mask, const QRect& region);

signals:
    void stageFinished(const QString& documentId, PipelineStage stage, bool success,
                       const QString& error);

private slots:
    void onDocumentsReset();

private:
    struct BlockJob;
    void processNextOcrBlock(const std::shared_ptr<BlockJob>& job);
    void processNextTranslateBlock(const std::shared_ptr<BlockJob>& job);
    bool pushOnCurrent(PipelineStage stage, const PipelineOptions& options,
                       const StageCallback& callback);

    DocumentStore* m_store;
    InferenceSession* m_session;
    QHash<QString, SerialTaskQueue*> m_queues;
};

Q_DECLARE_METATYPE(PipelineStage)

#endif // PIPELINECOMMANDS_H
