#include "pipeline/PipelineCommands.h"

#include "document/DocumentStore.h"
#include "pipeline/InferenceSession.h"
#include "pipeline/SerialTaskQueue.h"

#include <QDebug>
#include <QPointer>

namespace {

const QString kDocumentGone = QStringLiteral("Document no longer exists");

bool sameGeometry(const TextBlock& a, const TextBlock& b)
{
    return qFuzzyCompare(a.x + 1.0, b.x + 1.0) && qFuzzyCompare(a.y + 1.0, b.y + 1.0)
        && qFuzzyCompare(a.width + 1.0, b.width + 1.0)
        && qFuzzyCompare(a.height + 1.0, b.height + 1.0);
}

bool regionTouchesBlocks(const QRect& region, const QVector<TextBlock>& blocks)
{
    const QRectF area(region);
    for (const TextBlock& block : blocks) {
        if (area.intersects(block.rect())) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

QString pipelineStageName(PipelineStage stage)
{
    switch (stage) {
    case PipelineStage::Detect:
        return QStringLiteral("detect");
    case PipelineStage::Ocr:
        return QStringLiteral("ocr");
    case PipelineStage::Inpaint:
        return QStringLiteral("inpaint");
    case PipelineStage::Translate:
        return QStringLiteral("translate");
    }
    return QString();
}

std::optional<PipelineStage> pipelineStageFromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    for (PipelineStage stage : {PipelineStage::Detect, PipelineStage::Ocr,
                                PipelineStage::Inpaint, PipelineStage::Translate}) {
        if (pipelineStageName(stage) == key) {
            return stage;
        }
    }
    return std::nullopt;
}

// Sequential per-block work for OCR and translation.
struct PipelineCommands::BlockJob {
    QString documentId;
    QVector<int> indices;
    QVector<TextBlock> snapshot;
    int position = 0;
    CancellationToken token;
    StageCallback callback;

    void finish(const StageResult& result) const
    {
        if (callback) {
            callback(result);
        }
    }
};

PipelineCommands::PipelineCommands(DocumentStore* store, InferenceSession* session, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_session(session)
{
    connect(m_store, &DocumentStore::documentsReset, this, &PipelineCommands::onDocumentsReset);
}

PipelineCommands::~PipelineCommands() = default;

SerialTaskQueue* PipelineCommands::queueFor(const QString& documentId)
{
    auto it = m_queues.find(documentId);
    if (it != m_queues.end()) {
        return it.value();
    }
    auto* queue = new SerialTaskQueue(this);
    m_queues.insert(documentId, queue);
    return queue;
}

void PipelineCommands::onDocumentsReset()
{
    for (SerialTaskQueue* queue : std::as_const(m_queues)) {
        // Work already queued keeps draining on the detached chain.
        queue->reset();
        queue->deleteLater();
    }
    m_queues.clear();
}

bool PipelineCommands::pushOnCurrent(PipelineStage stage, const PipelineOptions& options,
                                     const StageCallback& callback)
{
    const Document* doc = m_store->current();
    if (!doc) {
        qDebug() << "PipelineCommands: No document, ignoring" << pipelineStageName(stage);
        return false;
    }
    enqueueStage(doc->id(), stage, options, CancellationToken(), callback);
    return true;
}

bool PipelineCommands::detect(float confThreshold, float nmsThreshold, const StageCallback& callback)
{
    PipelineOptions options;
    options.detect.confThreshold = confThreshold;
    options.detect.nmsThreshold = nmsThreshold;
    return pushOnCurrent(PipelineStage::Detect, options, callback);
}

bool PipelineCommands::ocr(const StageCallback& callback)
{
    return pushOnCurrent(PipelineStage::Ocr, PipelineOptions(), callback);
}

bool PipelineCommands::inpaint(const std::optional<QRect>& region, int dilateKernelSize,
                               int erodeDistance, const StageCallback& callback)
{
    PipelineOptions options;
    options.inpaint.dilateKernelSize = dilateKernelSize;
    options.inpaint.erodeDistance = erodeDistance;
    options.inpaintRegion = region;
    return pushOnCurrent(PipelineStage::Inpaint, options, callback);
}

bool PipelineCommands::translate(const StageCallback& callback)
{
    return pushOnCurrent(PipelineStage::Translate, PipelineOptions(), callback);
}

void PipelineCommands::enqueueStage(const QString& documentId, PipelineStage stage,
                                    const PipelineOptions& options, const CancellationToken& token,
                                    const StageCallback& callback)
{
    QPointer<PipelineCommands> guard(this);
    queueFor(documentId)->push([guard, documentId, stage, options, token, callback](
                                   const SerialTaskQueue::Done& done) {
        auto settle = [guard, documentId, stage, callback, done](const StageResult& result) {
            if (guard) {
                emit guard->stageFinished(documentId, stage, result.success, result.error);
            }
            if (callback) {
                callback(result);
            }
            done(result.success || result.cancelled, result.error);
        };

        if (!guard) {
            settle(StageResult::failed(QStringLiteral("Pipeline closed")));
            return;
        }
        if (token.isCancelled()) {
            settle(StageResult::wasCancelled());
            return;
        }

        switch (stage) {
        case PipelineStage::Detect:
            guard->runDetect(documentId, options.detect, token, settle);
            break;
        case PipelineStage::Ocr:
            guard->runOcr(documentId, token, settle);
            break;
        case PipelineStage::Inpaint:
            guard->runInpaint(documentId, options.inpaintRegion, options.inpaint, token, settle);
            break;
        case PipelineStage::Translate:
            guard->runTranslate(documentId, token, settle);
            break;
        }
    });
}

void PipelineCommands::runDetect(const QString& documentId, const DetectConfig& config,
                                 const CancellationToken& token, const StageCallback& callback)
{
    const Document* doc = m_store->documentById(documentId);
    if (!doc) {
        callback(StageResult::failed(kDocumentGone));
        return;
    }

    DetectRequest request;
    request.image = doc->image();
    request.confThreshold = config.confThreshold;
    request.nmsThreshold = config.nmsThreshold;

    QPointer<PipelineCommands> guard(this);
    m_session->detect(request, token, [guard, documentId, token, callback](
                                          const DetectResult& result) {
        if (token.isCancelled()) {
            qDebug() << "PipelineCommands: Discarding detection result after cancel";
            callback(StageResult::wasCancelled());
            return;
        }
        if (!result.success) {
            callback(StageResult::failed(result.error));
            return;
        }
        if (!guard || !guard->m_store->replaceDetection(documentId, result.blocks,
                                                        result.segmentationMask)) {
            callback(StageResult::failed(kDocumentGone));
            return;
        }
        qDebug() << "PipelineCommands: Detected" << result.blocks.size() << "blocks";
        callback(StageResult::ok());
    });
}

void PipelineCommands::runOcr(const QString& documentId, const CancellationToken& token,
                              const StageCallback& callback)
{
    const Document* doc = m_store->documentById(documentId);
    if (!doc) {
        callback(StageResult::failed(kDocumentGone));
        return;
    }

    auto job = std::make_shared<BlockJob>();
    job->documentId = documentId;
    job->snapshot = doc->textBlocks();
    job->token = token;
    job->callback = callback;
    for (int i = 0; i < job->snapshot.size(); ++i) {
        if (!job->snapshot.at(i).hasText()) {
            job->indices.append(i);
        }
    }
    processNextOcrBlock(job);
}

void PipelineCommands::processNextOcrBlock(const std::shared_ptr<BlockJob>& job)
{
    if (job->token.isCancelled()) {
        job->finish(StageResult::wasCancelled());
        return;
    }
    if (job->position >= job->indices.size()) {
        job->finish(StageResult::ok());
        return;
    }

    const Document* doc = m_store->documentById(job->documentId);
    if (!doc) {
        job->finish(StageResult::failed(kDocumentGone));
        return;
    }

    const int index = job->indices.at(job->position);
    const QRect crop = job->snapshot.at(index).rect().toAlignedRect().intersected(doc->image().rect());
    if (crop.isEmpty()) {
        ++job->position;
        processNextOcrBlock(job);
        return;
    }

    OcrRequest request;
    request.image = doc->image().copy(crop);

    QPointer<PipelineCommands> guard(this);
    m_session->recognize(request, job->token, [guard, job, index](const OcrResult& result) {
        if (job->token.isCancelled()) {
            job->finish(StageResult::wasCancelled());
            return;
        }
        if (!result.success) {
            job->finish(StageResult::failed(result.error));
            return;
        }
        if (!guard) {
            job->finish(StageResult::failed(QStringLiteral("Pipeline closed")));
            return;
        }

        // Only write back when the block was not removed or replaced meanwhile.
        const Document* current = guard->m_store->documentById(job->documentId);
        if (current && index < current->textBlocks().size()
            && sameGeometry(current->textBlocks().at(index), job->snapshot.at(index))) {
            guard->m_store->setBlockText(job->documentId, index, result.text);
        }
        ++job->position;
        guard->processNextOcrBlock(job);
    });
}

void PipelineCommands::runInpaint(const QString& documentId, const std::optional<QRect>& region,
                                  const InpaintConfig& config, const CancellationToken& token,
                                  const StageCallback& callback)
{
    const Document* doc = m_store->documentById(documentId);
    if (!doc) {
        callback(StageResult::failed(kDocumentGone));
        return;
    }
    if (doc->segmentationMask().isNull()) {
        callback(StageResult::failed(QStringLiteral("Segmentation mask not found")));
        return;
    }

    std::optional<QRect> area;
    if (region) {
        const QRect clamped = region->intersected(QRect(QPoint(0, 0), doc->size()));
        if (clamped.isEmpty() || !regionTouchesBlocks(clamped, doc->textBlocks())) {
            qDebug() << "PipelineCommands: Region" << *region << "has no text, skipping inpaint";
            callback(StageResult::ok());
            return;
        }
        area = clamped;
    }

    InpaintRequest request;
    request.image = doc->image();
    request.mask = doc->segmentationMask();
    request.region = area;
    request.dilateKernelSize = config.dilateKernelSize;
    request.erodeDistance = config.erodeDistance;

    const QImage mask = request.mask;
    QPointer<PipelineCommands> guard(this);
    m_session->inpaint(request, token, [guard, documentId, area, mask, token, callback](
                                           const InpaintResult& result) {
        if (token.isCancelled()) {
            qDebug() << "PipelineCommands: Discarding inpaint result after cancel";
            callback(StageResult::wasCancelled());
            return;
        }
        if (!result.success) {
            callback(StageResult::failed(result.error));
            return;
        }
        const Document* current = guard ? guard->m_store->documentById(documentId) : nullptr;
        if (!current) {
            callback(StageResult::failed(kDocumentGone));
            return;
        }

        QImage output;
        if (area) {
            const QImage base = current->inpainted().isNull() ? current->image() : current->inpainted();
            output = stitchPatch(base, current->image(), result.image, mask, *area);
        } else {
            output = result.image.convertToFormat(QImage::Format_RGB32);
        }
        if (output.size() != current->size()) {
            callback(StageResult::failed(QStringLiteral("Inpainted image has wrong size")));
            return;
        }
        guard->m_store->setInpainted(documentId, output);
        callback(StageResult::ok());
    });
}

QImage PipelineCommands::stitchPatch(const QImage& base, const QImage& original,
                                     const QImage& patch, const QImage& mask, const QRect& region)
{
    QImage output = base.convertToFormat(QImage::Format_RGB32);
    if (patch.isNull() || mask.isNull() || original.size() != output.size()) {
        return output;
    }
    const QImage source = patch.convertToFormat(QImage::Format_RGB32);
    const QImage page = original.convertToFormat(QImage::Format_RGB32);
    const QImage gray = mask.convertToFormat(QImage::Format_Grayscale8);
    const QRect area = region.intersected(output.rect()).intersected(gray.rect());

    for (int y = area.top(); y <= area.bottom(); ++y) {
        const int py = y - region.top();
        if (py < 0 || py >= source.height()) {
            continue;
        }
        const uchar* maskLine = gray.constScanLine(y);
        const QRgb* patchLine = reinterpret_cast<const QRgb*>(source.constScanLine(py));
        const QRgb* pageLine = reinterpret_cast<const QRgb*>(page.constScanLine(y));
        QRgb* outLine = reinterpret_cast<QRgb*>(output.scanLine(y));
        for (int x = area.left(); x <= area.right(); ++x) {
            const int px = x - region.left();
            if (px < 0 || px >= source.width()) {
                continue;
            }
            outLine[x] = maskLine[x] > 0 ? patchLine[px] : pageLine[x];
        }
    }
    return output;
}

void PipelineCommands::runTranslate(const QString& documentId, const CancellationToken& token,
                                    const StageCallback& callback)
{
    const Document* doc = m_store->documentById(documentId);
    if (!doc) {
        callback(StageResult::failed(kDocumentGone));
        return;
    }

    auto job = std::make_shared<BlockJob>();
    job->documentId = documentId;
    job->snapshot = doc->textBlocks();
    job->token = token;
    job->callback = callback;
    for (int i = 0; i < job->snapshot.size(); ++i) {
        const TextBlock& block = job->snapshot.at(i);
        if (block.hasText() && !block.hasTranslation()) {
            job->indices.append(i);
        }
    }
    processNextTranslateBlock(job);
}

void PipelineCommands::processNextTranslateBlock(const std::shared_ptr<BlockJob>& job)
{
    if (job->token.isCancelled()) {
        job->finish(StageResult::wasCancelled());
        return;
    }
    if (job->position >= job->indices.size()) {
        job->finish(StageResult::ok());
        return;
    }

    const int index = job->indices.at(job->position);
    TranslateRequest request;
    request.sourceText = job->snapshot.at(index).text.value_or(QString());

    QPointer<PipelineCommands> guard(this);
    m_session->translate(request, job->token, [guard, job, index](const TranslateResult& result) {
        if (job->token.isCancelled()) {
            job->finish(StageResult::wasCancelled());
            return;
        }
        if (!result.success) {
            job->finish(StageResult::failed(result.error));
            return;
        }
        if (!guard) {
            job->finish(StageResult::failed(QStringLiteral("Pipeline closed")));
            return;
        }

        const Document* current = guard->m_store->documentById(job->documentId);
        if (current && index < current->textBlocks().size()
            && sameGeometry(current->textBlocks().at(index), job->snapshot.at(index))) {
            guard->m_store->setBlockTranslation(job->documentId, index, result.text);
        }
        ++job->position;
        guard->processNextTranslateBlock(job);
    });
}
