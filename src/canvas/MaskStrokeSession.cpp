#include "canvas/MaskStrokeSession.h"

#include "canvas/ViewportTransform.h"
#include "document/DocumentStore.h"
#include "pipeline/PipelineCommands.h"
#include "pipeline/SerialTaskQueue.h"
#include "settings/PipelineSettingsManager.h"

#include <QDebug>
#include <QPainter>
#include <QPointer>

MaskStrokeSession::MaskStrokeSession(DocumentStore* store, ViewportTransform* viewport,
                                     PipelineCommands* commands, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_viewport(viewport)
    , m_commands(commands)
    , m_queue(new SerialTaskQueue(this))
{
    connect(m_store, &DocumentStore::documentsReset, this, &MaskStrokeSession::reset);
    connect(m_store, &DocumentStore::currentIndexChanged, this, &MaskStrokeSession::reset);
}

MaskStrokeSession::~MaskStrokeSession() = default;

int MaskStrokeSession::brushSize() const
{
    if (m_brushOverride > 0) {
        return PipelineSettingsManager::sanitized(BrushConfig{m_brushOverride}).size;
    }
    return PipelineSettingsManager::instance().loadBrushConfig().size;
}

void MaskStrokeSession::setEnabled(bool enabled)
{
    if (m_enabled == enabled) {
        return;
    }
    m_enabled = enabled;
    if (!enabled) {
        reset();
    }
}

void MaskStrokeSession::reset()
{
    m_stroking = false;
    m_documentId.clear();
    m_workingMask = QImage();
    m_accumulator.reset();
    m_queue->reset();
}

bool MaskStrokeSession::begin(const QPointF& pointerPos, const QRectF& containerRect)
{
    if (!m_enabled) {
        return false;
    }
    const Document* doc = m_store->current();
    if (!doc) {
        return false;
    }
    const std::optional<QPointF> mapped = m_viewport->pointerToDocument(pointerPos, containerRect);
    if (!mapped) {
        return false;
    }

    m_documentId = doc->id();
    m_activeBrush = brushSize();
    if (doc->segmentationMask().isNull()) {
        m_workingMask = QImage(doc->size(), QImage::Format_RGB32);
        m_workingMask.fill(Qt::black);
    } else {
        m_workingMask = doc->segmentationMask().convertToFormat(QImage::Format_RGB32);
    }

    m_accumulator.reset();
    m_stroking = true;

    const QPointF point = RegionAccumulator::clampToDocument(*mapped, doc->size());
    m_accumulator.addPoint(point, m_activeBrush / 2.0);
    paintDab(point, point);
    m_lastPoint = point;
    return true;
}

bool MaskStrokeSession::extend(const QPointF& pointerPos, const QRectF& containerRect)
{
    if (!m_stroking) {
        return false;
    }
    const Document* doc = m_store->documentById(m_documentId);
    const std::optional<QPointF> mapped = m_viewport->pointerToDocument(pointerPos, containerRect);
    if (!doc || !mapped) {
        return false;
    }

    const QPointF point = RegionAccumulator::clampToDocument(*mapped, doc->size());
    m_accumulator.addPoint(point, m_activeBrush / 2.0);
    paintDab(m_lastPoint, point);
    m_lastPoint = point;
    return true;
}

bool MaskStrokeSession::end()
{
    if (!m_stroking) {
        return false;
    }
    m_stroking = false;

    const Document* doc = m_store->documentById(m_documentId);
    const std::optional<RegionAccumulator::Bounds> bounds = m_accumulator.bounds();
    if (!doc || !bounds) {
        m_accumulator.reset();
        return false;
    }

    const QString documentId = m_documentId;
    const QRect region = RegionAccumulator::toRegionWithMargin(*bounds, m_activeBrush, doc->size());
    m_store->setSegmentationMask(documentId, m_workingMask);
    m_workingMask = QImage();
    m_accumulator.reset();
    emit strokeCommitted(region);

    const InpaintConfig config = PipelineSettingsManager::instance().loadInpaintConfig();
    QPointer<MaskStrokeSession> guard(this);
    QPointer<PipelineCommands> commands(m_commands);
    m_queue->push([guard, commands, documentId, region, config](const SerialTaskQueue::Done& done) {
        if (!commands) {
            done(false, QStringLiteral("Pipeline closed"));
            return;
        }
        commands->runInpaint(documentId, region, config, CancellationToken(),
                             [guard, region, done](const StageResult& result) {
            if (guard) {
                emit guard->inpaintFinished(region, result.success, result.error);
            }
            done(result.success, result.error);
        });
    });
    return true;
}

void MaskStrokeSession::paintDab(const QPointF& from, const QPointF& to)
{
    if (m_workingMask.isNull()) {
        return;
    }
    QPainter painter(&m_workingMask);
    painter.setRenderHint(QPainter::Antialiasing, false);
    QPen pen(m_mode == Mode::Repair ? Qt::white : Qt::black);
    pen.setWidthF(m_activeBrush);
    pen.setCapStyle(Qt::RoundCap);
    pen.setJoinStyle(Qt::RoundJoin);
    painter.setPen(pen);
    if (from == to) {
        painter.drawPoint(to);
    } else {
        painter.drawLine(from, to);
    }
}
