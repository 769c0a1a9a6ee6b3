#ifndef MASKSTROKESESSION_H
#define MASKSTROKESESSION_H

#include "canvas/RegionAccumulator.h"

#include <QImage>
#include <QObject>
#include <QPointF>
#include <QRect>
#include <QRectF>
#include <QString>

class DocumentStore;
class PipelineCommands;
class SerialTaskQueue;
class ViewportTransform;

/**
 * @brief Brush strokes on the current page's segmentation mask.
 *
 * A stroke paints on a working copy of the mask and grows a region around
 * every dab. end() commits the mask and queues an inpaint of just that
 * region on the session's own queue, so consecutive strokes are inpainted
 * in the order they were drawn.
 */
class MaskStrokeSession : public QObject
{
    Q_OBJECT

public:
    enum class Mode {
        Repair,     // Paint mask (white)
        Erase       // Clear mask (black)
    };

    MaskStrokeSession(DocumentStore* store, ViewportTransform* viewport,
                      PipelineCommands* commands, QObject* parent = nullptr);
    ~MaskStrokeSession() override;

    bool begin(const QPointF& pointerPos, const QRectF& containerRect);
    bool extend(const QPointF& pointerPos, const QRectF& containerRect);
    bool end();

    // Drops the active stroke and detaches queued inpaints.
    void reset();

    void setMode(Mode mode) { m_mode = mode; }
    Mode mode() const { return m_mode; }

    void setEnabled(bool enabled);
    bool isEnabled() const { return m_enabled; }

    // Overrides the configured brush; 0 restores the setting.
    void setBrushSize(int size) { m_brushOverride = size; }
    int brushSize() const;

    bool isStroking() const { return m_stroking; }
    std::optional<RegionAccumulator::Bounds> strokeBounds() const { return m_accumulator.bounds(); }
    SerialTaskQueue* queue() const { return m_queue; }

signals:
    void strokeCommitted(const QRect& region);
    void inpaintFinished(const QRect& region, bool success, const QString& error);

private:
    void paintDab(const QPointF& from, const QPointF& to);

    DocumentStore* m_store;
    ViewportTransform* m_viewport;
    PipelineCommands* m_commands;
    SerialTaskQueue* m_queue;

    Mode m_mode = Mode::Repair;
    bool m_enabled = true;
    int m_brushOverride = 0;

    bool m_stroking = false;
    int m_activeBrush = 0;
    QString m_documentId;
    QImage m_workingMask;
    QPointF m_lastPoint;
    RegionAccumulator m_accumulator;
};

#endif // MASKSTROKESESSION_H
