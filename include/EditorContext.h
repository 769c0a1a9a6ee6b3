#ifndef EDITORCONTEXT_H
#define EDITORCONTEXT_H

#include <QObject>

class BlockHitTester;
class DocumentStore;
class InferenceSession;
class MaskStrokeSession;
class OperationController;
class PipelineCommands;
class PipelineRunner;
class ViewportTransform;

/**
 * @brief Composition root for one editor.
 *
 * Owns the document store, viewport, operation state, inference session and
 * the components built on them. Components receive what they need through
 * their constructors; nothing reaches for global state.
 */
class EditorContext : public QObject
{
    Q_OBJECT

public:
    explicit EditorContext(QObject* parent = nullptr);
    ~EditorContext() override;

    // MSER detection, Tesseract OCR, OpenCV inpainting and the
    // OpenAI-compatible translator, configured from saved settings.
    void installDefaultAdapters();

    DocumentStore* documents() const { return m_documents; }
    ViewportTransform* viewport() const { return m_viewport; }
    OperationController* operations() const { return m_operations; }
    InferenceSession* inference() const { return m_inference; }
    PipelineCommands* commands() const { return m_commands; }
    PipelineRunner* runner() const { return m_runner; }
    BlockHitTester* hitTester() const { return m_hitTester; }
    MaskStrokeSession* maskStrokes() const { return m_maskStrokes; }

private:
    DocumentStore* m_documents;
    ViewportTransform* m_viewport;
    OperationController* m_operations;
    InferenceSession* m_inference;
    PipelineCommands* m_commands;
    PipelineRunner* m_runner;
    BlockHitTester* m_hitTester;
    MaskStrokeSession* m_maskStrokes;
};

#endif // EDITORCONTEXT_H
