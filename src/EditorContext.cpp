#include "EditorContext.h"

#include "canvas/BlockHitTester.h"
#include "canvas/MaskStrokeSession.h"
#include "canvas/ViewportTransform.h"
#include "document/DocumentStore.h"
#include "inference/MserDetectAdapter.h"
#include "inference/OpenAITranslateAdapter.h"
#include "inference/OpenCvInpaintAdapter.h"
#include "inference/TesseractOcrAdapter.h"
#include "pipeline/InferenceSession.h"
#include "pipeline/OperationController.h"
#include "pipeline/PipelineCommands.h"
#include "pipeline/PipelineRunner.h"
#include "settings/PipelineSettingsManager.h"
#include "settings/TranslationSettingsManager.h"

#include <QDebug>
#include <QPointer>

EditorContext::EditorContext(QObject* parent)
    : QObject(parent)
    , m_documents(new DocumentStore(this))
    , m_viewport(new ViewportTransform(this))
    , m_operations(new OperationController(this))
    , m_inference(new InferenceSession(this))
    , m_commands(new PipelineCommands(m_documents, m_inference, this))
    , m_runner(new PipelineRunner(m_documents, m_commands, m_operations, this))
    , m_hitTester(new BlockHitTester(m_documents, this))
    , m_maskStrokes(new MaskStrokeSession(m_documents, m_viewport, m_commands, this))
{
    connect(m_documents, &DocumentStore::currentIndexChanged,
            m_viewport, &ViewportTransform::setCurrentPageIndex);

    QPointer<InferenceSession> session(m_inference);
    m_operations->setCancelNotifier([session](QString* errorMessage) {
        if (!session) {
            if (errorMessage) {
                *errorMessage = QStringLiteral("Inference session closed");
            }
            return false;
        }
        session->requestCancel();
        return true;
    });
}

EditorContext::~EditorContext() = default;

void EditorContext::installDefaultAdapters()
{
    const OcrConfig ocrConfig = PipelineSettingsManager::instance().loadOcrConfig();
    const TranslationConfig translationConfig = TranslationSettingsManager::instance().load();

    m_inference->setDetectAdapter(std::make_unique<MserDetectAdapter>());
    m_inference->setOcrAdapter(std::make_unique<TesseractOcrAdapter>(ocrConfig.language,
                                                                     ocrConfig.dataPath));
    m_inference->setInpaintAdapter(std::make_unique<OpenCvInpaintAdapter>());
    m_inference->setTranslateAdapter(std::make_unique<OpenAITranslateAdapter>(translationConfig));

    qDebug() << "EditorContext: Installed adapters, OCR language:" << ocrConfig.language
             << "translator configured:" << TranslationSettingsManager::isConfigured(translationConfig);
}
