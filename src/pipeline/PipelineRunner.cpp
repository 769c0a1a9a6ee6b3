#include "pipeline/PipelineRunner.h"

#include "document/DocumentStore.h"
#include "pipeline/OperationController.h"

#include <QDebug>
#include <QPointer>

struct PipelineRunner::Run {
    quint64 id = 0;
    QStringList documentIds;
    Options options;
    bool allPages = false;
    int page = 0;
    int stage = 0;
    CancellationToken token;
};

PipelineRunner::PipelineRunner(DocumentStore* store, PipelineCommands* commands,
                               OperationController* operations, QObject* parent)
    : QObject(parent)
    , m_store(store)
    , m_commands(commands)
    , m_operations(operations)
{
}

PipelineRunner::~PipelineRunner() = default;

QString PipelineRunner::stageLabel(PipelineStage stage)
{
    switch (stage) {
    case PipelineStage::Detect:
        return QStringLiteral("Detecting text");
    case PipelineStage::Ocr:
        return QStringLiteral("Recognizing text");
    case PipelineStage::Inpaint:
        return QStringLiteral("Inpainting");
    case PipelineStage::Translate:
        return QStringLiteral("Translating");
    }
    return QString();
}

bool PipelineRunner::processCurrentPage(const Options& options)
{
    const Document* doc = m_store->current();
    if (!doc) {
        qDebug() << "PipelineRunner: No document to process";
        return false;
    }
    return startRun(QStringList{doc->id()}, options, false);
}

bool PipelineRunner::processAllPages(const Options& options)
{
    QStringList ids;
    for (int i = 0; i < m_store->count(); ++i) {
        ids.append(m_store->document(i)->id());
    }
    if (ids.isEmpty()) {
        qDebug() << "PipelineRunner: No documents to process";
        return false;
    }
    return startRun(ids, options, true);
}

bool PipelineRunner::startRun(const QStringList& documentIds, const Options& options, bool allPages)
{
    if (m_run) {
        qWarning() << "PipelineRunner: A run is already in progress";
        return false;
    }
    if (options.stages.isEmpty()) {
        qWarning() << "PipelineRunner: No stages selected";
        return false;
    }

    const OperationType type = allPages ? OperationType::ProcessAllPages
                                        : OperationType::ProcessCurrentPage;
    const int total = allPages ? documentIds.size() : options.stages.size();
    if (!m_operations->start(type, true, total)) {
        return false;
    }

    m_run = std::make_unique<Run>();
    m_run->id = ++m_runCounter;
    m_run->documentIds = documentIds;
    m_run->options = options;
    m_run->allPages = allPages;
    m_run->token = m_operations->cancellationToken();

    OperationUpdate update;
    update.current = 0;
    if (allPages) {
        update.stageIndex = 0;
        update.stageCount = options.stages.size();
    }
    m_operations->update(update);

    qDebug() << "PipelineRunner: Processing" << documentIds.size() << "pages with"
             << options.stages.size() << "stages";
    emit runStarted(documentIds.size(), options.stages.size());
    step();
    return true;
}

void PipelineRunner::step()
{
    if (!m_run) {
        return;
    }
    if (m_run->token.isCancelled()) {
        complete(RunStatus::Cancelled);
        return;
    }

    const int stageCount = m_run->options.stages.size();
    if (m_run->stage >= stageCount) {
        m_run->stage = 0;
        ++m_run->page;
    }
    if (m_run->page >= m_run->documentIds.size()) {
        complete(RunStatus::Completed);
        return;
    }

    const QString documentId = m_run->documentIds.at(m_run->page);
    const int pageIndex = m_store->indexOf(documentId);
    if (pageIndex < 0) {
        complete(RunStatus::Failed, QStringLiteral("Document no longer exists"));
        return;
    }

    const PipelineStage stage = m_run->options.stages.at(m_run->stage);
    OperationUpdate update;
    update.step = stageLabel(stage);
    if (m_run->allPages) {
        update.current = m_run->page;
        update.stageIndex = m_run->stage;
    } else {
        update.current = m_run->stage;
    }
    m_operations->update(update);
    emit stageStarted(pageIndex, stage);

    QPointer<PipelineRunner> guard(this);
    const quint64 runId = m_run->id;
    m_commands->enqueueStage(documentId, stage, m_run->options.parameters, m_run->token,
                             [guard, runId](const StageResult& result) {
        // Ignore completions that belong to a run that has since ended.
        if (!guard || !guard->m_run || guard->m_run->id != runId) {
            return;
        }
        if (result.cancelled) {
            guard->complete(RunStatus::Cancelled);
            return;
        }
        if (!result.success) {
            guard->complete(RunStatus::Failed, result.error);
            return;
        }
        ++guard->m_run->stage;
        guard->step();
    });
}

void PipelineRunner::complete(RunStatus status, const QString& error)
{
    if (!m_run) {
        return;
    }

    if (status == RunStatus::Completed) {
        OperationUpdate update;
        update.current = m_run->allPages ? m_run->documentIds.size() : m_run->options.stages.size();
        update.stageIndex = 0;
        m_operations->update(update);
    }

    m_run.reset();
    m_operations->finish();

    if (status == RunStatus::Failed) {
        qWarning() << "PipelineRunner: Run failed:" << error;
        emit runFailed(error);
    } else {
        qDebug() << "PipelineRunner: Run" << (status == RunStatus::Completed ? "completed" : "cancelled");
    }
    emit runFinished(status);
}
