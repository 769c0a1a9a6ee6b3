#ifndef PIPELINERUNNER_H
#define PIPELINERUNNER_H

#include "pipeline/CancellationToken.h"
#include "pipeline/PipelineCommands.h"

#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include <memory>

class DocumentStore;
class OperationController;

/**
 * @brief Runs the stage chain over the current page or the whole set.
 *
 * The run owns the operation for its lifetime. Between stages it polls the
 * operation's cancellation token; it never interrupts a stage that has
 * already been handed to an adapter.
 */
class PipelineRunner : public QObject
{
    Q_OBJECT

public:
    enum class RunStatus {
        Completed,
        Cancelled,
        Failed
    };
    Q_ENUM(RunStatus)

    struct Options {
        QVector<PipelineStage> stages{PipelineStage::Detect, PipelineStage::Ocr,
                                      PipelineStage::Inpaint, PipelineStage::Translate};
        PipelineOptions parameters;
    };

    PipelineRunner(DocumentStore* store, PipelineCommands* commands,
                   OperationController* operations, QObject* parent = nullptr);
    ~PipelineRunner() override;

    bool processCurrentPage(const Options& options);
    bool processAllPages(const Options& options);

    bool isRunning() const { return m_run != nullptr; }

    static QString stageLabel(PipelineStage stage);

signals:
    void runStarted(int pageCount, int stageCount);
    void stageStarted(int pageIndex, PipelineStage stage);
    void runFailed(const QString& error);
    void runFinished(PipelineRunner::RunStatus status);

private:
    struct Run;
    bool startRun(const QStringList& documentIds, const Options& options, bool allPages);
    void step();
    void complete(RunStatus status, const QString& error = QString());

    DocumentStore* m_store;
    PipelineCommands* m_commands;
    OperationController* m_operations;
    std::unique_ptr<Run> m_run;
    quint64 m_runCounter = 0;
};

#endif // PIPELINERUNNER_H
