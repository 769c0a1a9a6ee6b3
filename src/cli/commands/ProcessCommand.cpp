#include "cli/commands/ProcessCommand.h"

#include "EditorContext.h"
#include "document/DocumentStore.h"
#include "pipeline/PipelineRunner.h"
#include "settings/PipelineSettingsManager.h"

#include <QDebug>
#include <QDir>
#include <QEventLoop>
#include <QFile>
#include <QHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>

namespace Inkwell {
namespace CLI {

namespace {

bool writeJson(const QString& path, const QJsonObject& object, QString* errorMessage)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        *errorMessage = QString("Failed to write %1: %2").arg(path, file.errorString());
        return false;
    }
    file.write(QJsonDocument(object).toJson(QJsonDocument::Indented));
    return true;
}

bool writeImage(const QString& path, const QImage& image, QString* errorMessage)
{
    if (!image.save(path, "PNG")) {
        *errorMessage = QString("Failed to write %1").arg(path);
        return false;
    }
    return true;
}

// Page names, with the 1-based page number appended where names repeat.
QStringList outputBaseNames(const DocumentStore* store)
{
    QHash<QString, int> counts;
    for (int i = 0; i < store->count(); ++i) {
        ++counts[store->document(i)->name()];
    }

    QStringList names;
    QSet<QString> taken;
    for (int i = 0; i < store->count(); ++i) {
        const QString name = store->document(i)->name();
        QString base = name;
        if (counts.value(name) > 1) {
            base = QString("%1-%2").arg(name).arg(i + 1);
            for (int n = 2; counts.contains(base) || taken.contains(base); ++n) {
                base = QString("%1-%2-%3").arg(name).arg(i + 1).arg(n);
            }
        }
        taken.insert(base);
        names.append(base);
    }
    return names;
}

} // anonymous namespace

ProcessCommand::ProcessCommand()
    : ProcessCommand([]() {
        auto context = std::make_unique<EditorContext>();
        context->installDefaultAdapters();
        return context;
    })
{
}

ProcessCommand::ProcessCommand(ContextFactory factory)
    : m_factory(std::move(factory))
{
}

ProcessCommand::~ProcessCommand() = default;

QString ProcessCommand::name() const { return "process"; }

QString ProcessCommand::description() const { return "Detect, recognize, inpaint and translate images"; }

void ProcessCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"stages", "Comma-separated stages (detect,ocr,inpaint,translate)", "list",
                      "detect,ocr,inpaint,translate"});
    parser.addOption({{"o", "output"}, "Output directory", "dir", "."});
    parser.addPositionalArgument("images", "Page images, in page order", "images...");
}

QJsonObject ProcessCommand::documentToJson(const Document& document)
{
    QJsonArray blocks;
    for (const TextBlock& block : document.textBlocks()) {
        QJsonObject obj;
        obj["x"] = block.x;
        obj["y"] = block.y;
        obj["width"] = block.width;
        obj["height"] = block.height;
        obj["confidence"] = static_cast<double>(block.confidence);
        if (block.text) {
            obj["text"] = *block.text;
        }
        if (block.translation) {
            obj["translation"] = *block.translation;
        }
        blocks.append(obj);
    }

    QJsonObject root;
    root["name"] = document.name();
    root["source"] = document.sourcePath();
    root["width"] = document.width();
    root["height"] = document.height();
    root["blocks"] = blocks;
    return root;
}

CLIResult ProcessCommand::execute(const QCommandLineParser& parser)
{
    PipelineRunner::Options options;
    options.stages.clear();
    const QStringList stageNames = parser.value("stages").split(',', Qt::SkipEmptyParts);
    for (const QString& stageName : stageNames) {
        const std::optional<PipelineStage> stage = pipelineStageFromName(stageName);
        if (!stage) {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    QString("Unknown stage: %1").arg(stageName.trimmed()));
        }
        if (!options.stages.contains(*stage)) {
            options.stages.append(*stage);
        }
    }
    if (options.stages.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "No stages selected");
    }

    const QStringList inputs = parser.positionalArguments();
    if (inputs.isEmpty()) {
        return CLIResult::error(CLIResult::Code::InvalidArguments, "No input images");
    }

    const QString outputDir = parser.value("output");
    if (!QDir().mkpath(outputDir)) {
        return CLIResult::error(CLIResult::Code::FileError,
                                QString("Cannot create output directory: %1").arg(outputDir));
    }

    QVector<Document> documents;
    for (const QString& input : inputs) {
        QString error;
        const Document document = Document::fromFile(input, &error);
        if (document.isNull()) {
            return CLIResult::error(CLIResult::Code::FileError, error);
        }
        documents.append(document);
    }

    std::unique_ptr<EditorContext> context = m_factory ? m_factory() : nullptr;
    if (!context) {
        return CLIResult::error(CLIResult::Code::GeneralError, "Failed to set up the pipeline");
    }
    context->documents()->setDocuments(documents);

    PipelineSettingsManager& settings = PipelineSettingsManager::instance();
    options.parameters.detect = settings.loadDetectConfig();
    options.parameters.inpaint = settings.loadInpaintConfig();

    PipelineRunner* runner = context->runner();
    bool finished = false;
    PipelineRunner::RunStatus status = PipelineRunner::RunStatus::Failed;
    QString failure;
    QEventLoop loop;
    QObject::connect(runner, &PipelineRunner::runFailed, &loop, [&failure](const QString& error) {
        failure = error;
    });
    QObject::connect(runner, &PipelineRunner::runFinished, &loop,
                     [&](PipelineRunner::RunStatus result) {
        finished = true;
        status = result;
        loop.quit();
    });

    if (!runner->processAllPages(options)) {
        return CLIResult::error(CLIResult::Code::GeneralError, "Failed to start processing");
    }
    if (!finished) {
        loop.exec();
    }

    if (status == PipelineRunner::RunStatus::Cancelled) {
        return CLIResult::error(CLIResult::Code::Cancelled, "Processing cancelled");
    }
    if (status == PipelineRunner::RunStatus::Failed) {
        return CLIResult::error(CLIResult::Code::PipelineError, failure);
    }

    const QDir dir(outputDir);
    const QStringList baseNames = outputBaseNames(context->documents());
    for (int i = 0; i < context->documents()->count(); ++i) {
        const Document* document = context->documents()->document(i);
        const QString base = dir.filePath(baseNames.at(i));
        QString error;
        if (!document->inpainted().isNull()
            && !writeImage(base + ".inpainted.png", document->inpainted(), &error)) {
            return CLIResult::error(CLIResult::Code::FileError, error);
        }
        if (!document->segmentationMask().isNull()
            && !writeImage(base + ".mask.png", document->segmentationMask(), &error)) {
            return CLIResult::error(CLIResult::Code::FileError, error);
        }
        if (!writeJson(base + ".blocks.json", documentToJson(*document), &error)) {
            return CLIResult::error(CLIResult::Code::FileError, error);
        }
    }

    return CLIResult::success(QString("Processed %1 page(s) into %2")
                                  .arg(context->documents()->count())
                                  .arg(QDir(outputDir).absolutePath()));
}

} // namespace CLI
} // namespace Inkwell
