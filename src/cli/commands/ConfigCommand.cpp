#include "cli/commands/ConfigCommand.h"

#include "settings/PipelineSettingsManager.h"
#include "settings/TranslationSettingsManager.h"

#include <QTextStream>
#include <QtMath>

namespace Inkwell {
namespace CLI {

namespace {

bool parseNumber(const QString& key, const QString& value, double* out, QString* errorMessage)
{
    bool ok = false;
    const double number = value.trimmed().toDouble(&ok);
    if (!ok || !qIsFinite(number)) {
        *errorMessage = QString("Invalid value for %1: %2").arg(key, value);
        return false;
    }
    *out = number;
    return true;
}

// Clamp before rounding; user input may lie far outside the int range.
int boundedInt(double value, int minimum, int maximum)
{
    return qRound(qBound<double>(minimum, value, maximum));
}

QString maskSecret(const QString& secret)
{
    if (secret.isEmpty()) {
        return QString();
    }
    return secret.size() <= 4 ? QString("****") : QString("****%1").arg(secret.right(4));
}

} // anonymous namespace

QString ConfigCommand::name() const { return "config"; }

QString ConfigCommand::description() const { return "Show or change pipeline settings"; }

void ConfigCommand::setupOptions(QCommandLineParser& parser)
{
    parser.addOption({"get", "Get setting value", "key"});
    parser.addOption({"set", "Set setting value", "key=value"});
    parser.addOption({"list", "List all settings"});
    parser.addOption({"reset", "Reset to default values"});
}

QStringList ConfigCommand::knownKeys()
{
    return {
        "detect.confThreshold", "detect.nmsThreshold",
        "inpaint.dilateKernelSize", "inpaint.erodeDistance",
        "brush.size",
        "ocr.language", "ocr.dataPath",
        "translation.endpoint", "translation.apiKey", "translation.model",
        "translation.language", "translation.prompt",
    };
}

QMap<QString, QString> ConfigCommand::currentValues(bool maskSecrets)
{
    const PipelineSettingsManager& pipeline = PipelineSettingsManager::instance();
    const DetectConfig detect = pipeline.loadDetectConfig();
    const InpaintConfig inpaint = pipeline.loadInpaintConfig();
    const BrushConfig brush = pipeline.loadBrushConfig();
    const OcrConfig ocr = pipeline.loadOcrConfig();
    const TranslationConfig translation = TranslationSettingsManager::instance().load();

    QMap<QString, QString> values;
    values["detect.confThreshold"] = QString::number(detect.confThreshold);
    values["detect.nmsThreshold"] = QString::number(detect.nmsThreshold);
    values["inpaint.dilateKernelSize"] = QString::number(inpaint.dilateKernelSize);
    values["inpaint.erodeDistance"] = QString::number(inpaint.erodeDistance);
    values["brush.size"] = QString::number(brush.size);
    values["ocr.language"] = ocr.language;
    values["ocr.dataPath"] = ocr.dataPath;
    values["translation.endpoint"] = translation.endpoint;
    values["translation.apiKey"] = maskSecrets ? maskSecret(translation.apiKey) : translation.apiKey;
    values["translation.model"] = translation.model;
    values["translation.language"] = translation.language;
    values["translation.prompt"] = translation.prompt;
    return values;
}

bool ConfigCommand::applySetting(const QString& key, const QString& value, QString* errorMessage)
{
    PipelineSettingsManager& pipeline = PipelineSettingsManager::instance();
    double number = 0.0;

    if (key.startsWith("detect.")) {
        DetectConfig config = pipeline.loadDetectConfig();
        if (!parseNumber(key, value, &number, errorMessage)) {
            return false;
        }
        if (key == "detect.confThreshold") {
            config.confThreshold = static_cast<float>(number);
        } else if (key == "detect.nmsThreshold") {
            config.nmsThreshold = static_cast<float>(number);
        } else {
            *errorMessage = QString("Unknown setting: %1").arg(key);
            return false;
        }
        pipeline.saveDetectConfig(config);
        return true;
    }

    if (key.startsWith("inpaint.")) {
        InpaintConfig config = pipeline.loadInpaintConfig();
        if (!parseNumber(key, value, &number, errorMessage)) {
            return false;
        }
        if (key == "inpaint.dilateKernelSize") {
            config.dilateKernelSize = boundedInt(number, PipelineSettingsManager::kMinDilateKernelSize,
                                                 PipelineSettingsManager::kMaxDilateKernelSize);
        } else if (key == "inpaint.erodeDistance") {
            config.erodeDistance = boundedInt(number, PipelineSettingsManager::kMinErodeDistance,
                                              PipelineSettingsManager::kMaxErodeDistance);
        } else {
            *errorMessage = QString("Unknown setting: %1").arg(key);
            return false;
        }
        pipeline.saveInpaintConfig(config);
        return true;
    }

    if (key == "brush.size") {
        if (!parseNumber(key, value, &number, errorMessage)) {
            return false;
        }
        pipeline.saveBrushConfig(BrushConfig{boundedInt(number, PipelineSettingsManager::kMinBrushSize,
                                                        PipelineSettingsManager::kMaxBrushSize)});
        return true;
    }

    if (key == "ocr.language" || key == "ocr.dataPath") {
        OcrConfig config = pipeline.loadOcrConfig();
        if (key == "ocr.language") {
            config.language = value;
        } else {
            config.dataPath = value;
        }
        pipeline.saveOcrConfig(config);
        return true;
    }

    if (key.startsWith("translation.")) {
        TranslationSettingsManager& manager = TranslationSettingsManager::instance();
        TranslationConfig config = manager.load();
        if (key == "translation.endpoint") {
            config.endpoint = value.trimmed();
        } else if (key == "translation.apiKey") {
            config.apiKey = value.trimmed();
        } else if (key == "translation.model") {
            config.model = value.trimmed();
        } else if (key == "translation.language") {
            config.language = value.trimmed();
        } else if (key == "translation.prompt") {
            config.prompt = value;
        } else {
            *errorMessage = QString("Unknown setting: %1").arg(key);
            return false;
        }
        manager.save(config);
        return true;
    }

    *errorMessage = QString("Unknown setting: %1").arg(key);
    return false;
}

CLIResult ConfigCommand::execute(const QCommandLineParser& parser)
{
    if (parser.isSet("reset")) {
        PipelineSettingsManager::instance().resetToDefaults();
        TranslationSettingsManager::instance().resetToDefaults();
        return CLIResult::success("Settings reset to defaults");
    }

    if (parser.isSet("get")) {
        const QString key = parser.value("get");
        const QMap<QString, QString> values = currentValues();
        if (!values.contains(key)) {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    QString("Setting not found: %1").arg(key));
        }
        return CLIResult::success(values.value(key));
    }

    if (parser.isSet("set")) {
        const QString assignment = parser.value("set");
        const int separator = assignment.indexOf('=');
        if (separator <= 0) {
            return CLIResult::error(CLIResult::Code::InvalidArguments,
                                    "Expected --set key=value");
        }
        const QString key = assignment.left(separator).trimmed();
        const QString value = assignment.mid(separator + 1);
        QString error;
        if (!applySetting(key, value, &error)) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, error);
        }
        return CLIResult::success(QString("Set %1 = %2").arg(key, currentValues().value(key)));
    }

    // Default and --list
    QString output;
    QTextStream out(&output);
    out << "Current settings:\n";
    const QMap<QString, QString> values = currentValues();
    for (auto it = values.cbegin(); it != values.cend(); ++it) {
        out << QString("  %1 = %2\n").arg(it.key(), it.value());
    }
    return CLIResult::success(output);
}

} // namespace CLI
} // namespace Inkwell
