#ifndef CONFIG_COMMAND_H
#define CONFIG_COMMAND_H

#include "cli/CLICommand.h"

#include <QMap>
#include <QStringList>

namespace Inkwell {
namespace CLI {

/**
 * @brief Show or change pipeline and translation settings
 */
class ConfigCommand : public CLICommand
{
public:
    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;

    static QStringList knownKeys();
    static QMap<QString, QString> currentValues(bool maskSecrets = true);
    static bool applySetting(const QString& key, const QString& value, QString* errorMessage);
};

} // namespace CLI
} // namespace Inkwell

#endif // CONFIG_COMMAND_H
