#ifndef CLI_COMMAND_H
#define CLI_COMMAND_H

#include "CLIResult.h"

#include <QCommandLineParser>
#include <QString>
#include <memory>

namespace Inkwell {
namespace CLI {

/**
 * @brief Abstract base class for CLI commands
 */
class CLICommand
{
public:
    virtual ~CLICommand() = default;

    /**
     * @brief Command name (e.g., "process", "config")
     */
    virtual QString name() const = 0;

    virtual QString description() const = 0;

    virtual void setupOptions(QCommandLineParser& parser) = 0;

    /**
     * @brief Execute the command
     * @param parser Parsed command line
     * @return Execution result
     */
    virtual CLIResult execute(const QCommandLineParser& parser) = 0;
};

using CLICommandPtr = std::unique_ptr<CLICommand>;

} // namespace CLI
} // namespace Inkwell

#endif // CLI_COMMAND_H
