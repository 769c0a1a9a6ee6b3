#ifndef CLI_HANDLER_H
#define CLI_HANDLER_H

#include "CLICommand.h"
#include "CLIResult.h"

#include <QString>
#include <QStringList>
#include <map>
#include <memory>

namespace Inkwell {
namespace CLI {

/**
 * @brief CLI handler for parsing and executing commands
 */
class CLIHandler
{
public:
    CLIHandler();
    ~CLIHandler();

    /**
     * @brief Parse and execute command line
     * @param arguments Command line arguments (including program name)
     */
    CLIResult process(const QStringList& arguments);

    // Replaces a built-in command with the same name.
    void registerCommand(CLICommandPtr command);

    static bool hasArguments(const QStringList& arguments);

    QString getHelpText() const;

    static QString getVersionText();

private:
    void registerCommands();
    CLICommand* findCommand(const QString& name) const;

    std::map<QString, CLICommandPtr> m_commands;
};

} // namespace CLI
} // namespace Inkwell

#endif // CLI_HANDLER_H
