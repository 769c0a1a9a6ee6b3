#ifndef PROCESS_COMMAND_H
#define PROCESS_COMMAND_H

#include "cli/CLICommand.h"

#include <QJsonObject>

#include <functional>
#include <memory>

class Document;
class EditorContext;

namespace Inkwell {
namespace CLI {

/**
 * @brief Run the pipeline over image files and write the results
 *
 * For every input page it writes <name>.inpainted.png, <name>.mask.png
 * and <name>.blocks.json into the output directory.
 */
class ProcessCommand : public CLICommand
{
public:
    // Builds the editor the command runs on; adapters must be installed.
    using ContextFactory = std::function<std::unique_ptr<EditorContext>()>;

    ProcessCommand();
    explicit ProcessCommand(ContextFactory factory);
    ~ProcessCommand() override;

    QString name() const override;
    QString description() const override;
    void setupOptions(QCommandLineParser& parser) override;
    CLIResult execute(const QCommandLineParser& parser) override;

    static QJsonObject documentToJson(const Document& document);

private:
    ContextFactory m_factory;
};

} // namespace CLI
} // namespace Inkwell

#endif // PROCESS_COMMAND_H
