#include <QtTest>

#include "cli/CLIHandler.h"
#include "version.h"

using Inkwell::CLI::CLICommand;
using Inkwell::CLI::CLIHandler;
using Inkwell::CLI::CLIResult;

namespace {

class EchoCommand : public CLICommand
{
public:
    QString name() const override { return "echo"; }
    QString description() const override { return "Echo the first argument"; }
    void setupOptions(QCommandLineParser& parser) override
    {
        parser.addOption({"upper", "Uppercase the output"});
        parser.addPositionalArgument("text", "Text to echo");
    }
    CLIResult execute(const QCommandLineParser& parser) override
    {
        const QStringList args = parser.positionalArguments();
        if (args.isEmpty()) {
            return CLIResult::error(CLIResult::Code::InvalidArguments, "Nothing to echo");
        }
        return CLIResult::success(parser.isSet("upper") ? args.first().toUpper() : args.first());
    }
};

} // namespace

class tst_CLIHandler : public QObject
{
    Q_OBJECT

private slots:
    void testNoArguments_ShowsHelpAsError();
    void testHelp();
    void testVersion();
    void testUnknownCommand();
    void testCommandHelp();
    void testUnknownOption();
    void testRegisteredCommand_Executes();
    void testCommandName_CaseInsensitive();
    void testHasArguments();
};

void tst_CLIHandler::testNoArguments_ShowsHelpAsError()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"inkwell"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("Usage: inkwell <command> [options]"));
}

void tst_CLIHandler::testHelp()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"inkwell", "--help"});
    QVERIFY(result.isSuccess());
    QVERIFY(result.message.contains("process"));
    QVERIFY(result.message.contains("config"));
    QCOMPARE(handler.process({"inkwell", "-h"}).message, result.message);
}

void tst_CLIHandler::testVersion()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"inkwell", "--version"});
    QVERIFY(result.isSuccess());
    QCOMPARE(result.message, QString("Inkwell version %1").arg(INKWELL_VERSION));
}

void tst_CLIHandler::testUnknownCommand()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"inkwell", "render"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.startsWith("Unknown command: render"));
}

void tst_CLIHandler::testCommandHelp()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"inkwell", "process", "--help"});
    QVERIFY(result.isSuccess());
    QVERIFY(result.message.contains("--stages"));
    QVERIFY(result.message.contains("--output"));
}

void tst_CLIHandler::testUnknownOption()
{
    CLIHandler handler;
    const CLIResult result = handler.process({"inkwell", "config", "--bogus"});
    QCOMPARE(result.code, CLIResult::Code::InvalidArguments);
    QVERIFY(result.message.contains("bogus"));
}

void tst_CLIHandler::testRegisteredCommand_Executes()
{
    CLIHandler handler;
    handler.registerCommand(std::make_unique<EchoCommand>());

    QCOMPARE(handler.process({"inkwell", "echo", "hi"}).message, QString("hi"));
    QCOMPARE(handler.process({"inkwell", "echo", "--upper", "hi"}).message, QString("HI"));
    QCOMPARE(handler.process({"inkwell", "echo"}).code, CLIResult::Code::InvalidArguments);
    QVERIFY(handler.getHelpText().contains("Echo the first argument"));
}

void tst_CLIHandler::testCommandName_CaseInsensitive()
{
    CLIHandler handler;
    handler.registerCommand(std::make_unique<EchoCommand>());
    QCOMPARE(handler.process({"inkwell", "ECHO", "x"}).message, QString("x"));
}

void tst_CLIHandler::testHasArguments()
{
    QVERIFY(!CLIHandler::hasArguments({"inkwell"}));
    QVERIFY(CLIHandler::hasArguments({"inkwell", "config"}));
}

QTEST_GUILESS_MAIN(tst_CLIHandler)
#include "tst_CLIHandler.moc"
