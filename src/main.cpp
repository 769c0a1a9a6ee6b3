#include <QCoreApplication>
#include <QTextStream>

#include "cli/CLIHandler.h"
#include "version.h"

#include <cstdio>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName(INKWELL_APP_NAME);
    app.setOrganizationName(INKWELL_ORGANIZATION);
    app.setApplicationVersion(INKWELL_VERSION);

    Inkwell::CLI::CLIHandler handler;
    const Inkwell::CLI::CLIResult result = handler.process(app.arguments());

    QTextStream out(result.isSuccess() ? stdout : stderr);
    if (!result.message.isEmpty()) {
        out << result.message;
        if (!result.message.endsWith('\n')) {
            out << Qt::endl;
        }
    }
    return static_cast<int>(result.code);
}
