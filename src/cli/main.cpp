#include <QCoreApplication>

#include "cli/RewindCli.hpp"
#include "common/hashprint_version.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("hashprint"));
    QCoreApplication::setApplicationVersion(QStringLiteral(HASHPRINT_VERSION));

    const bool trace = qEnvironmentVariableIntValue("HASHPRINT_TRACE") == 1;
    hashprint::logging::initLogging(QStringLiteral("hashprint"), trace);
    hashprint::logging::setConsoleEcho(true);
    HLOG_INFO("main", "cli_start",
              {{"args", argc - 1},
               {"version", HASHPRINT_VERSION}});

    // Arguments were already decoded by QCoreApplication; RewindCli re-parses
    // them so it can be driven in-process by tests.
    hashprint::RewindCli cli;
    return cli.run(argc, argv);
}
