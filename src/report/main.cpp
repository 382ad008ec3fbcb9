#include <QCoreApplication>
#include <QProcessEnvironment>

#include "report/ReportCli.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    const QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    const bool trace = env.value(QStringLiteral("MIRULOG_TRACE")) == QStringLiteral("1");
    mirulog::logging::initLogging(QStringLiteral("mirulog-report"),
                                  env.value(QStringLiteral("LOG_DIR")),
                                  mirulog::logging::parseLogLevel(env.value(QStringLiteral("LOG_LEVEL"))),
                                  trace);
    MLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("report_cli_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              mirulog::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", argc}}));

    // CLI entry point: delegate to ReportCli for argument parsing and output.
    mirulog::ReportCli cli;
    return cli.run(argc, argv);
}
