#include <QCoreApplication>
#include <QProcessEnvironment>

#include "analyzer/analyzer_cli.hpp"
#include "analyzer/http_transport.hpp"
#include "common/cli_args.hpp"
#include "common/clock.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    mirulog::QtHttpTransport transport;
    mirulog::SystemClock clock;
    mirulog::AnalyzerCli cli(QProcessEnvironment::systemEnvironment(), transport, clock);
    return cli.run(mirulog::toArgList(argc, argv));
}
