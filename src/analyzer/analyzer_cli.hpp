#pragma once

#include <optional>
#include <string>

#include <QProcessEnvironment>
#include <QStringList>

#include "analyzer/http_transport.hpp"
#include "common/clock.hpp"

namespace mirulog {

struct AnalyzerOptions {
    std::optional<int> limit;
    bool untilEmpty = false;
    bool requeueFailed = false;
    bool trace = false;
    std::optional<std::string> captureRoot;
    std::optional<std::string> archiveRoot;
    std::optional<std::string> singleImage;
};

// Returns nullopt and fills error on malformed arguments. args[0] is the
// program name.
std::optional<AnalyzerOptions> parseAnalyzerArgs(const QStringList &args, QString *error);

// mirulog-analyzer entry point. The transport and clock are injected so the
// whole invocation can run against fakes.
class AnalyzerCli {
public:
    AnalyzerCli(QProcessEnvironment env, HttpTransport &transport, Clock &clock);

    // returns exit code
    int run(const QStringList &args);

private:
    QProcessEnvironment m_env;
    HttpTransport &m_transport;
    Clock &m_clock;
};

} // namespace mirulog
