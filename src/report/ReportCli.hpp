#pragma once

#include <chrono>
#include <optional>

#include <QString>
#include <QStringList>

namespace mirulog {

class ReportCli
{
public:
    // CLI dispatcher for shard inspection and multi-host reports.
    // returns exit code
    int run(int argc, char *argv[]);

private:
    int runPendingCount(const QStringList &args);
    int runMergedReport(const QStringList &args);
    int runRequeue(const QStringList &args);

    std::optional<std::chrono::system_clock::time_point> parseIso8601(
        const QString &value) const;
};

} // namespace mirulog
