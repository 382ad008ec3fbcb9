#include "common/process_utils.hpp"

#include <QProcess>

#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace mirulog {

std::optional<CommandResult> runCommand(const QString &program,
                                        const QStringList &args,
                                        int timeoutMs)
{
    QProcess process;
    process.start(program, args);
    if (!process.waitForStarted(timeoutMs)) {
        MLOG_DEBUG(QStringLiteral("ProcessUtils"),
                   QStringLiteral("runCommand"),
                   QStringLiteral("command_not_started"),
                   QStringLiteral("tool missing or not executable"),
                   QStringLiteral("QProcess"),
                   mirulog::logging::defaultWho(),
                   mirulog::logging::currentCorrelationId(),
                   nlohmann::json{{"program", program.toStdString()},
                                  {"error", process.errorString().toStdString()}});
        return std::nullopt;
    }

    process.closeWriteChannel();

    if (!process.waitForFinished(timeoutMs)) {
        process.kill();
        process.waitForFinished(200);
        MLOG_DEBUG(QStringLiteral("ProcessUtils"),
                   QStringLiteral("runCommand"),
                   QStringLiteral("command_timeout"),
                   QStringLiteral("tool did not finish in time"),
                   QStringLiteral("killed"),
                   mirulog::logging::defaultWho(),
                   mirulog::logging::currentCorrelationId(),
                   nlohmann::json{{"program", program.toStdString()},
                                  {"timeoutMs", timeoutMs}});
        return std::nullopt;
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        return std::nullopt;
    }

    CommandResult result;
    result.exitCode = process.exitCode();
    result.standardOutput = QString::fromUtf8(process.readAllStandardOutput());
    result.standardError = QString::fromUtf8(process.readAllStandardError());
    return result;
}

std::optional<QString> commandOutput(const QString &program,
                                     const QStringList &args,
                                     int timeoutMs)
{
    const auto result = runCommand(program, args, timeoutMs);
    if (!result || result->exitCode != 0) {
        return std::nullopt;
    }
    return result->standardOutput.trimmed();
}

} // namespace mirulog
