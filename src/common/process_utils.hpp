#pragma once

#include <optional>

#include <QString>
#include <QStringList>

namespace mirulog {

struct CommandResult {
    int exitCode = -1;
    QString standardOutput;
    QString standardError;
};

// Runs an external tool to completion. Returns nullopt when it cannot be
// started, crashes, or does not finish within timeoutMs.
std::optional<CommandResult> runCommand(const QString &program,
                                        const QStringList &args,
                                        int timeoutMs = 2000);

// Trimmed stdout of a command that exited with status 0.
std::optional<QString> commandOutput(const QString &program,
                                     const QStringList &args,
                                     int timeoutMs = 2000);

} // namespace mirulog
