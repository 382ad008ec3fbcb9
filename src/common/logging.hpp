#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace mirulog::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main(), once the
// configuration is known. An empty logDir selects $LOG_DIR, then
// ~/.local/share/mirulog/logs.
void initLogging(const QString &processName,
                 const QString &logDir,
                 LogLevel minLevel,
                 bool traceEnabled);

bool isTraceEnabled();
QString logDirectory();

// Unknown names map to Info.
LogLevel parseLogLevel(const QString &name);

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace mirulog::logging

#define MLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::mirulog::logging::logEvent(::mirulog::logging::LogLevel::Debug, \
                                 ::mirulog::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define MLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::mirulog::logging::logEvent(::mirulog::logging::LogLevel::Info, \
                                 ::mirulog::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define MLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::mirulog::logging::logEvent(::mirulog::logging::LogLevel::Warn, \
                                 ::mirulog::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define MLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::mirulog::logging::logEvent(::mirulog::logging::LogLevel::Error, \
                                 ::mirulog::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
