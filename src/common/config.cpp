#include "common/config.hpp"

#include <cmath>

#include <QSysInfo>

namespace mirulog {

namespace {

constexpr const char *kDatabaseFileName = "mirulog.db";

QString envValue(const QProcessEnvironment &env, const char *key)
{
    return env.value(QString::fromLatin1(key)).trimmed();
}

std::string envString(const QProcessEnvironment &env, const char *key,
                      const std::string &fallback)
{
    const QString value = envValue(env, key);
    if (value.isEmpty()) {
        return fallback;
    }
    return value.toStdString();
}

bool envBool(const QProcessEnvironment &env, const char *key, bool fallback)
{
    const QString value = envValue(env, key).toLower();
    if (value.isEmpty()) {
        return fallback;
    }
    return value == QStringLiteral("1") || value == QStringLiteral("true")
        || value == QStringLiteral("yes") || value == QStringLiteral("on");
}

int envInt(const QProcessEnvironment &env, const char *key, int fallback)
{
    const QString value = envValue(env, key);
    if (value.isEmpty()) {
        return fallback;
    }
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok) {
        throw ConfigError(std::string("invalid integer for ") + key + ": "
                          + value.toStdString());
    }
    return parsed;
}

double envDouble(const QProcessEnvironment &env, const char *key, double fallback)
{
    const QString value = envValue(env, key);
    if (value.isEmpty()) {
        return fallback;
    }
    bool ok = false;
    const double parsed = value.toDouble(&ok);
    if (!ok || !std::isfinite(parsed)) {
        throw ConfigError(std::string("invalid number for ") + key + ": "
                          + value.toStdString());
    }
    return parsed;
}

BackendKind parseBackend(const std::string &value)
{
    if (value == "gemini" || value == "remote") {
        return BackendKind::Gemini;
    }
    if (value == "local" || value == "lmstudio") {
        return BackendKind::Local;
    }
    throw ConfigError("unknown ANALYZER_BACKEND: " + value);
}

std::filesystem::path resolveRoot(const std::string &pathTemplate,
                                  const std::string &hostName)
{
    const std::filesystem::path expanded(expandHostTemplate(pathTemplate, hostName));
    return std::filesystem::absolute(expanded).lexically_normal();
}

void requirePositive(int value, const char *key)
{
    if (value <= 0) {
        throw ConfigError(std::string(key) + " must be positive");
    }
}

} // namespace

std::filesystem::path AppConfig::databasePath() const
{
    return capture.archiveRoot / kDatabaseFileName;
}

std::string expandHostTemplate(const std::string &pathTemplate,
                               const std::string &hostName)
{
    static const std::string kPlaceholder = "{host}";
    std::string result = pathTemplate;
    std::string::size_type pos = 0;
    while ((pos = result.find(kPlaceholder, pos)) != std::string::npos) {
        result.replace(pos, kPlaceholder.size(), hostName);
        pos += hostName.size();
    }
    return result;
}

AppConfig loadConfig(const QProcessEnvironment &env, const ConfigOverrides &overrides)
{
    AppConfig config;

    config.hostName = envString(env, "MIRULOG_HOST",
                                QSysInfo::machineHostName().toStdString());
    if (config.hostName.empty()) {
        config.hostName = "localhost";
    }

    const QString tzName = envValue(env, "TIMEZONE");
    if (tzName.isEmpty()) {
        config.timeZone = QTimeZone::systemTimeZone();
    } else {
        config.timeZone = QTimeZone(tzName.toUtf8());
        if (!config.timeZone.isValid()) {
            throw ConfigError("unknown TIMEZONE: " + tzName.toStdString());
        }
    }

    const int intervalSeconds = envInt(env, "CAPTURE_INTERVAL_SECONDS", 60);
    requirePositive(intervalSeconds, "CAPTURE_INTERVAL_SECONDS");
    config.capture.interval = std::chrono::seconds(intervalSeconds);

    const int idleMinutes = envInt(env, "IDLE_THRESHOLD_MINUTES", 5);
    requirePositive(idleMinutes, "IDLE_THRESHOLD_MINUTES");
    config.capture.idleThreshold = std::chrono::minutes(idleMinutes);

    config.capture.lockCheckEnabled = !envBool(env, "MIRULOG_DISABLE_LOCK_CHECK", false);

    const std::string captureTemplate = overrides.captureRoot.value_or(
        envString(env, "CAPTURE_ROOT", "data/captures"));
    const std::string archiveTemplate = overrides.archiveRoot.value_or(
        envString(env, "ARCHIVE_ROOT", "data/archive"));
    config.capture.captureRoot = resolveRoot(captureTemplate, config.hostName);
    config.capture.archiveRoot = resolveRoot(archiveTemplate, config.hostName);

    config.capture.lifecyclePolicy = envBool(env, "DELETE_CAPTURE_AFTER_ANALYSIS", true)
        ? LifecyclePolicy::Delete
        : LifecyclePolicy::Archive;
    config.capture.partitionArchiveByHost = envBool(env, "ARCHIVE_PARTITION_BY_HOST", false);

    const BackendKind defaultBackend = overrides.defaultBackend.value_or(BackendKind::Gemini);
    const std::string backendName = envValue(env, "ANALYZER_BACKEND").toLower().toStdString();
    config.analyzer.backend = backendName.empty() ? defaultBackend : parseBackend(backendName);

    if (!envValue(env, "ANALYZER_BATCH_LIMIT").isEmpty()) {
        const int limit = envInt(env, "ANALYZER_BATCH_LIMIT", 0);
        requirePositive(limit, "ANALYZER_BATCH_LIMIT");
        config.analyzer.batchLimit = limit;
    }

    const int leaseSeconds = envInt(env, "ANALYZER_LEASE_SECONDS", 1800);
    requirePositive(leaseSeconds, "ANALYZER_LEASE_SECONDS");
    config.analyzer.leaseDuration = std::chrono::seconds(leaseSeconds);

    RetryConfig &retry = config.analyzer.retry;
    retry.maxRetries = envInt(env, "GEMINI_MAX_RETRIES", retry.maxRetries);
    retry.retryBufferSeconds = envDouble(env, "GEMINI_RETRY_BUFFER_SECONDS",
                                         retry.retryBufferSeconds);
    retry.requestSpacingSeconds = envDouble(env, "GEMINI_REQUEST_SPACING_SECONDS",
                                            retry.requestSpacingSeconds);
    retry.connectionRefusedRetries = envInt(env, "LOCAL_LLM_CONNECT_RETRIES",
                                            retry.connectionRefusedRetries);
    retry.maxRetryWaitSeconds = envDouble(env, "MAX_RETRY_WAIT_SECONDS",
                                          retry.maxRetryWaitSeconds);
    if (retry.maxRetries < 0 || retry.connectionRefusedRetries < 0
        || retry.retryBufferSeconds < 0.0 || retry.requestSpacingSeconds < 0.0) {
        throw ConfigError("retry tunables must not be negative");
    }
    if (retry.maxRetryWaitSeconds <= 0.0) {
        throw ConfigError("MAX_RETRY_WAIT_SECONDS must be positive");
    }

    config.gemini.apiKey = envString(env, "GEMINI_API_KEY", "");
    config.gemini.model = envString(env, "GEMINI_MODEL", config.gemini.model);
    config.gemini.endpoint = envString(env, "GEMINI_ENDPOINT", config.gemini.endpoint);
    config.gemini.maxTokens = envInt(env, "GEMINI_MAX_TOKENS", config.gemini.maxTokens);
    config.gemini.temperature = envDouble(env, "GEMINI_TEMPERATURE", config.gemini.temperature);

    config.local.baseUrl = envString(env, "LOCAL_LLM_BASE_URL", config.local.baseUrl);
    while (!config.local.baseUrl.empty() && config.local.baseUrl.back() == '/') {
        config.local.baseUrl.pop_back();
    }
    config.local.model = envString(env, "LOCAL_LLM_MODEL", config.local.model);
    config.local.apiKey = envString(env, "LOCAL_LLM_API_KEY", "");
    config.local.timeoutSeconds = envInt(env, "LOCAL_LLM_TIMEOUT_SECONDS",
                                         config.local.timeoutSeconds);
    requirePositive(config.local.timeoutSeconds, "LOCAL_LLM_TIMEOUT_SECONDS");
    config.local.maxTokens = envInt(env, "LOCAL_LLM_MAX_TOKENS", config.local.maxTokens);
    config.local.temperature = envDouble(env, "LOCAL_LLM_TEMPERATURE", config.local.temperature);

    config.logging.directory = envValue(env, "LOG_DIR");
    config.logging.level = logging::parseLogLevel(envValue(env, "LOG_LEVEL"));
    config.logging.trace = overrides.trace || envBool(env, "MIRULOG_TRACE", false);

    return config;
}

void requireBackendCredentials(const AppConfig &config)
{
    if (config.analyzer.backend == BackendKind::Gemini && config.gemini.apiKey.empty()) {
        throw ConfigError("Environment variable 'GEMINI_API_KEY' is required but missing");
    }
    if (config.analyzer.backend == BackendKind::Local && config.local.baseUrl.empty()) {
        throw ConfigError("Environment variable 'LOCAL_LLM_BASE_URL' must not be empty");
    }
}

} // namespace mirulog
