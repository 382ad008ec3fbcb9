#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

#include <QProcessEnvironment>
#include <QTimeZone>

#include "common/enums.hpp"
#include "common/logging.hpp"

namespace mirulog {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CaptureConfig {
    std::chrono::seconds interval{60};
    std::chrono::minutes idleThreshold{5};
    bool lockCheckEnabled = true;
    std::filesystem::path captureRoot;
    std::filesystem::path archiveRoot;
    LifecyclePolicy lifecyclePolicy = LifecyclePolicy::Delete;
    bool partitionArchiveByHost = false;
};

struct RetryConfig {
    int maxRetries = 5;
    double retryBufferSeconds = 0.5;
    double requestSpacingSeconds = 0.0;
    int connectionRefusedRetries = 2;
    // Ceiling for one hinted wait, buffer included.
    double maxRetryWaitSeconds = 300.0;
};

struct GeminiConfig {
    std::string apiKey;
    std::string model = "gemini-1.5-flash";
    std::string endpoint = "https://generativelanguage.googleapis.com/v1beta";
    int maxTokens = 1024;
    double temperature = 0.4;
    int timeoutSeconds = 120;
};

struct LocalLlmConfig {
    std::string baseUrl = "http://localhost:1234/v1";
    std::string model = "auto";
    std::string apiKey;
    int timeoutSeconds = 120;
    int maxTokens = 1024;
    double temperature = 0.2;
};

struct AnalyzerConfig {
    BackendKind backend = BackendKind::Gemini;
    // Unset means "use the backend's default batch size".
    std::optional<int> batchLimit;
    std::chrono::seconds leaseDuration{1800};
    RetryConfig retry;
};

struct LoggingConfig {
    QString directory;
    logging::LogLevel level = logging::LogLevel::Info;
    bool trace = false;
};

// Immutable process configuration. Built once in main() and passed by reference.
struct AppConfig {
    std::string hostName;
    QTimeZone timeZone;
    CaptureConfig capture;
    AnalyzerConfig analyzer;
    GeminiConfig gemini;
    LocalLlmConfig local;
    LoggingConfig logging;

    std::filesystem::path databasePath() const;
};

// Values given on the command line win over the environment.
struct ConfigOverrides {
    std::optional<std::string> captureRoot;
    std::optional<std::string> archiveRoot;
    std::optional<BackendKind> defaultBackend;
    bool trace = false;
};

AppConfig loadConfig(const QProcessEnvironment &env,
                     const ConfigOverrides &overrides = {});

// Throws ConfigError when the selected backend lacks a credential it needs.
void requireBackendCredentials(const AppConfig &config);

// Replaces every "{host}" in the template.
std::string expandHostTemplate(const std::string &pathTemplate,
                               const std::string &hostName);

} // namespace mirulog
