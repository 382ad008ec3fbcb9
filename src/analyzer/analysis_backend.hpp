#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

#include <QByteArray>

namespace mirulog {

enum class ErrorKind {
    // Fatal: retrying cannot help.
    Authentication,
    UnsupportedInput,
    MissingImage,
    Rejected,
    // Retryable.
    RateLimited,
    Transient,
    ConnectionRefused
};

std::string toErrorKindString(ErrorKind kind);

// Upper bound for any server wait hint.
constexpr std::chrono::seconds kMaxRetryHint{3600};

// Converts a server wait hint in seconds. Negative, NaN and infinite values
// are no hint at all; larger values are clamped to kMaxRetryHint.
std::optional<std::chrono::milliseconds> retryHintFromSeconds(double seconds);

class BackendError : public std::runtime_error {
public:
    BackendError(ErrorKind kind,
                 const std::string &message,
                 std::optional<std::chrono::milliseconds> retryAfter = std::nullopt);

    ErrorKind kind() const;
    std::optional<std::chrono::milliseconds> retryAfter() const;
    bool isRetryable() const;

private:
    ErrorKind m_kind;
    std::optional<std::chrono::milliseconds> m_retryAfter;
};

struct AnalysisRequest {
    QByteArray imageBytes;
    std::string mimeType = "image/png";
    std::string windowTitle;
    std::string processName;
    std::chrono::system_clock::time_point capturedAt;
    std::string extraContext;
};

struct RawAnalysis {
    std::string text;
    std::string model;
};

// Vision-capable analysis provider. The batch engine only sees this interface;
// the concrete variant is picked once from configuration.
class AnalysisBackend {
public:
    virtual ~AnalysisBackend() = default;

    virtual std::string backendId() const = 0;
    virtual std::string modelName() const = 0;

    // Batch size used when the caller does not give one. <= 0 means unbounded.
    virtual int defaultBatchLimit() const = 0;

    // Throws BackendError.
    virtual RawAnalysis analyze(const AnalysisRequest &request) = 0;
};

} // namespace mirulog
