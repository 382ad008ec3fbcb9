#include "analyzer/analysis_backend.hpp"

#include <cmath>

namespace mirulog {

std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Authentication:
        return "authentication";
    case ErrorKind::UnsupportedInput:
        return "unsupported_input";
    case ErrorKind::MissingImage:
        return "missing_image";
    case ErrorKind::Rejected:
        return "rejected";
    case ErrorKind::RateLimited:
        return "rate_limited";
    case ErrorKind::Transient:
        return "transient";
    case ErrorKind::ConnectionRefused:
        return "connection_refused";
    }
    return "transient";
}

std::optional<std::chrono::milliseconds> retryHintFromSeconds(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return std::nullopt;
    }
    const double ceiling = static_cast<double>(kMaxRetryHint.count());
    if (seconds >= ceiling) {
        return std::chrono::milliseconds(kMaxRetryHint);
    }
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
}

BackendError::BackendError(ErrorKind kind,
                           const std::string &message,
                           std::optional<std::chrono::milliseconds> retryAfter)
    : std::runtime_error(message)
    , m_kind(kind)
    , m_retryAfter(retryAfter)
{
}

ErrorKind BackendError::kind() const
{
    return m_kind;
}

std::optional<std::chrono::milliseconds> BackendError::retryAfter() const
{
    return m_retryAfter;
}

bool BackendError::isRetryable() const
{
    return m_kind == ErrorKind::RateLimited
        || m_kind == ErrorKind::Transient
        || m_kind == ErrorKind::ConnectionRefused;
}

} // namespace mirulog
