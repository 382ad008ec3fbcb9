#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "analyzer/analysis_backend.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"

namespace mirulog {

struct RetryOutcome {
    std::optional<RawAnalysis> analysis;
    int attempts = 0;
    int retries = 0;
    // Set whenever analysis is empty.
    std::optional<BackendError> lastError;

    bool succeeded() const { return analysis.has_value(); }
};

// Wraps one backend call with request spacing and bounded retries.
//
// Spacing is measured on the monotonic clock between the starts of
// consecutive calls, retries included. A retryable error waits the server
// hint plus the buffer when one is given, never longer than maxRetryWaitSeconds;
// otherwise 2 s doubling up to 60 s. Fatal errors return immediately.
class RetryController {
public:
    RetryController(RetryConfig config, Clock &clock, std::string backendId);

    RetryOutcome run(const std::function<RawAnalysis()> &call);

    // Delay before retry number retryIndex (0-based) when no hint is given.
    static std::chrono::milliseconds backoffDelay(int retryIndex);

    int retryBound(ErrorKind kind) const;

    std::chrono::milliseconds hintedDelay(std::chrono::milliseconds hint) const;

private:
    void awaitSpacing();

    RetryConfig m_config;
    Clock &m_clock;
    std::string m_backendId;
    std::optional<std::chrono::steady_clock::time_point> m_lastCallStart;
};

} // namespace mirulog
