#include "analyzer/retry_controller.hpp"

#include <algorithm>
#include <cmath>

#include "common/logging.hpp"

namespace mirulog {

namespace {

constexpr std::chrono::milliseconds kBackoffBase{2000};
constexpr std::chrono::milliseconds kBackoffCap{60000};

std::chrono::milliseconds fromSeconds(double seconds)
{
    if (!std::isfinite(seconds) || seconds <= 0.0) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::milliseconds(static_cast<long long>(std::ceil(seconds * 1000.0)));
}

} // namespace

RetryController::RetryController(RetryConfig config, Clock &clock, std::string backendId)
    : m_config(config)
    , m_clock(clock)
    , m_backendId(std::move(backendId))
{
}

std::chrono::milliseconds RetryController::backoffDelay(int retryIndex)
{
    std::chrono::milliseconds delay = kBackoffBase;
    for (int i = 0; i < retryIndex && delay < kBackoffCap; ++i) {
        delay *= 2;
    }
    return std::min(delay, kBackoffCap);
}

int RetryController::retryBound(ErrorKind kind) const
{
    const int maxRetries = std::max(0, m_config.maxRetries);
    if (kind == ErrorKind::ConnectionRefused) {
        return std::min(maxRetries, std::max(0, m_config.connectionRefusedRetries));
    }
    return maxRetries;
}

std::chrono::milliseconds RetryController::hintedDelay(std::chrono::milliseconds hint) const
{
    const auto ceiling = fromSeconds(m_config.maxRetryWaitSeconds);
    const auto clampedHint = std::clamp(hint, std::chrono::milliseconds(0), ceiling);
    return std::min(clampedHint + fromSeconds(m_config.retryBufferSeconds), ceiling);
}

void RetryController::awaitSpacing()
{
    const auto spacing = fromSeconds(m_config.requestSpacingSeconds);
    if (m_lastCallStart && spacing.count() > 0) {
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            m_clock.monotonicNow() - *m_lastCallStart);
        if (elapsed < spacing) {
            m_clock.sleepFor(spacing - elapsed);
        }
    }
    m_lastCallStart = m_clock.monotonicNow();
}

RetryOutcome RetryController::run(const std::function<RawAnalysis()> &call)
{
    RetryOutcome outcome;
    for (;;) {
        awaitSpacing();
        ++outcome.attempts;
        try {
            outcome.analysis = call();
            outcome.lastError.reset();
            return outcome;
        } catch (const BackendError &error) {
            outcome.lastError = error;

            nlohmann::json ctx = {
                {"backend", m_backendId},
                {"attempt", outcome.attempts},
                {"kind", toErrorKindString(error.kind())},
                {"error", error.what()}
            };

            if (!error.isRetryable()) {
                MLOG_WARN(QStringLiteral("RetryController"),
                          QStringLiteral("run"),
                          QStringLiteral("backend_call_fatal"),
                          QStringLiteral("backend reported a non-retryable error"),
                          QStringLiteral("no retry"),
                          mirulog::logging::defaultWho(),
                          mirulog::logging::currentCorrelationId(),
                          ctx);
                return outcome;
            }

            const int bound = retryBound(error.kind());
            if (outcome.retries >= bound) {
                ctx["retries"] = outcome.retries;
                MLOG_WARN(QStringLiteral("RetryController"),
                          QStringLiteral("run"),
                          QStringLiteral("backend_retries_exhausted"),
                          QStringLiteral("retry bound reached"),
                          QStringLiteral("giving up on this capture"),
                          mirulog::logging::defaultWho(),
                          mirulog::logging::currentCorrelationId(),
                          ctx);
                return outcome;
            }

            std::chrono::milliseconds delay;
            QString how;
            if (error.retryAfter()) {
                delay = hintedDelay(*error.retryAfter());
                ctx["hintMs"] = error.retryAfter()->count();
                how = QStringLiteral("server wait hint plus buffer");
            } else {
                delay = backoffDelay(outcome.retries);
                how = QStringLiteral("exponential backoff");
            }
            ctx["delayMs"] = delay.count();
            ctx["retry"] = outcome.retries + 1;
            MLOG_INFO(QStringLiteral("RetryController"),
                      QStringLiteral("run"),
                      QStringLiteral("backend_call_retry"),
                      QStringLiteral("backend reported a retryable error"),
                      how,
                      mirulog::logging::defaultWho(),
                      mirulog::logging::currentCorrelationId(),
                      ctx);

            m_clock.sleepFor(delay);
            ++outcome.retries;
        }
    }
}

} // namespace mirulog
