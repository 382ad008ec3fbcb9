#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "analyzer/analysis_backend.hpp"
#include "analyzer/image_lifecycle.hpp"
#include "analyzer/retry_controller.hpp"
#include "common/clock.hpp"
#include "store/capture_store.hpp"

namespace mirulog {

struct BatchStats {
    int selected = 0;
    int analyzed = 0;
    int failed = 0;
    // Selected but claimed by someone else first, or taken over after the
    // lease expired.
    int lost = 0;

    int processed() const { return analyzed + failed; }
    BatchStats &operator+=(const BatchStats &other);
};

struct DrainStats {
    int batches = 0;
    BatchStats totals;
};

// Moves pending captures through the backend one at a time. A failure of one
// capture is recorded on that capture and never aborts the batch; store
// errors propagate to the caller.
class BatchEngine {
public:
    BatchEngine(CaptureStore &store,
                AnalysisBackend &backend,
                RetryController &retry,
                ImageLifecycleManager &lifecycle,
                Clock &clock,
                std::chrono::seconds leaseDuration,
                std::string leaseOwner);

    // Bounded mode. No limit means the backend default; <= 0 means unbounded.
    BatchStats runBatch(std::optional<int> limit = std::nullopt);

    // Repeats bounded batches until one starts with nothing pending, or until
    // a batch makes no progress.
    DrainStats drain(std::optional<int> batchSize = std::nullopt);

    int effectiveLimit(std::optional<int> limit) const;

private:
    enum class Outcome {
        Analyzed,
        Failed,
        Lost
    };

    Outcome processCapture(const CaptureRecord &record);
    Outcome recordFailure(const CaptureRecord &record,
                          const std::string &errorDetail,
                          int retries,
                          std::chrono::system_clock::time_point attemptAt);
    void logLeaseLost(const CaptureRecord &record, const char *stage);
    std::chrono::system_clock::time_point leaseCutoff() const;

    CaptureStore &m_store;
    AnalysisBackend &m_backend;
    RetryController &m_retry;
    ImageLifecycleManager &m_lifecycle;
    Clock &m_clock;
    std::chrono::seconds m_leaseDuration;
    std::string m_leaseOwner;
};

} // namespace mirulog
