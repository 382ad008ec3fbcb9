#include "analyzer/batch_engine.hpp"

#include <QFile>

#include "analyzer/analysis_payload.hpp"
#include "common/logging.hpp"

namespace mirulog {

BatchStats &BatchStats::operator+=(const BatchStats &other)
{
    selected += other.selected;
    analyzed += other.analyzed;
    failed += other.failed;
    lost += other.lost;
    return *this;
}

BatchEngine::BatchEngine(CaptureStore &store,
                         AnalysisBackend &backend,
                         RetryController &retry,
                         ImageLifecycleManager &lifecycle,
                         Clock &clock,
                         std::chrono::seconds leaseDuration,
                         std::string leaseOwner)
    : m_store(store)
    , m_backend(backend)
    , m_retry(retry)
    , m_lifecycle(lifecycle)
    , m_clock(clock)
    , m_leaseDuration(leaseDuration)
    , m_leaseOwner(std::move(leaseOwner))
{
}

int BatchEngine::effectiveLimit(std::optional<int> limit) const
{
    if (limit.has_value()) {
        return *limit;
    }
    return m_backend.defaultBatchLimit();
}

std::chrono::system_clock::time_point BatchEngine::leaseCutoff() const
{
    return m_clock.now() - m_leaseDuration;
}

BatchStats BatchEngine::runBatch(std::optional<int> limit)
{
    const int effective = effectiveLimit(limit);
    const auto pending = m_store.pendingCaptures(effective, leaseCutoff());

    BatchStats stats;
    stats.selected = static_cast<int>(pending.size());

    MLOG_INFO(QStringLiteral("BatchEngine"),
              QStringLiteral("runBatch"),
              QStringLiteral("batch_started"),
              QStringLiteral("analyzer invocation"),
              QStringLiteral("oldest pending first"),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"limit", effective},
                             {"selected", stats.selected},
                             {"backend", m_backend.backendId()}});

    for (const auto &record : pending) {
        switch (processCapture(record)) {
        case Outcome::Analyzed:
            ++stats.analyzed;
            break;
        case Outcome::Failed:
            ++stats.failed;
            break;
        case Outcome::Lost:
            ++stats.lost;
            break;
        }
    }

    MLOG_INFO(QStringLiteral("BatchEngine"),
              QStringLiteral("runBatch"),
              QStringLiteral("batch_finished"),
              QStringLiteral("all selected captures handled"),
              QString(),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"selected", stats.selected},
                             {"analyzed", stats.analyzed},
                             {"failed", stats.failed},
                             {"lost", stats.lost}});
    return stats;
}

DrainStats BatchEngine::drain(std::optional<int> batchSize)
{
    DrainStats drainStats;
    for (;;) {
        const BatchStats batch = runBatch(batchSize);
        if (batch.selected == 0) {
            break;
        }
        ++drainStats.batches;
        drainStats.totals += batch;
        if (batch.processed() == 0) {
            MLOG_WARN(QStringLiteral("BatchEngine"),
                      QStringLiteral("drain"),
                      QStringLiteral("drain_no_progress"),
                      QStringLiteral("every selected capture was claimed elsewhere"),
                      QStringLiteral("stopping drain"),
                      mirulog::logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"selected", batch.selected}});
            break;
        }
    }
    return drainStats;
}

void BatchEngine::logLeaseLost(const CaptureRecord &record, const char *stage)
{
    MLOG_WARN(QStringLiteral("BatchEngine"),
              QStringLiteral("processCapture"),
              QStringLiteral("capture_lease_lost"),
              QStringLiteral("claim expired and was taken over before the result was stored"),
              QStringLiteral("result discarded, image left in place"),
              mirulog::logging::defaultWho(),
              mirulog::logging::currentCorrelationId(),
              nlohmann::json{{"captureId", record.id},
                             {"owner", m_leaseOwner},
                             {"stage", stage}});
}

BatchEngine::Outcome BatchEngine::recordFailure(const CaptureRecord &record,
                                                const std::string &errorDetail,
                                                int retries,
                                                std::chrono::system_clock::time_point attemptAt)
{
    AnalysisResult result;
    result.captureId = record.id;
    result.backend = m_backend.backendId();
    result.model = m_backend.modelName();
    result.errorDetail = errorDetail;
    result.retryCount = retries;
    result.lastAttemptAt = attemptAt;
    if (!m_store.markFailed(result, m_leaseOwner)) {
        logLeaseLost(record, "failed");
        return Outcome::Lost;
    }

    MLOG_WARN(QStringLiteral("BatchEngine"),
              QStringLiteral("processCapture"),
              QStringLiteral("capture_failed"),
              QStringLiteral("analysis did not succeed"),
              QStringLiteral("marked failed"),
              mirulog::logging::defaultWho(),
              mirulog::logging::currentCorrelationId(),
              nlohmann::json{{"captureId", record.id},
                             {"backend", result.backend},
                             {"retries", retries},
                             {"error", errorDetail}});
    return Outcome::Failed;
}

BatchEngine::Outcome BatchEngine::processCapture(const CaptureRecord &record)
{
    mirulog::logging::CorrelationScope correlation(
        QStringLiteral("capture-%1").arg(record.id));

    if (!m_store.claimForAnalysis(record.id, m_leaseOwner, m_clock.now(), leaseCutoff())) {
        MLOG_DEBUG(QStringLiteral("BatchEngine"),
                   QStringLiteral("processCapture"),
                   QStringLiteral("capture_claim_lost"),
                   QStringLiteral("row no longer claimable"),
                   QStringLiteral("conditional update"),
                   mirulog::logging::defaultWho(),
                   mirulog::logging::currentCorrelationId(),
                   nlohmann::json{{"captureId", record.id}});
        return Outcome::Lost;
    }

    const auto attemptAt = m_clock.now();

    QFile image(QString::fromStdString(record.imagePath));
    if (record.imagePath.empty() || !image.exists()) {
        return recordFailure(record, toErrorKindString(ErrorKind::MissingImage) + ": image missing",
                             0, attemptAt);
    }
    if (!image.open(QIODevice::ReadOnly)) {
        return recordFailure(record,
                             toErrorKindString(ErrorKind::MissingImage) + ": image unreadable: "
                                 + image.errorString().toStdString(),
                             0,
                             attemptAt);
    }

    AnalysisRequest request;
    request.imageBytes = image.readAll();
    request.windowTitle = record.windowTitle;
    request.processName = record.processName;
    request.capturedAt = record.capturedAt;
    image.close();

    const RetryOutcome outcome = m_retry.run([&]() {
        return m_backend.analyze(request);
    });

    if (!outcome.succeeded()) {
        std::string detail = "unknown error";
        if (outcome.lastError) {
            detail = toErrorKindString(outcome.lastError->kind()) + ": " + outcome.lastError->what();
        }
        return recordFailure(record, detail, outcome.retries, m_clock.now());
    }

    AnalysisResult result;
    result.captureId = record.id;
    result.backend = m_backend.backendId();
    result.model = outcome.analysis->model.empty() ? m_backend.modelName() : outcome.analysis->model;
    result.rawResponse = outcome.analysis->text;
    result.fields = parseAnalysisPayload(outcome.analysis->text);
    result.retryCount = outcome.retries;
    result.lastAttemptAt = m_clock.now();
    if (!m_store.markAnalyzed(result, m_leaseOwner)) {
        logLeaseLost(record, "analyzed");
        return Outcome::Lost;
    }

    MLOG_INFO(QStringLiteral("BatchEngine"),
              QStringLiteral("processCapture"),
              QStringLiteral("capture_analyzed"),
              QStringLiteral("backend returned a result"),
              QStringLiteral("marked analyzed"),
              mirulog::logging::defaultWho(),
              mirulog::logging::currentCorrelationId(),
              nlohmann::json{{"captureId", record.id},
                             {"backend", result.backend},
                             {"model", result.model},
                             {"attempts", outcome.attempts},
                             {"primaryTask", result.fields.primaryTask}});

    // Only after the commit above.
    m_lifecycle.apply(record.id);
    return Outcome::Analyzed;
}

} // namespace mirulog
