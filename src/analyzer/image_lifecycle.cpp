#include "analyzer/image_lifecycle.hpp"

#include <system_error>

#include "common/fs_utils.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_format.hpp"

namespace mirulog {

namespace {

void logDisposition(std::int64_t captureId, const LifecycleOutcome &outcome, const std::string &source)
{
    MLOG_INFO(QStringLiteral("ImageLifecycle"),
              QStringLiteral("apply"),
              QStringLiteral("image_disposition"),
              QStringLiteral("capture analyzed"),
              QStringLiteral("configured lifecycle policy"),
              mirulog::logging::defaultWho(),
              mirulog::logging::currentCorrelationId(),
              nlohmann::json{{"captureId", captureId},
                             {"disposition", toDispositionString(outcome.disposition)},
                             {"source", source},
                             {"archivedPath", outcome.archivedPath}});
}

void logKept(std::int64_t captureId, const std::string &source, const std::error_code &ec)
{
    MLOG_WARN(QStringLiteral("ImageLifecycle"),
              QStringLiteral("apply"),
              QStringLiteral("image_kept"),
              QStringLiteral("filesystem action failed"),
              QStringLiteral("leaving image in place"),
              mirulog::logging::defaultWho(),
              mirulog::logging::currentCorrelationId(),
              nlohmann::json{{"captureId", captureId},
                             {"source", source},
                             {"error", ec.message()}});
}

} // namespace

ImageLifecycleManager::ImageLifecycleManager(CaptureStore &store,
                                             const CaptureConfig &config,
                                             std::string hostName,
                                             QTimeZone timeZone)
    : m_store(store)
    , m_config(config)
    , m_hostName(std::move(hostName))
    , m_timeZone(std::move(timeZone))
{
}

std::filesystem::path ImageLifecycleManager::archiveTarget(const CaptureRecord &record) const
{
    std::filesystem::path target = m_config.archiveRoot / partitionDate(record.capturedAt, m_timeZone);
    if (m_config.partitionArchiveByHost) {
        target /= record.hostName.empty() ? m_hostName : record.hostName;
    }
    return target / std::filesystem::path(record.imagePath).filename();
}

LifecycleOutcome ImageLifecycleManager::apply(std::int64_t captureId)
{
    const auto record = m_store.getCapture(captureId);
    if (!record) {
        throw LifecycleError("capture " + std::to_string(captureId) + " does not exist");
    }
    if (record->status != CaptureStatus::Analyzed) {
        throw LifecycleError("capture " + std::to_string(captureId) + " is "
                             + toStatusString(record->status) + ", not analyzed");
    }

    LifecycleOutcome outcome;
    std::error_code ec;
    if (record->imagePath.empty() || !std::filesystem::exists(record->imagePath, ec)) {
        outcome.disposition = ImageDisposition::Missing;
    } else if (m_config.lifecyclePolicy == LifecyclePolicy::Archive) {
        outcome = archiveImage(*record);
    } else {
        outcome = deleteImage(*record);
    }

    m_store.recordImageDisposition(captureId, outcome.disposition, outcome.archivedPath);
    logDisposition(captureId, outcome, record->imagePath);
    return outcome;
}

LifecycleOutcome ImageLifecycleManager::deleteImage(const CaptureRecord &record)
{
    LifecycleOutcome outcome;
    std::error_code ec;
    if (std::filesystem::remove(record.imagePath, ec)) {
        outcome.disposition = ImageDisposition::Deleted;
    } else if (ec) {
        logKept(record.id, record.imagePath, ec);
        outcome.disposition = ImageDisposition::Kept;
    } else {
        outcome.disposition = ImageDisposition::Missing;
    }
    return outcome;
}

LifecycleOutcome ImageLifecycleManager::archiveImage(const CaptureRecord &record)
{
    LifecycleOutcome outcome;
    const std::filesystem::path source(record.imagePath);
    std::filesystem::path target = archiveTarget(record);

    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        logKept(record.id, record.imagePath, ec);
        outcome.disposition = ImageDisposition::Kept;
        return outcome;
    }
    target = uniquePath(target);

    std::filesystem::rename(source, target, ec);
    if (ec == std::errc::cross_device_link) {
        ec.clear();
        std::filesystem::copy_file(source, target, ec);
        if (!ec) {
            std::filesystem::remove(source, ec);
            if (ec) {
                // The copy is complete; only the original could not be removed.
                logKept(record.id, record.imagePath, ec);
                ec.clear();
            }
        }
    }
    if (ec) {
        logKept(record.id, record.imagePath, ec);
        outcome.disposition = ImageDisposition::Kept;
        return outcome;
    }

    outcome.disposition = ImageDisposition::Archived;
    outcome.archivedPath = target.string();
    return outcome;
}

} // namespace mirulog
