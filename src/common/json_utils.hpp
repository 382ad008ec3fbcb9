#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace mirulog {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
#if defined(_WIN32)
    std::time_t time = _mkgmtime(&tm);
#else
    std::time_t time = timegm(&tm);
#endif
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toStatusString(CaptureStatus status)
{
    switch (status) {
    case CaptureStatus::Pending:
        return "pending";
    case CaptureStatus::Analyzing:
        return "analyzing";
    case CaptureStatus::Analyzed:
        return "analyzed";
    case CaptureStatus::Failed:
        return "failed";
    }
    return "pending";
}

inline CaptureStatus parseStatusString(const std::string &value)
{
    if (value == "analyzing") {
        return CaptureStatus::Analyzing;
    }
    if (value == "analyzed") {
        return CaptureStatus::Analyzed;
    }
    if (value == "failed") {
        return CaptureStatus::Failed;
    }
    return CaptureStatus::Pending;
}

inline std::string toSessionStateString(SessionState state)
{
    switch (state) {
    case SessionState::Idle:
        return "idle";
    case SessionState::Active:
        return "active";
    case SessionState::Locked:
        return "locked";
    }
    return "active";
}

inline SessionState parseSessionStateString(const std::string &value)
{
    if (value == "idle") {
        return SessionState::Idle;
    }
    if (value == "locked") {
        return SessionState::Locked;
    }
    return SessionState::Active;
}

inline std::string toDispositionString(ImageDisposition disposition)
{
    switch (disposition) {
    case ImageDisposition::None:
        return "";
    case ImageDisposition::Deleted:
        return "deleted";
    case ImageDisposition::Archived:
        return "archived";
    case ImageDisposition::Missing:
        return "missing";
    case ImageDisposition::Kept:
        return "kept";
    }
    return "";
}

inline ImageDisposition parseDispositionString(const std::string &value)
{
    if (value == "deleted") {
        return ImageDisposition::Deleted;
    }
    if (value == "archived") {
        return ImageDisposition::Archived;
    }
    if (value == "missing") {
        return ImageDisposition::Missing;
    }
    if (value == "kept") {
        return ImageDisposition::Kept;
    }
    return ImageDisposition::None;
}

inline void to_json(nlohmann::json &j, const CaptureStatus &status)
{
    j = toStatusString(status);
}

inline void to_json(nlohmann::json &j, const AnalysisFields &fields)
{
    j = nlohmann::json{
        {"description", fields.summary},
        {"primary_task", fields.primaryTask},
        {"confidence", fields.confidence},
        {"tags", fields.tags},
        {"observed_files", fields.observedFiles},
        {"observed_repositories", fields.observedRepositories},
        {"observed_urls", fields.observedUrls}
    };
}

inline void to_json(nlohmann::json &j, const CaptureRecord &record)
{
    j = nlohmann::json{
        {"id", record.id},
        {"capturedAt", toIso8601Utc(record.capturedAt)},
        {"windowTitle", record.windowTitle},
        {"processName", record.processName},
        {"contentHash", record.contentHash},
        {"imagePath", record.imagePath},
        {"hostName", record.hostName},
        {"sessionState", toSessionStateString(record.sessionState)},
        {"status", record.status}
    };
}

inline void to_json(nlohmann::json &j, const AnalysisResult &result)
{
    j = nlohmann::json{
        {"captureId", result.captureId},
        {"backend", result.backend},
        {"model", result.model},
        {"fields", result.fields},
        {"retryCount", result.retryCount},
        {"failureCount", result.failureCount},
        {"lastAttemptAt", toIso8601Utc(result.lastAttemptAt)},
        {"imageDisposition", toDispositionString(result.imageDisposition)}
    };
    if (!result.errorDetail.empty()) {
        j["error"] = result.errorDetail;
    }
    if (!result.archivedPath.empty()) {
        j["archivedPath"] = result.archivedPath;
    }
}

inline void to_json(nlohmann::json &j, const CaptureEntry &entry)
{
    j = nlohmann::json{{"capture", entry.capture}};
    if (entry.analysis.has_value()) {
        j["analysis"] = *entry.analysis;
    } else {
        j["analysis"] = nullptr;
    }
}

} // namespace mirulog
