#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace mirulog {

struct CaptureRecord {
    std::int64_t id = 0;
    std::chrono::system_clock::time_point capturedAt;
    std::string windowTitle;
    std::string processName;
    std::string contentHash;
    std::string imagePath;
    std::string hostName;
    SessionState sessionState = SessionState::Active;
    CaptureStatus status = CaptureStatus::Pending;
    std::chrono::system_clock::time_point statusChangedAt;
};

// Best-effort fields derived from the backend payload. Any of them may be empty.
struct AnalysisFields {
    std::string summary;
    std::string primaryTask;
    double confidence = 0.0;
    std::vector<std::string> tags;
    std::vector<std::string> observedFiles;
    std::vector<std::string> observedRepositories;
    std::vector<std::string> observedUrls;
};

struct AnalysisResult {
    std::int64_t captureId = 0;
    std::string backend;
    std::string model;
    std::string rawResponse;
    AnalysisFields fields;

    // Only set when the capture ended up failed.
    std::string errorDetail;

    int retryCount = 0;
    int failureCount = 0;
    std::chrono::system_clock::time_point lastAttemptAt;

    ImageDisposition imageDisposition = ImageDisposition::None;
    std::string archivedPath;
};

struct CaptureEntry {
    CaptureRecord capture;
    std::optional<AnalysisResult> analysis;
};

} // namespace mirulog
