#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace mirulog {

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// CaptureStore is the SQLite access layer for one shard: capture records,
// their analysis results, and a small meta table.
//
// Status moves pending -> analyzing -> analyzed|failed. The only backwards
// edge is the explicit failed -> pending requeue. Every write either commits
// completely or throws StoreError and leaves the row untouched.
class CaptureStore {
public:
    enum class OpenMode {
        ReadWrite,
        ReadOnly
    };

    explicit CaptureStore(const std::filesystem::path &dbPath,
                          OpenMode mode = OpenMode::ReadWrite);
    ~CaptureStore();

    CaptureStore(const CaptureStore &) = delete;
    CaptureStore &operator=(const CaptureStore &) = delete;

    const std::filesystem::path &path() const;
    bool isReadOnly() const;

    // Capture scheduler side. The record is always stored as pending; the
    // assigned id is returned.
    std::int64_t addCapture(const CaptureRecord &record);

    std::optional<CaptureRecord> getCapture(std::int64_t id) const;
    std::optional<AnalysisResult> getAnalysis(std::int64_t id) const;

    // Oldest first. Analyzing rows whose claim is older than
    // leaseExpiredBefore are returned as well. limit <= 0 means no limit.
    std::vector<CaptureRecord> pendingCaptures(
        int limit,
        std::optional<std::chrono::system_clock::time_point> leaseExpiredBefore = std::nullopt) const;
    int pendingCount(
        std::optional<std::chrono::system_clock::time_point> leaseExpiredBefore = std::nullopt) const;
    int countByStatus(CaptureStatus status) const;

    // Conditional pending -> analyzing update. Returns false when another
    // claimer got there first or the row is no longer claimable.
    bool claimForAnalysis(
        std::int64_t id,
        const std::string &owner,
        std::chrono::system_clock::time_point now,
        std::optional<std::chrono::system_clock::time_point> leaseExpiredBefore = std::nullopt);

    // Write the analysis row and move the capture out of analyzing in one
    // transaction. Returns false and writes nothing when owner no longer
    // holds the claim (the row left analyzing, or its lease expired and
    // another claimer took it).
    bool markAnalyzed(const AnalysisResult &result, const std::string &owner);
    bool markFailed(const AnalysisResult &result, const std::string &owner);

    void recordImageDisposition(std::int64_t id,
                                ImageDisposition disposition,
                                const std::string &archivedPath);

    // failed -> pending. With no id every failed capture is requeued.
    int requeueFailed(std::optional<std::int64_t> id = std::nullopt);

    // Captures joined with their analysis, ordered by capture time.
    std::vector<CaptureEntry> listEntries(
        std::optional<std::chrono::system_clock::time_point> from = std::nullopt,
        std::optional<std::chrono::system_clock::time_point> to = std::nullopt) const;

    std::optional<std::string> getMeta(const std::string &key) const;
    void setMeta(const std::string &key, const std::string &value);

    // False when SQLite reports damage; throws StoreError if the check cannot run.
    bool integrityCheck(std::string *message) const;

private:
    bool finishAnalysis(const AnalysisResult &result,
                        const std::string &owner,
                        CaptureStatus target);

    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace mirulog
