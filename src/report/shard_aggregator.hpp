#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace mirulog {

struct ShardSource {
    std::string name;
    std::filesystem::path databasePath;
};

struct MergedEntry {
    std::string shard;
    CaptureEntry entry;
};

// Subdirectories of root that hold a mirulog.db, ordered by name.
std::vector<ShardSource> discoverShards(const std::filesystem::path &root);

// Read-only merge of several shard stores into one timeline. Output is
// ordered by capture time, then shard name, then capture id.
class ShardAggregator {
public:
    explicit ShardAggregator(std::vector<ShardSource> shards);

    std::vector<MergedEntry> merge(
        std::optional<std::chrono::system_clock::time_point> from = std::nullopt,
        std::optional<std::chrono::system_clock::time_point> to = std::nullopt);

    // Shards that could not be opened during the last merge.
    const std::vector<std::string> &skippedShards() const;

private:
    std::vector<ShardSource> m_shards;
    std::vector<std::string> m_skipped;
};

} // namespace mirulog
