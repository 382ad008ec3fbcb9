#include "report/shard_aggregator.hpp"

#include <algorithm>
#include <queue>
#include <tuple>

#include "common/logging.hpp"
#include "store/capture_store.hpp"

namespace mirulog {

namespace {

constexpr const char *kDatabaseName = "mirulog.db";

struct Cursor {
    std::size_t shard = 0;
    std::size_t index = 0;
};

} // namespace

std::vector<ShardSource> discoverShards(const std::filesystem::path &root)
{
    std::vector<ShardSource> shards;
    std::error_code ec;
    std::filesystem::directory_iterator it(root, ec);
    if (ec) {
        MLOG_WARN(QStringLiteral("ShardAggregator"),
                  QStringLiteral("discoverShards"),
                  QStringLiteral("shard_root_unreadable"),
                  QStringLiteral("cannot list aggregation root"),
                  QStringLiteral("no shards"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"root", root.string()},
                                 {"error", ec.message()}});
        return shards;
    }
    for (const auto &entry : it) {
        if (!entry.is_directory(ec)) {
            continue;
        }
        const auto dbPath = entry.path() / kDatabaseName;
        if (std::filesystem::is_regular_file(dbPath, ec)) {
            shards.push_back(ShardSource{entry.path().filename().string(), dbPath});
        }
    }
    std::sort(shards.begin(), shards.end(), [](const ShardSource &a, const ShardSource &b) {
        return a.name < b.name;
    });
    return shards;
}

ShardAggregator::ShardAggregator(std::vector<ShardSource> shards)
    : m_shards(std::move(shards))
{
}

const std::vector<std::string> &ShardAggregator::skippedShards() const
{
    return m_skipped;
}

std::vector<MergedEntry> ShardAggregator::merge(
    std::optional<std::chrono::system_clock::time_point> from,
    std::optional<std::chrono::system_clock::time_point> to)
{
    m_skipped.clear();

    std::vector<std::string> names;
    std::vector<std::vector<CaptureEntry>> perShard;
    for (const auto &shard : m_shards) {
        try {
            CaptureStore store(shard.databasePath, CaptureStore::OpenMode::ReadOnly);
            perShard.push_back(store.listEntries(from, to));
            names.push_back(shard.name);
        } catch (const StoreError &ex) {
            m_skipped.push_back(shard.name);
            MLOG_WARN(QStringLiteral("ShardAggregator"),
                      QStringLiteral("merge"),
                      QStringLiteral("shard_skipped"),
                      QStringLiteral("shard could not be read"),
                      QStringLiteral("continuing with remaining shards"),
                      mirulog::logging::defaultWho(),
                      QString(),
                      nlohmann::json{{"shard", shard.name},
                                     {"path", shard.databasePath.string()},
                                     {"error", ex.what()}});
        }
    }

    auto key = [&](const Cursor &c) {
        const auto &capture = perShard[c.shard][c.index].capture;
        return std::tie(capture.capturedAt, names[c.shard], capture.id);
    };
    // Min-heap on (timestamp, shard name, id).
    auto later = [&](const Cursor &a, const Cursor &b) {
        return key(a) > key(b);
    };
    std::priority_queue<Cursor, std::vector<Cursor>, decltype(later)> heap(later);

    std::size_t total = 0;
    for (std::size_t i = 0; i < perShard.size(); ++i) {
        total += perShard[i].size();
        if (!perShard[i].empty()) {
            heap.push(Cursor{i, 0});
        }
    }

    std::vector<MergedEntry> merged;
    merged.reserve(total);
    while (!heap.empty()) {
        const Cursor top = heap.top();
        heap.pop();
        merged.push_back(MergedEntry{names[top.shard], perShard[top.shard][top.index]});
        if (top.index + 1 < perShard[top.shard].size()) {
            heap.push(Cursor{top.shard, top.index + 1});
        }
    }

    MLOG_INFO(QStringLiteral("ShardAggregator"),
              QStringLiteral("merge"),
              QStringLiteral("shards_merged"),
              QStringLiteral("multi-host report"),
              QStringLiteral("k-way merge by timestamp"),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"shards", names.size()},
                             {"skipped", m_skipped.size()},
                             {"entries", merged.size()}});
    return merged;
}

} // namespace mirulog
