#include "report/ReportCli.hpp"

#include <filesystem>
#include <iostream>

#include <QDateTime>

#include "common/cli_args.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "report/shard_aggregator.hpp"
#include "store/capture_store.hpp"

namespace mirulog {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  mirulog-report pending --db PATH\n"
        "  mirulog-report merged --root PATH [--from ISO --to ISO] [--format markdown|json]\n"
        "  mirulog-report requeue --db PATH [--id N]\n");
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("markdown");
    }
    return value.toLower();
}

std::string formatLocalTime(std::chrono::system_clock::time_point timestamp)
{
    QDateTime dt = QDateTime::fromMSecsSinceEpoch(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            timestamp.time_since_epoch())
            .count(),
        Qt::UTC);
    dt = dt.toLocalTime();
    return dt.toString("yyyy-MM-dd HH:mm:ss").toStdString();
}

std::string joined(const std::vector<std::string> &values)
{
    std::string out;
    for (const auto &value : values) {
        if (!out.empty()) {
            out += ", ";
        }
        out += value;
    }
    return out;
}

void renderMergedMarkdown(const std::vector<MergedEntry> &entries,
                          const std::vector<std::string> &skipped)
{
    std::cout << "# Miru-Log Merged Timeline\n\n";
    std::cout << "Total captures: " << entries.size() << "\n";
    if (!skipped.empty()) {
        std::cout << "Skipped shards: " << joined(skipped) << "\n";
    }
    std::cout << "\n## Captures\n\n";

    if (entries.empty()) {
        std::cout << "No captures in this period.\n";
        return;
    }

    for (const auto &merged : entries) {
        const auto &capture = merged.entry.capture;
        std::cout << "- [" << formatLocalTime(capture.capturedAt) << "] ("
                  << merged.shard << ", " << toStatusString(capture.status) << ") "
                  << capture.processName << ": " << capture.windowTitle << "\n";
        if (!merged.entry.analysis) {
            continue;
        }
        const auto &analysis = *merged.entry.analysis;
        if (capture.status == CaptureStatus::Failed) {
            std::cout << "  - error: " << analysis.errorDetail << "\n";
            continue;
        }
        std::cout << "  - task: " << analysis.fields.primaryTask << "\n";
        if (!analysis.fields.summary.empty()) {
            std::cout << "  - summary: " << analysis.fields.summary << "\n";
        }
        if (!analysis.fields.tags.empty()) {
            std::cout << "  - tags: " << joined(analysis.fields.tags) << "\n";
        }
    }
}

void renderMergedJson(const std::vector<MergedEntry> &entries,
                      const std::vector<std::string> &skipped)
{
    nlohmann::json payload;
    payload["generatedAt"] =
        QDateTime::currentDateTimeUtc().toString(Qt::ISODate).toStdString();
    payload["totalCaptures"] = entries.size();
    payload["skippedShards"] = skipped;
    payload["captures"] = nlohmann::json::array();
    for (const auto &merged : entries) {
        nlohmann::json item = merged.entry;
        item["shard"] = merged.shard;
        payload["captures"].push_back(item);
    }
    std::cout << payload.dump(2) << std::endl;
}

} // namespace

int ReportCli::run(int argc, char *argv[])
{
    const QStringList args = toArgList(argc, argv);

    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    MLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("run"),
              QStringLiteral("report_cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"command", command.toStdString()}});
    if (command == QStringLiteral("pending")) {
        return runPendingCount(args);
    }
    if (command == QStringLiteral("merged")) {
        return runMergedReport(args);
    }
    if (command == QStringLiteral("requeue")) {
        return runRequeue(args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int ReportCli::runPendingCount(const QStringList &args)
{
    // Prints NA instead of failing so status bars can poll it.
    const QString dbValue = getArgValue(args, QStringLiteral("--db"));
    if (dbValue.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const std::filesystem::path dbPath(dbValue.toStdString());
    std::error_code ec;
    if (!std::filesystem::is_regular_file(dbPath, ec)) {
        std::cout << "NA" << std::endl;
        return 0;
    }

    try {
        CaptureStore store(dbPath, CaptureStore::OpenMode::ReadOnly);
        std::cout << store.pendingCount() << std::endl;
    } catch (const StoreError &ex) {
        MLOG_WARN(QStringLiteral("ReportCli"),
                  QStringLiteral("runPendingCount"),
                  QStringLiteral("pending_count_unavailable"),
                  QStringLiteral("shard could not be read"),
                  QStringLiteral("printing NA"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"db", dbPath.string()},
                                 {"error", ex.what()}});
        std::cout << "NA" << std::endl;
    }
    return 0;
}

int ReportCli::runMergedReport(const QStringList &args)
{
    const QString rootValue = getArgValue(args, QStringLiteral("--root"));
    if (rootValue.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));
    std::optional<std::chrono::system_clock::time_point> from;
    std::optional<std::chrono::system_clock::time_point> to;
    if (!fromValue.isEmpty()) {
        from = parseIso8601(fromValue);
        if (!from) {
            std::cerr << "Invalid ISO8601 timestamp." << std::endl;
            return 1;
        }
    }
    if (!toValue.isEmpty()) {
        to = parseIso8601(toValue);
        if (!to) {
            std::cerr << "Invalid ISO8601 timestamp." << std::endl;
            return 1;
        }
    }

    const QString format = getFormat(args);
    if (format != QStringLiteral("markdown") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use markdown or json." << std::endl;
        return 1;
    }

    const std::filesystem::path root(rootValue.toStdString());
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        std::cerr << "Root path does not exist." << std::endl;
        return 1;
    }

    ShardAggregator aggregator(discoverShards(root));
    const auto entries = aggregator.merge(from, to);

    MLOG_INFO(QStringLiteral("ReportCli"),
              QStringLiteral("runMergedReport"),
              QStringLiteral("report_merged"),
              QStringLiteral("user_invocation"),
              QStringLiteral("shard_merge"),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"entries", entries.size()},
                             {"format", format.toStdString()}});
    if (format == QStringLiteral("json")) {
        renderMergedJson(entries, aggregator.skippedShards());
    } else {
        renderMergedMarkdown(entries, aggregator.skippedShards());
    }
    return 0;
}

int ReportCli::runRequeue(const QStringList &args)
{
    const QString dbValue = getArgValue(args, QStringLiteral("--db"));
    if (dbValue.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    std::optional<std::int64_t> id;
    const QString idValue = getArgValue(args, QStringLiteral("--id"));
    if (!idValue.isEmpty()) {
        bool ok = false;
        id = idValue.toLongLong(&ok);
        if (!ok) {
            std::cerr << "Invalid capture id." << std::endl;
            return 1;
        }
    }

    const std::filesystem::path dbPath(dbValue.toStdString());
    std::error_code ec;
    if (!std::filesystem::is_regular_file(dbPath, ec)) {
        std::cerr << "Database does not exist." << std::endl;
        return 1;
    }

    try {
        CaptureStore store(dbPath);
        const int requeued = store.requeueFailed(id);
        MLOG_INFO(QStringLiteral("ReportCli"),
                  QStringLiteral("runRequeue"),
                  QStringLiteral("failed_requeued"),
                  QStringLiteral("user_invocation"),
                  QStringLiteral("failed -> pending"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"count", requeued},
                                 {"db", dbPath.string()}});
        std::cout << requeued << std::endl;
    } catch (const StoreError &ex) {
        std::cerr << "Store error: " << ex.what() << std::endl;
        return 2;
    }
    return 0;
}

std::optional<std::chrono::system_clock::time_point> ReportCli::parseIso8601(
    const QString &value) const
{
    const auto parsed = fromIso8601Utc(value.toStdString());
    if (parsed == std::chrono::system_clock::time_point{}) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace mirulog
