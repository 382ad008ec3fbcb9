#include "analyzer/analysis_payload.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace mirulog {

namespace {

constexpr double kDefaultConfidence = 0.6;

std::string trim(const std::string &value)
{
    const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c);
    });
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) {
        return std::isspace(c);
    }).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string stripCodeFence(const std::string &text)
{
    std::string cleaned = trim(text);
    if (cleaned.rfind("```", 0) != 0) {
        return cleaned;
    }
    const auto newline = cleaned.find('\n');
    if (newline == std::string::npos) {
        return {};
    }
    cleaned = cleaned.substr(newline + 1);
    const auto fence = cleaned.find("```");
    if (fence != std::string::npos) {
        cleaned = cleaned.substr(0, fence);
    }
    return trim(cleaned);
}

bool tryParseObject(const std::string &text, nlohmann::json *out)
{
    nlohmann::json parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return false;
    }
    *out = std::move(parsed);
    return true;
}

std::vector<std::string> stringList(const nlohmann::json &payload, const char *key)
{
    std::vector<std::string> values;
    const auto it = payload.find(key);
    if (it == payload.end()) {
        return values;
    }
    if (it->is_string()) {
        if (!it->get<std::string>().empty()) {
            values.push_back(it->get<std::string>());
        }
        return values;
    }
    if (!it->is_array()) {
        return values;
    }
    for (const auto &item : *it) {
        if (item.is_null()) {
            continue;
        }
        values.push_back(item.is_string() ? item.get<std::string>() : item.dump());
    }
    return values;
}

std::string stringField(const nlohmann::json &payload, const char *key)
{
    const auto it = payload.find(key);
    if (it == payload.end() || !it->is_string()) {
        return {};
    }
    return trim(it->get<std::string>());
}

double confidenceField(const nlohmann::json &payload)
{
    const auto it = payload.find("confidence");
    if (it == payload.end()) {
        return kDefaultConfidence;
    }
    if (it->is_number()) {
        return std::clamp(it->get<double>(), 0.0, 1.0);
    }
    if (it->is_string()) {
        try {
            return std::clamp(std::stod(it->get<std::string>()), 0.0, 1.0);
        } catch (const std::exception &) {
            return kDefaultConfidence;
        }
    }
    return kDefaultConfidence;
}

bool looksLikeRemoteDesktop(const AnalysisRequest &request)
{
    const std::string title = toLower(request.windowTitle);
    const std::string process = toLower(request.processName);
    for (const char *marker : {"remote desktop", "rdp", "mstsc", "msrdc", "remmina", "xfreerdp"}) {
        if (title.find(marker) != std::string::npos || process.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace

std::string analysisInstructions()
{
    return "You are Miru-Log, a meticulous self-tracking assistant. You receive desktop "
           "screenshots and contextual metadata.\n"
           "Analyze what the user was doing. Respond strictly as compact JSON with keys:\n"
           "  - description: 1 sentence summary of the activity.\n"
           "  - primary_task: concise task label (<=6 words).\n"
           "  - tags: array of activity tags/keywords.\n"
           "  - confidence: float between 0 and 1 reflecting your certainty.\n"
           "  - observed_files: array of file paths/names you can read from the screenshot (if any).\n"
           "  - observed_repositories: array of repository/workspace names you can read from the "
           "screenshot (if any).\n"
           "  - observed_urls: array of http(s) URLs you can read from the screenshot (if any).\n"
           "Focus on observable actions only.\n"
           "If you cannot confidently read items, return empty arrays for those keys.";
}

std::string analysisContextText(const AnalysisRequest &request)
{
    std::string text;
    text += "Timestamp: " + toIso8601Utc(request.capturedAt) + "\n";
    text += "Window: " + request.windowTitle + "\n";
    text += "Application: " + request.processName + "\n";
    if (looksLikeRemoteDesktop(request)) {
        text += "\nIMPORTANT (RDP): Describe what is happening inside the remote session "
                "(apps, code, browser, docs, errors) instead of summarizing it as using remote "
                "desktop. Only mention the remote session if the actual work cannot be inferred.\n";
    }
    if (!request.extraContext.empty()) {
        text += request.extraContext + "\n";
    }
    return text;
}

AnalysisFields parseAnalysisPayload(const std::string &text, bool *parsedJson)
{
    const std::string cleaned = stripCodeFence(text);

    nlohmann::json payload = nlohmann::json::object();
    bool parsed = tryParseObject(cleaned, &payload);
    if (!parsed) {
        const auto open = cleaned.find('{');
        const auto close = cleaned.rfind('}');
        if (open != std::string::npos && close != std::string::npos && close > open) {
            parsed = tryParseObject(cleaned.substr(open, close - open + 1), &payload);
        }
    }
    if (!parsed) {
        payload = nlohmann::json::object();
        MLOG_WARN(QStringLiteral("AnalysisPayload"),
                  QStringLiteral("parseAnalysisPayload"),
                  QStringLiteral("payload_not_json"),
                  QStringLiteral("model output did not contain a JSON object"),
                  QStringLiteral("keeping raw text as summary"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"length", text.size()}});
    }
    if (parsedJson) {
        *parsedJson = parsed;
    }

    AnalysisFields fields;
    fields.summary = stringField(payload, "description");
    if (fields.summary.empty()) {
        fields.summary = trim(text);
    }
    fields.primaryTask = stringField(payload, "primary_task");
    if (fields.primaryTask.empty()) {
        fields.primaryTask = "Unclassified";
    }
    fields.confidence = confidenceField(payload);
    fields.tags = stringList(payload, "tags");
    fields.observedFiles = stringList(payload, "observed_files");
    fields.observedRepositories = stringList(payload, "observed_repositories");
    fields.observedUrls = stringList(payload, "observed_urls");
    return fields;
}

} // namespace mirulog
