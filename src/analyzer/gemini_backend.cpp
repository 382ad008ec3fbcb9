#include "analyzer/gemini_backend.hpp"

#include <nlohmann/json.hpp>

#include "analyzer/analysis_payload.hpp"
#include "common/logging.hpp"

namespace mirulog {

namespace {

std::optional<std::chrono::milliseconds> parseSecondsText(const std::string &value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    try {
        return retryHintFromSeconds(std::stod(value));
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

// Retry-After header first, then google.rpc.RetryInfo in the error details.
std::optional<std::chrono::milliseconds> retryHint(const HttpResponse &response,
                                                   const nlohmann::json &error)
{
    if (const auto header = response.header("Retry-After")) {
        if (auto hint = parseSecondsText(header->trimmed().toStdString())) {
            return hint;
        }
    }
    const auto details = error.find("details");
    if (details == error.end() || !details->is_array()) {
        return std::nullopt;
    }
    for (const auto &detail : *details) {
        if (!detail.is_object()) {
            continue;
        }
        const std::string type = detail.value("@type", std::string());
        if (type.find("RetryInfo") == std::string::npos) {
            continue;
        }
        const auto delay = detail.find("retryDelay");
        if (delay != detail.end() && delay->is_string()) {
            return parseSecondsText(delay->get<std::string>());
        }
    }
    return std::nullopt;
}

bool mentionsInvalidKey(const nlohmann::json &error)
{
    if (error.value("message", std::string()).find("API key not valid") != std::string::npos) {
        return true;
    }
    const auto details = error.find("details");
    if (details == error.end() || !details->is_array()) {
        return false;
    }
    for (const auto &detail : *details) {
        if (detail.is_object() && detail.value("reason", std::string()) == "API_KEY_INVALID") {
            return true;
        }
    }
    return false;
}

std::string responseText(const nlohmann::json &body)
{
    const auto candidates = body.find("candidates");
    if (candidates == body.end() || !candidates->is_array() || candidates->empty()) {
        return {};
    }
    const auto &candidate = candidates->front();
    const auto content = candidate.find("content");
    if (content == candidate.end() || !content->is_object()) {
        return {};
    }
    const auto parts = content->find("parts");
    if (parts == content->end() || !parts->is_array()) {
        return {};
    }
    std::string text;
    for (const auto &part : *parts) {
        if (part.is_object() && part.contains("text") && part["text"].is_string()) {
            text += part["text"].get<std::string>();
        }
    }
    return text;
}

} // namespace

BackendError classifyGeminiFailure(const HttpResponse &response)
{
    if (response.error == TransportError::Timeout) {
        return BackendError(ErrorKind::Transient, "Gemini request timed out");
    }
    if (response.error != TransportError::None) {
        return BackendError(ErrorKind::Transient,
                            "Gemini request failed: " + response.errorString.toStdString());
    }

    const nlohmann::json body = nlohmann::json::parse(response.body.toStdString(), nullptr, false);
    nlohmann::json error = nlohmann::json::object();
    if (!body.is_discarded() && body.is_object() && body.contains("error") && body["error"].is_object()) {
        error = body["error"];
    }
    const std::string status = error.value("status", std::string());
    std::string message = error.value("message", std::string());
    if (message.empty()) {
        message = response.body.left(512).toStdString();
    }
    const std::string detail = "Gemini HTTP " + std::to_string(response.status) + ": " + message;

    if (response.status == 401 || response.status == 403 || mentionsInvalidKey(error)) {
        return BackendError(ErrorKind::Authentication, detail);
    }
    if (response.status == 429 || status == "RESOURCE_EXHAUSTED") {
        return BackendError(ErrorKind::RateLimited, detail, retryHint(response, error));
    }
    if (response.status == 408 || response.status >= 500) {
        return BackendError(ErrorKind::Transient, detail, retryHint(response, error));
    }
    return BackendError(ErrorKind::Rejected, detail);
}

GeminiBackend::GeminiBackend(GeminiConfig config, HttpTransport &transport)
    : m_config(std::move(config))
    , m_transport(transport)
{
}

std::string GeminiBackend::backendId() const
{
    return "gemini";
}

std::string GeminiBackend::modelName() const
{
    return m_config.model;
}

int GeminiBackend::defaultBatchLimit() const
{
    return kDefaultBatchLimit;
}

RawAnalysis GeminiBackend::analyze(const AnalysisRequest &request)
{
    if (request.imageBytes.isEmpty()) {
        throw BackendError(ErrorKind::MissingImage, "image is empty");
    }

    nlohmann::json payload;
    payload["contents"] = nlohmann::json::array({
        nlohmann::json{
            {"role", "user"},
            {"parts", nlohmann::json::array({
                nlohmann::json{{"text", analysisInstructions() + "\n" + analysisContextText(request)}},
                nlohmann::json{{"inline_data", {
                    {"mime_type", request.mimeType},
                    {"data", request.imageBytes.toBase64().toStdString()}
                }}}
            })}
        }
    });
    payload["generationConfig"] = {
        {"maxOutputTokens", m_config.maxTokens},
        {"temperature", m_config.temperature},
        {"responseMimeType", "application/json"}
    };

    HttpRequest httpRequest;
    httpRequest.method = "POST";
    httpRequest.url = QUrl(QString::fromStdString(m_config.endpoint + "/models/" + m_config.model
                                                  + ":generateContent"));
    httpRequest.headers = {
        {"Content-Type", "application/json"},
        {"x-goog-api-key", QByteArray::fromStdString(m_config.apiKey)}
    };
    httpRequest.body = QByteArray::fromStdString(payload.dump());
    httpRequest.timeout = std::chrono::seconds(m_config.timeoutSeconds);

    const HttpResponse response = m_transport.send(httpRequest);
    if (response.error != TransportError::None || response.status < 200 || response.status >= 300) {
        throw classifyGeminiFailure(response);
    }

    const nlohmann::json body = nlohmann::json::parse(response.body.toStdString(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw BackendError(ErrorKind::Transient, "Gemini returned a body that is not JSON");
    }

    std::string text = responseText(body);
    if (text.empty()) {
        const auto feedback = body.find("promptFeedback");
        if (feedback != body.end() && feedback->is_object() && feedback->contains("blockReason")) {
            throw BackendError(ErrorKind::Rejected,
                               "Gemini blocked the request: " + (*feedback)["blockReason"].dump());
        }
        MLOG_WARN(QStringLiteral("GeminiBackend"),
                  QStringLiteral("analyze"),
                  QStringLiteral("gemini_empty_response"),
                  QStringLiteral("no text parts in first candidate"),
                  QStringLiteral("treating as empty object"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"model", m_config.model}});
        text = "{}";
    }

    return RawAnalysis{text, m_config.model};
}

} // namespace mirulog
