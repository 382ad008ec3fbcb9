#include "analyzer/local_llm_backend.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "analyzer/analysis_payload.hpp"
#include "common/logging.hpp"

namespace mirulog {

namespace {

constexpr int kModelDiscoveryTimeoutSeconds = 10;

bool isPlaceholderModel(const std::string &model)
{
    QString lowered = QString::fromStdString(model).trimmed().toLower();
    return lowered.isEmpty() || lowered == QStringLiteral("auto")
        || lowered == QStringLiteral("local-model");
}

std::vector<std::pair<QByteArray, QByteArray>> baseHeaders(const LocalLlmConfig &config)
{
    std::vector<std::pair<QByteArray, QByteArray>> headers;
    headers.emplace_back("Content-Type", "application/json");
    if (!config.apiKey.empty()) {
        headers.emplace_back("Authorization", QByteArray("Bearer ") + QByteArray::fromStdString(config.apiKey));
    }
    return headers;
}

std::optional<std::chrono::milliseconds> retryAfterHeader(const HttpResponse &response)
{
    const auto header = response.header("Retry-After");
    if (!header) {
        return std::nullopt;
    }
    bool ok = false;
    const double seconds = header->trimmed().toDouble(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return retryHintFromSeconds(seconds);
}

std::string messageText(const nlohmann::json &body)
{
    const auto choices = body.find("choices");
    if (choices == body.end() || !choices->is_array() || choices->empty()) {
        return {};
    }
    const auto &choice = choices->front();
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object()) {
        return {};
    }
    const auto &content = choice["message"].value("content", nlohmann::json());
    if (content.is_string()) {
        return content.get<std::string>();
    }
    if (!content.is_array()) {
        return {};
    }
    // Some servers return structured content; join the text chunks.
    std::string text;
    for (const auto &item : content) {
        if (!item.is_object() || item.value("type", std::string()) != "text") {
            continue;
        }
        const std::string chunk = item.value("text", std::string());
        if (chunk.empty()) {
            continue;
        }
        if (!text.empty()) {
            text += "\n";
        }
        text += chunk;
    }
    return text;
}

} // namespace

bool indicatesUnsupportedImage(const QByteArray &body)
{
    const QString lowered = QString::fromUtf8(body).toLower();
    const bool aboutImages = lowered.contains(QStringLiteral("image"))
        || lowered.contains(QStringLiteral("vision"))
        || lowered.contains(QStringLiteral("multimodal"));
    if (!aboutImages) {
        return false;
    }
    for (const char *marker : {"not support", "unsupported", "cannot process", "no vision",
                               "does not have vision", "not a vision", "mmproj"}) {
        if (lowered.contains(QLatin1String(marker))) {
            return true;
        }
    }
    return false;
}

BackendError classifyLocalLlmFailure(const HttpResponse &response)
{
    switch (response.error) {
    case TransportError::ConnectionRefused:
        return BackendError(ErrorKind::ConnectionRefused,
                            "local LLM server refused the connection: "
                                + response.errorString.toStdString());
    case TransportError::Timeout:
        return BackendError(ErrorKind::Transient, "local LLM request timed out");
    case TransportError::Network:
        return BackendError(ErrorKind::Transient,
                            "local LLM request failed: " + response.errorString.toStdString());
    case TransportError::None:
        break;
    }

    const std::string detail = "Local LLM HTTP " + std::to_string(response.status) + ": "
        + response.body.left(512).toStdString();
    if (indicatesUnsupportedImage(response.body)) {
        return BackendError(ErrorKind::UnsupportedInput, detail);
    }
    if (response.status == 401 || response.status == 403) {
        return BackendError(ErrorKind::Authentication, detail);
    }
    if (response.status == 429) {
        return BackendError(ErrorKind::RateLimited, detail, retryAfterHeader(response));
    }
    if (response.status == 408 || response.status >= 500) {
        return BackendError(ErrorKind::Transient, detail, retryAfterHeader(response));
    }
    return BackendError(ErrorKind::Rejected, detail);
}

LocalLlmBackend::LocalLlmBackend(LocalLlmConfig config, HttpTransport &transport)
    : m_config(std::move(config))
    , m_transport(transport)
{
    if (!isPlaceholderModel(m_config.model)) {
        m_resolvedModel = m_config.model;
    }
}

std::string LocalLlmBackend::backendId() const
{
    return "local";
}

std::string LocalLlmBackend::modelName() const
{
    return m_resolvedModel ? *m_resolvedModel : m_config.model;
}

int LocalLlmBackend::defaultBatchLimit() const
{
    return 0;
}

const std::string &LocalLlmBackend::resolveModel()
{
    if (m_resolvedModel) {
        return *m_resolvedModel;
    }

    HttpRequest request;
    request.url = QUrl(QString::fromStdString(m_config.baseUrl + "/models"));
    request.headers = baseHeaders(m_config);
    request.timeout = std::chrono::seconds(std::min(kModelDiscoveryTimeoutSeconds, m_config.timeoutSeconds));

    const HttpResponse response = m_transport.send(request);
    if (response.error == TransportError::ConnectionRefused) {
        // Not cached: the server may come up before the next attempt.
        throw classifyLocalLlmFailure(response);
    }

    std::string chosen;
    if (response.error == TransportError::None && response.status >= 200 && response.status < 300) {
        const nlohmann::json body = nlohmann::json::parse(response.body.toStdString(), nullptr, false);
        if (!body.is_discarded() && body.is_object() && body.contains("data") && body["data"].is_array()
            && !body["data"].empty()) {
            const auto &first = body["data"].front();
            if (first.is_object() && first.contains("id")) {
                chosen = first["id"].is_string() ? first["id"].get<std::string>() : first["id"].dump();
            }
        }
    }

    if (chosen.empty()) {
        chosen = m_config.model.empty() ? std::string("local-model") : m_config.model;
        MLOG_WARN(QStringLiteral("LocalLlmBackend"),
                  QStringLiteral("resolveModel"),
                  QStringLiteral("local_model_discovery_failed"),
                  QStringLiteral("models endpoint gave no usable id"),
                  QStringLiteral("falling back to configured name"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"status", response.status},
                                 {"model", chosen}});
    } else {
        MLOG_INFO(QStringLiteral("LocalLlmBackend"),
                  QStringLiteral("resolveModel"),
                  QStringLiteral("local_model_selected"),
                  QStringLiteral("model configured as auto"),
                  QStringLiteral("first entry of GET /models"),
                  mirulog::logging::defaultWho(),
                  QString(),
                  nlohmann::json{{"model", chosen}});
    }
    m_resolvedModel = chosen;
    return *m_resolvedModel;
}

HttpResponse LocalLlmBackend::postChat(const std::string &model,
                                       const AnalysisRequest &request,
                                       bool withResponseFormat)
{
    const std::string dataUrl = "data:" + request.mimeType + ";base64,"
        + request.imageBytes.toBase64().toStdString();

    nlohmann::json payload;
    payload["model"] = model;
    payload["temperature"] = m_config.temperature;
    payload["max_tokens"] = m_config.maxTokens;
    payload["messages"] = nlohmann::json::array({
        nlohmann::json{{"role", "system"}, {"content", analysisInstructions()}},
        nlohmann::json{
            {"role", "user"},
            {"content", nlohmann::json::array({
                nlohmann::json{{"type", "text"}, {"text", analysisContextText(request)}},
                nlohmann::json{{"type", "image_url"}, {"image_url", {{"url", dataUrl}}}}
            })}
        }
    });
    if (withResponseFormat) {
        payload["response_format"] = {{"type", "json_object"}};
    }

    HttpRequest httpRequest;
    httpRequest.method = "POST";
    httpRequest.url = QUrl(QString::fromStdString(m_config.baseUrl + "/chat/completions"));
    httpRequest.headers = baseHeaders(m_config);
    httpRequest.body = QByteArray::fromStdString(payload.dump());
    httpRequest.timeout = std::chrono::seconds(m_config.timeoutSeconds);
    return m_transport.send(httpRequest);
}

RawAnalysis LocalLlmBackend::analyze(const AnalysisRequest &request)
{
    if (request.imageBytes.isEmpty()) {
        throw BackendError(ErrorKind::MissingImage, "image is empty");
    }

    const std::string model = resolveModel();

    HttpResponse response = postChat(model, request, true);
    if (response.error == TransportError::None
        && (response.status == 400 || response.status == 422)
        && !indicatesUnsupportedImage(response.body)) {
        // Not every server accepts response_format.
        MLOG_DEBUG(QStringLiteral("LocalLlmBackend"),
                   QStringLiteral("analyze"),
                   QStringLiteral("local_response_format_rejected"),
                   QStringLiteral("server rejected response_format"),
                   QStringLiteral("retrying once without it"),
                   mirulog::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"status", response.status}});
        response = postChat(model, request, false);
    }

    if (response.error != TransportError::None || response.status < 200 || response.status >= 300) {
        throw classifyLocalLlmFailure(response);
    }

    const nlohmann::json body = nlohmann::json::parse(response.body.toStdString(), nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        throw BackendError(ErrorKind::Transient, "local LLM returned a body that is not JSON");
    }

    std::string text = messageText(body);
    if (text.empty()) {
        text = "{}";
    }
    return RawAnalysis{text, model};
}

} // namespace mirulog
