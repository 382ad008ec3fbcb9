#pragma once

#include <optional>

#include "analyzer/analysis_backend.hpp"
#include "analyzer/http_transport.hpp"
#include "common/config.hpp"

namespace mirulog {

// OpenAI-compatible chat completions endpoint (LM Studio, llama.cpp server,
// Ollama). A model of "auto" or "local-model" is resolved once through
// GET {base}/models and the first listed id is used for the rest of the run.
class LocalLlmBackend : public AnalysisBackend {
public:
    LocalLlmBackend(LocalLlmConfig config, HttpTransport &transport);

    std::string backendId() const override;
    std::string modelName() const override;
    int defaultBatchLimit() const override;

    RawAnalysis analyze(const AnalysisRequest &request) override;

private:
    const std::string &resolveModel();
    HttpResponse postChat(const std::string &model,
                          const AnalysisRequest &request,
                          bool withResponseFormat);

    LocalLlmConfig m_config;
    HttpTransport &m_transport;
    std::optional<std::string> m_resolvedModel;
};

BackendError classifyLocalLlmFailure(const HttpResponse &response);

// True when an error body says the loaded model cannot take images.
bool indicatesUnsupportedImage(const QByteArray &body);

} // namespace mirulog
