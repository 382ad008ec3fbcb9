#pragma once

#include "analyzer/analysis_backend.hpp"
#include "analyzer/http_transport.hpp"
#include "common/config.hpp"

namespace mirulog {

// Remote Gemini generateContent over REST.
class GeminiBackend : public AnalysisBackend {
public:
    GeminiBackend(GeminiConfig config, HttpTransport &transport);

    std::string backendId() const override;
    std::string modelName() const override;
    int defaultBatchLimit() const override;

    RawAnalysis analyze(const AnalysisRequest &request) override;

    static constexpr int kDefaultBatchLimit = 20;

private:
    GeminiConfig m_config;
    HttpTransport &m_transport;
};

// Maps a non-2xx or failed Gemini response onto a BackendError.
BackendError classifyGeminiFailure(const HttpResponse &response);

} // namespace mirulog
