#include "analyzer/backend_factory.hpp"

#include "analyzer/gemini_backend.hpp"
#include "analyzer/local_llm_backend.hpp"
#include "common/logging.hpp"

namespace mirulog {

std::unique_ptr<AnalysisBackend> makeBackend(const AppConfig &config, HttpTransport &transport)
{
    requireBackendCredentials(config);

    std::unique_ptr<AnalysisBackend> backend;
    if (config.analyzer.backend == BackendKind::Local) {
        backend = std::make_unique<LocalLlmBackend>(config.local, transport);
    } else {
        backend = std::make_unique<GeminiBackend>(config.gemini, transport);
    }

    MLOG_INFO(QStringLiteral("BackendFactory"),
              QStringLiteral("makeBackend"),
              QStringLiteral("backend_selected"),
              QStringLiteral("analyzer startup"),
              QStringLiteral("ANALYZER_BACKEND"),
              mirulog::logging::defaultWho(),
              QString(),
              nlohmann::json{{"backend", backend->backendId()},
                             {"model", backend->modelName()}});
    return backend;
}

} // namespace mirulog
