#pragma once

#include <memory>

#include "analyzer/analysis_backend.hpp"
#include "analyzer/http_transport.hpp"
#include "common/config.hpp"

namespace mirulog {

// Picks the backend variant once per run. Throws ConfigError when the chosen
// variant is missing a credential. The transport must outlive the backend.
std::unique_ptr<AnalysisBackend> makeBackend(const AppConfig &config, HttpTransport &transport);

} // namespace mirulog
