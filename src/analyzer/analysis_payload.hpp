#pragma once

#include <string>

#include "analyzer/analysis_backend.hpp"
#include "common/models.hpp"

namespace mirulog {

// Instruction text shared by every backend. Asks for a single JSON object.
std::string analysisInstructions();

// Per-capture context (time, window, application) appended to the prompt.
std::string analysisContextText(const AnalysisRequest &request);

// Tolerant parser for model output: code fences are stripped and the first
// {...} block is salvaged from surrounding prose. Missing fields fall back to
// defaults; the raw text becomes the summary when no JSON is found.
// parsedJson reports whether a JSON object was recovered.
AnalysisFields parseAnalysisPayload(const std::string &text, bool *parsedJson = nullptr);

} // namespace mirulog
