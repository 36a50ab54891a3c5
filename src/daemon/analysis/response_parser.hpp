#pragma once

#include "analysis/analysis_types.hpp"

#include <optional>
#include <string_view>

inline constexpr double kDefaultConfidence = 0.8;
inline constexpr double kFallbackConfidence = 0.5;

// Interprets the completion text. Two shapes are accepted:
//   {"expenses": [{amount, category, title, description, ...}, ...], "confidence", "tags"}
//     first item is the primary result, the rest become alternatives;
//   {amount, category, title, description, confidence, tags, "alternatives": [...]}
// Returns nothing when the text is not a JSON object or carries no primary amount.
std::optional<AnalysisResult> parse_completion(std::string_view content,
                                               const AnalysisRequest& request);

// Deterministic low-confidence result without an amount, titled by the local
// time of day of the request.
AnalysisResult fallback_result(const AnalysisRequest& request);

// Removes a surrounding ``` / ```json fence, if any.
std::string_view strip_code_fence(std::string_view content);
