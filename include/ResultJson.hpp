#ifndef TRIAGE_RESULT_JSON_HPP
#define TRIAGE_RESULT_JSON_HPP

#include "TriageTypes.hpp"

#include <nlohmann/json.hpp>

namespace triage {

/**
 * @brief Serialize a segment as {"pages", "type", "image_cover"}
 */
nlohmann::json toJson(const DocumentSegment &segment);

/**
 * @brief Serialize an analysis result for the document pipeline
 *
 * Emits isMultiDocument, documentCount, pageCount, hasTextLayer,
 * textQuality, language and documents (null when absent). The "error" key
 * is only present when the analysis failed. Diagnostics such as the page
 * verdicts and timings are not serialized.
 */
nlohmann::json toJson(const AnalysisResult &result);

} // namespace triage

#endif // TRIAGE_RESULT_JSON_HPP
