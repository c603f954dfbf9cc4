#ifndef TRIAGE_TEXT_METRICS_HPP
#define TRIAGE_TEXT_METRICS_HPP

#include "TriageTypes.hpp"

#include <string>

namespace triage {

/**
 * @brief Number of Unicode code points in a UTF-8 string
 *
 * Malformed bytes are counted as one code point each.
 */
size_t countCodePoints(const std::string &text);

/**
 * @brief Copy of @p text without leading and trailing Unicode whitespace
 */
std::string stripWhitespace(const std::string &text);

/**
 * @brief Code point count of the text after stripping surrounding whitespace
 */
size_t strippedLength(const std::string &text);

/**
 * @brief Text of a page with characters hidden under images removed
 *
 * Pages without images return their direct text. Otherwise the characters
 * are concatenated, skipping any whose box overlaps one of the page images.
 * Text drawn over a scan (an invisible OCR layer, a watermark) does not
 * count as a text layer.
 */
std::string textOutsideImages(const PageContent &page);

/**
 * @brief Heuristic check for lines made mostly of extraction noise
 *
 * A line of at least 3 stripped characters is garbage when more than 30% of
 * it is neither alphanumeric nor common punctuation, or when less than half
 * of it is alphanumeric.
 */
bool isGarbageLine(const std::string &line);

/**
 * @brief Share of non-empty lines in @p text that are garbage (0 when none)
 */
double garbageLineRatio(const std::string &text);

} // namespace triage

#endif // TRIAGE_TEXT_METRICS_HPP
