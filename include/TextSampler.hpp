#ifndef TRIAGE_TEXT_SAMPLER_HPP
#define TRIAGE_TEXT_SAMPLER_HPP

#include "LanguageDetector.hpp"
#include "TriageTypes.hpp"

#include <string>
#include <vector>

namespace triage {

/**
 * @brief Document-wide text statistics gathered from the first pages
 */
struct TextSample {
  std::string text;       ///< Filtered sample text, one line break per page
  size_t textLength = 0;  ///< Stripped code point count of the sample
  TextQuality quality = TextQuality::None;
  bool hasTextLayer = false;
  std::string language = "unknown";
  std::vector<size_t> charsPerPage; ///< Stripped length per sampled page
  double garbageRatio = 0.0;        ///< Share of noisy lines in the sample
};

/**
 * @brief Map a sampled text length onto a quality tier
 *
 * - more than @c bestTextChars: Best
 * - more than @c goodTextChars: Good
 * - at least @c sparseTextChars: Poor
 * - otherwise: None
 */
TextQuality classifyTextQuality(size_t textLength, const TriageConfig &config);

/**
 * @brief Estimates text layer quality and language from the leading pages
 *
 * The estimate describes the document as a whole and is independent of the
 * page classification. It never throws; detector failures fall back to
 * "unknown".
 */
class TextSampler {
public:
  /**
   * @param config Thresholds and sample size
   * @param detector Language detector, may be null to skip detection
   */
  TextSampler(const TriageConfig &config, const LanguageDetector *detector);

  /**
   * @brief Sample the first @c samplePageCount pages
   * @param pages All pages of the document, in order
   * @return Sample statistics and quality tier
   */
  TextSample sample(const std::vector<PageContent> &pages) const;

private:
  std::string detectLanguage(const std::string &text) const;

  TriageConfig m_config;
  const LanguageDetector *m_detector;
};

} // namespace triage

#endif // TRIAGE_TEXT_SAMPLER_HPP
