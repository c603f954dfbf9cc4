#include "TextSampler.hpp"

#include "TextMetrics.hpp"

#include <algorithm>
#include <exception>
#include <iostream>

namespace triage {

TextQuality classifyTextQuality(size_t textLength, const TriageConfig &config) {
  if (textLength > config.bestTextChars) {
    return TextQuality::Best;
  }
  if (textLength > config.goodTextChars) {
    return TextQuality::Good;
  }
  if (textLength >= config.sparseTextChars) {
    return TextQuality::Poor;
  }
  return TextQuality::None;
}

TextSampler::TextSampler(const TriageConfig &config,
                         const LanguageDetector *detector)
    : m_config(config), m_detector(detector) {}

TextSample TextSampler::sample(const std::vector<PageContent> &pages) const {
  TextSample result;

  size_t sampleSize = std::min(
      pages.size(), static_cast<size_t>(std::max(m_config.samplePageCount, 0)));

  for (size_t i = 0; i < sampleSize; i++) {
    std::string pageText = textOutsideImages(pages[i]);
    result.charsPerPage.push_back(strippedLength(pageText));
    result.text += pageText;
    result.text += "\n";
  }

  result.textLength = strippedLength(result.text);
  result.quality = classifyTextQuality(result.textLength, m_config);
  result.hasTextLayer = result.quality == TextQuality::Good ||
                        result.quality == TextQuality::Best;
  result.garbageRatio = garbageLineRatio(result.text);

  if (result.textLength > m_config.languageMinChars) {
    result.language = detectLanguage(result.text);
  }

  if (m_config.debug) {
    std::cerr << "DEBUG: Sampled " << sampleSize << " pages, text length "
              << result.textLength << ", quality " << toString(result.quality)
              << ", garbage lines " << result.garbageRatio * 100.0 << "%"
              << ", language " << result.language << std::endl;
  }

  return result;
}

std::string TextSampler::detectLanguage(const std::string &text) const {
  if (!m_detector) {
    return "unknown";
  }

  try {
    return m_detector->detect(text);
  } catch (const std::exception &e) {
    if (m_config.debug) {
      std::cerr << "DEBUG: Language detection failed: " << e.what()
                << std::endl;
    }
    return "unknown";
  } catch (...) {
    if (m_config.debug) {
      std::cerr << "DEBUG: Language detection failed: unknown exception"
                << std::endl;
    }
    return "unknown";
  }
}

} // namespace triage
