#include "LanguageDetector.hpp"

#include <cld2/public/compact_lang_det.h>

#include <limits>
#include <stdexcept>

namespace triage {

std::string Cld2LanguageDetector::detect(const std::string &text) const {
  if (text.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    throw std::runtime_error("Text sample too large for language detection");
  }

  bool isReliable = false;
  CLD2::Language language =
      CLD2::DetectLanguage(text.data(), static_cast<int>(text.size()),
                           true, // plain text, not HTML
                           &isReliable);

  if (language == CLD2::UNKNOWN_LANGUAGE) {
    throw std::runtime_error("No features in text to identify its language");
  }

  return CLD2::LanguageCode(language);
}

} // namespace triage
