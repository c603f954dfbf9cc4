#ifndef TRIAGE_LANGUAGE_DETECTOR_HPP
#define TRIAGE_LANGUAGE_DETECTOR_HPP

#include <string>

namespace triage {

/**
 * @brief Natural language identification of a text sample
 */
class LanguageDetector {
public:
  virtual ~LanguageDetector() = default;

  /**
   * @brief Identify the language of @p text
   * @param text UTF-8 text
   * @return Language code such as "en" or "de"
   * @throws std::runtime_error if the language cannot be determined
   */
  virtual std::string detect(const std::string &text) const = 0;
};

/**
 * @brief Language detector backed by Compact Language Detector 2
 */
class Cld2LanguageDetector : public LanguageDetector {
public:
  std::string detect(const std::string &text) const override;
};

} // namespace triage

#endif // TRIAGE_LANGUAGE_DETECTOR_HPP
