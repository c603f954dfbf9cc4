#ifndef TRIAGE_DOCUMENT_TRIAGE_HPP
#define TRIAGE_DOCUMENT_TRIAGE_HPP

#include "LanguageDetector.hpp"
#include "TriageTypes.hpp"

#include <memory>
#include <string>
#include <vector>

namespace triage {

/**
 * @brief Decides how a PDF should be split and routed before extraction
 *
 * The analysis answers three questions about a document:
 * - how good its text layer is and which language it is in (sampled from the
 *   first pages),
 * - how its pages group into logical documents (runs of text pages, single
 *   image pages, or pages holding two documents side by side or stacked),
 * - whether it holds more than one logical document.
 *
 * Example usage:
 * @code
 * triage::DocumentTriage analyzer;
 * auto result = analyzer.analyzePDF("upload.pdf");
 * if (result.success && result.isMultiDocument) {
 *     for (const auto &segment : *result.documents) {
 *         std::cout << segment.type << std::endl;
 *     }
 * }
 * @endcode
 */
class DocumentTriage {
public:
  /**
   * @brief Default constructor, uses CLD2 for language detection
   */
  DocumentTriage();

  /**
   * @brief Constructor with custom configuration
   * @param config Triage thresholds and options
   */
  explicit DocumentTriage(const TriageConfig &config);

  /**
   * @brief Constructor with custom configuration and language detector
   * @param config Triage thresholds and options
   * @param detector Language detector, may be null to skip detection
   */
  DocumentTriage(const TriageConfig &config,
                 std::unique_ptr<LanguageDetector> detector);

  // Disable copy operations (owns the language detector)
  DocumentTriage(const DocumentTriage &) = delete;
  DocumentTriage &operator=(const DocumentTriage &) = delete;

  // Enable move operations
  DocumentTriage(DocumentTriage &&other) noexcept = default;
  DocumentTriage &operator=(DocumentTriage &&other) noexcept = default;

  /**
   * @brief Load a PDF with Poppler and analyze it
   *
   * Never throws. On failure the result has success == false, the error
   * message set and no documents.
   *
   * @param pdfPath Path to the PDF file
   * @return AnalysisResult for the whole document
   */
  AnalysisResult analyzePDF(const std::string &pdfPath) const;

  /**
   * @brief Analyze an already extracted page sequence
   *
   * Never throws. Running it twice on the same pages yields the same result
   * apart from the processing time. On failure the page count and the text
   * sample fields computed so far are kept; the segmentation is not.
   *
   * @param pages Document pages, in order
   * @return AnalysisResult for the whole document
   */
  AnalysisResult analyzePages(const std::vector<PageContent> &pages) const;

  /**
   * @brief Get the current configuration
   * @return Current triage configuration
   */
  const TriageConfig &getConfig() const;

  /**
   * @brief Set a new configuration
   * @param config New triage configuration
   */
  void setConfig(const TriageConfig &config);

private:
  void runPipeline(const std::vector<PageContent> &pages,
                   AnalysisResult &result) const;
  static void discardSegmentation(AnalysisResult &result);

  TriageConfig m_config; ///< Current configuration
  std::unique_ptr<LanguageDetector> m_languageDetector;
};

} // namespace triage

#endif // TRIAGE_DOCUMENT_TRIAGE_HPP
