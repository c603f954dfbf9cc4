#include "DocumentTriage.hpp"

#include "PageClassifier.hpp"
#include "PdfPageLoader.hpp"
#include "SegmentAssembler.hpp"
#include "TextSampler.hpp"

#include <chrono>
#include <iostream>

namespace triage {

DocumentTriage::DocumentTriage()
    : m_config(),
      m_languageDetector(std::make_unique<Cld2LanguageDetector>()) {}

DocumentTriage::DocumentTriage(const TriageConfig &config)
    : m_config(config),
      m_languageDetector(std::make_unique<Cld2LanguageDetector>()) {}

DocumentTriage::DocumentTriage(const TriageConfig &config,
                               std::unique_ptr<LanguageDetector> detector)
    : m_config(config), m_languageDetector(std::move(detector)) {}

AnalysisResult DocumentTriage::analyzePDF(const std::string &pdfPath) const {
  auto startTime = std::chrono::high_resolution_clock::now();

  PdfPageLoader loader(m_config.debug);
  PageLoadResult loaded = loader.loadPages(pdfPath);

  AnalysisResult result;
  if (!loaded.success) {
    result.errorMessage = loaded.errorMessage;
    if (m_config.debug) {
      std::cerr << "DEBUG: " << loaded.errorMessage << std::endl;
    }
  } else {
    result = analyzePages(loaded.pages);
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

AnalysisResult
DocumentTriage::analyzePages(const std::vector<PageContent> &pages) const {
  AnalysisResult result;
  result.success = false;
  result.pageCount = static_cast<int>(pages.size());

  auto startTime = std::chrono::high_resolution_clock::now();

  // Fields filled before a failure are kept; the segmentation is not
  try {
    runPipeline(pages, result);
  } catch (const std::exception &e) {
    discardSegmentation(result);
    result.errorMessage = std::string("Document triage failed: ") + e.what();
  } catch (...) {
    discardSegmentation(result);
    result.errorMessage = "Document triage failed: unknown exception";
  }

  if (!result.success && m_config.debug) {
    std::cerr << "DEBUG: " << result.errorMessage << std::endl;
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

void DocumentTriage::runPipeline(const std::vector<PageContent> &pages,
                                 AnalysisResult &result) const {
  // Document-wide text layer estimate from the leading pages
  TextSampler sampler(m_config, m_languageDetector.get());
  TextSample sample = sampler.sample(pages);
  result.textQuality = sample.quality;
  result.hasTextLayer = sample.hasTextLayer;
  result.language = sample.language;

  // Per-page layout decisions folded into segments
  PageClassifier classifier(m_config);
  result.pageVerdicts = classifier.classifyAll(pages);
  std::vector<DocumentSegment> segments =
      assembleSegments(result.pageVerdicts);

  result.documentCount = static_cast<int>(segments.size());
  result.isMultiDocument = result.documentCount > 1;
  result.documents = std::move(segments);
  result.success = true;

  if (m_config.debug) {
    std::cerr << "DEBUG: " << result.pageCount << " pages -> "
              << result.documentCount << " segments"
              << (result.isMultiDocument ? " (multi-document)" : "")
              << std::endl;
  }
}

void DocumentTriage::discardSegmentation(AnalysisResult &result) {
  result.success = false;
  result.isMultiDocument = false;
  result.documentCount = 0;
  result.documents.reset();
}

const TriageConfig &DocumentTriage::getConfig() const { return m_config; }

void DocumentTriage::setConfig(const TriageConfig &config) {
  m_config = config;
}

} // namespace triage
