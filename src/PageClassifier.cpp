#include "PageClassifier.hpp"

#include "PageGeometry.hpp"
#include "TextMetrics.hpp"

#include <iostream>
#include <stdexcept>

namespace triage {

PageClassifier::PageClassifier(const TriageConfig &config) : m_config(config) {
  if (config.imageCoverThreshold < 0.0 || config.imageCoverThreshold > 100.0) {
    throw std::invalid_argument("Image cover threshold must be within 0-100%");
  }
  if (config.goodTextChars > config.bestTextChars) {
    throw std::invalid_argument(
        "Good text threshold exceeds the best text threshold");
  }
  if (config.minGapRatio < 0.0 || config.minGapRatio >= 1.0) {
    throw std::invalid_argument("Minimum gap ratio must be within [0, 1)");
  }
  m_gapOptions.mergeTolerance = config.gapMergeTolerance;
  m_gapOptions.minGapRatio = config.minGapRatio;
}

PageVerdict PageClassifier::classify(const PageContent &page) const {
  PageVerdict verdict;
  verdict.pageNumber = page.pageNumber;
  verdict.textLength = strippedLength(page.text);

  cv::Rect2d bounds = effectiveBox(page);
  std::vector<PageImage> images =
      imagesWithinPage(page, m_config.boundsTolerance);
  verdict.imageCoverPercent = imageCoverPercent(images, mediaBoxArea(page));

  bool lowCover = verdict.imageCoverPercent < m_config.imageCoverThreshold;

  if (verdict.textLength < m_config.sparseTextChars && lowCover) {
    verdict.type = PageType::Dropped;
  } else if (verdict.textLength > m_config.bestTextChars ||
             (verdict.textLength > m_config.goodTextChars && lowCover)) {
    verdict.type = PageType::Document;
  } else {
    verdict.type = classifyLayout(images, bounds);
  }

  if (m_config.debug) {
    std::cerr << "DEBUG: Page " << page.pageNumber << ": text length "
              << verdict.textLength << ", " << images.size() << " of "
              << page.images.size() << " images in bounds, cover "
              << verdict.imageCoverPercent << "% -> " << toString(verdict.type)
              << std::endl;
  }

  return verdict;
}

std::vector<PageVerdict>
PageClassifier::classifyAll(const std::vector<PageContent> &pages) const {
  std::vector<PageVerdict> verdicts;
  verdicts.reserve(pages.size());
  for (const auto &page : pages) {
    verdicts.push_back(classify(page));
  }
  return verdicts;
}

PageType PageClassifier::classifyLayout(const std::vector<PageImage> &images,
                                        const cv::Rect2d &bounds) const {
  std::vector<Interval> verticalExtents;
  std::vector<Interval> horizontalExtents;

  for (const auto &image : images) {
    // Small images (icons, rules, specks) say nothing about the layout
    if (image.box.width < m_config.minImageSide ||
        image.box.height < m_config.minImageSide) {
      continue;
    }
    verticalExtents.push_back({image.box.y, image.box.y + image.box.height});
    horizontalExtents.push_back({image.box.x, image.box.x + image.box.width});
  }

  if (verticalExtents.size() < 2) {
    return PageType::FullPage;
  }

  if (detectGap(verticalExtents, bounds.height, m_gapOptions)) {
    return PageType::TopBottomSplit;
  }
  if (detectGap(horizontalExtents, bounds.width, m_gapOptions)) {
    return PageType::LeftRightSplit;
  }
  return PageType::FullPage;
}

} // namespace triage
