#ifndef TRIAGE_PAGE_CLASSIFIER_HPP
#define TRIAGE_PAGE_CLASSIFIER_HPP

#include "GapDetector.hpp"
#include "TriageTypes.hpp"

#include <vector>

namespace triage {

/**
 * @brief Assigns a page type to every page of a document
 *
 * Per page:
 * 1. Images outside the effective box (crop box, else media box) are
 *    ignored; the rest determine the image coverage of the media box.
 * 2. Pages with almost no text and little image coverage are dropped.
 * 3. Text-dominant pages become Document pages.
 * 4. Remaining pages are FullPage unless at least two sizeable images form
 *    two groups around the vertical midpoint (TopBottomSplit) or, failing
 *    that, the horizontal midpoint (LeftRightSplit).
 *
 * A page with between sparseTextChars and goodTextChars characters and high
 * image coverage is never a Document page; it goes through the split checks.
 */
class PageClassifier {
public:
  /**
   * @param config Classification thresholds
   * @throws std::invalid_argument if the cover threshold is outside 0-100,
   * the good text threshold exceeds the best one, or the gap ratio is
   * outside [0, 1)
   */
  explicit PageClassifier(const TriageConfig &config);

  /**
   * @brief Classify a single page
   * @param page Page geometry and text
   * @return Verdict with page type and image coverage
   */
  PageVerdict classify(const PageContent &page) const;

  /**
   * @brief Classify every page, in order
   * @param pages Document pages
   * @return One verdict per page (dropped pages included)
   */
  std::vector<PageVerdict>
  classifyAll(const std::vector<PageContent> &pages) const;

  /**
   * @brief Decide the layout of a page that is not text-dominant
   * @param images Images within the page bounds
   * @param bounds Effective page box, its height and width are the axis
   * lengths of the gap search
   * @return FullPage, TopBottomSplit or LeftRightSplit
   */
  PageType classifyLayout(const std::vector<PageImage> &images,
                          const cv::Rect2d &bounds) const;

private:
  TriageConfig m_config;
  GapOptions m_gapOptions;
};

} // namespace triage

#endif // TRIAGE_PAGE_CLASSIFIER_HPP
