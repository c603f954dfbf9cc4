#ifndef TRIAGE_TYPES_HPP
#define TRIAGE_TYPES_HPP

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace triage {

/**
 * @brief A single extracted character with its bounding box
 *
 * Boxes use a top-down coordinate system with the origin at the top-left
 * corner of the page's media box: x = x0, y = top, width = x1 - x0,
 * height = bottom - top.
 */
struct Character {
  cv::Rect2d box;   ///< Character bounding box in points
  std::string text; ///< Literal character text (UTF-8)
};

/**
 * @brief An embedded raster image placed on a page
 */
struct PageImage {
  cv::Rect2d box; ///< Axis-aligned placement box in points
};

/**
 * @brief Geometry and text of one page as delivered by the extraction backend
 */
struct PageContent {
  int pageNumber = 0;                ///< 1-indexed page number
  cv::Rect2d mediaBox;               ///< Page media box
  std::optional<cv::Rect2d> cropBox; ///< Page crop box, if the page has one
  std::string text;                  ///< Direct text extraction (may be empty)
  std::vector<Character> characters; ///< Characters in content order
  std::vector<PageImage> images;     ///< Images in content order
};

/**
 * @brief Classification assigned to a single page
 */
enum class PageType {
  Document,       ///< Text-dominant, joins a run of consecutive pages
  FullPage,       ///< One image-like region covering the page
  TopBottomSplit, ///< Two regions stacked vertically
  LeftRightSplit, ///< Two regions side by side
  Dropped         ///< Too sparse to classify
};

/**
 * @brief Per-page output of the page classifier
 */
struct PageVerdict {
  int pageNumber = 0;             ///< 1-indexed page number
  PageType type = PageType::Dropped;
  double imageCoverPercent = 0.0; ///< Image coverage of the media box (0-100)
  size_t textLength = 0;          ///< Stripped text length in code points
};

/**
 * @brief A run of pages (or half of a page) treated as one logical document
 */
struct DocumentSegment {
  std::vector<int> pages; ///< Ordered 1-indexed page numbers
  std::string type;       ///< "document", "full_page", "top_half", ...
  double imageCover = 0;  ///< Mean image coverage over member pages
};

/**
 * @brief Text layer quality tiers derived from sampled character counts
 */
enum class TextQuality { None, Poor, Good, Best };

/**
 * @brief Result of triaging a whole document
 */
struct AnalysisResult {
  bool success = false;     ///< Whether the analysis completed
  std::string errorMessage; ///< Error message if failed

  int pageCount = 0;
  bool isMultiDocument = false;
  int documentCount = 0;
  bool hasTextLayer = false;
  TextQuality textQuality = TextQuality::None;
  std::string language = "unknown";

  /// Ordered segments; empty optional when the analysis failed
  std::optional<std::vector<DocumentSegment>> documents;

  std::vector<PageVerdict> pageVerdicts; ///< Diagnostics, one per page
  double processingTimeMs = 0;           ///< Processing time in milliseconds
};

/**
 * @brief Tunable thresholds for the triage heuristics
 *
 * The defaults are empirically chosen and downstream routing depends on
 * them exactly.
 */
struct TriageConfig {
  int samplePageCount = 3; ///< Pages inspected for text quality and language

  size_t sparseTextChars = 20;  ///< Below this a page or sample has no text
  size_t goodTextChars = 200;   ///< Above this text quality is "good"
  size_t bestTextChars = 2000;  ///< Above this text quality is "best"
  size_t languageMinChars = 50; ///< Language detection needs more than this

  double imageCoverThreshold = 25.0; ///< Percent of media box area
  double boundsTolerance = 2.0;      ///< Points an image must reach inside
  double minImageSide = 20.0;        ///< Smaller images are noise for splits
  double gapMergeTolerance = 5.0;    ///< Merge intervals closer than this
  double minGapRatio = 0.01;         ///< Minimum split gap, share of axis

  bool debug = false; ///< Emit DEBUG diagnostics on stderr
};

/**
 * @brief Serialized name of a text quality tier ("none", "poor", ...)
 */
std::string toString(TextQuality quality);

/**
 * @brief Short name of a page type, used in diagnostics
 */
std::string toString(PageType type);

} // namespace triage

#endif // TRIAGE_TYPES_HPP
