#ifndef TRIAGE_PDF_PAGE_LOADER_HPP
#define TRIAGE_PDF_PAGE_LOADER_HPP

#include "TriageTypes.hpp"

#include <string>
#include <utility>
#include <vector>

namespace triage {

/**
 * @brief Result of reading page geometry and text from a PDF file
 */
struct PageLoadResult {
  bool success = false;           ///< Whether the document could be read
  std::string errorMessage;       ///< Error message if failed
  std::vector<PageContent> pages; ///< One entry per page, in order
  double processingTimeMs = 0;    ///< Processing time in milliseconds
};

/**
 * @brief Reads the page model the triage heuristics work on, using Poppler
 *
 * For each page this collects:
 * - media and crop boxes from the low-level page object,
 * - the direct text extraction and per-character boxes from the Poppler C++
 *   wrapper,
 * - the placement box of every drawn image, captured by a custom OutputDev.
 *
 * All boxes are converted to a top-down coordinate system whose origin is
 * the top-left corner of the media box, in the page's displayed orientation:
 * for a page with /Rotate 90 or 270 the media box is returned with its sides
 * swapped, matching the space Poppler draws text and images in. Spaces
 * between words are returned as characters of their own. A page that Poppler cannot open is
 * returned empty.
 *
 * Example usage:
 * @code
 * triage::PdfPageLoader loader;
 * auto loaded = loader.loadPages("scan.pdf");
 * if (loaded.success) {
 *     std::cout << loaded.pages.size() << " pages" << std::endl;
 * }
 * @endcode
 */
class PdfPageLoader {
public:
  /**
   * @param debug Emit DEBUG diagnostics on stderr
   */
  explicit PdfPageLoader(bool debug = false);

  /**
   * @brief Load every page of a PDF file
   * @param pdfPath Path to the PDF file
   * @return PageLoadResult with the page model or an error message
   */
  PageLoadResult loadPages(const std::string &pdfPath) const;

private:
  bool m_debug;
};

/**
 * @brief Group UTF-16 code units into code points
 *
 * Poppler's word text is UTF-16 while its character boxes are per code
 * point; a surrogate pair is one character. Unpaired surrogates stand alone.
 *
 * @param units UTF-16 code units
 * @param count Number of code units
 * @return {offset, length} of each code point, in order
 */
std::vector<std::pair<size_t, size_t>>
utf16CodePointRuns(const unsigned short *units, size_t count);

} // namespace triage

#endif // TRIAGE_PDF_PAGE_LOADER_HPP
