#include "PdfPageLoader.hpp"

#include "PageGeometry.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>

// Poppler C++ wrapper
#include <poppler-document.h>
#include <poppler-page.h>

// Poppler low-level API for page boxes and image placement
#include <GfxState.h>
#include <GlobalParams.h>
#include <OutputDev.h>
#include <PDFDoc.h>
#include <Page.h>
#include <Stream.h>
#include <goo/GooString.h>

namespace triage {

namespace {

// PDF user space (origin bottom-left) to top-down coordinates relative to
// the top-left corner of the media box
cv::Rect2d toTopDown(const PDFRectangle &box, const PDFRectangle &media) {
  double mediaLeft = std::min(media.x1, media.x2);
  double mediaTop = std::max(media.y1, media.y2);

  double x0 = std::min(box.x1, box.x2) - mediaLeft;
  double x1 = std::max(box.x1, box.x2) - mediaLeft;
  double top = mediaTop - std::max(box.y1, box.y2);
  double bottom = mediaTop - std::min(box.y1, box.y2);

  return cv::Rect2d(x0, top, x1 - x0, bottom - top);
}

// Custom OutputDev that records where images are drawn on a page
class ImageBoxOutputDev : public OutputDev {
public:
  ImageBoxOutputDev() = default;

  std::vector<PageImage> takeImages() {
    std::vector<PageImage> taken = std::move(images);
    images.clear();
    return taken;
  }

  // Required OutputDev overrides
  bool upsideDown() override { return true; } // top-down device space
  bool useDrawChar() override { return false; }
  bool interpretType3Chars() override { return false; }
  bool needNonText() override { return true; } // We need images!

  void drawImage(GfxState *state, Object *ref, Stream *str, int width,
                 int height, GfxImageColorMap *colorMap, bool interpolate,
                 const int *maskColors, bool inlineImg) override {
    recordImage(state);
    // Base implementation skips the data of inline images
    OutputDev::drawImage(state, ref, str, width, height, colorMap,
                         interpolate, maskColors, inlineImg);
  }

  void drawImageMask(GfxState *state, Object *ref, Stream *str, int width,
                     int height, bool invert, bool interpolate,
                     bool inlineImg) override {
    recordImage(state);
    OutputDev::drawImageMask(state, ref, str, width, height, invert,
                             interpolate, inlineImg);
  }

  // drawMaskedImage and drawSoftMaskedImage fall back to drawImage in the
  // base class, so each image is recorded exactly once

private:
  void recordImage(GfxState *state) {
    // The CTM maps the unit square onto the image; rotated or skewed images
    // get the axis-aligned bounding box of the four transformed corners
    const auto &ctm = state->getCTM();

    double xs[4] = {ctm[4], ctm[4] + ctm[0], ctm[4] + ctm[2],
                    ctm[4] + ctm[0] + ctm[2]};
    double ys[4] = {ctm[5], ctm[5] + ctm[1], ctm[5] + ctm[3],
                    ctm[5] + ctm[1] + ctm[3]};

    double x0 = *std::min_element(xs, xs + 4);
    double x1 = *std::max_element(xs, xs + 4);
    double top = *std::min_element(ys, ys + 4);
    double bottom = *std::max_element(ys, ys + 4);

    images.push_back({cv::Rect2d(x0, top, x1 - x0, bottom - top)});
  }

  std::vector<PageImage> images;
};

// Split the word boxes of a page into per-character boxes. Poppler reports
// them relative to the (rotated) crop box; shift them by its offset into
// media box coordinates.
std::vector<Character> extractCharacters(poppler::page &page,
                                         const cv::Point2d &cropOffset) {
  std::vector<Character> characters;

  std::vector<poppler::text_box> words = page.text_list();
  for (size_t w = 0; w < words.size(); w++) {
    const poppler::text_box &word = words[w];
    poppler::ustring wordText = word.text();

    // One bounding box per code point, surrogate pairs included
    size_t glyph = 0;
    for (const auto &run :
         utf16CodePointRuns(wordText.data(), wordText.size())) {
      poppler::rectf bbox = word.char_bbox(glyph++);

      poppler::ustring codePoint;
      codePoint.assign(wordText, run.first, run.second);
      poppler::byte_array utf8 = codePoint.to_utf8();

      Character character;
      character.text.assign(utf8.begin(), utf8.end());
      character.box = cv::Rect2d(bbox.x() + cropOffset.x,
                                 bbox.y() + cropOffset.y, bbox.width(),
                                 bbox.height());
      characters.push_back(std::move(character));
    }

    // Words carry no whitespace; the space between two words spans the gap
    if (word.has_space_after()) {
      poppler::rectf wordBox = word.bbox();
      double spaceLeft = wordBox.right();
      double spaceRight = spaceLeft;
      if (w + 1 < words.size() && words[w + 1].bbox().left() > spaceLeft) {
        spaceRight = words[w + 1].bbox().left();
      }

      Character space;
      space.text = " ";
      space.box = cv::Rect2d(spaceLeft + cropOffset.x,
                             wordBox.top() + cropOffset.y,
                             spaceRight - spaceLeft, wordBox.height());
      characters.push_back(std::move(space));
    }
  }

  return characters;
}

} // anonymous namespace

std::vector<std::pair<size_t, size_t>>
utf16CodePointRuns(const unsigned short *units, size_t count) {
  std::vector<std::pair<size_t, size_t>> runs;
  runs.reserve(count);

  size_t i = 0;
  while (i < count) {
    bool highSurrogate = units[i] >= 0xD800 && units[i] <= 0xDBFF;
    bool lowFollows =
        i + 1 < count && units[i + 1] >= 0xDC00 && units[i + 1] <= 0xDFFF;
    size_t length = (highSurrogate && lowFollows) ? 2 : 1;

    runs.emplace_back(i, length);
    i += length;
  }

  return runs;
}

PdfPageLoader::PdfPageLoader(bool debug) : m_debug(debug) {}

PageLoadResult PdfPageLoader::loadPages(const std::string &pdfPath) const {
  PageLoadResult result;
  result.success = false;

  auto startTime = std::chrono::high_resolution_clock::now();

  try {
    // Load the PDF document using the Poppler C++ wrapper (text)
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_file(pdfPath));

    if (!doc) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    if (doc->is_locked()) {
      result.errorMessage = "PDF file is password protected: " + pdfPath;
      return result;
    }

    // Initialize Poppler's global parameters (required for low-level API)
    GlobalParamsIniter globalParamsInit(nullptr);

    // Load the same file with the low-level API (boxes and images)
    auto fileName = std::make_unique<GooString>(pdfPath);
    std::unique_ptr<PDFDoc> pdfDoc(new PDFDoc(std::move(fileName)));

    if (!pdfDoc->isOk()) {
      result.errorMessage = "Failed to load PDF file: " + pdfPath;
      return result;
    }

    int pageCount = doc->pages();
    if (m_debug) {
      std::cerr << "DEBUG: PDF has " << pageCount << " pages" << std::endl;
    }

    ImageBoxOutputDev outputDev;
    result.pages.reserve(pageCount);

    for (int pageIndex = 0; pageIndex < pageCount; pageIndex++) {
      PageContent content;
      content.pageNumber = pageIndex + 1;

      Page *pdfPage = pdfDoc->getPage(content.pageNumber);
      std::unique_ptr<poppler::page> page(doc->create_page(pageIndex));

      if (!pdfPage || !page) {
        // Left empty, the classifier drops it like any blank page
        if (m_debug) {
          std::cerr << "DEBUG: Failed to open page " << content.pageNumber
                    << ", treating it as empty" << std::endl;
        }
        result.pages.push_back(std::move(content));
        continue;
      }

      const PDFRectangle *mediaBox = pdfPage->getMediaBox();
      const PDFRectangle *cropBox = pdfPage->getCropBox();

      // Poppler displays text and images with the page's /Rotate applied,
      // so the page boxes are rotated into the same space
      int rotation = pdfPage->getRotate();
      cv::Rect2d mediaRect = toTopDown(*mediaBox, *mediaBox);
      cv::Size2d pageSize = mediaRect.size();
      cv::Rect2d cropRect =
          rotateBox(toTopDown(*cropBox, *mediaBox), pageSize, rotation);

      content.mediaBox = rotateBox(mediaRect, pageSize, rotation);
      if (pdfPage->isCropped()) {
        content.cropBox = cropRect;
      }

      poppler::byte_array textBytes = page->text().to_utf8();
      content.text.assign(textBytes.begin(), textBytes.end());
      content.characters = extractCharacters(*page, cropRect.tl());

      // Display the page against its media box; this triggers the image
      // callbacks with top-down coordinates relative to the media box
      pdfDoc->displayPage(&outputDev, content.pageNumber, 72.0,
                          72.0,   // DPI, 1 device unit per point
                          0,      // no rotation beyond the page /Rotate
                          true,   // useMediaBox
                          false,  // crop
                          false); // printing
      content.images = outputDev.takeImages();

      if (m_debug) {
        std::cerr << "DEBUG: Page " << content.pageNumber << ": "
                  << content.characters.size() << " characters, "
                  << content.images.size() << " images, media box "
                  << content.mediaBox.width << " x " << content.mediaBox.height
                  << (content.cropBox ? " (cropped)" : "");
        if (rotation != 0) {
          std::cerr << ", rotated " << rotation;
        }
        std::cerr << std::endl;
      }

      result.pages.push_back(std::move(content));
    }

    result.success = true;

  } catch (const std::exception &e) {
    result.errorMessage = std::string("PDF page extraction failed: ") + e.what();
  }

  auto endTime = std::chrono::high_resolution_clock::now();
  result.processingTimeMs =
      std::chrono::duration<double, std::milli>(endTime - startTime).count();

  return result;
}

} // namespace triage
