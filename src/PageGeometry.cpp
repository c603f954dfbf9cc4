#include "PageGeometry.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

namespace triage {

cv::Rect2d effectiveBox(const PageContent &page) {
  if (page.cropBox && *page.cropBox != page.mediaBox) {
    return *page.cropBox;
  }
  return page.mediaBox;
}

double mediaBoxArea(const PageContent &page) {
  // Degenerate media boxes would otherwise divide by zero
  return std::max(page.mediaBox.width * page.mediaBox.height, 1.0);
}

bool isWithinBounds(const cv::Rect2d &box, const cv::Rect2d &bounds,
                    double tolerance) {
  double boxRight = box.x + box.width;
  double boxBottom = box.y + box.height;
  double boundsRight = bounds.x + bounds.width;
  double boundsBottom = bounds.y + bounds.height;

  return boxRight > bounds.x + tolerance && box.x < boundsRight - tolerance &&
         boxBottom > bounds.y + tolerance && box.y < boundsBottom - tolerance;
}

bool boxesOverlap(const cv::Rect2d &a, const cv::Rect2d &b) {
  return a.x < b.x + b.width && a.x + a.width > b.x &&
         a.y < b.y + b.height && a.y + a.height > b.y;
}

std::vector<PageImage> imagesWithinPage(const PageContent &page,
                                        double tolerance) {
  cv::Rect2d bounds = effectiveBox(page);

  std::vector<PageImage> kept;
  kept.reserve(page.images.size());
  for (const auto &image : page.images) {
    if (isWithinBounds(image.box, bounds, tolerance)) {
      kept.push_back(image);
    }
  }
  return kept;
}

double imageCoverPercent(const std::vector<PageImage> &images,
                         double pageArea) {
  double totalArea = 0.0;
  for (const auto &image : images) {
    totalArea += image.box.width * image.box.height;
  }

  double percent = totalArea / pageArea * 100.0;
  return roundPercent(std::clamp(percent, 0.0, 100.0));
}

double roundPercent(double value) {
  // printf rounds the exact binary value with ties to even
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return std::strtod(buffer, nullptr);
}

cv::Rect2d rotateBox(const cv::Rect2d &box, const cv::Size2d &pageSize,
                     int rotation) {
  double right = box.x + box.width;
  double bottom = box.y + box.height;

  switch (((rotation % 360) + 360) % 360) {
  case 90:
    return cv::Rect2d(pageSize.height - bottom, box.x, box.height, box.width);
  case 180:
    return cv::Rect2d(pageSize.width - right, pageSize.height - bottom,
                      box.width, box.height);
  case 270:
    return cv::Rect2d(box.y, pageSize.width - right, box.height, box.width);
  default:
    return box;
  }
}

} // namespace triage
