#ifndef TRIAGE_PAGE_GEOMETRY_HPP
#define TRIAGE_PAGE_GEOMETRY_HPP

#include "TriageTypes.hpp"

#include <vector>

namespace triage {

/**
 * @brief Resolve the box that bounds a page's visible content
 *
 * @return The crop box when present and different from the media box,
 * otherwise the media box
 */
cv::Rect2d effectiveBox(const PageContent &page);

/**
 * @brief Media box area, floored at 1.0 so it is always a safe divisor
 */
double mediaBoxArea(const PageContent &page);

/**
 * @brief Check whether a box reaches into the page bounds
 *
 * The box counts as inside only when it intersects the bounds by more than
 * @p tolerance points on both axes.
 */
bool isWithinBounds(const cv::Rect2d &box, const cv::Rect2d &bounds,
                    double tolerance);

/**
 * @brief Strict overlap test between two boxes (touching edges do not count)
 */
bool boxesOverlap(const cv::Rect2d &a, const cv::Rect2d &b);

/**
 * @brief Images of a page that lie within its effective box
 * @param page Page to inspect
 * @param tolerance Bounds tolerance in points
 */
std::vector<PageImage> imagesWithinPage(const PageContent &page,
                                        double tolerance);

/**
 * @brief Percentage of the media box covered by the given images
 *
 * Clamped to [0, 100] and rounded to two decimals. Overlapping images are
 * counted once each.
 */
double imageCoverPercent(const std::vector<PageImage> &images,
                         double pageArea);

/**
 * @brief Round to two decimal places
 *
 * Rounds the exact binary value of @p value, ties to even, so 20.005 (stored
 * as 20.00499...) becomes 20.0 and 0.125 becomes 0.12.
 */
double roundPercent(double value);

/**
 * @brief Map a top-down page box into the space of the rotated page
 *
 * Poppler applies the page's /Rotate entry (clockwise) when it displays a
 * page, so image and text boxes arrive in the rotated space. Boxes read from
 * the page dictionary are converted with this function to match.
 *
 * @param box Top-down box relative to the unrotated media box
 * @param pageSize Unrotated media box size
 * @param rotation Page rotation in degrees; only multiples of 90 rotate
 * @return The box in the rotated page space
 */
cv::Rect2d rotateBox(const cv::Rect2d &box, const cv::Size2d &pageSize,
                     int rotation);

} // namespace triage

#endif // TRIAGE_PAGE_GEOMETRY_HPP
