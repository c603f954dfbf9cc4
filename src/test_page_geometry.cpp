#include "PageGeometry.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace triage;
using triage::test::makeImage;
using triage::test::makePage;

TEST(PageGeometry, EffectiveBoxDefaultsToMediaBox) {
  PageContent page = makePage(1, 0);
  EXPECT_EQ(effectiveBox(page), page.mediaBox);
}

TEST(PageGeometry, EffectiveBoxIgnoresCropBoxEqualToMediaBox) {
  PageContent page = makePage(1, 0);
  page.cropBox = page.mediaBox;
  EXPECT_EQ(effectiveBox(page), page.mediaBox);
}

TEST(PageGeometry, EffectiveBoxPrefersDistinctCropBox) {
  PageContent page = makePage(1, 0);
  page.cropBox = cv::Rect2d(36, 36, 540, 720);
  EXPECT_EQ(effectiveBox(page), *page.cropBox);
}

TEST(PageGeometry, MediaBoxAreaIsFlooredAtOne) {
  EXPECT_DOUBLE_EQ(mediaBoxArea(makePage(1, 0, 100, 50)), 5000.0);
  EXPECT_DOUBLE_EQ(mediaBoxArea(makePage(1, 0, 0, 0)), 1.0);
  EXPECT_DOUBLE_EQ(mediaBoxArea(makePage(1, 0, 0.5, 0.5)), 1.0);
}

TEST(PageGeometry, WithinBoundsNeedsMoreThanTolerance) {
  cv::Rect2d bounds(0, 0, 100, 200);

  EXPECT_TRUE(isWithinBounds(makeImage(10, 10, 50, 50).box, bounds, 2.0));
  // Reaches exactly 2 points into the left edge
  EXPECT_FALSE(isWithinBounds(makeImage(-40, 10, 2, 50).box, bounds, 2.0));
  EXPECT_TRUE(isWithinBounds(makeImage(-40, 10, 2.5, 50).box, bounds, 2.0));
  // Starts 2 points before the right edge
  EXPECT_FALSE(isWithinBounds(makeImage(98, 10, 150, 50).box, bounds, 2.0));
  // Entirely below the page
  EXPECT_FALSE(isWithinBounds(makeImage(10, 210, 50, 260).box, bounds, 2.0));
}

TEST(PageGeometry, ImageLargerThanPageIsWithinBounds) {
  cv::Rect2d bounds(0, 0, 100, 200);
  EXPECT_TRUE(isWithinBounds(makeImage(-10, -10, 110, 210).box, bounds, 2.0));
}

TEST(PageGeometry, OverlapIsStrict) {
  cv::Rect2d a = makeImage(0, 0, 10, 10).box;
  EXPECT_TRUE(boxesOverlap(a, makeImage(5, 5, 15, 15).box));
  EXPECT_FALSE(boxesOverlap(a, makeImage(10, 0, 20, 10).box));
  EXPECT_FALSE(boxesOverlap(a, makeImage(0, 10, 10, 20).box));
}

TEST(PageGeometry, ImagesOutsideCropBoxAreFiltered) {
  PageContent page = makePage(1, 0, 200, 200);
  page.cropBox = cv::Rect2d(0, 0, 100, 200);
  page.images.push_back(makeImage(10, 10, 90, 90));
  page.images.push_back(makeImage(150, 0, 200, 200));

  std::vector<PageImage> kept = imagesWithinPage(page, 2.0);
  ASSERT_EQ(kept.size(), 1u);
  EXPECT_EQ(kept[0].box, page.images[0].box);
}

TEST(PageGeometry, CoverIsRoundedAndClamped) {
  std::vector<PageImage> images = {makeImage(0, 0, 10, 10)};
  EXPECT_DOUBLE_EQ(imageCoverPercent(images, 300.0), 33.33);

  images.push_back(makeImage(0, 0, 20, 20));
  EXPECT_DOUBLE_EQ(imageCoverPercent(images, 100.0), 100.0);

  EXPECT_DOUBLE_EQ(imageCoverPercent({}, 100.0), 0.0);
}

TEST(PageGeometry, RoundPercentKeepsTwoDecimals) {
  EXPECT_DOUBLE_EQ(roundPercent(12.3449), 12.34);
  EXPECT_DOUBLE_EQ(roundPercent(12.346), 12.35);
}

TEST(PageGeometry, RoundPercentTiesFollowTheStoredValue) {
  // 20.005 is stored just below the tie, 0.125 and 0.375 are exact ties
  EXPECT_DOUBLE_EQ(roundPercent(20.005), 20.0);
  EXPECT_DOUBLE_EQ(roundPercent(2.675), 2.67);
  EXPECT_DOUBLE_EQ(roundPercent(0.125), 0.12);
  EXPECT_DOUBLE_EQ(roundPercent(0.375), 0.38);
  EXPECT_DOUBLE_EQ(roundPercent(100.0), 100.0);
}

TEST(PageGeometry, RotateBoxFollowsClockwisePageRotation) {
  cv::Size2d letter(612, 792);
  // Lower part of a portrait page, as drawn in the page's own coordinates
  cv::Rect2d box = makeImage(20, 402, 592, 792).box;

  EXPECT_EQ(rotateBox(box, letter, 0), box);
  EXPECT_EQ(rotateBox(box, letter, 90), cv::Rect2d(0, 20, 390, 572));
  EXPECT_EQ(rotateBox(box, letter, 180), cv::Rect2d(20, 0, 572, 390));
  EXPECT_EQ(rotateBox(box, letter, 270), cv::Rect2d(402, 20, 390, 572));
}

TEST(PageGeometry, RotateBoxNormalizesTheAngle) {
  cv::Size2d letter(612, 792);
  cv::Rect2d box = makeImage(20, 402, 592, 792).box;

  EXPECT_EQ(rotateBox(box, letter, -90), rotateBox(box, letter, 270));
  EXPECT_EQ(rotateBox(box, letter, 450), rotateBox(box, letter, 90));
  EXPECT_EQ(rotateBox(box, letter, 360), box);
}

TEST(PageGeometry, RotatedMediaBoxSwapsItsSides) {
  cv::Size2d letter(612, 792);
  cv::Rect2d media(0, 0, 612, 792);

  EXPECT_EQ(rotateBox(media, letter, 90), cv::Rect2d(0, 0, 792, 612));
  EXPECT_EQ(rotateBox(media, letter, 270), cv::Rect2d(0, 0, 792, 612));
  EXPECT_EQ(rotateBox(media, letter, 180), media);
}
