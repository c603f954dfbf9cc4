#include "PageClassifier.hpp"
#include "PdfPageLoader.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace triage;

namespace {

// Page 1: /Rotate 90, two images filling the left and right halves of the
//         displayed (landscape) page.
// Page 2: "Hello brave new world" in Helvetica 12 at (72, 700).
// Page 3: same text, crop box [36 36 576 756].
const std::string kFixture =
    std::string(DOC_TRIAGE_TESTDATA_DIR) + "/rotated_and_cropped.pdf";

std::string joinCharacters(const PageContent &page) {
  std::string joined;
  for (const auto &character : page.characters) {
    joined += character.text;
  }
  return joined;
}

} // anonymous namespace

class PdfPageLoaderTest : public ::testing::Test {
protected:
  void SetUp() override {
    PdfPageLoader loader;
    loaded = loader.loadPages(kFixture);
    ASSERT_TRUE(loaded.success) << loaded.errorMessage;
    ASSERT_EQ(loaded.pages.size(), 3u);
  }

  PageLoadResult loaded;
};

TEST_F(PdfPageLoaderTest, RotatedPageUsesDisplayedOrientation) {
  const PageContent &page = loaded.pages[0];
  EXPECT_EQ(page.pageNumber, 1);
  EXPECT_DOUBLE_EQ(page.mediaBox.width, 792.0);
  EXPECT_DOUBLE_EQ(page.mediaBox.height, 612.0);
  EXPECT_FALSE(page.cropBox.has_value());

  ASSERT_EQ(page.images.size(), 2u);
  EXPECT_NEAR(page.images[0].box.x, 0.0, 0.5);
  EXPECT_NEAR(page.images[0].box.width, 390.0, 0.5);
  EXPECT_NEAR(page.images[0].box.y, 20.0, 0.5);
  EXPECT_NEAR(page.images[0].box.height, 572.0, 0.5);
  EXPECT_NEAR(page.images[1].box.x, 402.0, 0.5);
  EXPECT_NEAR(page.images[1].box.width, 390.0, 0.5);
}

TEST_F(PdfPageLoaderTest, RotatedSideBySideScansSplitLeftRight) {
  PageClassifier classifier{TriageConfig()};
  EXPECT_EQ(classifier.classify(loaded.pages[0]).type,
            PageType::LeftRightSplit);
}

TEST_F(PdfPageLoaderTest, WordsAreSeparatedBySpaces) {
  const PageContent &page = loaded.pages[1];
  EXPECT_TRUE(page.images.empty());
  EXPECT_NE(page.text.find("Hello"), std::string::npos);
  EXPECT_EQ(joinCharacters(page), "Hello brave new world");
}

TEST_F(PdfPageLoaderTest, CharacterBoxesAreMediaBoxRelative) {
  const PageContent &plain = loaded.pages[1];
  const PageContent &cropped = loaded.pages[2];

  ASSERT_TRUE(cropped.cropBox.has_value());
  EXPECT_EQ(*cropped.cropBox, cv::Rect2d(36, 36, 540, 720));
  ASSERT_FALSE(plain.characters.empty());
  ASSERT_FALSE(cropped.characters.empty());

  // "H" starts at x = 72; the baseline sits 92 points below the top
  const cv::Rect2d &first = plain.characters.front().box;
  EXPECT_NEAR(first.x, 72.0, 0.5);
  EXPECT_LT(first.y, 92.0);
  EXPECT_GE(first.y + first.height, 91.5);

  const cv::Rect2d &croppedFirst = cropped.characters.front().box;
  EXPECT_NEAR(croppedFirst.x, first.x, 0.5);
  EXPECT_NEAR(croppedFirst.y, first.y, 0.5);
}

TEST_F(PdfPageLoaderTest, SpaceBoxesFillTheGapBetweenWords) {
  const std::vector<Character> &characters = loaded.pages[1].characters;
  ASSERT_GT(characters.size(), 6u);

  // "Hello" then the space, then "b"
  const Character &space = characters[5];
  EXPECT_EQ(space.text, " ");
  EXPECT_NEAR(space.box.x, characters[4].box.x + characters[4].box.width,
              0.5);
  EXPECT_LE(space.box.x + space.box.width, characters[6].box.x + 0.5);
}

TEST(PdfPageLoader, MissingFileFails) {
  PdfPageLoader loader;
  PageLoadResult result = loader.loadPages("/nonexistent/scan.pdf");
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.errorMessage.empty());
  EXPECT_TRUE(result.pages.empty());
}

TEST(Utf16CodePoints, SurrogatePairsAreOneCodePoint) {
  // "a", U+1F4C4 as a surrogate pair, "b"
  const unsigned short units[] = {0x61, 0xD83D, 0xDCC4, 0x62};
  std::vector<std::pair<size_t, size_t>> runs = utf16CodePointRuns(units, 4);

  ASSERT_EQ(runs.size(), 3u);
  EXPECT_EQ(runs[0], std::make_pair(size_t(0), size_t(1)));
  EXPECT_EQ(runs[1], std::make_pair(size_t(1), size_t(2)));
  EXPECT_EQ(runs[2], std::make_pair(size_t(3), size_t(1)));
}

TEST(Utf16CodePoints, UnpairedSurrogatesStandAlone) {
  const unsigned short lone[] = {0xD83D, 0x61, 0xDCC4};
  EXPECT_EQ(utf16CodePointRuns(lone, 3).size(), 3u);

  const unsigned short trailing[] = {0x61, 0xD83D};
  EXPECT_EQ(utf16CodePointRuns(trailing, 2).size(), 2u);

  EXPECT_TRUE(utf16CodePointRuns(nullptr, 0).empty());
}
