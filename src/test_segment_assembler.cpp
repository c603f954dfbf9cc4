#include "SegmentAssembler.hpp"

#include <gtest/gtest.h>

using namespace triage;

namespace {

PageVerdict verdict(int pageNumber, PageType type, double cover = 0.0) {
  PageVerdict v;
  v.pageNumber = pageNumber;
  v.type = type;
  v.imageCoverPercent = cover;
  return v;
}

} // anonymous namespace

TEST(SegmentAssembler, NoVerdictsNoSegments) {
  EXPECT_TRUE(assembleSegments({}).empty());
}

TEST(SegmentAssembler, ConsecutiveDocumentPagesFormOneRun) {
  std::vector<DocumentSegment> segments =
      assembleSegments({verdict(1, PageType::Document, 0.0),
                        verdict(2, PageType::Document, 10.0),
                        verdict(3, PageType::Document, 5.0)});

  ASSERT_EQ(segments.size(), 1u);
  EXPECT_EQ(segments[0].type, "document");
  EXPECT_EQ(segments[0].pages, (std::vector<int>{1, 2, 3}));
  EXPECT_DOUBLE_EQ(segments[0].imageCover, 5.0);
}

TEST(SegmentAssembler, RunCoverIsRoundedMean) {
  std::vector<DocumentSegment> segments =
      assembleSegments({verdict(1, PageType::Document, 1.0),
                        verdict(2, PageType::Document, 1.0),
                        verdict(3, PageType::Document, 2.0)});

  ASSERT_EQ(segments.size(), 1u);
  EXPECT_DOUBLE_EQ(segments[0].imageCover, 1.33);
}

TEST(SegmentAssembler, DroppedPageBreaksRun) {
  std::vector<DocumentSegment> segments =
      assembleSegments({verdict(1, PageType::Document),
                        verdict(2, PageType::Dropped),
                        verdict(3, PageType::Document)});

  ASSERT_EQ(segments.size(), 2u);
  EXPECT_EQ(segments[0].pages, std::vector<int>{1});
  EXPECT_EQ(segments[1].pages, std::vector<int>{3});
}

TEST(SegmentAssembler, DroppedPagesEmitNothing) {
  std::vector<DocumentSegment> segments = assembleSegments(
      {verdict(1, PageType::Dropped), verdict(2, PageType::Dropped)});
  EXPECT_TRUE(segments.empty());
}

TEST(SegmentAssembler, FullPageClosesRunAndStandsAlone) {
  std::vector<DocumentSegment> segments =
      assembleSegments({verdict(1, PageType::Document, 2.0),
                        verdict(2, PageType::FullPage, 80.0),
                        verdict(3, PageType::Document, 4.0)});

  ASSERT_EQ(segments.size(), 3u);
  EXPECT_EQ(segments[0].type, "document");
  EXPECT_EQ(segments[1].type, "full_page");
  EXPECT_EQ(segments[1].pages, std::vector<int>{2});
  EXPECT_DOUBLE_EQ(segments[1].imageCover, 80.0);
  EXPECT_EQ(segments[2].type, "document");
  EXPECT_EQ(segments[2].pages, std::vector<int>{3});
}

TEST(SegmentAssembler, SplitPagesEmitTwoHalves) {
  std::vector<DocumentSegment> segments =
      assembleSegments({verdict(1, PageType::TopBottomSplit, 70.0),
                        verdict(2, PageType::LeftRightSplit, 60.0)});

  ASSERT_EQ(segments.size(), 4u);
  EXPECT_EQ(segments[0].type, "top_half");
  EXPECT_EQ(segments[1].type, "bottom_half");
  EXPECT_EQ(segments[2].type, "left_half");
  EXPECT_EQ(segments[3].type, "right_half");

  for (size_t i = 0; i < 2; i++) {
    EXPECT_EQ(segments[i].pages, std::vector<int>{1});
    EXPECT_DOUBLE_EQ(segments[i].imageCover, 70.0);
  }
  for (size_t i = 2; i < 4; i++) {
    EXPECT_EQ(segments[i].pages, std::vector<int>{2});
    EXPECT_DOUBLE_EQ(segments[i].imageCover, 60.0);
  }
}

TEST(SegmentAssembler, FoldStepsMatchBatchAssembly) {
  std::vector<PageVerdict> verdicts = {
      verdict(1, PageType::Document), verdict(2, PageType::Document),
      verdict(3, PageType::FullPage), verdict(4, PageType::Document)};

  AssemblyState state;
  state = addVerdict(std::move(state), verdicts[0]);
  state = addVerdict(std::move(state), verdicts[1]);
  EXPECT_EQ(state.pendingPages, (std::vector<int>{1, 2}));
  EXPECT_TRUE(state.segments.empty());

  state = addVerdict(std::move(state), verdicts[2]);
  EXPECT_TRUE(state.pendingPages.empty());
  EXPECT_EQ(state.segments.size(), 2u);

  state = addVerdict(std::move(state), verdicts[3]);
  std::vector<DocumentSegment> folded = finishAssembly(std::move(state));
  std::vector<DocumentSegment> batch = assembleSegments(verdicts);

  ASSERT_EQ(folded.size(), batch.size());
  for (size_t i = 0; i < folded.size(); i++) {
    EXPECT_EQ(folded[i].pages, batch[i].pages);
    EXPECT_EQ(folded[i].type, batch[i].type);
  }
}
