#include "SegmentAssembler.hpp"

#include "PageGeometry.hpp"

#include <numeric>

namespace triage {

namespace {

void flushPendingRun(AssemblyState &state) {
  if (state.pendingPages.empty()) {
    return;
  }

  double sum = std::accumulate(state.pendingCovers.begin(),
                               state.pendingCovers.end(), 0.0);

  DocumentSegment segment;
  segment.pages = std::move(state.pendingPages);
  segment.type = "document";
  segment.imageCover = roundPercent(sum / state.pendingCovers.size());
  state.segments.push_back(std::move(segment));

  state.pendingPages.clear();
  state.pendingCovers.clear();
}

void emitPageSegment(AssemblyState &state, const PageVerdict &verdict,
                     const char *type) {
  state.segments.push_back(
      {{verdict.pageNumber}, type, verdict.imageCoverPercent});
}

} // anonymous namespace

AssemblyState addVerdict(AssemblyState state, const PageVerdict &verdict) {
  if (verdict.type == PageType::Document) {
    state.pendingPages.push_back(verdict.pageNumber);
    state.pendingCovers.push_back(verdict.imageCoverPercent);
    return state;
  }

  flushPendingRun(state);

  switch (verdict.type) {
  case PageType::FullPage:
    emitPageSegment(state, verdict, "full_page");
    break;
  case PageType::TopBottomSplit:
    emitPageSegment(state, verdict, "top_half");
    emitPageSegment(state, verdict, "bottom_half");
    break;
  case PageType::LeftRightSplit:
    emitPageSegment(state, verdict, "left_half");
    emitPageSegment(state, verdict, "right_half");
    break;
  case PageType::Dropped:
  case PageType::Document:
    break;
  }

  return state;
}

std::vector<DocumentSegment> finishAssembly(AssemblyState state) {
  flushPendingRun(state);
  return std::move(state.segments);
}

std::vector<DocumentSegment>
assembleSegments(const std::vector<PageVerdict> &verdicts) {
  AssemblyState state;
  for (const auto &verdict : verdicts) {
    state = addVerdict(std::move(state), verdict);
  }
  return finishAssembly(std::move(state));
}

} // namespace triage
