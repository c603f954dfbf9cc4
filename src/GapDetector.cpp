#include "GapDetector.hpp"

#include <algorithm>

namespace triage {

namespace {

bool crossesMidpoint(const std::vector<Interval> &intervals, double mid) {
  return std::any_of(intervals.begin(), intervals.end(),
                     [mid](const Interval &interval) {
                       return interval.start < mid && interval.end > mid;
                     });
}

} // anonymous namespace

std::vector<Interval> mergeIntervals(std::vector<Interval> intervals,
                                     double tolerance) {
  std::vector<Interval> merged;
  if (intervals.empty()) {
    return merged;
  }

  std::stable_sort(intervals.begin(), intervals.end(),
                   [](const Interval &a, const Interval &b) {
                     return a.start < b.start;
                   });

  Interval current = intervals.front();
  for (size_t i = 1; i < intervals.size(); i++) {
    const Interval &next = intervals[i];
    if (next.start <= current.end + tolerance) {
      current.end = std::max(current.end, next.end);
    } else {
      merged.push_back(current);
      current = next;
    }
  }
  merged.push_back(current);

  return merged;
}

bool detectGap(std::vector<Interval> intervals, double totalLength,
               const GapOptions &options) {
  if (intervals.empty()) {
    return false;
  }

  const double mid = totalLength / 2.0;

  // A single image across the centre already makes this one region
  if (crossesMidpoint(intervals, mid)) {
    return false;
  }

  std::vector<Interval> merged =
      mergeIntervals(std::move(intervals), options.mergeTolerance);

  if (crossesMidpoint(merged, mid)) {
    return false;
  }

  bool hasBefore =
      std::any_of(merged.begin(), merged.end(),
                  [mid](const Interval &run) { return run.end <= mid; });
  bool hasAfter =
      std::any_of(merged.begin(), merged.end(),
                  [mid](const Interval &run) { return run.start >= mid; });
  if (!hasBefore || !hasAfter) {
    return false;
  }

  const double minGap = totalLength * options.minGapRatio;
  for (size_t i = 0; i + 1 < merged.size(); i++) {
    double gap = merged[i + 1].start - merged[i].end;
    if (gap >= minGap && merged[i].end <= mid && merged[i + 1].start >= mid) {
      return true;
    }
  }

  return false;
}

} // namespace triage
