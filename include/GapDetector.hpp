#ifndef TRIAGE_GAP_DETECTOR_HPP
#define TRIAGE_GAP_DETECTOR_HPP

#include <vector>

namespace triage {

/**
 * @brief Extent of an image box projected onto one page axis
 */
struct Interval {
  double start; ///< Lower coordinate (top or x0)
  double end;   ///< Upper coordinate (bottom or x1)
};

/**
 * @brief Parameters of the gap search
 */
struct GapOptions {
  double mergeTolerance = 5.0; ///< Intervals closer than this are merged
  double minGapRatio = 0.01;   ///< Minimum gap as a share of the axis length
};

/**
 * @brief Decide whether projected image extents form two groups separated
 * around the middle of the axis
 *
 * The check is conservative:
 * - an empty list never splits,
 * - any interval (before or after merging) that crosses the midpoint
 *   prevents a split,
 * - intervals closer than @c mergeTolerance are merged into one run,
 * - a split needs a run ending at or before the midpoint followed directly
 *   by a run starting at or after it, with a gap of at least
 *   @c minGapRatio * @p totalLength between them.
 *
 * @param intervals Projected extents, in any order
 * @param totalLength Length of the axis; the midpoint is totalLength / 2
 * @param options Merge tolerance and minimum gap ratio
 * @return true if the intervals split into two groups
 */
bool detectGap(std::vector<Interval> intervals, double totalLength,
               const GapOptions &options = GapOptions());

/**
 * @brief Sort by start and merge intervals whose gap is within @p tolerance
 */
std::vector<Interval> mergeIntervals(std::vector<Interval> intervals,
                                     double tolerance);

} // namespace triage

#endif // TRIAGE_GAP_DETECTOR_HPP
