#ifndef TRIAGE_SEGMENT_ASSEMBLER_HPP
#define TRIAGE_SEGMENT_ASSEMBLER_HPP

#include "TriageTypes.hpp"

#include <vector>

namespace triage {

/**
 * @brief State carried while folding page verdicts into segments
 */
struct AssemblyState {
  std::vector<int> pendingPages;       ///< Current run of Document pages
  std::vector<double> pendingCovers;   ///< Image cover of each pending page
  std::vector<DocumentSegment> segments; ///< Segments emitted so far
};

/**
 * @brief Fold one page verdict into the assembly state
 *
 * Document pages extend the pending run. Any other verdict closes the run
 * (flushing it as one "document" segment) and then emits its own segments:
 * one "full_page", "top_half" + "bottom_half", "left_half" + "right_half",
 * or nothing for a dropped page.
 */
AssemblyState addVerdict(AssemblyState state, const PageVerdict &verdict);

/**
 * @brief Flush the pending run and return the final segment list
 */
std::vector<DocumentSegment> finishAssembly(AssemblyState state);

/**
 * @brief Build the ordered segment list for a sequence of page verdicts
 */
std::vector<DocumentSegment>
assembleSegments(const std::vector<PageVerdict> &verdicts);

} // namespace triage

#endif // TRIAGE_SEGMENT_ASSEMBLER_HPP
