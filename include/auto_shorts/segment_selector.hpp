/**
 * @file segment_selector.hpp
 * @brief Greedy selection of non-overlapping highlight segments
 *
 * @details Every curve timestamp t with t + D <= duration is a candidate,
 *          scored by the mean of the curve over [t, t + D). Candidates are
 *          taken best-first (earlier start wins ties) as long as they keep
 *          D + min_gap away from every segment already accepted.
 *
 *          When the greedy pass ends short of K, an exact placement over the
 *          same candidates looks for the largest number of segments that fit
 *          (up to K) with the best total score, and replaces the greedy pick
 *          if it found more.
 */

#ifndef AUTO_SHORTS_SEGMENT_SELECTOR_HPP
#define AUTO_SHORTS_SEGMENT_SELECTOR_HPP

#include <vector>

#include "types.hpp"

namespace auto_shorts {

/**
 * @struct SelectionResult
 * @brief Accepted segments sorted by start time.
 */
struct SelectionResult {
  std::vector<Segment> segments;
  int requested = 0;
  bool partial = false; //< Fewer than `requested` segments could be placed
};

/**
 * @brief Choose up to `count` segments of `duration` seconds.
 *
 * @param curve Score curve of the source
 * @param count Segments wanted (K)
 * @param duration Length of every segment (D)
 * @param min_gap Extra spacing required between accepted starts
 * @return Segments sorted by start; partial when fewer than K were found
 * @throws std::invalid_argument if duration <= 0, min_gap < 0, count < 0
 *         or the curve step is not positive
 */
SelectionResult select_segments(const ScoreCurve &curve, int count,
                                double duration, double min_gap = 0.0);

} // namespace auto_shorts

#endif // AUTO_SHORTS_SEGMENT_SELECTOR_HPP
