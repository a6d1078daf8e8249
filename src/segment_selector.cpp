/**
 * @file segment_selector.cpp
 * @brief Segment selection implementation
 */

#include "auto_shorts/segment_selector.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

#include <fmt/core.h>

#include "auto_shorts/logging.hpp"

namespace auto_shorts {

namespace {

/// Float slack for comparisons of accumulated timestamps
constexpr double TIME_EPSILON = 1e-9;

struct Candidate {
  size_t first; //< Index of the first curve sample
  double start;
  double score;
};

/**
 * @brief Exact placement of as many segments as fit, up to `count`.
 *
 * @details Dynamic programming over candidates in start order. best[c][i]
 *          holds the top total score of c segments taken from candidates
 *          i.. with the required spacing. The largest feasible c wins, and
 *          on equal totals the earlier candidate is taken.
 */
std::vector<Segment> place_most(const std::vector<Candidate> &by_start,
                                int count, double duration, double spacing) {
  const size_t n = by_start.size();
  const double NONE = -std::numeric_limits<double>::infinity();

  /// First candidate clear of candidate i
  std::vector<size_t> next(n, n);
  size_t j = 0;
  for (size_t i = 0; i < n; ++i) {
    j = std::max(j, i + 1);
    while (j < n &&
           by_start[j].start < by_start[i].start + spacing - TIME_EPSILON)
      ++j;
    next[i] = j;
  }

  std::vector<std::vector<double>> best(
      static_cast<size_t>(count) + 1, std::vector<double>(n + 1, NONE));
  std::vector<std::vector<char>> take(static_cast<size_t>(count) + 1,
                                      std::vector<char>(n, 0));
  std::fill(best[0].begin(), best[0].end(), 0.0);

  for (size_t c = 1; c <= static_cast<size_t>(count); ++c) {
    for (size_t i = n; i-- > 0;) {
      double skip = best[c][i + 1];
      double with = best[c - 1][next[i]];
      if (with != NONE && with + by_start[i].score >= skip) {
        best[c][i] = with + by_start[i].score;
        take[c][i] = 1;
      } else {
        best[c][i] = skip;
      }
    }
  }

  size_t fit = static_cast<size_t>(count);
  while (fit > 0 && best[fit][0] == NONE)
    --fit;

  std::vector<Segment> placed;
  size_t i = 0;
  for (size_t c = fit; c > 0 && i < n;) {
    if (take[c][i]) {
      const Candidate &pick = by_start[i];
      placed.push_back({pick.start, pick.start + duration, pick.score});
      i = next[i];
      --c;
    } else {
      ++i;
    }
  }
  return placed;
}

} // anonymous namespace

SelectionResult select_segments(const ScoreCurve &curve, int count,
                                double duration, double min_gap) {
  if (!(duration > 0))
    throw std::invalid_argument(
        fmt::format("segment duration must be > 0, got {}", duration));
  if (!(curve.step > 0))
    throw std::invalid_argument(
        fmt::format("curve step must be > 0, got {}", curve.step));
  if (count < 0)
    throw std::invalid_argument("segment count must be >= 0");
  if (min_gap < 0)
    throw std::invalid_argument("min_gap must be >= 0");

  SelectionResult result;
  result.requested = count;
  if (count == 0)
    return result;

  const size_t n = curve.samples.size();

  // **----- CANDIDATE SCORES (prefix sums) -----**

  std::vector<double> prefix(n + 1, 0.0);
  for (size_t i = 0; i < n; ++i)
    prefix[i + 1] = prefix[i] + curve.samples[i].score;

  /// Samples covered by [t, t + D)
  const size_t span = std::max<size_t>(
      1, static_cast<size_t>(std::ceil(duration / curve.step - TIME_EPSILON)));

  std::vector<Candidate> candidates;
  for (size_t i = 0; i < n; ++i) {
    double t = curve.samples[i].timestamp;
    if (t + duration > curve.duration + TIME_EPSILON)
      break;
    size_t last = std::min(n, i + span);
    double mean = (prefix[last] - prefix[i]) / static_cast<double>(last - i);
    candidates.push_back({i, t, mean});
  }

  // **----- GREEDY ACCEPTANCE -----**

  const std::vector<Candidate> by_start = candidates;
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const Candidate &a, const Candidate &b) {
                     if (a.score != b.score)
                       return a.score > b.score;
                     return a.start < b.start;
                   });

  const double spacing = duration + min_gap;
  for (const auto &c : candidates) {
    if (result.segments.size() >= static_cast<size_t>(count))
      break;

    bool clear = std::all_of(
        result.segments.begin(), result.segments.end(),
        [&](const Segment &s) {
          return std::fabs(c.start - s.start) >= spacing - TIME_EPSILON;
        });
    if (clear)
      result.segments.push_back({c.start, c.start + duration, c.score});
  }

  std::sort(result.segments.begin(), result.segments.end(),
            [](const Segment &a, const Segment &b) { return a.start < b.start; });

  // **----- EXACT FALLBACK -----**

  /// Greedy picks can leave gaps too narrow for one more segment
  if (result.segments.size() < static_cast<size_t>(count)) {
    const double bound = std::floor(
        (curve.duration + min_gap + TIME_EPSILON) / spacing);
    const int limit = static_cast<int>(
        std::min<double>(count, std::max(0.0, bound)));
    if (static_cast<size_t>(limit) > result.segments.size()) {
      std::vector<Segment> placed =
          place_most(by_start, limit, duration, spacing);
      if (placed.size() > result.segments.size())
        result.segments = std::move(placed);
    }
  }

  result.partial = result.segments.size() < static_cast<size_t>(count);
  if (result.partial) {
    LOG_WARN("Selected {} of {} segments of {:.0f}s from {:.0f}s of source",
             result.segments.size(), count, duration, curve.duration);
  }
  return result;
}

} // namespace auto_shorts
