// Unit tests for highlight selection.

#include "auto_shorts/segment_selector.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdlib>
#include <random>
#include <stdexcept>

using namespace auto_shorts;

namespace {

ScoreCurve make_curve(const std::vector<double> &scores, double step = 1.0) {
  ScoreCurve curve;
  curve.step = step;
  curve.duration = static_cast<double>(scores.size()) * step;
  for (size_t i = 0; i < scores.size(); ++i)
    curve.samples.push_back({static_cast<double>(i) * step, scores[i]});
  return curve;
}

ScoreCurve flat_curve(size_t seconds, double value = 1.0) {
  return make_curve(std::vector<double>(seconds, value));
}

void expect_valid(const SelectionResult &r, double duration, double d,
                  double min_gap) {
  for (size_t i = 0; i < r.segments.size(); ++i) {
    const Segment &s = r.segments[i];
    EXPECT_GE(s.start, 0.0);
    EXPECT_LE(s.end, duration + 1e-9);
    EXPECT_NEAR(s.length(), d, 1e-9);
    if (i > 0) {
      EXPECT_LT(r.segments[i - 1].start, s.start);
      EXPECT_GE(s.start - r.segments[i - 1].start, d + min_gap - 1e-9);
      EXPECT_LE(r.segments[i - 1].end, s.start + 1e-9 - min_gap);
    }
  }
}

} // namespace

TEST(SegmentSelectorTest, ShortSourceYieldsSinglePartialSelection) {
  SelectionResult r = select_segments(flat_curve(90), 7, 60.0);

  ASSERT_EQ(r.segments.size(), 1u);
  EXPECT_TRUE(r.partial);
  EXPECT_EQ(r.requested, 7);
  EXPECT_DOUBLE_EQ(r.segments[0].start, 0.0);
  EXPECT_DOUBLE_EQ(r.segments[0].end, 60.0);
}

TEST(SegmentSelectorTest, TenMinuteSourceYieldsSevenMinutesOfShorts) {
  SelectionResult r = select_segments(flat_curve(600), 7, 60.0);

  ASSERT_EQ(r.segments.size(), 7u);
  EXPECT_FALSE(r.partial);

  double total = 0;
  for (const auto &s : r.segments)
    total += s.length();
  EXPECT_DOUBLE_EQ(total, 420.0);
  expect_valid(r, 600.0, 60.0, 0.0);
}

TEST(SegmentSelectorTest, FlatCurveTiesPreferEarlierStarts) {
  SelectionResult r = select_segments(flat_curve(600), 3, 60.0);

  ASSERT_EQ(r.segments.size(), 3u);
  EXPECT_DOUBLE_EQ(r.segments[0].start, 0.0);
  EXPECT_DOUBLE_EQ(r.segments[1].start, 60.0);
  EXPECT_DOUBLE_EQ(r.segments[2].start, 120.0);
}

TEST(SegmentSelectorTest, PicksLoudestSpan) {
  std::vector<double> scores(300, 0.1);
  for (int t = 200; t < 230; ++t)
    scores[t] = 0.9;

  SelectionResult r = select_segments(make_curve(scores), 1, 30.0);

  ASSERT_EQ(r.segments.size(), 1u);
  EXPECT_DOUBLE_EQ(r.segments[0].start, 200.0);
  EXPECT_NEAR(r.segments[0].score, 0.9, 1e-12);
}

TEST(SegmentSelectorTest, ScoreIsMeanOverSpan) {
  SelectionResult r =
      select_segments(make_curve({1, 2, 3, 4, 5, 6}), 1, 2.0);

  ASSERT_EQ(r.segments.size(), 1u);
  EXPECT_DOUBLE_EQ(r.segments[0].start, 4.0);
  EXPECT_DOUBLE_EQ(r.segments[0].score, 5.5);
}

TEST(SegmentSelectorTest, OutputSortedByStartNotScore) {
  std::vector<double> scores(100, 0.0);
  for (int t = 70; t < 80; ++t)
    scores[t] = 1.0;
  for (int t = 10; t < 20; ++t)
    scores[t] = 0.5;

  SelectionResult r = select_segments(make_curve(scores), 2, 10.0);

  ASSERT_EQ(r.segments.size(), 2u);
  EXPECT_DOUBLE_EQ(r.segments[0].start, 10.0);
  EXPECT_DOUBLE_EQ(r.segments[1].start, 70.0);
  EXPECT_GT(r.segments[1].score, r.segments[0].score);
}

TEST(SegmentSelectorTest, MinGapWidensSpacing) {
  SelectionResult r = select_segments(flat_curve(100), 5, 10.0, 15.0);

  expect_valid(r, 100.0, 10.0, 15.0);
  ASSERT_EQ(r.segments.size(), 4u);
  EXPECT_DOUBLE_EQ(r.segments[1].start, 25.0);
  EXPECT_TRUE(r.partial);
}

TEST(SegmentSelectorTest, OffGridPeaksStillYieldAllSegments) {
  /// Loudest starts leave 59 s holes between them, too narrow for a 60 s short
  std::vector<double> scores(600, 0.1);
  for (int peak : {59, 178, 297, 416, 535})
    for (int t = peak; t < peak + 60; ++t)
      scores[t] = 1.0;

  SelectionResult r = select_segments(make_curve(scores), 7, 60.0);

  ASSERT_EQ(r.segments.size(), 7u);
  EXPECT_FALSE(r.partial);
  expect_valid(r, 600.0, 60.0, 0.0);
}

TEST(SegmentSelectorTest, CentredPeakDoesNotBlockTwoHalves) {
  std::vector<double> scores(120, 0.0);
  for (int t = 30; t < 90; ++t)
    scores[t] = 1.0;

  SelectionResult r = select_segments(make_curve(scores), 2, 60.0);

  ASSERT_EQ(r.segments.size(), 2u);
  EXPECT_FALSE(r.partial);
  EXPECT_DOUBLE_EQ(r.segments[0].start, 0.0);
  EXPECT_DOUBLE_EQ(r.segments[1].start, 60.0);
  EXPECT_DOUBLE_EQ(r.segments[0].score, 0.5);
  EXPECT_DOUBLE_EQ(r.segments[1].score, 0.5);
}

TEST(SegmentSelectorTest, ExactPlacementHonoursMinGap) {
  /// Greedy takes [40, 60), after which only one more fits with gap 10
  std::vector<double> scores(80, 0.0);
  for (int t = 40; t < 60; ++t)
    scores[t] = 1.0;

  SelectionResult r = select_segments(make_curve(scores), 3, 20.0, 10.0);

  expect_valid(r, 80.0, 20.0, 10.0);
  ASSERT_EQ(r.segments.size(), 3u);
  EXPECT_FALSE(r.partial);
  EXPECT_DOUBLE_EQ(r.segments[0].start, 0.0);
  EXPECT_DOUBLE_EQ(r.segments[1].start, 30.0);
  EXPECT_DOUBLE_EQ(r.segments[2].start, 60.0);
}

TEST(SegmentSelectorTest, ZeroCountIsEmptyAndComplete) {
  SelectionResult r = select_segments(flat_curve(100), 0, 10.0);

  EXPECT_TRUE(r.segments.empty());
  EXPECT_FALSE(r.partial);
}

TEST(SegmentSelectorTest, SourceShorterThanDurationIsPartial) {
  SelectionResult r = select_segments(flat_curve(30), 2, 60.0);

  EXPECT_TRUE(r.segments.empty());
  EXPECT_TRUE(r.partial);
}

TEST(SegmentSelectorTest, RejectsInvalidArguments) {
  EXPECT_THROW(select_segments(flat_curve(100), 1, 0.0), std::invalid_argument);
  EXPECT_THROW(select_segments(flat_curve(100), 1, -5.0),
               std::invalid_argument);
  EXPECT_THROW(select_segments(flat_curve(100), -1, 10.0),
               std::invalid_argument);

  ScoreCurve bad = flat_curve(100);
  bad.step = 0.0;
  EXPECT_THROW(select_segments(bad, 1, 10.0), std::invalid_argument);
}

TEST(SegmentSelectorTest, RandomCurvesNeverOverlapAndAreDeterministic) {
  std::mt19937 rng(1234);
  std::uniform_real_distribution<double> score(0.0, 1.0);
  std::uniform_int_distribution<int> length(20, 400);
  std::uniform_int_distribution<int> count(1, 9);
  std::uniform_int_distribution<int> dur(5, 60);

  for (int round = 0; round < 200; ++round) {
    std::vector<double> scores(length(rng));
    for (auto &s : scores)
      s = score(rng);
    ScoreCurve curve = make_curve(scores, 0.5);
    int k = count(rng);
    double d = dur(rng);
    double gap = round % 3 == 0 ? 4.0 : 0.0;

    SelectionResult a = select_segments(curve, k, d, gap);
    SelectionResult b = select_segments(curve, k, d, gap);

    expect_valid(a, curve.duration, d, gap);
    EXPECT_LE(a.segments.size(), static_cast<size_t>(k));
    EXPECT_EQ(a.partial, a.segments.size() < static_cast<size_t>(k));

    ASSERT_EQ(a.segments.size(), b.segments.size());
    for (size_t i = 0; i < a.segments.size(); ++i) {
      EXPECT_EQ(a.segments[i].start, b.segments[i].start);
      EXPECT_EQ(a.segments[i].score, b.segments[i].score);
    }
  }
}
