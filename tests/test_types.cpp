// Unit tests for layout construction and core value types.

#include "auto_shorts/errors.hpp"
#include "auto_shorts/types.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

using namespace auto_shorts;

TEST(LayoutModeTest, PassthroughIsDefault) {
  LayoutMode mode = LayoutMode::passthrough();
  EXPECT_EQ(mode.kind(), LayoutMode::Kind::Passthrough);
  EXPECT_FALSE(mode.is_split_screen());
  EXPECT_EQ(mode.name(), "passthrough");
}

TEST(LayoutModeTest, SplitScreenKeepsRegions) {
  SplitScreenLayout split;
  split.top_fraction = 0.4;
  split.bottom_fraction = 0.6;
  split.camera = {0.0, 0.5, 0.25, 0.5};

  LayoutMode mode = LayoutMode::split_screen(split);
  EXPECT_TRUE(mode.is_split_screen());
  EXPECT_DOUBLE_EQ(mode.split().top_fraction, 0.4);
  EXPECT_DOUBLE_EQ(mode.split().camera.y, 0.5);
  EXPECT_NE(mode.name().find("0.40/0.60"), std::string::npos);
}

TEST(LayoutModeTest, DefaultSplitIsValid) {
  EXPECT_NO_THROW(LayoutMode::split_screen(SplitScreenLayout{}));
}

TEST(LayoutModeTest, FractionsMustSumToOne) {
  SplitScreenLayout split;
  split.top_fraction = 0.5;
  split.bottom_fraction = 0.6;
  EXPECT_THROW(LayoutMode::split_screen(split), std::invalid_argument);

  /// Within tolerance
  split.bottom_fraction = 0.5 + 5e-7;
  EXPECT_NO_THROW(LayoutMode::split_screen(split));
}

TEST(LayoutModeTest, FractionsMustBeInsideUnitInterval) {
  SplitScreenLayout split;
  split.top_fraction = 0.0;
  split.bottom_fraction = 1.0;
  EXPECT_THROW(LayoutMode::split_screen(split), std::invalid_argument);
}

TEST(LayoutModeTest, CropRectsMustBeInsideFrame) {
  SplitScreenLayout split;
  split.camera = {0.8, 0.0, 0.3, 0.3};
  EXPECT_THROW(LayoutMode::split_screen(split), std::invalid_argument);

  split = SplitScreenLayout{};
  split.content = {0.0, 0.0, 0.0, 1.0};
  EXPECT_THROW(LayoutMode::split_screen(split), std::invalid_argument);
}

TEST(CropRectTest, Validity) {
  EXPECT_TRUE((CropRect{0, 0, 1, 1}).is_valid());
  EXPECT_TRUE((CropRect{0.7, 0.0, 0.3, 0.35}).is_valid());
  EXPECT_FALSE((CropRect{-0.1, 0, 0.5, 0.5}).is_valid());
  EXPECT_FALSE((CropRect{0.5, 0.5, 0.6, 0.1}).is_valid());
}

TEST(TypesTest, FailureKindNames) {
  EXPECT_STREQ(to_string(FailureKind::ComposeError), "ComposeError");
  EXPECT_STREQ(to_string(FailureKind::AudioMuxFailure), "AudioMuxFailure");
  EXPECT_STREQ(to_string(FailureKind::Cancelled), "Cancelled");
}

TEST(TypesTest, ErrorKindsAreCarried) {
  AnalysisError a(AnalysisError::Kind::TooShort, "short");
  EXPECT_EQ(a.kind(), AnalysisError::Kind::TooShort);
  EXPECT_STREQ(to_string(a.kind()), "TooShort");

  EncodeError e(EncodeError::Kind::AudioMuxFailure, "no audio");
  EXPECT_EQ(e.kind(), EncodeError::Kind::AudioMuxFailure);
  EXPECT_STREQ(e.what(), "no audio");

  const Error &base = e;
  EXPECT_STREQ(base.what(), "no audio");
}

TEST(TypesTest, SegmentLength) {
  Segment s{12.5, 72.5, 0.3};
  EXPECT_DOUBLE_EQ(s.length(), 60.0);
}
