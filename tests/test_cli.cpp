// Unit tests for command-line parsing.

#include "auto_shorts/cli.hpp"
#include "auto_shorts/errors.hpp"

#include <gtest/gtest.h>

using namespace auto_shorts;

TEST(CliTest, LayoutAliases) {
  LayoutMode::Kind kind = LayoutMode::Kind::SplitScreen;
  for (const char *name : {"normal", "n", "shorts", "s", "NORMAL"}) {
    ASSERT_TRUE(parse_layout_kind(name, kind)) << name;
    EXPECT_EQ(kind, LayoutMode::Kind::Passthrough) << name;
  }
  for (const char *name : {"screen", "split", "split_screen", "Screen"}) {
    ASSERT_TRUE(parse_layout_kind(name, kind)) << name;
    EXPECT_EQ(kind, LayoutMode::Kind::SplitScreen) << name;
  }
  EXPECT_FALSE(parse_layout_kind("landscape", kind));
  EXPECT_FALSE(parse_layout_kind("", kind));
}

TEST(CliTest, CountMustBePositiveInteger) {
  int count = 0;
  EXPECT_TRUE(parse_count("7", count));
  EXPECT_EQ(count, 7);

  count = 5;
  EXPECT_FALSE(parse_count("0", count));
  EXPECT_FALSE(parse_count("-3", count));
  EXPECT_FALSE(parse_count("3.5", count));
  EXPECT_FALSE(parse_count("three", count));
  EXPECT_FALSE(parse_count("", count));
  EXPECT_EQ(count, 5);
}

TEST(CliTest, SourceOnlyUsesConfiguredCount) {
  PipelineConfig cfg;
  cfg.count_per_video = 4;
  const char *argv[] = {"auto_shorts", "video.mp4"};
  CliOptions opts;

  ASSERT_TRUE(parse_cli(2, argv, cfg, opts));
  EXPECT_EQ(opts.source, "video.mp4");
  EXPECT_EQ(opts.count, 4);
  EXPECT_EQ(opts.layout, LayoutMode::Kind::Passthrough);
}

TEST(CliTest, AllArguments) {
  PipelineConfig cfg;
  const char *argv[] = {"auto_shorts", "https://youtu.be/x", "3", "screen"};
  CliOptions opts;

  ASSERT_TRUE(parse_cli(4, argv, cfg, opts));
  EXPECT_EQ(opts.source, "https://youtu.be/x");
  EXPECT_EQ(opts.count, 3);
  EXPECT_EQ(opts.layout, LayoutMode::Kind::SplitScreen);
}

TEST(CliTest, RejectsBadArguments) {
  PipelineConfig cfg;
  CliOptions opts;

  const char *none[] = {"auto_shorts"};
  EXPECT_FALSE(parse_cli(1, none, cfg, opts));

  const char *too_many[] = {"auto_shorts", "a", "1", "normal", "extra"};
  EXPECT_FALSE(parse_cli(5, too_many, cfg, opts));

  const char *bad_count[] = {"auto_shorts", "a", "zero"};
  EXPECT_FALSE(parse_cli(3, bad_count, cfg, opts));

  const char *bad_layout[] = {"auto_shorts", "a", "2", "wide"};
  EXPECT_FALSE(parse_cli(4, bad_layout, cfg, opts));
}

TEST(CliTest, ResolveLayout) {
  PipelineConfig cfg;
  EXPECT_FALSE(
      resolve_layout(LayoutMode::Kind::Passthrough, cfg).is_split_screen());
  EXPECT_TRUE(
      resolve_layout(LayoutMode::Kind::SplitScreen, cfg).is_split_screen());

  cfg.split.camera = {0.9, 0.0, 0.5, 0.5};
  EXPECT_THROW(resolve_layout(LayoutMode::Kind::SplitScreen, cfg), ConfigError);
}
