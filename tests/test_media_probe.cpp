// Unit tests for media probing against generated fixtures.

#include "auto_shorts/errors.hpp"
#include "auto_shorts/media_probe.hpp"

#include "fixtures/media_fixture.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

using namespace auto_shorts;
using namespace auto_shorts::test_support;

namespace fs = std::filesystem;

class MediaProbeTest : public ::testing::Test {
protected:
  void SetUp() override { dir = make_test_dir("media"); }
  void TearDown() override { fs::remove_all(dir); }

  std::string path(const std::string &name) const {
    return (fs::path(dir) / name).string();
  }

  std::string dir;
};

TEST_F(MediaProbeTest, DescribesAudioVideoFile) {
  FixtureSpec spec;
  spec.duration = 10.0;
  std::string file = path("My Stream.nut");
  write_media_fixture(file, spec);

  SourceVideo src = probe_media(file);

  EXPECT_EQ(src.path, file);
  EXPECT_EQ(src.title, "My Stream");
  EXPECT_NEAR(src.duration, 10.0, 0.2);
  EXPECT_EQ(src.width, 64);
  EXPECT_EQ(src.height, 36);
  EXPECT_NEAR(src.fps, 10.0, 0.01);
  EXPECT_TRUE(src.has_audio);
}

TEST_F(MediaProbeTest, ReportsMissingAudio) {
  FixtureSpec spec;
  spec.with_audio = false;
  std::string file = path("silent.nut");
  write_media_fixture(file, spec);

  SourceVideo src = probe_media(file);
  EXPECT_FALSE(src.has_audio);
  EXPECT_GT(src.duration, 0.0);
}

TEST_F(MediaProbeTest, MissingFileIsProbeError) {
  EXPECT_THROW(probe_media(path("does_not_exist.mp4")), ProbeError);
}

TEST_F(MediaProbeTest, GarbageFileIsProbeError) {
  std::string file = path("garbage.mp4");
  {
    std::ofstream out(file, std::ios::binary);
    for (int i = 0; i < 4096; ++i)
      out.put(static_cast<char>((i * 31) & 0x7f));
  }
  EXPECT_THROW(probe_media(file), ProbeError);
}

TEST_F(MediaProbeTest, DirectoryIsProbeError) {
  EXPECT_THROW(probe_media(dir), ProbeError);
}
