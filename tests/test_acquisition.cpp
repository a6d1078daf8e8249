// Unit tests for resolving the source argument to a local file.

#include "auto_shorts/acquisition.hpp"
#include "auto_shorts/errors.hpp"

#include "fixtures/fake_runner.hpp"
#include "fixtures/media_fixture.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace auto_shorts;
using namespace auto_shorts::test_support;

namespace fs = std::filesystem;

class AcquisitionTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = make_test_dir("acquire");
    downloads = (fs::path(dir) / "downloads").string();
  }
  void TearDown() override { fs::remove_all(dir); }

  std::string dir;
  std::string downloads;
  FakeRunner runner;
};

TEST_F(AcquisitionTest, LocalFilePassesThrough) {
  std::string file = (fs::path(dir) / "local.nut").string();
  write_media_fixture(file, FixtureSpec{});

  EXPECT_EQ(acquire_source(file, downloads, runner), file);
  EXPECT_EQ(runner.call_count(), 0u);
  EXPECT_FALSE(fs::exists(downloads));
}

TEST_F(AcquisitionTest, MissingLocalPathIsRejected) {
  EXPECT_THROW(acquire_source((fs::path(dir) / "nope.mp4").string(), downloads,
                              runner),
               AcquisitionError);
  EXPECT_THROW(acquire_source(dir, downloads, runner), AcquisitionError);
  EXPECT_EQ(runner.call_count(), 0u);
}

TEST_F(AcquisitionTest, UrlIsDownloaded) {
  std::string url = "https://www.youtube.com/watch?v=abc123";
  std::string file = acquire_source(url, downloads, runner, "/opt/yt-dlp");

  EXPECT_EQ(fs::path(file).filename().string(), "video.mp4");
  EXPECT_TRUE(fs::exists(file));
  EXPECT_EQ(fs::path(file).parent_path().parent_path(), fs::path(downloads));

  ASSERT_EQ(runner.call_count(), 1u);
  auto args = runner.calls()[0];
  EXPECT_EQ(args.front(), "/opt/yt-dlp");
  EXPECT_EQ(args.back(), url);
}

TEST_F(AcquisitionTest, EachDownloadGetsItsOwnDirectory) {
  std::string a = acquire_source("https://example.com/a", downloads, runner);
  std::string b = acquire_source("https://example.com/b", downloads, runner);
  EXPECT_NE(fs::path(a).parent_path(), fs::path(b).parent_path());
}

TEST_F(AcquisitionTest, DownloaderFailureIsReported) {
  runner.fail_when = [](const std::vector<std::string> &) { return true; };
  EXPECT_THROW(acquire_source("http://example.com/v", downloads, runner),
               AcquisitionError);
}

TEST(AcquisitionArgsTest, RemoteDetection) {
  EXPECT_TRUE(is_remote_source("https://youtu.be/x"));
  EXPECT_TRUE(is_remote_source("http://host/video.mp4"));
  EXPECT_FALSE(is_remote_source("/videos/http_dump.mp4"));
  EXPECT_FALSE(is_remote_source("ftp://host/file"));
}

TEST(AcquisitionArgsTest, DownloadArguments) {
  auto args = build_download_args("yt-dlp", "https://youtu.be/x", "/dl/d1");

  EXPECT_EQ(args.front(), "yt-dlp");
  EXPECT_EQ(args.back(), "https://youtu.be/x");
  EXPECT_EQ(arg_after(args, "-o"), "/dl/d1/%(title)s.%(ext)s");
  EXPECT_EQ(arg_after(args, "--merge-output-format"), "mp4");
  EXPECT_TRUE(has_arg_containing(args, "--no-playlist"));
}
