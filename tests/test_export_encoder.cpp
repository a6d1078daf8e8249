// Unit tests for final encoding, verification and publishing.

#include "auto_shorts/errors.hpp"
#include "auto_shorts/export_encoder.hpp"

#include "fixtures/fake_runner.hpp"
#include "fixtures/media_fixture.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace auto_shorts;
using namespace auto_shorts::test_support;

namespace fs = std::filesystem;

class ExportEncoderTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir = make_test_dir("encoder");
    work = (fs::path(dir) / "work").string();
    fs::create_directories(work);
    final_path = (fs::path(dir) / "out" / "stream_short_1.mp4").string();

    spec.width = 64;
    spec.height = 112;
    spec.fps = 10;

    runner.encoded.width = 64;
    runner.encoded.height = 112;
    runner.encoded.duration = 3.0;

    composed = (fs::path(work) / "composed.mkv").string();
  }
  void TearDown() override { fs::remove_all(dir); }

  void write_composed(bool with_audio) {
    FixtureSpec clip;
    clip.width = 64;
    clip.height = 112;
    clip.duration = 3.0;
    clip.with_audio = with_audio;
    write_media_fixture(composed, clip);
  }

  EncodeError::Kind encode_failure_kind() {
    ExportEncoder encoder(runner);
    try {
      encoder.encode(composed, segment, 1, spec, final_path, work);
    } catch (const EncodeError &e) {
      return e.kind();
    }
    ADD_FAILURE() << "encode() did not throw";
    return EncodeError::Kind::EncoderFailed;
  }

  std::string dir;
  std::string work;
  std::string composed;
  std::string final_path;
  RenderSpec spec;
  Segment segment{30.0, 33.0, 0.5};
  FakeRunner runner;
};

TEST_F(ExportEncoderTest, PublishesVerifiedShort) {
  write_composed(true);
  ExportEncoder encoder(runner);

  ShortArtifact artifact =
      encoder.encode(composed, segment, 2, spec, final_path, work);

  EXPECT_EQ(artifact.index, 2);
  EXPECT_EQ(artifact.path, final_path);
  EXPECT_TRUE(artifact.has_audio);
  EXPECT_GT(artifact.size_bytes, 0u);
  EXPECT_DOUBLE_EQ(artifact.segment.start, 30.0);
  EXPECT_TRUE(fs::exists(final_path));
  EXPECT_FALSE(fs::exists(fs::path(work) / "encoded.mp4"));

  ASSERT_EQ(runner.call_count(), 1u);
  auto args = runner.calls()[0];
  EXPECT_TRUE(has_arg_containing(args, "aresample=async=1,apad"));
  EXPECT_FALSE(has_arg_containing(args, "anullsrc"));
  EXPECT_EQ(arg_after(args, "-i"), composed);
}

TEST_F(ExportEncoderTest, SizeIsTakenFromTheStagedFile) {
  write_composed(true);
  fs::create_directories(fs::path(final_path).parent_path());
  ExportEncoder encoder(runner);

  ShortArtifact artifact =
      encoder.encode(composed, segment, 1, spec, final_path, work);

  ASSERT_TRUE(fs::exists(final_path));
  EXPECT_EQ(artifact.size_bytes, fs::file_size(final_path));
}

TEST_F(ExportEncoderTest, SilentSourceGetsGeneratedTrack) {
  write_composed(false);
  ExportEncoder encoder(runner);

  ShortArtifact artifact =
      encoder.encode(composed, segment, 1, spec, final_path, work);

  EXPECT_TRUE(artifact.has_audio);
  auto args = runner.calls().at(0);
  EXPECT_TRUE(has_arg_containing(args, "anullsrc"));
  EXPECT_EQ(arg_after(args, "-map"), "[v]");
  EXPECT_TRUE(has_arg_containing(args, "1:a:0"));
}

TEST_F(ExportEncoderTest, EncoderExitCodeFails) {
  write_composed(true);
  runner.fail_when = [](const std::vector<std::string> &) { return true; };

  EXPECT_EQ(encode_failure_kind(), EncodeError::Kind::EncoderFailed);
  EXPECT_FALSE(fs::exists(final_path));
}

TEST_F(ExportEncoderTest, CrashAfterWritingPublishesNothing) {
  write_composed(true);
  runner.write_then_fail = true;

  EXPECT_EQ(encode_failure_kind(), EncodeError::Kind::EncoderFailed);
  EXPECT_FALSE(fs::exists(final_path));
}

TEST_F(ExportEncoderTest, WrongDimensionsFailVerification) {
  write_composed(true);
  runner.encoded.width = 32;

  EXPECT_EQ(encode_failure_kind(), EncodeError::Kind::VerificationFailed);
  EXPECT_FALSE(fs::exists(final_path));
}

TEST_F(ExportEncoderTest, MissingAudioIsAudioMuxFailure) {
  write_composed(true);
  runner.encoded.with_audio = false;

  EXPECT_EQ(encode_failure_kind(), EncodeError::Kind::AudioMuxFailure);
  EXPECT_FALSE(fs::exists(final_path));
}

TEST_F(ExportEncoderTest, UnreadableComposedClip) {
  EXPECT_EQ(encode_failure_kind(), EncodeError::Kind::EncoderFailed);
  EXPECT_EQ(runner.call_count(), 0u);
}

TEST_F(ExportEncoderTest, ThumbnailIsPublishedBesideTheShort) {
  write_composed(true);
  ExportEncoder encoder(runner);
  ShortArtifact artifact =
      encoder.encode(composed, segment, 1, spec, final_path, work);
  std::string jpg =
      fs::path(final_path).replace_extension(".jpg").string();

  EXPECT_EQ(encoder.thumbnail(artifact, jpg, work), jpg);

  EXPECT_TRUE(fs::exists(jpg));
  EXPECT_FALSE(fs::exists(fs::path(work) / "thumbnail.jpg"));
  ASSERT_EQ(runner.call_count(), 2u);
  auto args = runner.calls()[1];
  EXPECT_EQ(arg_after(args, "-i"), final_path);
  EXPECT_EQ(arg_after(args, "-ss"), "1.500");
  EXPECT_EQ(arg_after(args, "-frames:v"), "1");
}

TEST_F(ExportEncoderTest, ThumbnailFailureLeavesTheShortAlone) {
  write_composed(true);
  runner.fail_when = [](const std::vector<std::string> &argv) {
    return fs::path(argv.back()).extension() == ".jpg";
  };
  ExportEncoder encoder(runner);
  ShortArtifact artifact =
      encoder.encode(composed, segment, 1, spec, final_path, work);
  std::string jpg =
      fs::path(final_path).replace_extension(".jpg").string();

  EXPECT_EQ(encoder.thumbnail(artifact, jpg, work), "");
  EXPECT_FALSE(fs::exists(jpg));
  EXPECT_TRUE(fs::exists(final_path));
}

TEST(EncodeArgsTest, CarriesRenderSpec) {
  RenderSpec spec;
  spec.video_bitrate = "3M";
  spec.audio_sample_rate = 48000;

  auto args = build_encode_args("/usr/bin/ffmpeg", "in.mkv", true, 60.0, spec,
                                "out.mp4");

  EXPECT_EQ(args.front(), "/usr/bin/ffmpeg");
  EXPECT_EQ(args.back(), "out.mp4");
  EXPECT_EQ(arg_after(args, "-c:v"), "libx264");
  EXPECT_EQ(arg_after(args, "-b:v"), "3M");
  EXPECT_EQ(arg_after(args, "-c:a"), "aac");
  EXPECT_EQ(arg_after(args, "-ar"), "48000");
  EXPECT_EQ(arg_after(args, "-r"), "30");
  EXPECT_EQ(arg_after(args, "-f"), "mp4");
  EXPECT_TRUE(has_arg_containing(args, "scale=720:1280"));
}

TEST(EncodeArgsTest, SilentTrackMatchesClipLength) {
  auto args = build_encode_args("ffmpeg", "in.mkv", false, 59.5, RenderSpec{},
                                "out.mp4");

  EXPECT_EQ(arg_after(args, "-f"), "lavfi");
  EXPECT_EQ(arg_after(args, "-t"), "59.500");
  EXPECT_TRUE(has_arg_containing(args, "sample_rate=44100"));
}

TEST(EncodeArgsTest, ThumbnailIsOneShrunkFrame) {
  auto args = build_thumbnail_args("ffmpeg", "short.mp4", 30.0, "short.jpg");

  EXPECT_EQ(arg_after(args, "-ss"), "30.000");
  EXPECT_EQ(arg_after(args, "-i"), "short.mp4");
  EXPECT_EQ(arg_after(args, "-frames:v"), "1");
  EXPECT_EQ(arg_after(args, "-vf"),
            "scale=320:180:force_original_aspect_ratio=decrease");
  EXPECT_EQ(args.back(), "short.jpg");
}
