/**
 * @file export_encoder.cpp
 * @brief Final encode, verification and publication
 */

#include "auto_shorts/export_encoder.hpp"

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <system_error>
#include <utility>

#include <fmt/core.h>

#include "auto_shorts/errors.hpp"
#include "auto_shorts/logging.hpp"
#include "auto_shorts/media_probe.hpp"
#include "auto_shorts/temp_dir.hpp"

namespace auto_shorts {

namespace fs = std::filesystem;

std::vector<std::string> build_encode_args(const std::string &ffmpeg_bin,
                                           const std::string &input,
                                           bool input_has_audio,
                                           double duration,
                                           const RenderSpec &spec,
                                           const std::string &output) {
  std::vector<std::string> args = {ffmpeg_bin, "-y", "-hide_banner",
                                   "-loglevel", "error", "-i", input};

  std::string video_chain = fmt::format(
      "[0:v]scale={}:{},setsar=1,fps={},format=yuv420p[v]", spec.width,
      spec.height, spec.fps);

  if (input_has_audio) {
    /// async resampling closes timestamp gaps; apad runs to the video end
    args.insert(args.end(),
                {"-filter_complex",
                 fmt::format("{};[0:a:0]aresample=async=1,apad[a]",
                             video_chain),
                 "-map", "[v]", "-map", "[a]"});
  } else {
    args.insert(args.end(),
                {"-f", "lavfi", "-t", fmt::format("{:.3f}", duration), "-i",
                 fmt::format("anullsrc=channel_layout=stereo:sample_rate={}",
                             spec.audio_sample_rate),
                 "-filter_complex", video_chain, "-map", "[v]", "-map",
                 "1:a:0"});
  }

  args.insert(args.end(),
              {"-c:v", spec.video_codec, "-b:v", spec.video_bitrate, "-r",
               std::to_string(spec.fps), "-c:a", spec.audio_codec, "-b:a",
               spec.audio_bitrate, "-ar", std::to_string(spec.audio_sample_rate),
               "-shortest", "-movflags", "+faststart", "-f", "mp4", output});
  return args;
}

std::vector<std::string> build_thumbnail_args(const std::string &ffmpeg_bin,
                                              const std::string &input,
                                              double at,
                                              const std::string &output) {
  return {ffmpeg_bin,
          "-y",
          "-hide_banner",
          "-loglevel",
          "error",
          "-ss",
          fmt::format("{:.3f}", at),
          "-i",
          input,
          "-frames:v",
          "1",
          "-vf",
          fmt::format("scale={}:{}:force_original_aspect_ratio=decrease",
                      THUMBNAIL_MAX_WIDTH, THUMBNAIL_MAX_HEIGHT),
          "-q:v",
          "3",
          "-f",
          "image2",
          output};
}

SourceVideo verify_output(const std::string &path, const RenderSpec &spec) {
  std::error_code ec;
  auto size = fs::file_size(path, ec);
  if (ec || size == 0) {
    throw EncodeError(EncodeError::Kind::VerificationFailed,
                      fmt::format("encoded file {} is missing or empty", path));
  }

  SourceVideo clip;
  try {
    clip = probe_media(path);
  } catch (const ProbeError &e) {
    throw EncodeError(EncodeError::Kind::VerificationFailed,
                      fmt::format("encoded file is unreadable: {}", e.what()));
  }

  if (!clip.has_audio) {
    throw EncodeError(EncodeError::Kind::AudioMuxFailure,
                      fmt::format("encoded file {} has no audio stream", path));
  }
  if (clip.width != spec.width || clip.height != spec.height) {
    throw EncodeError(EncodeError::Kind::VerificationFailed,
                      fmt::format("encoded size {}x{}, expected {}x{}",
                                  clip.width, clip.height, spec.width,
                                  spec.height));
  }
  if (std::fabs(clip.fps - spec.fps) > FPS_TOLERANCE) {
    throw EncodeError(EncodeError::Kind::VerificationFailed,
                      fmt::format("encoded frame rate {:.3f}, expected {}",
                                  clip.fps, spec.fps));
  }
  return clip;
}

// **---- ExportEncoder ----**

ExportEncoder::ExportEncoder(CommandRunner &runner, std::string ffmpeg_bin)
    : runner_(runner), ffmpeg_bin_(std::move(ffmpeg_bin)) {}

ShortArtifact ExportEncoder::encode(const std::string &composed,
                                    const Segment &segment, int index,
                                    const RenderSpec &spec,
                                    const std::string &final_path,
                                    const std::string &work_dir) const {
  SourceVideo clip;
  try {
    clip = probe_media(composed);
  } catch (const ProbeError &e) {
    throw EncodeError(EncodeError::Kind::EncoderFailed,
                      fmt::format("cannot read composed clip: {}", e.what()));
  }
  if (!clip.has_audio) {
    LOG_WARN("[Segment {}] No audio in composed clip, adding silent track",
             index);
  }

  std::string staged = (fs::path(work_dir) / "encoded.mp4").string();
  double duration = clip.duration > 0 ? clip.duration : segment.length();

  int status = runner_.run(build_encode_args(ffmpeg_bin_, composed,
                                             clip.has_audio, duration, spec,
                                             staged));
  if (status != 0) {
    throw EncodeError(EncodeError::Kind::EncoderFailed,
                      fmt::format("ffmpeg encode failed (exit code {})", status));
  }

  SourceVideo encoded = verify_output(staged, spec);

  /// Measured before the rename; the published path is never touched again
  std::error_code size_error;
  std::uintmax_t size_bytes = fs::file_size(staged, size_error);
  if (size_error) {
    throw EncodeError(EncodeError::Kind::EncoderFailed,
                      fmt::format("cannot stat {}: {}", staged,
                                  size_error.message()));
  }

  try {
    publish_atomically(staged, final_path);
  } catch (const fs::filesystem_error &e) {
    throw EncodeError(EncodeError::Kind::EncoderFailed,
                      fmt::format("could not publish {}: {}", final_path,
                                  e.what()));
  }

  ShortArtifact artifact;
  artifact.segment = segment;
  artifact.index = index;
  artifact.path = final_path;
  artifact.size_bytes = size_bytes;
  artifact.has_audio = encoded.has_audio;
  return artifact;
}

std::string ExportEncoder::thumbnail(const ShortArtifact &artifact,
                                     const std::string &final_path,
                                     const std::string &work_dir) const {
  std::string staged = (fs::path(work_dir) / "thumbnail.jpg").string();
  double at = artifact.segment.length() / 2.0;

  int status = runner_.run(
      build_thumbnail_args(ffmpeg_bin_, artifact.path, at, staged));
  std::error_code ec;
  auto size = fs::file_size(staged, ec);
  if (status != 0 || ec || size == 0) {
    LOG_WARN("[Segment {}] No thumbnail (exit code {})", artifact.index,
             status);
    return "";
  }

  try {
    publish_atomically(staged, final_path);
  } catch (const fs::filesystem_error &e) {
    LOG_WARN("[Segment {}] Could not publish thumbnail: {}", artifact.index,
             e.what());
    return "";
  }
  return final_path;
}

} // namespace auto_shorts
