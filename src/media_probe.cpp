/**
 * @file media_probe.cpp
 * @brief Media probing with libavformat
 */

#include "auto_shorts/media_probe.hpp"

#include <algorithm>
#include <filesystem>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include <fmt/core.h>

#include "auto_shorts/errors.hpp"
#include "auto_shorts/logging.hpp"

namespace auto_shorts {

namespace {

/// Closes the input on every exit path
struct InputCloser {
  AVFormatContext *ctx = nullptr;
  ~InputCloser() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

double stream_fps(const AVStream *st) {
  AVRational r = st->avg_frame_rate;
  if (r.num > 0 && r.den > 0)
    return av_q2d(r);
  r = st->r_frame_rate;
  if (r.num > 0 && r.den > 0)
    return av_q2d(r);
  return 25.0;
}

double container_duration(const AVFormatContext *fmt_ctx) {
  if (fmt_ctx->duration != AV_NOPTS_VALUE && fmt_ctx->duration > 0)
    return fmt_ctx->duration / static_cast<double>(AV_TIME_BASE);

  /// Some containers only carry per-stream durations
  double longest = 0.0;
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; ++i) {
    const AVStream *st = fmt_ctx->streams[i];
    if (st->duration != AV_NOPTS_VALUE && st->duration > 0)
      longest = std::max(longest, st->duration * av_q2d(st->time_base));
  }
  return longest;
}

} // anonymous namespace

SourceVideo probe_media(const std::string &path) {
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::is_regular_file(path, ec)) {
    throw ProbeError(fmt::format("not a readable file: {}", path));
  }

  InputCloser input;
  int ret = avformat_open_input(&input.ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    input.ctx = nullptr;
    throw ProbeError(
        fmt::format("cannot open {}: {}", path, av_error_string(ret)));
  }

  ret = avformat_find_stream_info(input.ctx, nullptr);
  if (ret < 0) {
    throw ProbeError(fmt::format("cannot read stream info of {}: {}", path,
                                 av_error_string(ret)));
  }

  int video_idx =
      av_find_best_stream(input.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_idx < 0) {
    throw ProbeError(fmt::format("no video stream in {}", path));
  }
  int audio_idx =
      av_find_best_stream(input.ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);

  const AVStream *vst = input.ctx->streams[video_idx];

  SourceVideo src;
  src.path = path;
  src.title = fs::path(path).stem().string();
  src.duration = container_duration(input.ctx);
  src.fps = stream_fps(vst);
  src.width = vst->codecpar->width;
  src.height = vst->codecpar->height;
  src.has_audio = (audio_idx >= 0);

  if (!(src.duration > 0.0)) {
    throw ProbeError(fmt::format("zero or unknown duration: {}", path));
  }
  if (src.width <= 0 || src.height <= 0) {
    throw ProbeError(fmt::format("unknown video dimensions: {}", path));
  }

  return src;
}

} // namespace auto_shorts
