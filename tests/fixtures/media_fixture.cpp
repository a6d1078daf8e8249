/**
 * @file media_fixture.cpp
 * @brief NUT fixture writer
 */

#include "fixtures/media_fixture.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <limits>
#include <stdexcept>

#include <unistd.h>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
}

#include <fmt/core.h>

#include "auto_shorts/errors.hpp"

namespace auto_shorts {
namespace test_support {

namespace {

constexpr double TONE_HZ = 440.0;
constexpr double PI = 3.14159265358979323846;

struct OutputHolder {
  AVFormatContext *ctx = nullptr;
  ~OutputHolder() {
    if (!ctx)
      return;
    if (ctx->pb && !(ctx->oformat->flags & AVFMT_NOFILE))
      avio_closep(&ctx->pb);
    avformat_free_context(ctx);
  }
};

struct PacketHolder {
  AVPacket *pkt = av_packet_alloc();
  ~PacketHolder() { av_packet_free(&pkt); }
};

void check(int ret, const char *what) {
  if (ret < 0)
    throw std::runtime_error(fmt::format("{}: {}", what, av_error_string(ret)));
}

bool is_loud(const FixtureSpec &spec, double t) {
  for (const auto &r : spec.loud_ranges) {
    if (t >= r.first && t < r.second)
      return true;
  }
  return false;
}

} // anonymous namespace

void write_media_fixture(const std::string &path, const FixtureSpec &spec) {
  OutputHolder out;
  check(avformat_alloc_output_context2(&out.ctx, nullptr, "nut", path.c_str()),
        "avformat_alloc_output_context2");

  AVStream *vs = avformat_new_stream(out.ctx, nullptr);
  if (!vs)
    throw std::runtime_error("avformat_new_stream (video)");
  vs->codecpar->codec_type = AVMEDIA_TYPE_VIDEO;
  vs->codecpar->codec_id = AV_CODEC_ID_RAWVIDEO;
  vs->codecpar->format = AV_PIX_FMT_GRAY8;
  vs->codecpar->width = spec.width;
  vs->codecpar->height = spec.height;
  vs->time_base = AVRational{1, spec.fps};
  vs->avg_frame_rate = AVRational{spec.fps, 1};
  vs->r_frame_rate = AVRational{spec.fps, 1};

  AVStream *as = nullptr;
  if (spec.with_audio) {
    as = avformat_new_stream(out.ctx, nullptr);
    if (!as)
      throw std::runtime_error("avformat_new_stream (audio)");
    as->codecpar->codec_type = AVMEDIA_TYPE_AUDIO;
    as->codecpar->codec_id = AV_CODEC_ID_PCM_S16LE;
    as->codecpar->format = AV_SAMPLE_FMT_S16;
    as->codecpar->sample_rate = spec.sample_rate;
    av_channel_layout_default(&as->codecpar->ch_layout, 1);
    as->codecpar->bits_per_coded_sample = 16;
    as->codecpar->block_align = 2;
    as->codecpar->bit_rate = static_cast<int64_t>(spec.sample_rate) * 16;
    as->time_base = AVRational{1, spec.sample_rate};
  }

  if (!(out.ctx->oformat->flags & AVFMT_NOFILE))
    check(avio_open(&out.ctx->pb, path.c_str(), AVIO_FLAG_WRITE), "avio_open");
  check(avformat_write_header(out.ctx, nullptr), "avformat_write_header");

  const int64_t frames = std::llround(spec.duration * spec.fps);
  const int64_t total_samples =
      spec.with_audio ? std::llround(spec.duration * spec.sample_rate) : 0;
  const int64_t chunk = std::max(1, spec.sample_rate / 10);
  const int frame_bytes = spec.width * spec.height;
  const double inf = std::numeric_limits<double>::infinity();

  PacketHolder holder;
  if (!holder.pkt)
    throw std::runtime_error("av_packet_alloc");
  AVPacket *pkt = holder.pkt;

  int64_t vi = 0;
  int64_t ai = 0;
  while (vi < frames || ai < total_samples) {
    double vt = vi < frames ? static_cast<double>(vi) / spec.fps : inf;
    double at =
        ai < total_samples ? static_cast<double>(ai) / spec.sample_rate : inf;

    if (vt <= at) {
      check(av_new_packet(pkt, frame_bytes), "av_new_packet");
      std::memset(pkt->data, static_cast<int>((vi * 7) % 256), frame_bytes);
      pkt->stream_index = vs->index;
      pkt->pts = pkt->dts = vi;
      pkt->duration = 1;
      pkt->flags |= AV_PKT_FLAG_KEY;
      av_packet_rescale_ts(pkt, AVRational{1, spec.fps}, vs->time_base);
      ++vi;
    } else {
      int64_t n = std::min(chunk, total_samples - ai);
      check(av_new_packet(pkt, static_cast<int>(n * 2)), "av_new_packet");
      for (int64_t j = 0; j < n; ++j) {
        double t = static_cast<double>(ai + j) / spec.sample_rate;
        double amp = is_loud(spec, t) ? spec.loud_amplitude
                                      : spec.quiet_amplitude;
        auto v = static_cast<int16_t>(
            std::lround(amp * 32767.0 * std::sin(2.0 * PI * TONE_HZ * t)));
        auto u = static_cast<uint16_t>(v);
        pkt->data[2 * j] = static_cast<uint8_t>(u & 0xff);
        pkt->data[2 * j + 1] = static_cast<uint8_t>(u >> 8);
      }
      pkt->stream_index = as->index;
      pkt->pts = pkt->dts = ai;
      pkt->duration = n;
      pkt->flags |= AV_PKT_FLAG_KEY;
      av_packet_rescale_ts(pkt, AVRational{1, spec.sample_rate}, as->time_base);
      ai += n;
    }

    /// Takes ownership of the payload and leaves pkt blank
    check(av_interleaved_write_frame(out.ctx, pkt), "av_interleaved_write_frame");
  }

  check(av_write_trailer(out.ctx), "av_write_trailer");
}

std::string make_test_dir(const std::string &name) {
  namespace fs = std::filesystem;
  static std::atomic<int> counter{0};

  fs::path dir = fs::temp_directory_path() /
                 fmt::format("auto_shorts_test_{}_{}_{}", name, getpid(),
                             counter++);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir.string();
}

} // namespace test_support
} // namespace auto_shorts
