/**
 * @file energy_analyzer.cpp
 * @brief Audio energy scoring implementation
 *
 * @details Workflow of EnergyAnalyzer::analyze():
 *
 *          1. Validate the source (audio present, long enough)
 *
 *          2. Map the file into RAM once
 *
 *          3. Split the timeline into whole-window chunks on a TaskQueue
 *
 *          4. Workers decode their chunks and report window energy
 *
 *          5. RMS per window, then moving-average smoothing
 */

#include "auto_shorts/energy_analyzer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <exception>
#include <limits>
#include <mutex>
#include <new>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
}

#include <fmt/core.h>

#include "auto_shorts/errors.hpp"
#include "auto_shorts/logging.hpp"
#include "auto_shorts/system.hpp"

namespace auto_shorts {

namespace {

AnalysisError decode_failure(const std::string &what) {
  return AnalysisError(AnalysisError::Kind::DecodeFailure, what);
}

long elapsed_us(std::chrono::steady_clock::time_point since) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - since)
          .count());
}

} // anonymous namespace

// **---- AudioScanner ----**

AudioScanner::AudioScanner(const MappedFile &data) : file_data(data) {
  frame = av_frame_alloc();
  pkt = av_packet_alloc();
  if (!frame || !pkt) {
    av_frame_free(&frame);
    av_packet_free(&pkt);
    throw std::bad_alloc();
  }
}

AudioScanner::~AudioScanner() {
  swr_free(&swr_ctx);
  if (dec_ctx)
    avcodec_free_context(&dec_ctx);

  /// Custom I/O: the AVIOContext is released by `reader` afterwards
  if (fmt_ctx)
    avformat_close_input(&fmt_ctx);

  av_frame_free(&frame);
  av_packet_free(&pkt);
}

void AudioScanner::initialize() {
  reader = std::make_unique<MemoryReader>(file_data);

  fmt_ctx = avformat_alloc_context();
  if (!fmt_ctx)
    throw decode_failure("failed to allocate AVFormatContext");

  fmt_ctx->pb = reader->context();
  fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

  /// On failure avformat_open_input frees the context and nulls the pointer
  int ret = avformat_open_input(&fmt_ctx, "RAM", nullptr, nullptr);
  if (ret < 0)
    throw decode_failure("avformat_open_input: " + av_error_string(ret));

  ret = avformat_find_stream_info(fmt_ctx, nullptr);
  if (ret < 0)
    throw decode_failure("avformat_find_stream_info: " + av_error_string(ret));

  audio_stream_idx =
      av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (audio_stream_idx < 0) {
    throw AnalysisError(AnalysisError::Kind::NoAudioTrack,
                        "no audio stream to analyze");
  }

  /// Only the audio stream is demuxed
  for (unsigned int i = 0; i < fmt_ctx->nb_streams; i++) {
    if (i != static_cast<unsigned int>(audio_stream_idx)) {
      fmt_ctx->streams[i]->discard = AVDISCARD_ALL;
    }
  }

  AVStream *st = fmt_ctx->streams[audio_stream_idx];
  const AVCodec *codec = avcodec_find_decoder(st->codecpar->codec_id);
  if (!codec) {
    throw decode_failure(fmt::format("no decoder for audio codec {}",
                                     avcodec_get_name(st->codecpar->codec_id)));
  }

  dec_ctx = avcodec_alloc_context3(codec);
  if (!dec_ctx)
    throw decode_failure("failed to allocate decoder context");

  ret = avcodec_parameters_to_context(dec_ctx, st->codecpar);
  if (ret < 0)
    throw decode_failure("avcodec_parameters_to_context: " +
                         av_error_string(ret));

  /// Parallelism is at chunk level
  dec_ctx->thread_count = 1;

  ret = avcodec_open2(dec_ctx, codec, nullptr);
  if (ret < 0)
    throw decode_failure("avcodec_open2: " + av_error_string(ret));

  time_base = av_q2d(st->time_base);
  if (!(time_base > 0))
    throw decode_failure("audio stream has no time base");

  /// Timeline zero is the container start, as seen by ffmpeg -ss
  origin = (fmt_ctx->start_time != AV_NOPTS_VALUE)
               ? fmt_ctx->start_time / static_cast<double>(AV_TIME_BASE)
               : 0.0;
}

void AudioScanner::ensure_converter(const AVFrame *f) {
  const int channels = f->ch_layout.nb_channels;
  if (swr_ctx && swr_format == f->format && swr_rate == f->sample_rate &&
      swr_channels == channels) {
    return;
  }
  swr_free(&swr_ctx);

  AVChannelLayout src_layout;
  av_channel_layout_default(&src_layout, channels);
  AVChannelLayout dst_layout;
  av_channel_layout_default(&dst_layout, 1);

  /// Same rate in and out: format conversion and downmix only
  int ret = swr_alloc_set_opts2(&swr_ctx, &dst_layout, AV_SAMPLE_FMT_FLT,
                                f->sample_rate, &src_layout,
                                static_cast<AVSampleFormat>(f->format),
                                f->sample_rate, 0, nullptr);
  av_channel_layout_uninit(&src_layout);
  av_channel_layout_uninit(&dst_layout);
  if (ret < 0 || !swr_ctx)
    throw decode_failure("swr_alloc_set_opts2: " + av_error_string(ret));

  ret = swr_init(swr_ctx);
  if (ret < 0) {
    swr_free(&swr_ctx);
    throw decode_failure("swr_init: " + av_error_string(ret));
  }

  swr_format = f->format;
  swr_rate = f->sample_rate;
  swr_channels = channels;
}

bool AudioScanner::accumulate_frame(const AnalysisTask &task, double window_sec,
                                    std::vector<WindowEnergy> &out) {
  const int rate = frame->sample_rate;
  const int n = frame->nb_samples;
  if (rate <= 0 || n <= 0 || frame->ch_layout.nb_channels <= 0)
    return false;

  int64_t ts = frame->best_effort_timestamp;
  if (ts == AV_NOPTS_VALUE)
    ts = frame->pts;

  double frame_start;
  if (ts != AV_NOPTS_VALUE) {
    frame_start = ts * time_base - origin;
  } else if (!std::isnan(next_frame_time)) {
    frame_start = next_frame_time;
  } else {
    /// No timing at all right after a seek: cannot place the samples
    return false;
  }
  next_frame_time = frame_start + static_cast<double>(n) / rate;

  if (frame_start >= task.end)
    return true;
  if (next_frame_time <= task.start)
    return false;

  ensure_converter(frame);

  int capacity = std::max(swr_get_out_samples(swr_ctx, n), n);
  if (mono.size() < static_cast<size_t>(capacity))
    mono.resize(static_cast<size_t>(capacity));

  uint8_t *out_ptr = reinterpret_cast<uint8_t *>(mono.data());
  int got = swr_convert(swr_ctx, &out_ptr, capacity,
                        const_cast<const uint8_t **>(frame->extended_data), n);
  if (got < 0)
    throw decode_failure("swr_convert: " + av_error_string(got));

  const size_t last = task.window_count - 1;
  for (int j = 0; j < got; ++j) {
    double t = frame_start + static_cast<double>(j) / rate;
    if (t < task.start)
      continue;
    if (t >= task.end)
      return true;

    /// Clamp: floor() may round across a chunk edge by one ulp
    double w = std::floor(t / window_sec);
    size_t local = 0;
    if (w > static_cast<double>(task.first_window)) {
      local = std::min(static_cast<size_t>(w) - task.first_window, last);
    }

    double s = mono[j];
    out[local].sum_sq += s * s;
    out[local].count++;
  }
  return false;
}

std::vector<WindowEnergy> AudioScanner::scan_range(const AnalysisTask &task,
                                                   double window_sec,
                                                   long &decode_us,
                                                   long &analyze_us) {
  std::vector<WindowEnergy> out(task.window_count);
  if (task.window_count == 0)
    return out;

  auto seek_start = std::chrono::steady_clock::now();

  /// Always seek: a scanner may be reused after reaching a later chunk
  int64_t seek_ts = static_cast<int64_t>((task.start + origin) / time_base);
  int ret = av_seek_frame(fmt_ctx, audio_stream_idx, seek_ts,
                          AVSEEK_FLAG_BACKWARD);
  if (ret < 0 && task.start > 0) {
    throw decode_failure(fmt::format("seek to {:.2f}s failed: {}", task.start,
                                     av_error_string(ret)));
  }
  avcodec_flush_buffers(dec_ctx);
  next_frame_time = std::numeric_limits<double>::quiet_NaN();

  decode_us += elapsed_us(seek_start);

  /// Pull every frame the decoder has ready; true once past the chunk
  auto drain = [&]() -> bool {
    while (true) {
      auto dec_start = std::chrono::steady_clock::now();
      int r = avcodec_receive_frame(dec_ctx, frame);
      decode_us += elapsed_us(dec_start);

      if (r == AVERROR(EAGAIN) || r == AVERROR_EOF)
        return false;
      if (r < 0)
        throw decode_failure("avcodec_receive_frame: " + av_error_string(r));

      auto analyze_start = std::chrono::steady_clock::now();
      bool past_end = accumulate_frame(task, window_sec, out);
      analyze_us += elapsed_us(analyze_start);

      av_frame_unref(frame);
      if (past_end)
        return true;
    }
  };

  // **----- DECODE + ANALYZE LOOP -----**

  while (true) {
    auto read_start = std::chrono::steady_clock::now();
    ret = av_read_frame(fmt_ctx, pkt);
    decode_us += elapsed_us(read_start);

    if (ret < 0) {
      /// End of stream: flush the decoder
      avcodec_send_packet(dec_ctx, nullptr);
      drain();
      break;
    }

    if (pkt->stream_index == audio_stream_idx) {
      auto dec_start = std::chrono::steady_clock::now();
      int send_ret = avcodec_send_packet(dec_ctx, pkt);
      decode_us += elapsed_us(dec_start);

      /// A damaged packet costs its samples, not the whole chunk
      if (send_ret < 0 && send_ret != AVERROR_INVALIDDATA &&
          send_ret != AVERROR(EAGAIN)) {
        av_packet_unref(pkt);
        throw decode_failure("avcodec_send_packet: " +
                             av_error_string(send_ret));
      }
      if (drain()) {
        av_packet_unref(pkt);
        break;
      }
    }
    av_packet_unref(pkt);
  }

  return out;
}

// **---- EnergyAnalyzer ----**

EnergyAnalyzer::EnergyAnalyzer(AnalyzerOptions options)
    : options_(std::move(options)) {
  if (!(options_.window_sec > 0))
    throw std::invalid_argument("window_sec must be > 0");
  if (!(options_.chunk_duration_sec > 0))
    throw std::invalid_argument("chunk_duration_sec must be > 0");
}

ScoreCurve EnergyAnalyzer::analyze(const SourceVideo &source) const {
  if (!source.has_audio) {
    throw AnalysisError(AnalysisError::Kind::NoAudioTrack,
                        fmt::format("{} has no audio track", source.path));
  }
  if (source.duration < options_.min_duration_sec) {
    throw AnalysisError(
        AnalysisError::Kind::TooShort,
        fmt::format("{} lasts {:.1f}s, shorter than one short ({:.1f}s)",
                    source.path, source.duration, options_.min_duration_sec));
  }

  TIMER_START(analysis);

  const double window = options_.window_sec;
  const size_t n_windows = window_count_for(source.duration, window);
  const size_t per_chunk = std::max<size_t>(
      1, static_cast<size_t>(
             std::ceil(options_.chunk_duration_sec / window - 1e-9)));

  MappedFile file;
  try {
    file = MappedFile::map(source.path);
  } catch (const std::system_error &e) {
    throw decode_failure(e.what());
  }
  LOG_INFO("Mapped {} MB for analysis", file.size() / 1024 / 1024);

  /// Fail fast on an undecodable file before spawning workers
  {
    AudioScanner first(file);
    first.initialize();
  }

  // **----- Setup task queue -----**

  TaskQueue task_queue;
  int chunk_id = 0;
  for (size_t first = 0; first < n_windows; first += per_chunk) {
    size_t count = std::min(per_chunk, n_windows - first);
    task_queue.push({first * window, (first + count) * window, first, count,
                     chunk_id++});
  }
  task_queue.finish();

  const int num_threads = resolve_worker_count(options_.threads, chunk_id);
  LOG_INFO("Analyzing {} windows in {} chunks ({} threads)", n_windows,
           chunk_id, num_threads);

  // **----- Worker execution -----**

  EnergyCollector collector(n_windows);
  PaddedAtomic<int> chunks_done{0};
  PaddedAtomic<long> total_decode_us{0};
  PaddedAtomic<long> total_analyze_us{0};

  std::mutex error_mutex;
  std::exception_ptr first_error;

  std::vector<std::thread> workers;
  workers.reserve(num_threads);
  for (int i = 0; i < num_threads; ++i) {
    workers.emplace_back([&]() {
      long local_decode_us = 0;
      long local_analyze_us = 0;
      int local_chunks = 0;
      try {
        AudioScanner scanner(file);
        scanner.initialize();

        AnalysisTask task;
        while (task_queue.pop(task)) {
          auto energies = scanner.scan_range(task, window, local_decode_us,
                                             local_analyze_us);
          collector.add(task.first_window, energies);
          ++local_chunks;
        }
      } catch (...) {
        /// Rethrown on the calling thread after join
        std::lock_guard<std::mutex> lock(error_mutex);
        if (!first_error)
          first_error = std::current_exception();
      }
      chunks_done += local_chunks;
      total_decode_us += local_decode_us;
      total_analyze_us += local_analyze_us;
    });
  }

  for (auto &w : workers) {
    w.join();
  }

  if (first_error)
    std::rethrow_exception(first_error);

  TimingCollector::record("  ├─decode", total_decode_us.load());
  TimingCollector::record("  └─energy", total_analyze_us.load());

  std::vector<WindowEnergy> windows = collector.extract();
  bool any_samples = std::any_of(windows.begin(), windows.end(),
                                 [](const WindowEnergy &w) { return w.count > 0; });
  if (!any_samples) {
    throw decode_failure(
        fmt::format("no audio samples could be decoded from {}", source.path));
  }

  std::vector<double> scores =
      smooth_scores(rms_scores(windows), options_.smoothing_windows);
  ScoreCurve curve = make_score_curve(scores, window, source.duration);

  TIMER_END(analysis);
  LOG_INFO("Scored {} chunks into {} windows", chunks_done.load(),
           curve.size());
  return curve;
}

// **---- Curve helpers ----**

size_t window_count_for(double duration, double window_sec) {
  if (!(duration > 0) || !(window_sec > 0))
    return 0;
  /// Tolerate float noise: 90.0000000001 / 1.0 is still 90 windows
  return static_cast<size_t>(std::ceil(duration / window_sec - 1e-9));
}

std::vector<double> rms_scores(const std::vector<WindowEnergy> &windows) {
  std::vector<double> scores;
  scores.reserve(windows.size());
  for (const auto &w : windows) {
    scores.push_back(w.count > 0 ? std::sqrt(w.sum_sq / w.count) : 0.0);
  }
  return scores;
}

std::vector<double> smooth_scores(const std::vector<double> &scores,
                                  int width) {
  if (width <= 1 || scores.size() < 2)
    return scores;

  const long half = width / 2;
  const long n = static_cast<long>(scores.size());
  std::vector<double> out(scores.size());
  for (long i = 0; i < n; ++i) {
    long lo = std::max(0L, i - half);
    long hi = std::min(n - 1, i + half);
    double sum = 0;
    for (long k = lo; k <= hi; ++k)
      sum += scores[k];
    out[i] = sum / static_cast<double>(hi - lo + 1);
  }
  return out;
}

ScoreCurve make_score_curve(const std::vector<double> &scores, double step,
                            double duration) {
  ScoreCurve curve;
  curve.step = step;
  curve.duration = duration;
  curve.samples.reserve(scores.size());
  for (size_t i = 0; i < scores.size(); ++i) {
    curve.samples.push_back({static_cast<double>(i) * step, scores[i]});
  }
  return curve;
}

} // namespace auto_shorts
