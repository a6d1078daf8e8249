/**
 * @file energy_analyzer.hpp
 * @brief Audio energy scoring of the source timeline
 *
 * @details The timeline is cut into fixed windows (1 s by default) and every
 *          window is scored by the RMS amplitude of the mono-downmixed audio
 *          inside it. Decoding is spread over worker threads: the timeline is
 *          split into chunks that workers pop from a TaskQueue, each worker
 *          owning its own demuxer and decoder over a shared memory map.
 *
 * @attention THREAD MODEL:
 *            - Each worker thread creates its own AudioScanner instance.
 *
 *            - FFmpeg decoder state is not thread-safe, so nothing but the
 *              MappedFile is shared.
 */

#ifndef AUTO_SHORTS_ENERGY_ANALYZER_HPP
#define AUTO_SHORTS_ENERGY_ANALYZER_HPP

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswresample/swresample.h>
}

#include <memory>
#include <vector>

#include "memory_io.hpp"
#include "task_queue.hpp"
#include "types.hpp"

namespace auto_shorts {

/**
 * @struct AnalyzerOptions
 * @brief Tuning for EnergyAnalyzer.
 */
struct AnalyzerOptions {
  double window_sec = 1.0;          //< Curve step
  int smoothing_windows = 3;        //< Centered moving average width (1 = off)
  double chunk_duration_sec = 60.0; //< Work unit, rounded to whole windows
  int threads = 0;                  //< 0 = detected CPU limit
  double min_duration_sec = 0.0;    //< Shorter sources fail with TooShort
};

/**
 * @class AudioScanner
 * @brief Decodes the audio track of a mapped file and measures energy.
 *
 * @attention MANAGEMENT:
 *            - Destructor handles partial initialization failures
 *
 *            - A scanner may be reused for several chunks; every scan seeks
 *              and flushes the decoder first
 */
class AudioScanner {
  AVFormatContext *fmt_ctx = nullptr;
  AVCodecContext *dec_ctx = nullptr;
  AVFrame *frame = nullptr;
  AVPacket *pkt = nullptr;
  SwrContext *swr_ctx = nullptr;
  std::unique_ptr<MemoryReader> reader;

  int audio_stream_idx = -1;
  double time_base = 0;
  double origin = 0;          //< Container start time in seconds
  double next_frame_time = 0; //< Expected start of the next frame (NaN if unknown)

  /// Source format the resampler was built for
  int swr_format = -1;
  int swr_rate = 0;
  int swr_channels = 0;

  /// Mono float conversion buffer (reused across frames)
  std::vector<float> mono;

  const MappedFile &file_data;

  /**
   * @brief Build or rebuild the mono float converter for this frame format.
   * @throws AnalysisError(DecodeFailure) if libswresample rejects it
   */
  void ensure_converter(const AVFrame *f);

  /**
   * @brief Accumulate one decoded frame into the chunk's windows.
   * @return true once the frame reaches the end of the chunk
   */
  bool accumulate_frame(const AnalysisTask &task, double window_sec,
                        std::vector<WindowEnergy> &out);

public:
  explicit AudioScanner(const MappedFile &data);
  ~AudioScanner();

  AudioScanner(const AudioScanner &) = delete;
  AudioScanner &operator=(const AudioScanner &) = delete;

  /**
   * @brief Open the demuxer and the audio decoder.
   * @throws AnalysisError(NoAudioTrack) when the file has no audio stream,
   *         AnalysisError(DecodeFailure) for any other FFmpeg failure
   */
  void initialize();

  /**
   * @brief Measure the windows of one chunk.
   *
   * @param task Chunk to scan
   * @param window_sec Window width in seconds
   * @param decode_us Output: accumulated demux+decode time in microseconds
   * @param analyze_us Output: accumulated conversion+energy time
   * @return task.window_count entries, zero-filled where no samples fell
   */
  std::vector<WindowEnergy> scan_range(const AnalysisTask &task,
                                       double window_sec, long &decode_us,
                                       long &analyze_us);
};

/**
 * @class EnergyAnalyzer
 * @brief Produces the ScoreCurve of a source.
 * @note analyze() is a pure function of the file bytes and the options;
 *       chunk boundaries do not depend on the thread count.
 */
class EnergyAnalyzer {
public:
  explicit EnergyAnalyzer(AnalyzerOptions options);

  /**
   * @brief Score the whole timeline.
   * @throws AnalysisError NoAudioTrack if !source.has_audio, TooShort if
   *         source.duration < min_duration_sec, DecodeFailure if the audio
   *         cannot be decoded
   */
  ScoreCurve analyze(const SourceVideo &source) const;

  const AnalyzerOptions &options() const { return options_; }

private:
  AnalyzerOptions options_;
};

// **---- Curve helpers ----**

/**
 * @brief Number of windows needed to cover [0, duration).
 */
size_t window_count_for(double duration, double window_sec);

/**
 * @brief RMS of every window (0 for windows without samples).
 */
std::vector<double> rms_scores(const std::vector<WindowEnergy> &windows);

/**
 * @brief Centered moving average.
 * @note Even widths behave like width + 1. Near the edges only existing
 *       samples are averaged.
 */
std::vector<double> smooth_scores(const std::vector<double> &scores,
                                  int width);

/**
 * @brief Wrap per-window scores into a ScoreCurve (timestamps i * step).
 */
ScoreCurve make_score_curve(const std::vector<double> &scores, double step,
                            double duration);

} // namespace auto_shorts

#endif // AUTO_SHORTS_ENERGY_ANALYZER_HPP
