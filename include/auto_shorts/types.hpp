/**
 * @file types.hpp
 * @brief Core data types and constants for Auto Shorts
 *
 * @details Contains the value types passed between pipeline stages:
 *          - SourceVideo: probed, read-only description of the input
 *
 *          - ScoreCurve: per-window interest score over the timeline
 *
 *          - Segment: a fixed-length highlight chosen by the selector
 *
 *          - LayoutMode / CropRect: how a segment is framed
 *
 *          - RenderSpec: fixed output parameters
 *
 *          - ShortArtifact / SegmentFailure / RunManifest: run results
 */

#ifndef AUTO_SHORTS_TYPES_HPP
#define AUTO_SHORTS_TYPES_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace auto_shorts {

// **----- CONSTANTS -----**

/**
 * @brief Size of the I/O buffer used by FFmpeg when reading from RAM.
 * @note Larger buffer = fewer callbacks between memory reader and demuxer.
 */
constexpr size_t AVIO_BUFFER_SIZE = 256 * 1024; //< 256KB

/**
 * @brief CPU cache line size for alignment.
 * @note Aligning hot data to cache lines prevents false sharing in
 *       multi-threaded code.
 */
constexpr size_t CACHE_LINE_SIZE = 64;

/// Tolerance used when checking that split fractions add up to 1.0
constexpr double FRACTION_EPSILON = 1e-6;

// **----- SOURCE -----**

/**
 * @struct SourceVideo
 * @brief Immutable description of the input media file.
 * @note Produced once by probe_media() and only read afterwards.
 */
struct SourceVideo {
  std::string path;     //< Path to the media file
  std::string title;    //< File stem, used for output naming
  double duration = 0;  //< Duration in seconds
  double fps = 0;       //< Video frame rate
  int width = 0;        //< Native video width
  int height = 0;       //< Native video height
  bool has_audio = false;
};

// **----- SCORING -----**

/**
 * @struct ScoreSample
 * @brief Interest score of one analysis window.
 */
struct ScoreSample {
  double timestamp; //< Window start in seconds
  double score;     //< RMS amplitude (optionally smoothed)
};

/**
 * @struct ScoreCurve
 * @brief Uniformly sampled score over [0, duration).
 * @note samples[i].timestamp == i * step, strictly increasing.
 */
struct ScoreCurve {
  double step = 1.0;      //< Window width in seconds
  double duration = 0;    //< Source duration covered by the curve
  std::vector<ScoreSample> samples;

  bool empty() const { return samples.empty(); }
  size_t size() const { return samples.size(); }
};

/**
 * @struct Segment
 * @brief A selected highlight [start, end) with its selection score.
 */
struct Segment {
  double start = 0; //< Start time in seconds
  double end = 0;   //< End time in seconds
  double score = 0; //< Mean curve score over the span

  double length() const { return end - start; }
};

// **----- LAYOUT -----**

/**
 * @struct CropRect
 * @brief Rectangle as fractions of the source frame (all in [0, 1]).
 */
struct CropRect {
  double x = 0;
  double y = 0;
  double w = 1;
  double h = 1;

  bool is_valid() const;
};

/**
 * @struct PixelRect
 * @brief Rectangle in source pixels.
 */
struct PixelRect {
  int x = 0;
  int y = 0;
  int w = 0;
  int h = 0;
};

/**
 * @struct SplitScreenLayout
 * @brief Camera feed over content feed.
 * @attention top_fraction + bottom_fraction must equal 1.0.
 */
struct SplitScreenLayout {
  double top_fraction = 0.45;
  double bottom_fraction = 0.55;
  CropRect camera{0.70, 0.00, 0.30, 0.35};  //< Region shown in the top band
  CropRect content{0.00, 0.00, 0.70, 1.00}; //< Region shown in the bottom band
};

/**
 * @class LayoutMode
 * @brief Tagged variant {Passthrough, SplitScreen}.
 * @note Resolved once before the pipeline starts.
 */
class LayoutMode {
public:
  enum class Kind { Passthrough, SplitScreen };

  static LayoutMode passthrough();

  /**
   * @brief Build a split-screen layout.
   * @throws std::invalid_argument if the fractions do not add up to 1.0,
   *         are not in (0, 1), or a crop rectangle is out of bounds.
   */
  static LayoutMode split_screen(const SplitScreenLayout &split);

  Kind kind() const { return kind_; }
  bool is_split_screen() const { return kind_ == Kind::SplitScreen; }

  /// Only meaningful when is_split_screen()
  const SplitScreenLayout &split() const { return split_; }

  std::string name() const;

private:
  LayoutMode() = default;

  Kind kind_ = Kind::Passthrough;
  SplitScreenLayout split_;
};

// **----- RENDERING -----**

/**
 * @struct RenderSpec
 * @brief Fixed output parameters shared by the composer and the encoder.
 */
struct RenderSpec {
  int width = 720;
  int height = 1280;
  int fps = 30;
  std::string video_bitrate = "2M";
  std::string audio_bitrate = "128k";
  std::string video_codec = "libx264";
  std::string audio_codec = "aac";
  int audio_sample_rate = 44100;
};

/**
 * @struct CaptionSpec
 * @brief Text burned into one short: an intro caption at the top for the
 *        first seconds and a footer at the bottom for the last seconds.
 * @note Both lines fade in and out. Empty text means no caption.
 */
struct CaptionSpec {
  std::string intro;       //< e.g. "Parte 2/7"
  std::string footer;      //< e.g. "#gaming #shorts"
  double intro_sec = 3.0;  //< Shown from t = 0
  double footer_sec = 3.0; //< Shown until the end of the clip
  double fade_sec = 0.5;
  int font_size = 60;      //< Footer uses font_size - 10
  std::string font_file;   //< Empty = fontconfig default

  bool empty() const { return intro.empty() && footer.empty(); }
};

// **----- RESULTS -----**

/**
 * @struct ShortArtifact
 * @brief A published short on disk.
 */
struct ShortArtifact {
  Segment segment;      //< Source span
  int index = 0;        //< 1-based index in presentation order
  std::string path;     //< Final published path
  uint64_t size_bytes = 0;
  bool has_audio = false;
  std::string thumbnail_path; //< JPEG still, empty when not generated
  std::string metadata_path;  //< JSON sidecar, empty when not written
};

/**
 * @brief Why a segment did not produce an artifact.
 */
enum class FailureKind {
  ComposeError,
  EncodeError,
  AudioMuxFailure,
  Cancelled,
};

const char *to_string(FailureKind kind);

/**
 * @struct SegmentFailure
 * @brief Non-fatal per-segment failure recorded in the manifest.
 */
struct SegmentFailure {
  Segment segment;
  int index = 0;
  FailureKind kind = FailureKind::ComposeError;
  std::string message;
};

/**
 * @struct RunManifest
 * @brief Outcome of one pipeline run.
 * @note artifacts and failures are both sorted by index.
 */
struct RunManifest {
  SourceVideo source;
  int requested = 0;
  bool partial_selection = false;
  std::vector<Segment> segments;
  std::vector<ShortArtifact> artifacts;
  std::vector<SegmentFailure> failures;
};

// **----- THREADING -----**

/**
 * @struct PaddedAtomic
 * @brief Cache-line aligned atomic to prevent false sharing.
 */
template <typename T> struct alignas(CACHE_LINE_SIZE) PaddedAtomic {
  std::atomic<T> value{0};

  PaddedAtomic() = default;
  explicit PaddedAtomic(T v) : value(v) {}

  T load(std::memory_order order = std::memory_order_seq_cst) const {
    return value.load(order);
  }
  void store(T v, std::memory_order order = std::memory_order_seq_cst) {
    value.store(v, order);
  }
  T operator++() { return ++value; }
  T operator++(int) { return value++; }
  PaddedAtomic &operator+=(T v) {
    value += v;
    return *this;
  }
};

/**
 * @struct AnalysisTask
 * @brief A chunk of the timeline for the analyzer's task queue.
 * @note Covers windows [first_window, first_window + window_count).
 */
struct alignas(CACHE_LINE_SIZE) AnalysisTask {
  double start;     //< Start time in seconds
  double end;       //< End time in seconds
  size_t first_window;
  size_t window_count;
  int id;           //< Chunk ID for logging
};

} // namespace auto_shorts

#endif // AUTO_SHORTS_TYPES_HPP
