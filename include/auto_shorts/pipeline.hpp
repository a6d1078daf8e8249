/**
 * @file pipeline.hpp
 * @brief Shorts generation pipeline orchestration
 *
 * @details The ShortsPipeline class drives one source through:
 *
 *          1. Probe the source metadata
 *
 *          2. Score the audio timeline (parallel chunked analysis)
 *
 *          3. Select the highlight segments
 *
 *          4. Push one render job per segment onto a RenderQueue
 *
 *          5. Compose + encode on max_concurrent worker threads
 *
 *          6. Collect artifacts and per-segment failures into a RunManifest
 *
 *          With the matching options a worker also burns in captions,
 *          extracts a thumbnail and writes a JSON metadata sidecar.
 *
 * @note Probe and analysis errors abort the run. Segment errors are recorded
 *       and the remaining segments still render.
 */

#ifndef AUTO_SHORTS_PIPELINE_HPP
#define AUTO_SHORTS_PIPELINE_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "command_runner.hpp"
#include "config.hpp"
#include "render_queue.hpp"
#include "types.hpp"

namespace auto_shorts {

class FrameComposer;
class ExportEncoder;
class ScopedTempDir;

/**
 * @brief Pipeline progress.
 * @note Probing -> Analyzing -> Selecting -> Rendering -> Done, or Failed from
 *       any stage before Done.
 */
enum class RunState { Idle, Probing, Analyzing, Selecting, Rendering, Done, Failed };

const char *to_string(RunState state);

/**
 * @brief Progress of one segment while the run is Rendering.
 * @note Pending -> Composing -> Encoding -> Published, or Failed / Cancelled.
 */
enum class SegmentStage { Pending, Composing, Encoding, Published, Failed, Cancelled };

const char *to_string(SegmentStage stage);

/**
 * @brief Published file name of a short: `<title>_short_<index>.mp4`.
 */
std::string short_file_name(const std::string &title, int index);

/// Hashtags shown in the caption footer
constexpr size_t MAX_FOOTER_HASHTAGS = 5;

/**
 * @brief Captions for short `index` of `total`.
 * @return An empty spec unless config.overlay_text is set
 */
CaptionSpec make_captions(const PipelineConfig &config, int index, int total);

/**
 * @class ShortsPipeline
 * @brief Orchestrates analysis, selection and rendering of one source.
 *
 * @attention THREAD MODEL:
 *
 *   - Analysis parallelizes internally over timeline chunks
 *
 *   - Rendering runs max_concurrent workers; each writes only to its own
 *     temp subdirectory and final path
 *
 *   - The run's temp directory is removed on every exit path
 */
class ShortsPipeline {
  PipelineConfig config_;
  CommandRunner &runner_;
  const std::atomic<bool> *stop_flag_ = nullptr;
  std::atomic<RunState> state_{RunState::Idle};

  /// Guards artifacts, failures and stages_ while workers report
  mutable std::mutex results_mutex_;
  std::vector<SegmentStage> stages_; //< Indexed by segment index - 1

  void set_state(RunState state);
  void set_stage(int index, SegmentStage stage);

  bool stop_requested() const {
    return stop_flag_ && stop_flag_->load(std::memory_order_relaxed);
  }

  /// A stop signal also reaches ffmpeg, so a failure seen after it is a cancel
  FailureKind interrupted_or(FailureKind kind) const {
    return stop_requested() ? FailureKind::Cancelled : kind;
  }

  /**
   * @brief Compose + encode one job, recording the outcome in the manifest.
   * @note Never throws for segment-level errors.
   */
  void render_job(const SourceVideo &source, const RenderJob &job,
                  const LayoutMode &layout, const RenderSpec &spec,
                  const FrameComposer &composer, const ExportEncoder &encoder,
                  const ScopedTempDir &run_dir, RunManifest &manifest);

  void record_failure(RunManifest &manifest, const RenderJob &job,
                      FailureKind kind, const std::string &message);

public:
  /**
   * @param config Validated configuration, copied and never mutated
   * @param runner Launches ffmpeg for the composer and the encoder
   */
  ShortsPipeline(PipelineConfig config, CommandRunner &runner);

  /**
   * @brief Observe a stop flag; jobs not yet started when it is raised are
   *        recorded as Cancelled, and so is a running job that fails after
   *        it was raised.
   */
  void set_stop_flag(const std::atomic<bool> *flag) { stop_flag_ = flag; }

  /**
   * @brief Run the complete pipeline on one local file.
   *
   * @param source_path Local media file
   * @param count Number of shorts wanted
   * @param layout Resolved layout mode
   * @throws ProbeError, AnalysisError, std::invalid_argument (bad count),
   *         std::system_error / filesystem_error (temp or output directory)
   */
  RunManifest run(const std::string &source_path, int count,
                  const LayoutMode &layout);

  RunState state() const { return state_.load(); }

  /// Snapshot of every segment's stage (empty before Rendering)
  std::vector<SegmentStage> segment_stages() const;

  const PipelineConfig &config() const { return config_; }
};

/**
 * @brief Print the run summary table to stdout.
 */
void print_run_summary(const RunManifest &manifest);

} // namespace auto_shorts

#endif // AUTO_SHORTS_PIPELINE_HPP
