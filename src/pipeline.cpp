/**
 * @file pipeline.cpp
 * @brief Shorts generation pipeline implementation
 *
 * @details Orchestrates the whole run:
 *
 *          1. Probe video metadata
 *
 *          2. Energy analysis (chunked, multi-threaded)
 *
 *          3. Greedy segment selection
 *
 *          4. Render queue with one job per segment
 *
 *          5. Render workers compose, encode and publish
 *
 * @note Log lines of render workers are prefixed with [Segment N].
 */

#include "auto_shorts/pipeline.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "auto_shorts/energy_analyzer.hpp"
#include "auto_shorts/errors.hpp"
#include "auto_shorts/export_encoder.hpp"
#include "auto_shorts/frame_composer.hpp"
#include "auto_shorts/logging.hpp"
#include "auto_shorts/media_probe.hpp"
#include "auto_shorts/publisher.hpp"
#include "auto_shorts/segment_selector.hpp"
#include "auto_shorts/system.hpp"
#include "auto_shorts/temp_dir.hpp"

namespace auto_shorts {

namespace fs = std::filesystem;

const char *to_string(RunState state) {
  switch (state) {
  case RunState::Idle:
    return "Idle";
  case RunState::Probing:
    return "Probing";
  case RunState::Analyzing:
    return "Analyzing";
  case RunState::Selecting:
    return "Selecting";
  case RunState::Rendering:
    return "Rendering";
  case RunState::Done:
    return "Done";
  case RunState::Failed:
    return "Failed";
  }
  return "Unknown";
}

const char *to_string(SegmentStage stage) {
  switch (stage) {
  case SegmentStage::Pending:
    return "Pending";
  case SegmentStage::Composing:
    return "Composing";
  case SegmentStage::Encoding:
    return "Encoding";
  case SegmentStage::Published:
    return "Published";
  case SegmentStage::Failed:
    return "Failed";
  case SegmentStage::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

std::string short_file_name(const std::string &title, int index) {
  return fmt::format("{}_short_{}.mp4", sanitize_file_component(title), index);
}

CaptionSpec make_captions(const PipelineConfig &config, int index, int total) {
  CaptionSpec captions;
  if (!config.overlay_text)
    return captions;

  captions.intro = config.caption_label.empty()
                       ? fmt::format("{}/{}", index, total)
                       : fmt::format("{} {}/{}", config.caption_label, index,
                                     total);
  size_t shown = std::min(config.hashtags.size(), MAX_FOOTER_HASHTAGS);
  captions.footer = format_hashtags(std::vector<std::string>(
      config.hashtags.begin(), config.hashtags.begin() + shown));
  captions.font_size = config.caption_font_size;
  captions.font_file = config.font_file;
  return captions;
}

namespace {

/// Writes the JSON sidecar beside the short; "" if that failed
std::string publish_metadata(const SourceVideo &source,
                             const ShortArtifact &artifact, int total,
                             const std::vector<std::string> &hashtags,
                             const std::string &work_dir) {
  std::string staged = (fs::path(work_dir) / "metadata.json").string();
  std::string final_path =
      fs::path(artifact.path).replace_extension(".json").string();
  try {
    write_metadata_file(
        make_short_metadata(source.title, artifact, total, hashtags), artifact,
        staged);
    publish_atomically(staged, final_path);
  } catch (const std::system_error &e) {
    LOG_WARN("[Segment {}] Could not write metadata: {}", artifact.index,
             e.what());
    return "";
  }
  return final_path;
}

} // anonymous namespace

// **---- Constructor ----**

ShortsPipeline::ShortsPipeline(PipelineConfig config, CommandRunner &runner)
    : config_(std::move(config)), runner_(runner) {}

void ShortsPipeline::set_state(RunState state) { state_.store(state); }

void ShortsPipeline::set_stage(int index, SegmentStage stage) {
  std::lock_guard<std::mutex> lock(results_mutex_);
  if (index >= 1 && static_cast<size_t>(index) <= stages_.size())
    stages_[index - 1] = stage;
}

std::vector<SegmentStage> ShortsPipeline::segment_stages() const {
  std::lock_guard<std::mutex> lock(results_mutex_);
  return stages_;
}

// **---- Main Processing ----**

RunManifest ShortsPipeline::run(const std::string &source_path, int count,
                                const LayoutMode &layout) {
  TIMER_START(total_run);

  RunManifest manifest;
  manifest.requested = count;
  {
    std::lock_guard<std::mutex> lock(results_mutex_);
    stages_.clear();
  }

  try {
    // **----- PHASE 0: PROBE -----**

    set_state(RunState::Probing);
    LOG_PHASE("Probing...");
    TIMER_START(inspect);
    manifest.source = probe_media(source_path);
    TIMER_END(inspect);

    const SourceVideo &source = manifest.source;
    LOG_INFO("Duration: {} ({}x{} @ {:.2f}fps, audio: {})",
             format_time(source.duration), source.width, source.height,
             source.fps, source.has_audio ? "yes" : "no");

    // **----- PHASE 1: ANALYSIS -----**

    set_state(RunState::Analyzing);
    LOG_PHASE("Analyzing audio ({:.0f}s chunks)...",
              config_.chunk_duration_sec);

    AnalyzerOptions options;
    options.window_sec = config_.window_sec;
    options.smoothing_windows = config_.smoothing_windows;
    options.chunk_duration_sec = config_.chunk_duration_sec;
    options.threads = config_.analysis_threads;
    options.min_duration_sec = config_.short_duration_sec;

    EnergyAnalyzer analyzer(options);
    ScoreCurve curve = analyzer.analyze(source);

    // **----- PHASE 2: SELECTION -----**

    set_state(RunState::Selecting);
    LOG_PHASE("Selecting...");
    TIMER_START(selection);
    SelectionResult selection = select_segments(
        curve, count, config_.short_duration_sec, config_.min_gap_sec);
    TIMER_END(selection);

    manifest.segments = selection.segments;
    manifest.partial_selection = selection.partial;
    for (size_t i = 0; i < selection.segments.size(); ++i) {
      const Segment &s = selection.segments[i];
      LOG_INFO("Segment {}: {} -> {} (score {:.4f})", i + 1,
               format_time(s.start), format_time(s.end), s.score);
    }

    if (selection.segments.empty()) {
      LOG_WARN("No segments to render.");
      set_state(RunState::Done);
      TIMER_END(total_run);
      return manifest;
    }

    // **----- PHASE 3: RENDERING -----**

    set_state(RunState::Rendering);
    const RenderSpec spec = config_.render_spec_for(layout);
    fs::create_directories(config_.output_dir);
    ScopedTempDir run_dir(config_.temp_dir, "auto_shorts_run");

    {
      std::lock_guard<std::mutex> lock(results_mutex_);
      stages_.assign(selection.segments.size(), SegmentStage::Pending);
    }

    RenderQueue render_queue;
    for (size_t i = 0; i < selection.segments.size(); ++i) {
      RenderJob job;
      job.segment = selection.segments[i];
      job.index = static_cast<int>(i) + 1;
      job.total = static_cast<int>(selection.segments.size());
      job.final_path = (fs::path(config_.output_dir) /
                        short_file_name(source.title, job.index))
                           .string();
      render_queue.push(std::move(job));
    }
    render_queue.finish();

    const int num_workers = resolve_worker_count(
        config_.max_concurrent, static_cast<int>(selection.segments.size()));
    LOG_PHASE("Rendering {} shorts ({}x{}, {}, {} workers)...",
              selection.segments.size(), spec.width, spec.height,
              layout.name(), num_workers);

    TIMER_START(rendering);

    FrameComposer composer(runner_, config_.ffmpeg_bin);
    ExportEncoder encoder(runner_, config_.ffmpeg_bin);

    std::vector<std::thread> workers;
    workers.reserve(num_workers);
    for (int i = 0; i < num_workers; ++i) {
      workers.emplace_back([&]() {
        RenderJob job;
        while (render_queue.pop(job)) {
          if (stop_requested()) {
            record_failure(manifest, job, FailureKind::Cancelled,
                           "stop requested before the segment started");
            for (const RenderJob &left : render_queue.drain())
              record_failure(manifest, left, FailureKind::Cancelled,
                             "stop requested before the segment started");
            continue;
          }
          render_job(source, job, layout, spec, composer, encoder, run_dir,
                     manifest);
        }
      });
    }

    for (auto &w : workers) {
      w.join();
    }

    TIMER_END(rendering);

    auto by_index = [](const auto &a, const auto &b) {
      return a.index < b.index;
    };
    std::sort(manifest.artifacts.begin(), manifest.artifacts.end(), by_index);
    std::sort(manifest.failures.begin(), manifest.failures.end(), by_index);

    set_state(RunState::Done);
  } catch (...) {
    set_state(RunState::Failed);
    throw;
  }

  TIMER_END(total_run);
  return manifest;
}

// **---- Per-segment Work ----**

void ShortsPipeline::render_job(const SourceVideo &source, const RenderJob &job,
                                const LayoutMode &layout,
                                const RenderSpec &spec,
                                const FrameComposer &composer,
                                const ExportEncoder &encoder,
                                const ScopedTempDir &run_dir,
                                RunManifest &manifest) {
  auto start = std::chrono::steady_clock::now();
  std::string work_dir;

  try {
    work_dir = run_dir.subdir(fmt::format("segment_{:02d}", job.index));

    set_stage(job.index, SegmentStage::Composing);
    LOG_INFO("[Segment {}] Composing {} -> {}", job.index,
             format_time(job.segment.start), format_time(job.segment.end));
    std::string composed =
        composer.compose(source, job.segment, layout, spec, work_dir,
                         make_captions(config_, job.index, job.total));

    set_stage(job.index, SegmentStage::Encoding);
    LOG_INFO("[Segment {}] Encoding...", job.index);
    ShortArtifact artifact = encoder.encode(composed, job.segment, job.index,
                                            spec, job.final_path, work_dir);

    /// Extras never fail a short that is already published
    if (config_.thumbnails) {
      artifact.thumbnail_path = encoder.thumbnail(
          artifact, fs::path(job.final_path).replace_extension(".jpg").string(),
          work_dir);
    }
    if (config_.write_metadata) {
      artifact.metadata_path = publish_metadata(
          source, artifact, job.total, config_.hashtags, work_dir);
    }

    auto us = std::chrono::duration_cast<std::chrono::microseconds>(
                  std::chrono::steady_clock::now() - start)
                  .count();
    TimingCollector::record(fmt::format("  ├─segment_{}", job.index), us);
    LOG_SUCCESS("[Segment {}] Output saved to: {}", job.index, artifact.path);

    std::lock_guard<std::mutex> lock(results_mutex_);
    stages_[job.index - 1] = SegmentStage::Published;
    manifest.artifacts.push_back(std::move(artifact));
  } catch (const ComposeError &e) {
    record_failure(manifest, job, interrupted_or(FailureKind::ComposeError),
                   e.what());
  } catch (const EncodeError &e) {
    FailureKind kind = (e.kind() == EncodeError::Kind::AudioMuxFailure)
                           ? FailureKind::AudioMuxFailure
                           : FailureKind::EncodeError;
    record_failure(manifest, job, interrupted_or(kind), e.what());
  } catch (const fs::filesystem_error &e) {
    record_failure(manifest, job, FailureKind::ComposeError,
                   fmt::format("work directory: {}", e.what()));
  } catch (const std::exception &e) {
    record_failure(manifest, job, FailureKind::EncodeError,
                   fmt::format("unexpected error: {}", e.what()));
  }

  /// Intermediate files are not needed once the segment is settled
  if (!work_dir.empty()) {
    std::error_code ec;
    fs::remove_all(work_dir, ec);
    if (ec)
      LOG_WARN("[Segment {}] Could not remove {}: {}", job.index, work_dir,
               ec.message());
  }
}

void ShortsPipeline::record_failure(RunManifest &manifest, const RenderJob &job,
                                    FailureKind kind,
                                    const std::string &message) {
  if (kind == FailureKind::Cancelled) {
    LOG_WARN("[Segment {}] Cancelled", job.index);
  } else {
    LOG_ERROR("[Segment {}] {}: {}", job.index, to_string(kind), message);
  }

  SegmentFailure failure;
  failure.segment = job.segment;
  failure.index = job.index;
  failure.kind = kind;
  failure.message = message;

  std::lock_guard<std::mutex> lock(results_mutex_);
  if (job.index >= 1 && static_cast<size_t>(job.index) <= stages_.size()) {
    stages_[job.index - 1] = (kind == FailureKind::Cancelled)
                                 ? SegmentStage::Cancelled
                                 : SegmentStage::Failed;
  }
  manifest.failures.push_back(std::move(failure));
}

// **---- Run Summary ----**

void print_run_summary(const RunManifest &manifest) {
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== RUN SUMMARY ====================\n");

  fmt::print("{:<20} {:>15}\n", "Source:", manifest.source.title);
  fmt::print("{:<20} {:>15}\n", "Duration:",
             format_time(manifest.source.duration));
  fmt::print("{:<20} {:>15}\n", "Requested:", manifest.requested);
  fmt::print("{:<20} {:>15}\n", "Selected:",
             fmt::format("{}{}", manifest.segments.size(),
                         manifest.partial_selection ? " (partial)" : ""));
  fmt::print("{:<20} {:>15}\n", "Produced:", manifest.artifacts.size());
  fmt::print("{:<20} {:>15}\n", "Failed:", manifest.failures.size());

  if (!manifest.artifacts.empty()) {
    fmt::print("\n");
    for (const auto &a : manifest.artifacts) {
      fmt::print("  #{:<3} {} -> {}  {:>8.1f} MB  {}\n", a.index,
                 format_time(a.segment.start), format_time(a.segment.end),
                 a.size_bytes / (1024.0 * 1024.0), a.path);
    }
  }
  if (!manifest.failures.empty()) {
    fmt::print("\n");
    for (const auto &f : manifest.failures) {
      fmt::print(fg(fmt::color::red), "  #{:<3} {:<16} {}\n", f.index,
                 to_string(f.kind), f.message);
    }
  }

  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

} // namespace auto_shorts
