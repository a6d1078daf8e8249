/**
 * @file score_curve.cpp
 * @brief Score Curve Dump Utility
 *
 * @details Standalone utility that runs the energy analyzer on a media file
 *          and writes the resulting score curve as CSV, for tuning the
 *          window, smoothing and duration settings. The selected segments
 *          are appended as comment lines.
 *
 * @usage
 *   auto_shorts_scores input.mp4 [output.csv]
 *
 * @note Reads the same environment variables as auto_shorts
 *       (SCORE_WINDOW_SEC, SMOOTHING_WINDOWS, SHORT_DURATION_SEC, ...).
 */

#include <cstdio>
#include <exception>

#include "auto_shorts/config.hpp"
#include "auto_shorts/energy_analyzer.hpp"
#include "auto_shorts/errors.hpp"
#include "auto_shorts/logging.hpp"
#include "auto_shorts/media_probe.hpp"
#include "auto_shorts/segment_selector.hpp"

using namespace auto_shorts;

int main(int argc, char **argv) {
  if (argc < 2 || argc > 3) {
    fprintf(stderr, "Usage: %s input.mp4 [output.csv]\n", argv[0]);
    return 2;
  }

  const char *input = argv[1];
  const char *output = (argc == 3) ? argv[2] : nullptr;

  /// Logs go to stdout; keep them out of a CSV written there
  if (!output)
    set_log_level(LogLevel::Warn);

  try {
    PipelineConfig cfg = load_pipeline_config();
    SourceVideo source = probe_media(input);

    AnalyzerOptions options;
    options.window_sec = cfg.window_sec;
    options.smoothing_windows = cfg.smoothing_windows;
    options.chunk_duration_sec = cfg.chunk_duration_sec;
    options.threads = cfg.analysis_threads;

    ScoreCurve curve = EnergyAnalyzer(options).analyze(source);

    FILE *out = output ? fopen(output, "w") : stdout;
    if (!out) {
      perror("fopen");
      return 1;
    }

    fprintf(out, "timestamp,score\n");
    for (const auto &s : curve.samples) {
      fprintf(out, "%.3f,%.6f\n", s.timestamp, s.score);
    }

    if (source.duration >= cfg.short_duration_sec) {
      SelectionResult sel =
          select_segments(curve, cfg.count_per_video, cfg.short_duration_sec,
                          cfg.min_gap_sec);
      for (const auto &seg : sel.segments) {
        fprintf(out, "# segment %.3f-%.3f score %.6f\n", seg.start, seg.end,
                seg.score);
      }
    }

    if (out != stdout)
      fclose(out);
  } catch (const Error &e) {
    fprintf(stderr, "%s\n", e.what());
    return 1;
  } catch (const std::exception &e) {
    fprintf(stderr, "Unexpected failure: %s\n", e.what());
    return 1;
  }
  return 0;
}
