/**
 * @file main.cpp
 * @brief Entry point for the Auto Shorts application
 *
 * @details Main entry point that handles:
 *
 *          - Environment configuration and command-line parsing
 *
 *          - Source acquisition (local file or yt-dlp download)
 *
 *          - One pipeline run, then timing and run summaries
 *
 * @note SIGINT/SIGTERM stop the run gracefully: segments already rendering
 *       finish, the others are recorded as cancelled. A segment whose
 *       ffmpeg was interrupted by the same Ctrl-C is recorded as cancelled
 *       too.
 */

#include <cstdio>
#include <exception>
#include <string>

#include "auto_shorts/acquisition.hpp"
#include "auto_shorts/cli.hpp"
#include "auto_shorts/command_runner.hpp"
#include "auto_shorts/config.hpp"
#include "auto_shorts/errors.hpp"
#include "auto_shorts/logging.hpp"
#include "auto_shorts/pipeline.hpp"

using namespace auto_shorts;

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  PipelineConfig cfg;
  try {
    set_log_level(parse_log_level(Config::get_env_string("LOG_LEVEL", "info")));
    cfg = load_pipeline_config();
  } catch (const ConfigError &e) {
    LOG_ERROR("Configuration: {}", e.what());
    return EXIT_USAGE;
  }

  CliOptions options;
  if (!parse_cli(argc, argv, cfg, options))
    return EXIT_USAGE;

  LayoutMode layout = LayoutMode::passthrough();
  try {
    layout = resolve_layout(options.layout, cfg);
  } catch (const ConfigError &e) {
    LOG_ERROR("Configuration: {}", e.what());
    return EXIT_USAGE;
  }

  install_stop_handlers();

  LOG_INFO("Auto Shorts");
  LOG_INFO("Source: {}", options.source);
  LOG_INFO("Shorts: {} x {:.0f}s ({})", options.count, cfg.short_duration_sec,
           layout.name());
  LOG_INFO("Output directory: {}", cfg.output_dir);

  SystemCommandRunner runner;
  RunManifest manifest;
  try {
    std::string path =
        acquire_source(options.source, cfg.download_dir, runner, cfg.ytdlp_bin);

    ShortsPipeline pipeline(cfg, runner);
    pipeline.set_stop_flag(&stop_signal_flag());
    manifest = pipeline.run(path, options.count, layout);
  } catch (const Error &e) {
    LOG_ERROR("{}", e.what());
    return EXIT_NO_OUTPUT;
  } catch (const std::exception &e) {
    LOG_ERROR("Unexpected failure: {}", e.what());
    return EXIT_NO_OUTPUT;
  }

  TimingCollector::print_summary();
  print_run_summary(manifest);

  return manifest.artifacts.empty() ? EXIT_NO_OUTPUT : EXIT_OK;
}
