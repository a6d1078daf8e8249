/**
 * @file cli.hpp
 * @brief Command-line argument parsing for the auto_shorts executable
 */

#ifndef AUTO_SHORTS_CLI_HPP
#define AUTO_SHORTS_CLI_HPP

#include <atomic>
#include <string>

#include "config.hpp"
#include "types.hpp"

namespace auto_shorts {

/// Exit codes of the auto_shorts executable
constexpr int EXIT_OK = 0;         //< At least one short was produced
constexpr int EXIT_NO_OUTPUT = 1;  //< Run failed or produced nothing
constexpr int EXIT_USAGE = 2;      //< Bad arguments or configuration

/**
 * @struct CliOptions
 * @brief `auto_shorts <url_or_path> [num_shorts] [format]`
 */
struct CliOptions {
  std::string source;
  int count = 0;
  LayoutMode::Kind layout = LayoutMode::Kind::Passthrough;
};

/**
 * @brief Map a format argument to a layout kind.
 * @note normal, n, shorts, s -> Passthrough;
 *       screen, split, split_screen, splitscreen -> SplitScreen
 *       (case-insensitive)
 * @return false for an unknown name
 */
bool parse_layout_kind(const std::string &text, LayoutMode::Kind &kind);

/**
 * @brief Parse a strictly positive count.
 */
bool parse_count(const std::string &text, int &count);

/**
 * @brief Parse argv. Missing count falls back to cfg.count_per_video.
 * @return false on a usage error (message already logged)
 */
bool parse_cli(int argc, const char *const argv[], const PipelineConfig &cfg,
               CliOptions &out);

/**
 * @brief Build the LayoutMode for a kind from the configured split layout.
 * @throws ConfigError if the configured split layout is invalid
 */
LayoutMode resolve_layout(LayoutMode::Kind kind, const PipelineConfig &cfg);

void print_usage(const char *program);

// **---- Stop Signals ----**

/**
 * @brief Flag raised by SIGINT/SIGTERM once install_stop_handlers() ran.
 */
std::atomic<bool> &stop_signal_flag();

/**
 * @brief Route SIGINT and SIGTERM to stop_signal_flag().
 * @note Child programs are started without a shell, so the handlers stay
 *       in effect while ffmpeg or yt-dlp runs.
 */
void install_stop_handlers();

} // namespace auto_shorts

#endif // AUTO_SHORTS_CLI_HPP
