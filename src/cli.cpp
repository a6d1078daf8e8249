/**
 * @file cli.cpp
 * @brief Command-line argument parsing
 */

#include "auto_shorts/cli.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <stdexcept>

#include "auto_shorts/errors.hpp"
#include "auto_shorts/logging.hpp"

namespace auto_shorts {

bool parse_layout_kind(const std::string &text, LayoutMode::Kind &kind) {
  std::string name = text;
  std::transform(name.begin(), name.end(), name.begin(),
                 [](unsigned char c) { return std::tolower(c); });

  if (name == "normal" || name == "n" || name == "shorts" || name == "s") {
    kind = LayoutMode::Kind::Passthrough;
    return true;
  }
  if (name == "screen" || name == "split" || name == "split_screen" ||
      name == "splitscreen") {
    kind = LayoutMode::Kind::SplitScreen;
    return true;
  }
  return false;
}

bool parse_count(const std::string &text, int &count) {
  try {
    size_t used = 0;
    int value = std::stoi(text, &used);
    if (used != text.size() || value < 1)
      return false;
    count = value;
    return true;
  } catch (const std::logic_error &) {
    return false;
  }
}

bool parse_cli(int argc, const char *const argv[], const PipelineConfig &cfg,
               CliOptions &out) {
  if (argc < 2 || argc > 4) {
    print_usage(argc > 0 ? argv[0] : "auto_shorts");
    return false;
  }

  out.source = argv[1];
  out.count = cfg.count_per_video;
  out.layout = LayoutMode::Kind::Passthrough;

  if (argc >= 3 && !parse_count(argv[2], out.count)) {
    LOG_ERROR("num_shorts must be a positive integer, got '{}'", argv[2]);
    return false;
  }
  if (argc >= 4 && !parse_layout_kind(argv[3], out.layout)) {
    LOG_ERROR("Unknown format '{}' (use normal or screen)", argv[3]);
    return false;
  }
  return true;
}

LayoutMode resolve_layout(LayoutMode::Kind kind, const PipelineConfig &cfg) {
  if (kind == LayoutMode::Kind::Passthrough)
    return LayoutMode::passthrough();
  try {
    return LayoutMode::split_screen(cfg.split);
  } catch (const std::invalid_argument &e) {
    throw ConfigError(e.what());
  }
}

void print_usage(const char *program) {
  LOG_WARN("Usage: {} <url_or_path> [num_shorts] [normal|screen]", program);
}

// **---- Stop Signals ----**

namespace {

std::atomic<bool> g_stop_requested{false};

extern "C" void handle_stop_signal(int) { g_stop_requested.store(true); }

} // anonymous namespace

std::atomic<bool> &stop_signal_flag() { return g_stop_requested; }

void install_stop_handlers() {
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);
}

} // namespace auto_shorts
