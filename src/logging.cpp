/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides:
 *          - The global log mutex and runtime level
 *
 *          - Colored line output (warnings and errors go to stderr)
 *
 *          - TimingCollector static members and methods
 */

#include "auto_shorts/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>

#include <fmt/color.h>

namespace auto_shorts {

// **----- LOG STATE -----**

namespace {

std::mutex log_mutex;
std::atomic<int> min_level{static_cast<int>(LogLevel::Info)};

LogLevel level_of(detail::LineStyle style) {
  switch (style) {
  case detail::LineStyle::Warn:
    return LogLevel::Warn;
  case detail::LineStyle::Error:
    return LogLevel::Error;
  default:
    return LogLevel::Info;
  }
}

} // anonymous namespace

void set_log_level(LogLevel level) { min_level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(min_level.load()); }

LogLevel parse_log_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "warn" || lower == "warning")
    return LogLevel::Warn;
  if (lower == "error")
    return LogLevel::Error;
  if (lower == "off" || lower == "none")
    return LogLevel::Off;
  return LogLevel::Info;
}

namespace detail {

void write_log_line(LineStyle style, const std::string &line) {
  if (static_cast<int>(level_of(style)) < min_level.load())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  switch (style) {
  case LineStyle::Info:
    fmt::print("{}\n", line);
    std::fflush(stdout);
    break;
  case LineStyle::Warn:
    fmt::print(stderr, fg(fmt::color::yellow), "{}\n", line);
    std::fflush(stderr);
    break;
  case LineStyle::Error:
    fmt::print(stderr, fg(fmt::color::red), "{}\n", line);
    std::fflush(stderr);
    break;
  case LineStyle::Phase:
    fmt::print(fg(fmt::color::cyan), "{}\n", line);
    std::fflush(stdout);
    break;
  case LineStyle::Success:
    fmt::print(fg(fmt::color::green), "{}\n", line);
    std::fflush(stdout);
    break;
  }
}

} // namespace detail

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>20}\n", "Phase", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds, seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

std::vector<TimingEntry> TimingCollector::snapshot() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries;
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace auto_shorts
