/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *            with a runtime minimum level (LOG_LEVEL environment variable)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating phase durations
 *
 * @note All logs use fmt for type-safe formatting and are flushed
 *       immediately so that interleaved worker output stays readable.
 */

#ifndef AUTO_SHORTS_LOGGING_HPP
#define AUTO_SHORTS_LOGGING_HPP

#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/core.h>

namespace auto_shorts {

// **----- LOGGING CONFIGURATION -----**

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

enum class LogLevel { Info = 0, Warn = 1, Error = 2, Off = 3 };

/**
 * @brief Set the minimum level that reaches the terminal.
 * @note Phase and success lines are treated as Info.
 */
void set_log_level(LogLevel level);
LogLevel log_level();

/**
 * @brief Parse "info", "warn", "error" or "off" (case-insensitive).
 * @return Info for unrecognized names
 */
LogLevel parse_log_level(const std::string &name);

namespace detail {

enum class LineStyle { Info, Warn, Error, Phase, Success };

/// Write one complete line under the global log mutex
void write_log_line(LineStyle style, const std::string &line);

} // namespace detail

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define AUTO_SHORTS_LOG(style, format_str, ...)                                \
  auto_shorts::detail::write_log_line(                                         \
      auto_shorts::detail::LineStyle::style,                                   \
      fmt::format(format_str, ##__VA_ARGS__))

#define LOG_INFO(format_str, ...)                                              \
  AUTO_SHORTS_LOG(Info, "[INFO] " format_str, ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  AUTO_SHORTS_LOG(Warn, "[WARN] " format_str, ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  AUTO_SHORTS_LOG(Error, "[ERROR] " format_str, ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  AUTO_SHORTS_LOG(Phase, format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  AUTO_SHORTS_LOG(Success, format_str, ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector for phase timings.
 * @note Workers record concurrently; the CLI prints the table at the end.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table.
   */
  static void print_summary();

  /// Copy of the collected entries (in recording order)
  static std::vector<TimingEntry> snapshot();

  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    auto_shorts::TimingCollector::record(#name, timer_duration_##name);        \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace auto_shorts

#endif // AUTO_SHORTS_LOGGING_HPP
