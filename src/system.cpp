/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Worker count resolution
 *
 *          - Time formatting and file-name sanitizing
 */

#include "auto_shorts/system.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>

#include <fmt/core.h>

namespace auto_shorts {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.good() ? val : -1;
}

/// Count CPUs in a cpuset string like "0,2,4,6" or "0-3"
int count_cpuset_string(const std::string &line) {
  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();
    std::string item = line.substr(pos, end - pos);
    try {
      size_t dash = item.find('-');
      if (dash == std::string::npos) {
        std::stoi(item);
        ++count;
      } else {
        int first = std::stoi(item.substr(0, dash));
        int last = std::stoi(item.substr(dash + 1));
        if (last >= first)
          count += last - first + 1;
      }
    } catch (const std::logic_error &) {
      return -1;
    }
    pos = end + 1;
  }
  return count > 0 ? count : -1;
}

/// Helper to count CPUs from a cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  return count_cpuset_string(line);
}

/// CPU quota from cgroup v2 cpu.max ("max 100000" or "200000 100000")
int read_cgroup_v2_quota() {
  std::ifstream f("/sys/fs/cgroup/cpu.max");
  if (!f)
    return -1;
  std::string quota_str, period_str;
  f >> quota_str >> period_str;
  if (quota_str == "max" || period_str.empty())
    return -1;
  try {
    long quota = std::stol(quota_str);
    long period = std::stol(period_str);
    if (quota > 0 && period > 0)
      return static_cast<int>((quota + period - 1) / period);
  } catch (const std::logic_error &) {
  }
  return -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = read_cgroup_v2_quota();

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  if (limit <= 0)
    limit = 4;
  return std::min(limit, 64);
}

int resolve_worker_count(int configured, int work_items) {
  int workers = configured > 0 ? configured : detect_cpu_limit();
  workers = std::min(workers, std::max(1, work_items));
  return std::max(1, workers);
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int total = static_cast<int>(seconds);
  int h = total / 3600;
  int m = (total % 3600) / 60;
  int s = total % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string sanitize_file_component(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (unsigned char c : text) {
    if (c == '/' || c == '\\' || c < 0x20 || c == 0x7f) {
      out += '_';
    } else {
      out += static_cast<char>(c);
    }
  }
  if (out.empty() || out == "." || out == "..")
    return "video";
  return out;
}

} // namespace auto_shorts
