/**
 * @file system.hpp
 * @brief System utilities: CPU detection and small formatting helpers
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Worker count resolution for the analyzer and render pool
 *
 *          - Time formatting and file-name sanitizing
 */

#ifndef AUTO_SHORTS_SYSTEM_HPP
#define AUTO_SHORTS_SYSTEM_HPP

#include <string>

namespace auto_shorts {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the cgroup limit. This function reads
 *       cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cpuset: `cpuset.cpus(.effective)` (counts allowed cores)
 *
 * @return Detected CPU limit in [1, 64]
 */
int detect_cpu_limit();

/**
 * @brief Resolve a configured worker count.
 * @param configured 0 = detected CPU limit
 * @param work_items Upper bound (no more workers than work)
 * @return A value in [1, max(1, work_items)]
 */
int resolve_worker_count(int configured, int work_items);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

/**
 * @brief Make a string safe to use as a file name component.
 * @note Path separators and control characters become '_'; an empty
 *       result becomes "video".
 */
std::string sanitize_file_component(const std::string &text);

} // namespace auto_shorts

#endif // AUTO_SHORTS_SYSTEM_HPP
