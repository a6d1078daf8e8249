/**
 * @file task_queue.hpp
 * @brief Thread-safe analysis task queue and energy collection
 *
 * @details Provides:
 *          - TaskQueue: shared queue of timeline chunks for analyzer workers
 *
 *          - EnergyCollector: per-window accumulator the workers report into
 */

#ifndef AUTO_SHORTS_TASK_QUEUE_HPP
#define AUTO_SHORTS_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <vector>

#include "types.hpp"

namespace auto_shorts {

/**
 * @class TaskQueue
 * @brief Work-stealing queue of analysis chunks.
 *
 * @note A worker that lands on a dense chunk does not hold the others up;
 *       idle workers keep popping until the queue is drained.
 */
class TaskQueue {
  std::queue<AnalysisTask> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a task to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(AnalysisTask task);

  /**
   * @brief Pop a task from the queue.
   * @note Blocks until a task is available or queue is finished.
   * @return true if a task was retrieved, false if queue is empty and done
   */
  bool pop(AnalysisTask &task);

  /**
   * @brief Signal that no more tasks will be added.
   */
  void finish();
};

/**
 * @struct WindowEnergy
 * @brief Raw energy of one analysis window.
 */
struct WindowEnergy {
  double sum_sq = 0;  //< Sum of squared mono samples
  uint64_t count = 0; //< Number of samples
};

/**
 * @class EnergyCollector
 * @brief Thread-safe per-window energy store.
 * @note Every window is owned by exactly one chunk, so workers never
 *       write the same slot and the result does not depend on ordering.
 */
class EnergyCollector {
  std::vector<WindowEnergy> windows;
  std::mutex mutex;

public:
  explicit EnergyCollector(size_t window_count);

  /**
   * @brief Store the windows of one finished chunk.
   * @param first_window Index of chunk_windows[0] in the full timeline
   */
  void add(size_t first_window, const std::vector<WindowEnergy> &chunk_windows);

  /**
   * @brief Extract all windows.
   * @attention Moves the internal vector out, leaving the collector empty.
   */
  std::vector<WindowEnergy> extract();
};

} // namespace auto_shorts

#endif // AUTO_SHORTS_TASK_QUEUE_HPP
