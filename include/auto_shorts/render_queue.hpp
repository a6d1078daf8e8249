/**
 * @file render_queue.hpp
 * @brief Thread-safe queue of per-segment render jobs
 *
 * @details Producer-consumer hand-off between the orchestrator and the
 *          render workers:
 *
 *          - The orchestrator pushes one job per selected segment
 *
 *          - max_concurrent workers pop jobs and compose + encode them
 *
 *          - finish() releases the workers once the queue drains
 */

#ifndef AUTO_SHORTS_RENDER_QUEUE_HPP
#define AUTO_SHORTS_RENDER_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include "types.hpp"

namespace auto_shorts {

/**
 * @struct RenderJob
 * @brief A single segment to compose and encode.
 */
struct RenderJob {
  Segment segment;        //< Source span
  int index = 0;          //< 1-based presentation index
  int total = 0;          //< Segments in the run
  std::string final_path; //< Where the short is published
};

/**
 * @class RenderQueue
 * @brief Thread-safe FIFO of RenderJobs.
 */
class RenderQueue {
public:
  void push(RenderJob job);

  /**
   * @brief Pop a job (blocking).
   * @return true if a job was retrieved, false if the queue is finished
   */
  bool pop(RenderJob &job);

  void finish();

  /**
   * @brief Remove every job still waiting.
   * @return The jobs that will never run, in queue order
   */
  std::vector<RenderJob> drain();

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.empty();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<RenderJob> jobs_;
  std::atomic<bool> done_{false};
};

} // namespace auto_shorts

#endif // AUTO_SHORTS_RENDER_QUEUE_HPP
