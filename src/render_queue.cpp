/**
 * @file render_queue.cpp
 * @brief Render job queue implementation
 */

#include "auto_shorts/render_queue.hpp"

#include <utility>
#include <vector>

namespace auto_shorts {

void RenderQueue::push(RenderJob job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push(std::move(job));
  }
  cv_.notify_one();
}

bool RenderQueue::pop(RenderJob &job) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !jobs_.empty() || done_.load(); });

  if (jobs_.empty()) {
    return false;
  }

  job = std::move(jobs_.front());
  jobs_.pop();
  return true;
}

void RenderQueue::finish() {
  done_.store(true);
  cv_.notify_all();
}

std::vector<RenderJob> RenderQueue::drain() {
  std::vector<RenderJob> left;
  std::lock_guard<std::mutex> lock(mutex_);
  while (!jobs_.empty()) {
    left.push_back(std::move(jobs_.front()));
    jobs_.pop();
  }
  return left;
}

} // namespace auto_shorts
