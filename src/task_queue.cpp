/**
 * @file task_queue.cpp
 * @brief Analysis task queue and energy collection implementation
 */

#include "auto_shorts/task_queue.hpp"

#include <algorithm>

namespace auto_shorts {

// **----- TaskQueue Implementation -----**

void TaskQueue::push(AnalysisTask task) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    tasks.push(task);
  }
  cv.notify_one();
}

bool TaskQueue::pop(AnalysisTask &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  task = tasks.front();
  tasks.pop();
  return true;
}

void TaskQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

// **----- EnergyCollector Implementation -----**

EnergyCollector::EnergyCollector(size_t window_count) : windows(window_count) {}

void EnergyCollector::add(size_t first_window,
                          const std::vector<WindowEnergy> &chunk_windows) {
  std::lock_guard<std::mutex> lock(mutex);
  if (first_window >= windows.size())
    return;
  size_t n = std::min(chunk_windows.size(), windows.size() - first_window);
  std::copy(chunk_windows.begin(), chunk_windows.begin() + n,
            windows.begin() + first_window);
}

std::vector<WindowEnergy> EnergyCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  return std::move(windows);
}

} // namespace auto_shorts
