/**
 * @file task_queue.cpp
 * @brief Thread-safe task queue and result collection implementation
 */

#include "clip_unify/task_queue.hpp"

#include <utility>

namespace clip_unify {

// **----- TaskQueue Implementation -----**

void TaskQueue::push(NormalizeTask task) {
  std::lock_guard<std::mutex> lock(mutex);
  tasks.push(std::move(task));
  cv.notify_one();
}

bool TaskQueue::pop(NormalizeTask &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  task = std::move(tasks.front());
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

// **----- ResultCollector Implementation -----**

void ResultCollector::place(size_t index, NormalizationResult &&result) {
  std::lock_guard<std::mutex> lock(mutex);
  if (index < results.size())
    results[index] = std::move(result);
}

std::vector<NormalizationResult> ResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  return std::move(results);
}

} // namespace clip_unify
