/**
 * @file task_queue.hpp
 * @brief Thread-safe task queue and positional result collection
 *
 * @details Used only when normalization runs on more than one worker:
 *          - TaskQueue: shared queue workers pop clips from
 *
 *          - ResultCollector: stores each result at its scan index so the
 *            manifest can be built in scan order, not completion order
 */

#ifndef CLIP_UNIFY_TASK_QUEUE_HPP
#define CLIP_UNIFY_TASK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

#include "types.hpp"

namespace clip_unify {

/**
 * @struct NormalizeTask
 * @brief One clip waiting for a worker.
 */
struct NormalizeTask {
  size_t index;            //< Position in scan order
  std::string source_path; //< Input clip
  std::string output_path; //< Pending output keyed by index
};

/**
 * @class TaskQueue
 * @brief Thread-safe queue for dynamic load balancing across workers.
 * @note A long clip keeps one worker busy while the others keep pulling.
 */
class TaskQueue {
  std::queue<NormalizeTask> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a task to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(NormalizeTask task);

  /**
   * @brief Pop a task from the queue.
   * @note Blocks until a task is available or queue is finished.
   * @param task Output parameter for the task
   * @return true if a task was retrieved, false if queue is empty and done
   */
  bool pop(NormalizeTask &task);

  /**
   * @brief Signal that no more tasks will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();
};

/**
 * @class ResultCollector
 * @brief Thread-safe, index-addressed store of normalization results.
 */
class ResultCollector {
  std::vector<NormalizationResult> results;
  std::mutex mutex;

public:
  explicit ResultCollector(size_t count) : results(count) {}

  /**
   * @brief Store the result for a scan index.
   */
  void place(size_t index, NormalizationResult &&result);

  /**
   * @brief Extract all results in scan order.
   * @attention Moves the internal vector out, leaving collector empty.
   */
  std::vector<NormalizationResult> extract();
};

} // namespace clip_unify

#endif // CLIP_UNIFY_TASK_QUEUE_HPP
