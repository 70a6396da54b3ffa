/**
 * @file work_queue.hpp
 * @brief Thread-safe sidecar queue and run ledger
 *
 * @details Provides:
 *          - SidecarQueue: shared queue the stream workers pull sidecars from
 *
 *          - RunLedger: the run's success counter and failure list
 */

#ifndef TAKEOUT_TIMEFIX_WORK_QUEUE_HPP
#define TAKEOUT_TIMEFIX_WORK_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <filesystem>
#include <mutex>
#include <queue>
#include <utility>
#include <vector>

#include "types.hpp"

namespace takeout_timefix {

/**
 * @struct SidecarTask
 * @brief A work unit: one sidecar and its position in walk order.
 */
struct SidecarTask {
  size_t index = 0;
  std::filesystem::path path;
};

/**
 * @class SidecarQueue
 * @brief Thread-safe queue for dynamic load balancing across streams.
 *
 * @note A file stalled in retry backoff only blocks its own stream; the
 *       others keep pulling work.
 */
class SidecarQueue {
  std::queue<SidecarTask> tasks;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a task to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(SidecarTask task);

  /**
   * @brief Pop a task from the queue.
   * @note Blocks until a task is available or queue is finished.
   * @param task Output parameter for the task
   * @return true if a task was retrieved, false if queue is empty and done
   */
  bool pop(SidecarTask &task);

  /**
   * @brief Signal that no more tasks will be added.
   * @note Wakes all waiting workers so they can exit.
   */
  void finish();
};

/**
 * @class RunLedger
 * @brief Single-writer-at-a-time accumulator for per-file outcomes.
 *
 * @attention Failures are returned in walk order (by task index), not in
 *            completion order, so parallel runs report like sequential ones.
 */
class RunLedger {
  std::mutex mutex;
  int succeeded_ = 0;
  std::vector<std::pair<size_t, FailureRecord>> failures_;

public:
  void record_success();
  void record_failure(size_t index, FailureRecord failure);

  int succeeded();

  /**
   * @brief Failures sorted by walk index.
   * @attention Moves the internal list out, leaving the ledger's list empty.
   */
  std::vector<FailureRecord> extract_failures();
};

} // namespace takeout_timefix

#endif // TAKEOUT_TIMEFIX_WORK_QUEUE_HPP
