/**
 * @file work_queue.cpp
 * @brief Sidecar queue and run ledger implementation
 */

#include "takeout_timefix/work_queue.hpp"

#include <algorithm>

namespace takeout_timefix {

// **----- SidecarQueue Implementation -----**

void SidecarQueue::push(SidecarTask task) {
  std::lock_guard<std::mutex> lock(mutex);
  tasks.push(std::move(task));
  cv.notify_one();
}

bool SidecarQueue::pop(SidecarTask &task) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !tasks.empty() || done.load(); });
  if (tasks.empty())
    return false;
  task = std::move(tasks.front());
  tasks.pop();
  return true;
}

void SidecarQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

// **----- RunLedger Implementation -----**

void RunLedger::record_success() {
  std::lock_guard<std::mutex> lock(mutex);
  ++succeeded_;
}

void RunLedger::record_failure(size_t index, FailureRecord failure) {
  std::lock_guard<std::mutex> lock(mutex);
  failures_.emplace_back(index, std::move(failure));
}

int RunLedger::succeeded() {
  std::lock_guard<std::mutex> lock(mutex);
  return succeeded_;
}

std::vector<FailureRecord> RunLedger::extract_failures() {
  std::lock_guard<std::mutex> lock(mutex);
  std::stable_sort(failures_.begin(), failures_.end(),
                   [](const auto &a, const auto &b) { return a.first < b.first; });
  std::vector<FailureRecord> out;
  out.reserve(failures_.size());
  for (auto &entry : failures_)
    out.push_back(std::move(entry.second));
  failures_.clear();
  return out;
}

} // namespace takeout_timefix
