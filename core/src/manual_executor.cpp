#include "core/executor.h"

#include <utility>

namespace sflight::core {

void ManualExecutor::submit(Task task) {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.push_back(std::move(task));
}

bool ManualExecutor::run_next() {
  Task task;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
      return false;
    }
    task = std::move(queue_.front());
    queue_.pop_front();
  }

  // Run outside the lock: tasks may submit follow-up tasks.
  if (task) {
    task();
  }
  return true;
}

std::size_t ManualExecutor::run_all() {
  std::size_t done = 0;
  while (run_next()) {
    ++done;
  }
  return done;
}

std::size_t ManualExecutor::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace sflight::core
