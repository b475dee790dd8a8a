#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace sflight::core {

class ILogger;

/// Executor runtime configuration.
struct ExecutorConfig {
  int worker_count = 0; // 0 = auto: clamp((hw_threads - 1), 2, 8)
  std::string name = "pool";
};

/// Executor interface — the scheduling substrate task bodies run on.
///
/// SingleFlightLock layers its own FIFO mutual exclusion on top, so an
/// executor is free to run unrelated tasks in parallel.
///
/// Executors must outlive the locks (and state machines) that submit to them.
class IExecutor {
public:
  using Task = std::function<void()>;

  virtual ~IExecutor() = default;

  /// Enqueue a task. Never runs the task inline.
  virtual void submit(Task task) = 0;
};

/// Single-threaded executor driven by the caller.
/// Nothing runs until run_next()/run_all() is called, which makes every
/// interleaving reproducible in tests.
class ManualExecutor : public IExecutor {
public:
  ManualExecutor() = default;

  ManualExecutor(const ManualExecutor &) = delete;
  ManualExecutor &operator=(const ManualExecutor &) = delete;

  void submit(Task task) override;

  /// Run the oldest queued task. Returns false if the queue was empty.
  bool run_next();

  /// Run tasks until the queue is empty, including tasks enqueued while
  /// draining. Returns the number of tasks run.
  std::size_t run_all();

  [[nodiscard]] std::size_t pending() const;

private:
  mutable std::mutex mutex_;
  std::deque<Task> queue_;
};

/// Thread-pool executor: FIFO queue shared by config.worker_count threads.
/// The destructor lets workers drain the queue, then joins them.
std::unique_ptr<IExecutor>
create_thread_pool_executor(const ExecutorConfig &config,
                            std::shared_ptr<ILogger> logger = nullptr);

} // namespace sflight::core
