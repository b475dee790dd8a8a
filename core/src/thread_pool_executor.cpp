#include "core/executor.h"

#include "core/logger.h"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <thread>
#include <utility>
#include <vector>

namespace sflight::core {
namespace {

int clamp_auto_workers() {
  const auto hw = static_cast<int>(std::thread::hardware_concurrency());
  if (hw <= 0) {
    return 4;
  }
  return std::clamp(hw - 1, 2, 8);
}

class ThreadPoolExecutor final : public IExecutor {
public:
  ThreadPoolExecutor(ExecutorConfig config, std::shared_ptr<ILogger> logger)
      : config_(normalize_config(std::move(config))),
        logger_(std::move(logger)) {
    workers_.reserve(static_cast<size_t>(config_.worker_count));
    for (int i = 0; i < config_.worker_count; ++i) {
      workers_.emplace_back([this]() { worker_loop(); });
    }
    if (logger_) {
      logger_->info("startup", component(), "executor_started",
                    "workers=" + std::to_string(config_.worker_count));
    }
  }

  ~ThreadPoolExecutor() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      stopping_ = true;
    }
    cv_.notify_all();
    for (auto &w : workers_) {
      if (w.joinable()) {
        w.join();
      }
    }
  }

  void submit(Task task) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      queue_.push_back(std::move(task));
    }
    cv_.notify_one();
  }

private:
  static ExecutorConfig normalize_config(ExecutorConfig config) {
    if (config.worker_count <= 0) {
      config.worker_count = clamp_auto_workers();
    }
    if (config.name.empty()) {
      config.name = "pool";
    }
    return config;
  }

  std::string component() const { return "executor:" + config_.name; }

  void worker_loop() {
    while (true) {
      Task task;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });

        // Drain before exiting so queued jobs still settle their futures.
        if (queue_.empty()) {
          return;
        }
        task = std::move(queue_.front());
        queue_.pop_front();
      }

      run_task(task);
    }
  }

  void run_task(Task &task) {
    if (!task) {
      return;
    }
    try {
      task();
    } catch (const std::exception &e) {
      if (logger_) {
        logger_->error("-", component(), "task_failed", e.what());
      }
    } catch (...) {
      if (logger_) {
        logger_->error("-", component(), "task_failed", "unknown exception");
      }
    }
  }

  ExecutorConfig config_;
  std::shared_ptr<ILogger> logger_;

  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Task> queue_;
  bool stopping_ = false;
  std::vector<std::thread> workers_;
};

} // namespace

std::unique_ptr<IExecutor>
create_thread_pool_executor(const ExecutorConfig &config,
                            std::shared_ptr<ILogger> logger) {
  return std::make_unique<ThreadPoolExecutor>(config, std::move(logger));
}

} // namespace sflight::core
