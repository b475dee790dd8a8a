#include "core/single_flight_lock.h"

#include "core/logger.h"

#include <deque>
#include <functional>
#include <mutex>

namespace sflight::core {

namespace detail {

void JobBase::report_settled(const std::exception_ptr &error) const {
  if (!logger_) {
    return;
  }

  bool cancelled = false;
  if (error) {
    try {
      std::rethrow_exception(error);
    } catch (const CancelledException &) {
      cancelled = true;
    } catch (...) {
      cancelled = false;
    }
  }

  if (abandoned()) {
    logger_->info("-", component_, "result_discarded",
                  cancelled ? "superseded task unwound at a checkpoint"
                            : "superseded task ran to completion");
    return;
  }
  if (!detached_ || !error) {
    return;
  }
  if (cancelled) {
    logger_->info("-", component_, "run_cancelled", describe(error));
  } else {
    logger_->warn("-", component_, "detached_task_failed", describe(error));
  }
}

} // namespace detail

/// Shared with queued closures so a job can finish after the lock object
/// itself is gone.
///
/// The pending deque plus the draining flag form a strand: exactly one
/// closure is handed to the executor at a time, the next one only after
/// the previous returned.
struct SingleFlightLock::State
    : std::enable_shared_from_this<SingleFlightLock::State> {
  using Task = std::function<void()>;

  std::weak_ptr<IExecutor> executor;

  std::mutex mutex;
  std::shared_ptr<CancellationToken> active_token;
  std::deque<Task> pending;
  bool draining = false;

  void push(Task task) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      pending.push_back(std::move(task));
      if (draining) {
        return;
      }
      draining = true;
    }
    post_next();
  }

  void post_next() {
    auto target = executor.lock();
    if (!target) {
      std::deque<Task> dropped;
      {
        std::lock_guard<std::mutex> lock(mutex);
        dropped.swap(pending);
        draining = false;
      }
      // Destroying the closures settles their jobs as cancelled.
      return;
    }
    target->submit([self = shared_from_this()]() { self->run_one(); });
  }

  void run_one() {
    Task task;
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (pending.empty()) {
        draining = false;
        return;
      }
      task = std::move(pending.front());
      pending.pop_front();
    }

    // A throwing task still hands the strand to the next one before the
    // exception reaches the executor.
    try {
      task();
    } catch (...) {
      task = nullptr;
      advance();
      throw;
    }
    task = nullptr;
    advance();
  }

  void advance() {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (pending.empty()) {
        draining = false;
        return;
      }
    }
    post_next();
  }

  /// A finished body's token leaves the active slot, unless a newer
  /// submission already replaced it.
  void retire(const std::shared_ptr<CancellationToken> &token) {
    std::lock_guard<std::mutex> lock(mutex);
    if (active_token == token) {
      active_token.reset();
    }
  }
};

SingleFlightLock::SingleFlightLock(std::shared_ptr<IExecutor> executor,
                                   std::shared_ptr<ILogger> logger,
                                   std::string name)
    : executor_(std::move(executor)), logger_(std::move(logger)),
      name_(std::move(name)), state_(std::make_shared<State>()) {
  state_->executor = executor_;
}

SingleFlightLock::~SingleFlightLock() = default;

bool SingleFlightLock::has_active_task() const {
  std::lock_guard<std::mutex> lock(state_->mutex);
  return state_->active_token != nullptr;
}

void SingleFlightLock::schedule(std::shared_ptr<detail::JobBase> job) {
  auto token = CancellationToken::create();

  std::shared_ptr<CancellationToken> previous;
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    previous = std::exchange(state_->active_token, token);
  }

  // The predecessor is cancelled before the new body is even queued.
  if (previous) {
    previous->cancel();
    if (logger_) {
      logger_->info("-", component(), "token_superseded",
                    "previous task cancelled");
      const int failures = previous->callback_failures();
      if (failures > 0) {
        logger_->warn("-", component(), "cleanup_failed",
                      std::to_string(failures) +
                          " cleanup callback(s) threw, last: " +
                          previous->last_callback_failure());
      }
    }
  }

  token->on_cancel([weak_job = std::weak_ptr<detail::JobBase>(job)]() {
    if (auto j = weak_job.lock()) {
      j->abandon();
    }
  });

  state_->push([state = state_, job = std::move(job), token]() {
    try {
      job->run(*token);
    } catch (...) {
      state->retire(token);
      throw;
    }
    state->retire(token);
  });
}

} // namespace sflight::core
