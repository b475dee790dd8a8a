#pragma once

#include "core/cancellation_token.h"
#include "core/error.h"
#include "core/executor.h"

#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <string>
#include <type_traits>
#include <utility>

namespace sflight::core {

class ILogger;

namespace detail {

/// Type-erased part of a submitted job: everything the lock needs to run,
/// abandon and report it without knowing the result type.
class JobBase {
public:
  JobBase(std::shared_ptr<ILogger> logger, std::string component,
          bool detached)
      : logger_(std::move(logger)), component_(std::move(component)),
        detached_(detached) {}
  virtual ~JobBase() = default;

  JobBase(const JobBase &) = delete;
  JobBase &operator=(const JobBase &) = delete;

  /// Run the body under the lock and settle the job's future.
  virtual void run(CancellationToken &token) = 0;

  /// Nobody needs this job's result any more (its token was superseded).
  void abandon() noexcept { abandoned_.store(true, std::memory_order_release); }
  [[nodiscard]] bool abandoned() const noexcept {
    return abandoned_.load(std::memory_order_acquire);
  }

protected:
  /// Log the outcome of a settled job according to its detached/abandoned
  /// status. error is null on success.
  void report_settled(const std::exception_ptr &error) const;

private:
  std::shared_ptr<ILogger> logger_;
  std::string component_;
  bool detached_;
  std::atomic<bool> abandoned_{false};
};

template <typename R, typename Body> class Job final : public JobBase {
public:
  Job(Body body, std::shared_ptr<ILogger> logger, std::string component,
      bool detached)
      : JobBase(std::move(logger), std::move(component), detached),
        body_(std::move(body)) {}

  /// A job destroyed before it ran (its executor went away) still settles.
  ~Job() override {
    if (!settled_) {
      promise_.set_exception(std::make_exception_ptr(
          CancelledException("Task dropped before execution")));
    }
  }

  std::future<R> get_future() { return promise_.get_future(); }

  void run(CancellationToken &token) override {
    std::exception_ptr error;
    try {
      token.guard();
      if constexpr (std::is_void_v<R>) {
        body_(token);
        promise_.set_value();
      } else {
        promise_.set_value(body_(token));
      }
    } catch (...) {
      // Delivered to whoever holds the future.
      error = std::current_exception();
      promise_.set_exception(error);
    }
    settled_ = true;
    report_settled(error);
  }

private:
  Body body_;
  std::promise<R> promise_;
  bool settled_ = false;
};

} // namespace detail

/// SingleFlightLock — serializes task bodies and supersedes the active one.
///
/// submit():
///   1. cancels the currently active token (running its cleanup callbacks),
///   2. creates a fresh token and makes it the active one,
///   3. queues body(token) behind every previously submitted body,
///   4. marks the job abandoned if its own token is later superseded,
///   5. returns the body's future.
///
/// At most one body runs at any instant and bodies start in submission
/// order. Cancellation never interrupts a body: a body that does not call
/// guard()/wait() runs to completion.
class SingleFlightLock {
public:
  explicit SingleFlightLock(std::shared_ptr<IExecutor> executor,
                            std::shared_ptr<ILogger> logger = nullptr,
                            std::string name = "lock");
  ~SingleFlightLock();

  SingleFlightLock(const SingleFlightLock &) = delete;
  SingleFlightLock &operator=(const SingleFlightLock &) = delete;

  template <typename Body>
  auto submit(Body body)
      -> std::future<std::invoke_result_t<Body &, CancellationToken &>> {
    using R = std::invoke_result_t<Body &, CancellationToken &>;
    auto job = std::make_shared<detail::Job<R, Body>>(
        std::move(body), logger_, component(), /*detached=*/false);
    auto future = job->get_future();
    schedule(std::move(job));
    return future;
  }

  /// Fire-and-forget submit: the result is dropped, a failure is logged
  /// (cancellation at info, anything else at warn).
  template <typename Body> void dispatch(Body body) {
    using R = std::invoke_result_t<Body &, CancellationToken &>;
    schedule(std::make_shared<detail::Job<R, Body>>(
        std::move(body), logger_, component(), /*detached=*/true));
  }

  /// True while the most recently submitted body has not finished.
  [[nodiscard]] bool has_active_task() const;

private:
  struct State;

  std::string component() const { return "lock:" + name_; }
  void schedule(std::shared_ptr<detail::JobBase> job);

  std::shared_ptr<IExecutor> executor_;
  std::shared_ptr<ILogger> logger_;
  std::string name_;
  std::shared_ptr<State> state_;
};

} // namespace sflight::core
