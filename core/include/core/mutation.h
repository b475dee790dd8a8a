#pragma once

#include "core/mutation_state.h"
#include "core/state_machine.h"

#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace sflight::core {

/// Mutation — an operation run on demand with arguments.
///
/// Starts Idle. Each run() supersedes the previous one; retry() repeats the
/// most recent run() with the same arguments.
template <typename R, typename Args> class Mutation {
public:
  using State = MutationState<R>;
  using StatePtr = typename State::Ptr;
  using Function = std::function<R(const Args &, CancellationToken &)>;
  using Machine = ObservableStateMachine<R, Args, State>;
  using Listener = typename Machine::Listener;
  using ListenerId = typename Machine::ListenerId;

  Mutation(Function fn, std::shared_ptr<IExecutor> executor,
           std::shared_ptr<ILogger> logger = nullptr,
           std::string name = "mutation")
      : machine_(State::idle(), std::move(fn), std::move(executor),
                 std::move(logger), std::move(name)) {}

  Result<void, Error> run(Args args) {
    remember(args);
    return machine_.run(std::move(args));
  }

  /// Re-run with the last arguments. Err(InvalidRetry) if run() was never
  /// called.
  Result<void, Error> retry() {
    auto args = last_args();
    if (!args) {
      return Result<void, Error>::Err(Error::InvalidRetry());
    }
    return machine_.run(std::move(*args));
  }

  std::future<R> run_and_await(Args args) {
    remember(args);
    return machine_.run_and_await(std::move(args));
  }

  /// The returned future holds InvalidRetryException if run() was never
  /// called.
  std::future<R> retry_and_await() {
    auto args = last_args();
    if (!args) {
      std::promise<R> refused;
      refused.set_exception(to_exception_ptr(Error::InvalidRetry()));
      return refused.get_future();
    }
    return machine_.run_and_await(std::move(*args));
  }

  [[nodiscard]] StatePtr state() const { return machine_.state(); }

  ListenerId add_listener(Listener listener) {
    return machine_.add_listener(std::move(listener));
  }
  bool remove_listener(ListenerId id) { return machine_.remove_listener(id); }

  void dispose() { machine_.dispose(); }
  [[nodiscard]] bool is_disposed() const { return machine_.is_disposed(); }

private:
  void remember(const Args &args) {
    std::lock_guard<std::mutex> lock(args_mutex_);
    last_args_ = args;
  }

  std::optional<Args> last_args() const {
    std::lock_guard<std::mutex> lock(args_mutex_);
    return last_args_;
  }

  mutable std::mutex args_mutex_;
  std::optional<Args> last_args_;
  Machine machine_;
};

} // namespace sflight::core
