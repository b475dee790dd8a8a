#pragma once

#include "core/query_state.h"
#include "core/state_machine.h"

#include <functional>
#include <future>
#include <memory>
#include <string>

namespace sflight::core {

/// Query — a read operation that starts running as soon as it is created.
///
/// restart() supersedes the in-flight run; use QueryState::displayed() to
/// keep showing the last result while a restart is loading.
template <typename R> class Query {
public:
  using State = QueryState<R>;
  using StatePtr = typename State::Ptr;
  using Function = std::function<R(CancellationToken &)>;
  using Machine = ObservableStateMachine<R, NoArgs, State>;
  using Listener = typename Machine::Listener;
  using ListenerId = typename Machine::ListenerId;

  Query(Function fn, std::shared_ptr<IExecutor> executor,
        std::shared_ptr<ILogger> logger = nullptr, std::string name = "query")
      : machine_(State::running(),
                 [fn = std::move(fn)](const NoArgs &, CancellationToken &token) {
                   return fn(token);
                 },
                 std::move(executor), std::move(logger), std::move(name)) {
    machine_.run(NoArgs{});
  }

  Result<void, Error> restart() { return machine_.run(NoArgs{}); }

  std::future<R> restart_and_await() {
    return machine_.run_and_await(NoArgs{});
  }

  [[nodiscard]] StatePtr state() const { return machine_.state(); }

  ListenerId add_listener(Listener listener) {
    return machine_.add_listener(std::move(listener));
  }
  bool remove_listener(ListenerId id) { return machine_.remove_listener(id); }

  void dispose() { machine_.dispose(); }
  [[nodiscard]] bool is_disposed() const { return machine_.is_disposed(); }

private:
  Machine machine_;
};

} // namespace sflight::core
