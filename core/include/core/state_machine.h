#pragma once

#include "core/cancellation_token.h"
#include "core/error.h"
#include "core/executor.h"
#include "core/logger.h"
#include "core/pending_result.h"
#include "core/result.h"
#include "core/single_flight_lock.h"
#include "core/trace_id.h"

#include <atomic>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sflight::core {

/// Argument type of functions that take none (Query).
struct NoArgs {};

/// ObservableStateMachine — runs a user function through a SingleFlightLock
/// and publishes its progress as immutable State snapshots.
///
/// State is a builder policy: it supplies State::Ptr and the static factories
/// running(prev), completed(prev, value) and failed(prev, error, trace).
///
/// Lifecycle of one run:
///   Running → Completed(value)  : function returned
///           → Failed(error)     : function threw anything but Cancelled
///           (no write)          : run cancelled by a newer one, or the
///                                 machine was disposed meanwhile
///
/// Every run gets a trace id ("run-<n>/<uuid>") used in its log lines and
/// stored in Failed::trace.
template <typename R, typename Args, typename State>
class ObservableStateMachine {
  static_assert(!std::is_void_v<R>,
                "state machines need a result value; use std::monostate");

public:
  using StatePtr = typename State::Ptr;
  using Function = std::function<R(const Args &, CancellationToken &)>;
  using Listener = std::function<void(const StatePtr &)>;
  using ListenerId = std::uint64_t;

  ObservableStateMachine(StatePtr initial, Function fn,
                         std::shared_ptr<IExecutor> executor,
                         std::shared_ptr<ILogger> logger = nullptr,
                         std::string name = "machine")
      : core_(std::make_shared<Core>()),
        lock_(std::move(executor), logger, name) {
    core_->state = std::move(initial);
    core_->fn = std::move(fn);
    core_->logger = std::move(logger);
    core_->component = "machine:" + name;
  }

  ~ObservableStateMachine() { dispose(); }

  ObservableStateMachine(const ObservableStateMachine &) = delete;
  ObservableStateMachine &operator=(const ObservableStateMachine &) = delete;

  /// Fire-and-forget run. Refused with Disposed after dispose().
  Result<void, Error> run(Args args) {
    if (is_disposed()) {
      return Result<void, Error>::Err(Error::Disposed());
    }
    submit(std::move(args), 0);
    return Result<void, Error>::Ok();
  }

  /// Run and wait for this run's own outcome: its value, the exception the
  /// function threw, CancelledException when a newer run superseded it, or
  /// DisposedException when the machine was torn down first.
  std::future<R> run_and_await(Args args) {
    auto awaiter = std::make_shared<PendingResult<R>>();
    auto future = awaiter->take_future();

    const std::uint64_t run_id = core_->next_run.fetch_add(1);
    if (!core_->attach(run_id, awaiter)) {
      awaiter->settle_error(to_exception_ptr(Error::Disposed()));
      return future;
    }
    submit(std::move(args), run_id);
    return future;
  }

  /// Current state snapshot.
  [[nodiscard]] StatePtr state() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->state;
  }

  /// Listeners are called after every state write, outside the machine's
  /// mutex, on the thread that ran the body.
  ListenerId add_listener(Listener listener) {
    std::lock_guard<std::mutex> lock(core_->mutex);
    const ListenerId id = core_->next_listener++;
    core_->listeners.emplace(
        id, std::make_shared<ListenerSlot>(std::move(listener)));
    return id;
  }

  /// Once this returns the listener is never called again. Blocks while the
  /// listener is running on another thread.
  bool remove_listener(ListenerId id) {
    std::shared_ptr<ListenerSlot> slot;
    {
      std::lock_guard<std::mutex> lock(core_->mutex);
      auto it = core_->listeners.find(id);
      if (it == core_->listeners.end()) {
        return false;
      }
      slot = std::move(it->second);
      core_->listeners.erase(it);
    }
    slot->deactivate();
    return true;
  }

  /// Idempotent. Settles outstanding awaiters with DisposedException and
  /// drops all listeners; no listener runs after dispose() returns. An
  /// in-flight body keeps running but its writes are ignored.
  void dispose() {
    std::map<std::uint64_t, std::shared_ptr<PendingResult<R>>> awaiters;
    std::map<ListenerId, std::shared_ptr<ListenerSlot>> listeners;
    {
      std::lock_guard<std::mutex> lock(core_->mutex);
      if (core_->disposed) {
        return;
      }
      core_->disposed = true;
      listeners.swap(core_->listeners);
      awaiters.swap(core_->awaiters);
    }
    for (auto &entry : listeners) {
      entry.second->deactivate();
    }
    for (auto &entry : awaiters) {
      entry.second->settle_error(to_exception_ptr(Error::Disposed()));
    }
    if (core_->logger) {
      core_->logger->info("-", core_->component, "disposed",
                          std::to_string(awaiters.size()) +
                              " awaiter(s) released");
    }
  }

  [[nodiscard]] bool is_disposed() const {
    std::lock_guard<std::mutex> lock(core_->mutex);
    return core_->disposed;
  }

private:
  /// One registered listener. A call holds call_mutex, so deactivate()
  /// waits for a call in flight on another thread. The mutex is recursive
  /// so a listener may remove itself or dispose the machine.
  class ListenerSlot {
  public:
    explicit ListenerSlot(Listener fn) : fn_(std::move(fn)) {}

    /// No-op once deactivated.
    template <typename Call> void invoke(Call &&call) {
      std::lock_guard<std::recursive_mutex> lock(call_mutex_);
      if (active_) {
        call(fn_);
      }
    }

    void deactivate() {
      std::lock_guard<std::recursive_mutex> lock(call_mutex_);
      active_ = false;
    }

  private:
    std::recursive_mutex call_mutex_;
    bool active_ = true;
    Listener fn_;
  };

  /// Everything a running body touches. Shared with the queued bodies so a
  /// body that outlives the machine only ever sees a disposed core.
  struct Core {
    Function fn;
    std::shared_ptr<ILogger> logger;
    std::string component;

    mutable std::mutex mutex;
    StatePtr state;
    bool disposed = false;
    std::map<ListenerId, std::shared_ptr<ListenerSlot>> listeners;
    ListenerId next_listener = 1;
    std::map<std::uint64_t, std::shared_ptr<PendingResult<R>>> awaiters;

    std::atomic<std::uint64_t> next_run{1};

    bool attach(std::uint64_t run_id,
                std::shared_ptr<PendingResult<R>> awaiter) {
      std::lock_guard<std::mutex> lock(mutex);
      if (disposed) {
        return false;
      }
      awaiters.emplace(run_id, std::move(awaiter));
      return true;
    }

    std::shared_ptr<PendingResult<R>> detach(std::uint64_t run_id) {
      std::lock_guard<std::mutex> lock(mutex);
      auto it = awaiters.find(run_id);
      if (it == awaiters.end()) {
        return nullptr;
      }
      auto awaiter = std::move(it->second);
      awaiters.erase(it);
      return awaiter;
    }

    /// Guarded write: dropped when the run was superseded or the machine
    /// disposed. Returns whether the state was written.
    template <typename Build>
    bool write(const CancellationToken &token, const std::string &trace,
               Build &&build) {
      StatePtr next;
      std::vector<std::shared_ptr<ListenerSlot>> targets;
      {
        std::lock_guard<std::mutex> lock(mutex);
        if (disposed || token.is_cancelled()) {
          return false;
        }
        StatePtr outgoing = state;
        if (outgoing) {
          outgoing->clear_previous_state();
        }
        next = build(outgoing);
        state = next;
        targets.reserve(listeners.size());
        for (const auto &entry : listeners) {
          targets.push_back(entry.second);
        }
      }
      for (auto &slot : targets) {
        slot->invoke(
            [&](Listener &listener) { notify(listener, next, trace); });
      }
      return true;
    }

    void notify(Listener &listener, const StatePtr &next,
                const std::string &trace) {
      try {
        listener(next);
      } catch (const std::exception &e) {
        if (logger) {
          logger->warn(trace, component, "listener_failed", e.what());
        }
      } catch (...) {
        if (logger) {
          logger->warn(trace, component, "listener_failed",
                       "unknown exception");
        }
      }
    }
  };

  /// Releases a run's awaiter once its body is gone (finished or dropped
  /// unrun). An awaiter still pending at that point never saw its run
  /// write a result.
  class AwaiterRelease {
  public:
    AwaiterRelease(std::shared_ptr<Core> core, std::uint64_t run_id)
        : core_(std::move(core)), run_id_(run_id) {}

    ~AwaiterRelease() {
      auto awaiter = core_->detach(run_id_);
      if (!awaiter) {
        return;
      }
      bool disposed = false;
      {
        std::lock_guard<std::mutex> lock(core_->mutex);
        disposed = core_->disposed;
      }
      awaiter->settle_error(to_exception_ptr(
          disposed ? Error::Disposed()
                   : Error::Cancelled("Run superseded before it settled")));
    }

    AwaiterRelease(const AwaiterRelease &) = delete;
    AwaiterRelease &operator=(const AwaiterRelease &) = delete;

  private:
    std::shared_ptr<Core> core_;
    std::uint64_t run_id_;
  };

  /// run_id 0 means nobody awaits this run.
  void submit(Args args, std::uint64_t run_id) {
    if (run_id == 0) {
      run_id = core_->next_run.fetch_add(1);
    }
    const std::string trace =
        "run-" + std::to_string(run_id) + "/" + generate_trace_id();
    if (core_->logger) {
      core_->logger->info(trace, core_->component, "run_submitted", "queued");
    }

    auto release = std::make_shared<AwaiterRelease>(core_, run_id);
    lock_.dispatch([core = core_, args = std::move(args), run_id, trace,
                    release](CancellationToken &token) -> R {
      token.guard();
      core->write(token, trace,
                  [](const StatePtr &prev) { return State::running(prev); });

      try {
        R value = token.wait([&] { return core->fn(args, token); });
        if (core->write(token, trace, [&](const StatePtr &prev) {
              return State::completed(prev, value);
            })) {
          if (auto awaiter = core->detach(run_id)) {
            awaiter->settle_value(value);
          }
        }
        return value;
      } catch (const CancelledException &) {
        throw;
      } catch (...) {
        auto error = std::current_exception();
        if (core->logger) {
          core->logger->warn(trace, core->component, "run_failed",
                             describe(error));
        }
        if (core->write(token, trace, [&](const StatePtr &prev) {
              return State::failed(prev, error, trace);
            })) {
          if (auto awaiter = core->detach(run_id)) {
            awaiter->settle_error(error);
          }
        }
        throw;
      }
    });
  }

  std::shared_ptr<Core> core_;
  SingleFlightLock lock_;
};

} // namespace sflight::core
