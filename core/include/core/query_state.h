#pragma once

#include "core/observed_state.h"

namespace sflight::core {

/// What a Query shows while it is Running after an earlier result.
/// Defaults: keep showing a previous failure, show loading over a previous
/// value.
struct DisplayPolicy {
  bool skip_loading_on_restart_after_success = false;
  bool skip_loading_on_restart_after_failure = true;
};

/// State of a Query: Running → Completed | Failed (no Idle: a query starts
/// running at construction).
template <typename T>
class QueryState final
    : public ObservedState<QueryState<T>, Running, Completed<T>, Failed> {
  using Base = ObservedState<QueryState<T>, Running, Completed<T>, Failed>;

public:
  using Ptr = typename Base::Ptr;
  using Variant = typename Base::Variant;

  static Ptr running(Ptr previous = nullptr) {
    return Ptr(new QueryState(Running{}, std::move(previous)));
  }

  static Ptr completed(Ptr previous, T value) {
    return Ptr(
        new QueryState(Completed<T>{std::move(value)}, std::move(previous)));
  }

  static Ptr failed(Ptr previous, std::exception_ptr error, std::string trace) {
    return Ptr(new QueryState(Failed{std::move(error), std::move(trace)},
                              std::move(previous)));
  }

  [[nodiscard]] bool is_loading() const noexcept {
    return this->template holds<Running>();
  }
  [[nodiscard]] bool has_value() const noexcept {
    return this->template holds<Completed<T>>();
  }

  [[nodiscard]] const T *value() const noexcept {
    const auto *c = std::get_if<Completed<T>>(&this->variant());
    return c ? &c->value : nullptr;
  }

  /// Exhaustive match: loading(), data(const T&), failed(exception_ptr, trace).
  template <typename OnLoading, typename OnData, typename OnFailed>
  decltype(auto) map(OnLoading &&loading, OnData &&data,
                     OnFailed &&failed) const {
    return this->match([&](const Running &) { return loading(); },
                       [&](const Completed<T> &c) { return data(c.value); },
                       [&](const Failed &f) {
                         return failed(f.error, f.trace);
                       });
  }

  /// The state to display under policy: while Running, the previous
  /// Completed/Failed state may stand in for the loading state so a refresh
  /// does not flicker.
  [[nodiscard]] Ptr displayed(const DisplayPolicy &policy = {}) const {
    if (is_loading()) {
      if (auto previous = this->previous_state()) {
        if (previous->has_failed() &&
            policy.skip_loading_on_restart_after_failure) {
          return previous;
        }
        if (previous->has_value() &&
            policy.skip_loading_on_restart_after_success) {
          return previous;
        }
      }
    }
    return this->shared_from_this();
  }

  /// map() applied to displayed(policy).
  template <typename OnData, typename OnFailed, typename OnLoading>
  decltype(auto) when(const DisplayPolicy &policy, OnData &&data,
                      OnFailed &&failed, OnLoading &&loading) const {
    return displayed(policy)->map(std::forward<OnLoading>(loading),
                                  std::forward<OnData>(data),
                                  std::forward<OnFailed>(failed));
  }

private:
  QueryState(Variant variant, Ptr previous)
      : Base(std::move(variant), std::move(previous)) {}
};

} // namespace sflight::core
