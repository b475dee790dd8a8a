#pragma once

#include "core/observed_state.h"

namespace sflight::core {

/// State of a Mutation: Idle → Running → Completed | Failed.
template <typename T>
class MutationState final
    : public ObservedState<MutationState<T>, Idle, Running, Completed<T>,
                           Failed> {
  using Base =
      ObservedState<MutationState<T>, Idle, Running, Completed<T>, Failed>;

public:
  using Ptr = typename Base::Ptr;
  using Variant = typename Base::Variant;

  static Ptr idle(Ptr previous = nullptr) {
    return Ptr(new MutationState(Idle{}, std::move(previous)));
  }

  static Ptr running(Ptr previous) {
    return Ptr(new MutationState(Running{}, std::move(previous)));
  }

  static Ptr completed(Ptr previous, T value) {
    return Ptr(new MutationState(Completed<T>{std::move(value)},
                                 std::move(previous)));
  }

  static Ptr failed(Ptr previous, std::exception_ptr error, std::string trace) {
    return Ptr(new MutationState(Failed{std::move(error), std::move(trace)},
                                 std::move(previous)));
  }

  [[nodiscard]] bool is_idle() const noexcept {
    return this->template holds<Idle>();
  }
  [[nodiscard]] bool is_loading() const noexcept {
    return this->template holds<Running>();
  }
  [[nodiscard]] bool has_value() const noexcept {
    return this->template holds<Completed<T>>();
  }

  /// The result if Completed, null otherwise.
  [[nodiscard]] const T *value() const noexcept {
    const auto *c = std::get_if<Completed<T>>(&this->variant());
    return c ? &c->value : nullptr;
  }

  /// Exhaustive match with one handler per variant:
  ///   idle(), running(), data(const T&), failed(exception_ptr, trace).
  template <typename OnIdle, typename OnRunning, typename OnData,
            typename OnFailed>
  decltype(auto) map(OnIdle &&idle, OnRunning &&running, OnData &&data,
                     OnFailed &&failed) const {
    return this->match([&](const Idle &) { return idle(); },
                       [&](const Running &) { return running(); },
                       [&](const Completed<T> &c) { return data(c.value); },
                       [&](const Failed &f) {
                         return failed(f.error, f.trace);
                       });
  }

private:
  MutationState(Variant variant, Ptr previous)
      : Base(std::move(variant), std::move(previous)) {}
};

} // namespace sflight::core
