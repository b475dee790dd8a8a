#pragma once

#include "core/error.h"

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace sflight::core {

// ---- State variants ----

/// Nothing has run yet (Mutation only).
struct Idle {};

/// A run is in progress.
struct Running {};

template <typename T> struct Completed {
  T value;
};

struct Failed {
  std::exception_ptr error; // The exception thrown by the function, verbatim
  std::string trace;        // Trace id of the failing run (see logs)

  [[nodiscard]] std::string message() const { return describe(error); }
};

template <typename... Fs> struct Overloaded : Fs... {
  using Fs::operator()...;
};
template <typename... Fs> Overloaded(Fs...) -> Overloaded<Fs...>;

/// Common part of QueryState / MutationState: a closed set of variants plus
/// a single link to the state this one replaced.
///
/// States are immutable once published, except for previous_state(): the
/// state machine clears the outgoing state's link when that state becomes
/// the previous of the incoming one, which caps the history at one level.
/// The link is read and cleared with atomic shared_ptr operations because
/// readers may hold the state on another thread.
template <typename Derived, typename... Variants>
class ObservedState : public std::enable_shared_from_this<Derived> {
public:
  using Ptr = std::shared_ptr<const Derived>;
  using Variant = std::variant<Variants...>;

  [[nodiscard]] const Variant &variant() const noexcept { return variant_; }

  template <typename V> [[nodiscard]] bool holds() const noexcept {
    return std::holds_alternative<V>(variant_);
  }

  /// The state this one replaced, or null.
  [[nodiscard]] Ptr previous_state() const {
    return std::atomic_load(&previous_);
  }

  /// Drop the link to the previous state.
  void clear_previous_state() const { std::atomic_store(&previous_, Ptr{}); }

  /// Exhaustive visit: one handler per variant type.
  template <typename... Handlers>
  decltype(auto) match(Handlers &&...handlers) const {
    return std::visit(Overloaded{std::forward<Handlers>(handlers)...},
                      variant_);
  }

  /// The stored exception if this state is Failed, null otherwise.
  [[nodiscard]] std::exception_ptr error() const {
    const auto *f = std::get_if<Failed>(&variant_);
    return f ? f->error : nullptr;
  }

  /// The failing run's trace if this state is Failed, empty otherwise.
  [[nodiscard]] std::string trace() const {
    const auto *f = std::get_if<Failed>(&variant_);
    return f ? f->trace : std::string();
  }

  [[nodiscard]] bool has_failed() const noexcept { return holds<Failed>(); }

protected:
  ObservedState(Variant variant, Ptr previous)
      : variant_(std::move(variant)), previous_(std::move(previous)) {}

private:
  Variant variant_;
  mutable Ptr previous_;
};

} // namespace sflight::core
