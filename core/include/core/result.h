#pragma once

#include <cassert>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace sflight::core {

/// Rust-style Result<T, E> for synchronous calls that can be refused
/// (run on a disposed machine, retry without a prior run, ...).
/// Asynchronous outcomes travel through futures instead.
template <typename T, typename E> class Result {
public:
  /// Construct a success result.
  static Result Ok(T value) {
    return Result(std::in_place_index<0>, std::move(value));
  }

  /// Construct an error result.
  static Result Err(E error) {
    return Result(std::in_place_index<1>, std::move(error));
  }

  [[nodiscard]] bool is_ok() const noexcept { return storage_.index() == 0; }
  [[nodiscard]] bool is_err() const noexcept { return storage_.index() == 1; }

  explicit operator bool() const noexcept { return is_ok(); }

  /// Access the success value. UB if is_err().
  [[nodiscard]] const T &value() const & {
    assert(is_ok() && "Result::value() called on Err");
    return std::get<0>(storage_);
  }

  [[nodiscard]] T &&value() && {
    assert(is_ok() && "Result::value() called on Err");
    return std::get<0>(std::move(storage_));
  }

  [[nodiscard]] T value_or(T fallback) const & {
    return is_ok() ? std::get<0>(storage_) : std::move(fallback);
  }

  /// Access the error value. UB if is_ok().
  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result::error() called on Ok");
    return std::get<1>(storage_);
  }

  [[nodiscard]] E &&error() && {
    assert(is_err() && "Result::error() called on Ok");
    return std::get<1>(std::move(storage_));
  }

private:
  template <std::size_t I, typename V>
  Result(std::in_place_index_t<I> tag, V &&v)
      : storage_(tag, std::forward<V>(v)) {}

  // Index-based so that Result<E, E> stays unambiguous.
  std::variant<T, E> storage_;
};

/// Result<void, E>: success carries no value.
template <typename E> class Result<void, E> {
public:
  static Result Ok() { return Result(); }

  static Result Err(E error) {
    Result r;
    r.error_ = std::move(error);
    return r;
  }

  [[nodiscard]] bool is_ok() const noexcept { return !error_.has_value(); }
  [[nodiscard]] bool is_err() const noexcept { return error_.has_value(); }

  explicit operator bool() const noexcept { return is_ok(); }

  [[nodiscard]] const E &error() const & {
    assert(is_err() && "Result<void,E>::error() called on Ok");
    return *error_;
  }

private:
  Result() = default;
  std::optional<E> error_;
};

} // namespace sflight::core
