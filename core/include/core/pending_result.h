#pragma once

#include <atomic>
#include <exception>
#include <future>

namespace sflight::core {

/// Single-resolution promise: the first settle_* call wins, later calls are
/// no-ops that return false. Safe to race from several threads.
template <typename T> class PendingResult {
public:
  PendingResult() : future_(promise_.get_future()) {}

  PendingResult(const PendingResult &) = delete;
  PendingResult &operator=(const PendingResult &) = delete;

  /// Hand out the future. Call once.
  std::future<T> take_future() { return std::move(future_); }

  bool settle_value(T value) {
    if (settled_.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    promise_.set_value(std::move(value));
    return true;
  }

  bool settle_error(std::exception_ptr error) {
    if (settled_.exchange(true, std::memory_order_acq_rel)) {
      return false;
    }
    promise_.set_exception(std::move(error));
    return true;
  }

  [[nodiscard]] bool is_settled() const noexcept {
    return settled_.load(std::memory_order_acquire);
  }

private:
  std::promise<T> promise_;
  std::future<T> future_;
  std::atomic<bool> settled_{false};
};

} // namespace sflight::core
