#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <type_traits>
#include <vector>

namespace sflight::core {

/// Per-submission cancellation token.
///
/// Created by SingleFlightLock::submit() and cancelled by the next submit().
/// Cancellation is cooperative: it flips a write-once flag and runs the
/// registered cleanup callbacks, it never interrupts a running body.
///
/// Usage in a task body:
///   lock.submit([](CancellationToken &token) {
///     token.guard();
///     auto page = token.wait([&] { return http.get(url); });
///     token.on_cancel([&] { connection.close(); });
///     return parse(page);
///   });
class CancellationToken {
public:
  using Callback = std::function<void()>;

  CancellationToken() = default;

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  /// Mark the token cancelled and run the cleanup callbacks in registration
  /// order. Thread-safe, idempotent: callbacks run on the first call only.
  /// A throwing callback does not stop the remaining ones.
  void cancel() noexcept;

  [[nodiscard]] bool is_cancelled() const noexcept;

  /// Checkpoint: throws CancelledException if the token was cancelled.
  void guard() const;

  /// guard(); r = op(); guard(); return r;
  /// A reference returned by op is forwarded as the same reference.
  template <typename Op> auto wait(Op &&op) -> std::invoke_result_t<Op &&> {
    using R = std::invoke_result_t<Op &&>;
    guard();
    if constexpr (std::is_void_v<R>) {
      std::forward<Op>(op)();
      guard();
    } else if constexpr (std::is_reference_v<R>) {
      R result = std::forward<Op>(op)();
      guard();
      return static_cast<R>(result);
    } else {
      R result = std::forward<Op>(op)();
      guard();
      return result;
    }
  }

  /// Register a cleanup callback. If the token is already cancelled the
  /// callback runs immediately, on the calling thread, exactly once.
  void on_cancel(Callback cb);

  /// Number of cleanup callbacks that threw while being run.
  [[nodiscard]] int callback_failures() const;

  /// Message of the most recent failing callback (empty if none failed).
  [[nodiscard]] std::string last_callback_failure() const;

  static std::shared_ptr<CancellationToken> create();

private:
  void invoke(Callback &cb) noexcept;

  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  std::vector<Callback> callbacks_;
  int callback_failures_ = 0;
  std::string last_failure_;
};

} // namespace sflight::core
