#include "core/cancellation_token.h"
#include "core/error.h"

#include <exception>

namespace sflight::core {

void CancellationToken::cancel() noexcept {
  std::vector<Callback> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load(std::memory_order_relaxed)) {
      return;
    }
    // Flag and callback list change together so on_cancel() can never
    // append to a list that has already been drained.
    cancelled_.store(true, std::memory_order_release);
    pending.swap(callbacks_);
  }

  for (auto &cb : pending) {
    invoke(cb);
  }
}

bool CancellationToken::is_cancelled() const noexcept {
  return cancelled_.load(std::memory_order_acquire);
}

void CancellationToken::guard() const {
  if (is_cancelled()) {
    throw CancelledException();
  }
}

void CancellationToken::on_cancel(Callback cb) {
  if (!cb) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_.load(std::memory_order_relaxed)) {
      callbacks_.push_back(std::move(cb));
      return;
    }
  }
  // Already cancelled: the list was drained, run it here instead.
  invoke(cb);
}

int CancellationToken::callback_failures() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callback_failures_;
}

std::string CancellationToken::last_callback_failure() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_failure_;
}

std::shared_ptr<CancellationToken> CancellationToken::create() {
  return std::make_shared<CancellationToken>();
}

void CancellationToken::invoke(Callback &cb) noexcept {
  std::string failure;
  try {
    cb();
    return;
  } catch (const std::exception &e) {
    failure = e.what();
  } catch (...) {
    failure = "unknown exception";
  }

  std::lock_guard<std::mutex> lock(mutex_);
  ++callback_failures_;
  last_failure_ = std::move(failure);
}

} // namespace sflight::core
