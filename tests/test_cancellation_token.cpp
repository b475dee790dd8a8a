#include <gtest/gtest.h>

#include "core/cancellation_token.h"
#include "core/error.h"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace sflight::core;

// ============================================================
// Flag and checkpoints
// ============================================================

TEST(CancellationToken, StartsNotCancelled) {
  auto token = CancellationToken::create();
  ASSERT_FALSE(token->is_cancelled());
  ASSERT_NO_THROW(token->guard());
}

TEST(CancellationToken, GuardThrowsAfterCancel) {
  auto token = CancellationToken::create();
  token->cancel();

  ASSERT_TRUE(token->is_cancelled());
  ASSERT_THROW(token->guard(), CancelledException);
}

TEST(CancellationToken, CancelledExceptionCarriesCategory) {
  auto token = CancellationToken::create();
  token->cancel();
  try {
    token->guard();
    FAIL() << "guard() did not throw";
  } catch (const FlightException &e) {
    ASSERT_EQ(e.category(), ErrorCategory::Cancelled);
  }
}

TEST(CancellationToken, WaitReturnsValueWhenNotCancelled) {
  auto token = CancellationToken::create();
  const int value = token->wait([] { return 42; });
  ASSERT_EQ(value, 42);
}

TEST(CancellationToken, WaitChecksBeforeRunningOperation) {
  auto token = CancellationToken::create();
  token->cancel();

  bool ran = false;
  ASSERT_THROW(token->wait([&] {
    ran = true;
    return 1;
  }),
               CancelledException);
  ASSERT_FALSE(ran);
}

TEST(CancellationToken, WaitChecksAfterOperation) {
  auto token = CancellationToken::create();

  bool ran = false;
  ASSERT_THROW(token->wait([&] {
    ran = true;
    token->cancel(); // Superseded while the operation was in flight
    return 1;
  }),
               CancelledException);
  ASSERT_TRUE(ran);
}

TEST(CancellationToken, WaitSupportsVoidOperations) {
  auto token = CancellationToken::create();
  int calls = 0;
  token->wait([&] { ++calls; });
  ASSERT_EQ(calls, 1);
}

TEST(CancellationToken, WaitForwardsReferenceResults) {
  auto token = CancellationToken::create();
  std::string owned = "page body";

  const std::string &ref =
      token->wait([&]() -> const std::string & { return owned; });
  ASSERT_EQ(&ref, &owned);
  ASSERT_EQ(ref, "page body");

  std::string &&moved =
      token->wait([&]() -> std::string && { return std::move(owned); });
  ASSERT_EQ(&moved, &owned);
}

// ============================================================
// Cleanup callbacks
// ============================================================

TEST(CancellationToken, CallbacksRunInRegistrationOrder) {
  auto token = CancellationToken::create();
  std::vector<int> order;
  token->on_cancel([&] { order.push_back(1); });
  token->on_cancel([&] { order.push_back(2); });
  token->on_cancel([&] { order.push_back(3); });

  ASSERT_TRUE(order.empty());
  token->cancel();
  ASSERT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(CancellationToken, CancelIsIdempotent) {
  auto token = CancellationToken::create();
  int calls = 0;
  token->on_cancel([&] { ++calls; });

  token->cancel();
  token->cancel();
  ASSERT_EQ(calls, 1);
  ASSERT_TRUE(token->is_cancelled());
}

TEST(CancellationToken, ThrowingCallbackDoesNotStopTheRest) {
  auto token = CancellationToken::create();
  std::vector<int> order;
  token->on_cancel([&] { order.push_back(1); });
  token->on_cancel([] { throw std::runtime_error("close failed"); });
  token->on_cancel([&] { order.push_back(3); });

  ASSERT_NO_THROW(token->cancel());
  ASSERT_EQ(order, (std::vector<int>{1, 3}));
  ASSERT_EQ(token->callback_failures(), 1);
  ASSERT_EQ(token->last_callback_failure(), "close failed");
}

TEST(CancellationToken, NonStdExceptionIsCountedToo) {
  auto token = CancellationToken::create();
  token->on_cancel([] { throw 7; });
  token->cancel();

  ASSERT_EQ(token->callback_failures(), 1);
  ASSERT_EQ(token->last_callback_failure(), "unknown exception");
}

TEST(CancellationToken, LateRegistrationRunsImmediately) {
  auto token = CancellationToken::create();
  token->cancel();

  int calls = 0;
  token->on_cancel([&] { ++calls; });
  ASSERT_EQ(calls, 1);

  token->cancel();
  ASSERT_EQ(calls, 1);
}

TEST(CancellationToken, LateThrowingRegistrationIsIsolated) {
  auto token = CancellationToken::create();
  token->cancel();

  ASSERT_NO_THROW(
      token->on_cancel([] { throw std::runtime_error("too late"); }));
  ASSERT_EQ(token->callback_failures(), 1);
}

TEST(CancellationToken, EmptyCallbackIsIgnored) {
  auto token = CancellationToken::create();
  token->on_cancel(CancellationToken::Callback{});
  ASSERT_NO_THROW(token->cancel());
  ASSERT_EQ(token->callback_failures(), 0);
}
