#include <gtest/gtest.h>

#include "core/mutation_state.h"
#include "core/query_state.h"

#include <stdexcept>
#include <string>

using namespace sflight::core;

namespace {

std::exception_ptr boom() {
  return std::make_exception_ptr(std::runtime_error("boom"));
}

} // namespace

// ============================================================
// MutationState
// ============================================================

TEST(MutationState, IdleHasNoValueOrError) {
  auto state = MutationState<int>::idle();
  ASSERT_TRUE(state->is_idle());
  ASSERT_FALSE(state->is_loading());
  ASSERT_FALSE(state->has_value());
  ASSERT_FALSE(state->has_failed());
  ASSERT_EQ(state->value(), nullptr);
  ASSERT_EQ(state->error(), nullptr);
  ASSERT_TRUE(state->trace().empty());
  ASSERT_EQ(state->previous_state(), nullptr);
}

TEST(MutationState, CompletedExposesValueAndPrevious) {
  auto running = MutationState<int>::running(MutationState<int>::idle());
  auto done = MutationState<int>::completed(running, 10);

  ASSERT_TRUE(done->has_value());
  ASSERT_EQ(*done->value(), 10);
  ASSERT_EQ(done->previous_state(), running);
}

TEST(MutationState, FailedExposesErrorAndTrace) {
  auto failed = MutationState<int>::failed(nullptr, boom(), "run-1/abc");

  ASSERT_TRUE(failed->has_failed());
  ASSERT_EQ(failed->trace(), "run-1/abc");
  ASSERT_THROW(std::rethrow_exception(failed->error()), std::runtime_error);
  ASSERT_EQ(std::get<Failed>(failed->variant()).message(), "boom");
}

TEST(MutationState, MapIsExhaustive) {
  auto describe_state = [](const MutationState<int>::Ptr &state) {
    return state->map([] { return std::string("idle"); },
                      [] { return std::string("running"); },
                      [](int v) { return "data:" + std::to_string(v); },
                      [](const std::exception_ptr &, const std::string &trace) {
                        return "failed:" + trace;
                      });
  };

  ASSERT_EQ(describe_state(MutationState<int>::idle()), "idle");
  ASSERT_EQ(describe_state(MutationState<int>::running(nullptr)), "running");
  ASSERT_EQ(describe_state(MutationState<int>::completed(nullptr, 3)),
            "data:3");
  ASSERT_EQ(describe_state(MutationState<int>::failed(nullptr, boom(), "t")),
            "failed:t");
}

TEST(MutationState, ClearPreviousStateDropsTheLink) {
  auto idle = MutationState<int>::idle();
  auto running = MutationState<int>::running(idle);
  ASSERT_EQ(running->previous_state(), idle);

  running->clear_previous_state();
  ASSERT_EQ(running->previous_state(), nullptr);
}

TEST(MutationState, MatchVisitsVariantTypes) {
  auto state = MutationState<std::string>::completed(nullptr, "ok");
  const bool completed = state->match(
      [](const Idle &) { return false; }, [](const Running &) { return false; },
      [](const Completed<std::string> &c) { return c.value == "ok"; },
      [](const Failed &) { return false; });
  ASSERT_TRUE(completed);
}

// ============================================================
// QueryState display policy
// ============================================================

TEST(QueryState, RunningWithoutPreviousShowsLoading) {
  auto state = QueryState<int>::running();
  ASSERT_TRUE(state->is_loading());
  ASSERT_EQ(state->displayed(), state);
}

TEST(QueryState, RestartAfterFailureKeepsShowingFailureByDefault) {
  auto failed = QueryState<int>::failed(nullptr, boom(), "t1");
  auto restarting = QueryState<int>::running(failed);

  ASSERT_EQ(restarting->displayed(), failed);

  DisplayPolicy show_loading;
  show_loading.skip_loading_on_restart_after_failure = false;
  ASSERT_EQ(restarting->displayed(show_loading), restarting);
}

TEST(QueryState, RestartAfterSuccessShowsLoadingByDefault) {
  auto done = QueryState<int>::completed(nullptr, 5);
  auto restarting = QueryState<int>::running(done);

  ASSERT_EQ(restarting->displayed(), restarting);

  DisplayPolicy keep_value;
  keep_value.skip_loading_on_restart_after_success = true;
  ASSERT_EQ(restarting->displayed(keep_value), done);
}

TEST(QueryState, SettledStatesDisplayThemselves) {
  auto done = QueryState<int>::completed(QueryState<int>::running(), 5);
  DisplayPolicy keep_everything{true, true};
  ASSERT_EQ(done->displayed(keep_everything), done);
}

TEST(QueryState, WhenAppliesPolicyBeforeMapping) {
  auto done = QueryState<int>::completed(nullptr, 5);
  auto restarting = QueryState<int>::running(done);

  auto render = [&](const DisplayPolicy &policy) {
    return restarting->when(
        policy, [](int v) { return "data:" + std::to_string(v); },
        [](const std::exception_ptr &, const std::string &) {
          return std::string("failed");
        },
        [] { return std::string("loading"); });
  };

  ASSERT_EQ(render(DisplayPolicy{}), "loading");
  ASSERT_EQ(render(DisplayPolicy{true, true}), "data:5");
}
