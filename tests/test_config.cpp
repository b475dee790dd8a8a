#include <gtest/gtest.h>

#include "core/executor.h"
#include "core/logger.h"
#include "infra/config.h"
#include "infra/logger.h"

#include <cstdlib>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace sflight;

namespace {

class RecordingLogger : public core::ILogger {
public:
  void info(const std::string &, const std::string &, const std::string &event,
            const std::string &) override {
    record(event);
  }
  void warn(const std::string &, const std::string &, const std::string &event,
            const std::string &) override {
    record(event);
  }
  void error(const std::string &, const std::string &,
             const std::string &event, const std::string &) override {
    record(event);
  }

  int count(const std::string &event) {
    std::lock_guard<std::mutex> lock(mutex_);
    int n = 0;
    for (const auto &e : events_) {
      n += e == event ? 1 : 0;
    }
    return n;
  }

private:
  void record(const std::string &event) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  std::mutex mutex_;
  std::vector<std::string> events_;
};

class RuntimeConfigTest : public ::testing::Test {
protected:
  void SetUp() override { clear(); }
  void TearDown() override { clear(); }

  static void clear() {
    ::unsetenv("SFLIGHT_WORKERS");
    ::unsetenv("SFLIGHT_LOG_LEVEL");
    ::unsetenv("SFLIGHT_EXECUTOR");
  }

  std::shared_ptr<RecordingLogger> logger_ =
      std::make_shared<RecordingLogger>();
};

} // namespace

TEST_F(RuntimeConfigTest, DefaultsWhenUnset) {
  auto config = infra::RuntimeConfig::from_environment(logger_);

  ASSERT_EQ(config.executor.worker_count, 0);
  ASSERT_EQ(config.executor_kind, infra::ExecutorKind::ThreadPool);
  ASSERT_EQ(config.log_level, "info");
  ASSERT_EQ(logger_->count("config_invalid"), 0);
}

TEST_F(RuntimeConfigTest, ReadsValidValues) {
  ::setenv("SFLIGHT_WORKERS", "3", 1);
  ::setenv("SFLIGHT_LOG_LEVEL", "debug", 1);
  ::setenv("SFLIGHT_EXECUTOR", "manual", 1);

  auto config = infra::RuntimeConfig::from_environment(logger_);

  ASSERT_EQ(config.executor.worker_count, 3);
  ASSERT_EQ(config.log_level, "debug");
  ASSERT_EQ(config.executor_kind, infra::ExecutorKind::Manual);
  ASSERT_EQ(logger_->count("config_invalid"), 0);
}

TEST_F(RuntimeConfigTest, InvalidValuesFallBackWithWarnings) {
  ::setenv("SFLIGHT_WORKERS", "zero", 1);
  ::setenv("SFLIGHT_LOG_LEVEL", "verbose", 1);
  ::setenv("SFLIGHT_EXECUTOR", "fibers", 1);

  auto config = infra::RuntimeConfig::from_environment(logger_);

  ASSERT_EQ(config.executor.worker_count, 0);
  ASSERT_EQ(config.log_level, "info");
  ASSERT_EQ(config.executor_kind, infra::ExecutorKind::ThreadPool);
  ASSERT_EQ(logger_->count("config_invalid"), 3);
}

TEST_F(RuntimeConfigTest, WorkerCountMustBePositive) {
  ::setenv("SFLIGHT_WORKERS", "0", 1);
  ASSERT_EQ(infra::parse_env_int("SFLIGHT_WORKERS", 2, false, logger_), 2);
  ASSERT_EQ(infra::parse_env_int("SFLIGHT_WORKERS", 2, true, logger_), 0);
  ASSERT_EQ(logger_->count("config_invalid"), 1);
}

TEST_F(RuntimeConfigTest, OutOfRangeWorkerCountFallsBack) {
  ::setenv("SFLIGHT_WORKERS", "4294967298", 1);
  auto config = infra::RuntimeConfig::from_environment(logger_);
  ASSERT_EQ(config.executor.worker_count, 0);

  ::setenv("SFLIGHT_WORKERS", "99999999999999999999999", 1);
  ASSERT_EQ(infra::parse_env_int("SFLIGHT_WORKERS", 4, false, logger_), 4);
  ASSERT_EQ(logger_->count("config_invalid"), 2);
}

TEST_F(RuntimeConfigTest, MakeExecutorHonorsKind) {
  infra::RuntimeConfig config;
  config.executor_kind = infra::ExecutorKind::Manual;
  auto manual = infra::make_executor(config, logger_);
  ASSERT_NE(std::dynamic_pointer_cast<core::ManualExecutor>(manual), nullptr);

  config.executor_kind = infra::ExecutorKind::ThreadPool;
  config.executor.worker_count = 1;
  auto pool = infra::make_executor(config, logger_);
  ASSERT_EQ(std::dynamic_pointer_cast<core::ManualExecutor>(pool), nullptr);
}

TEST(ConsoleLogger, AcceptsKnownLevels) {
  ASSERT_TRUE(infra::is_valid_log_level("trace"));
  ASSERT_TRUE(infra::is_valid_log_level("off"));
  ASSERT_FALSE(infra::is_valid_log_level("verbose"));

  auto logger = infra::create_console_logger("warn");
  ASSERT_NE(logger, nullptr);
  logger->info("t", "test", "suppressed", "below threshold");
  logger->warn("t", "test", "emitted", "at threshold");
}
