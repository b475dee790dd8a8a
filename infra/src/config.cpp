#include "infra/config.h"

#include "infra/logger.h"

#include <cerrno>
#include <climits>
#include <cstdlib>

namespace sflight::infra {

namespace {

std::string env_string(const char *name) {
  const char *raw = std::getenv(name);
  return raw ? std::string(raw) : std::string();
}

void warn_invalid(const std::shared_ptr<core::ILogger> &logger,
                  const char *name, const std::string &raw,
                  const std::string &fallback) {
  if (logger) {
    logger->warn("startup", "config", "config_invalid",
                 std::string("Invalid value for ") + name + "=" + raw +
                     ", fallback=" + fallback);
  }
}

} // namespace

int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<core::ILogger> &logger) {
  const char *raw = std::getenv(name);
  if (!raw || raw[0] == 0) {
    return fallback;
  }

  char *end = nullptr;
  errno = 0;
  const long value = std::strtol(raw, &end, 10);
  const bool in_range = errno != ERANGE && value <= INT_MAX;
  const bool valid = end && *end == 0 && in_range &&
                     (allow_zero ? value >= 0 : value > 0);
  if (!valid) {
    warn_invalid(logger, name, raw, std::to_string(fallback));
    return fallback;
  }

  return static_cast<int>(value);
}

RuntimeConfig
RuntimeConfig::from_environment(const std::shared_ptr<core::ILogger> &logger) {
  RuntimeConfig config;

  config.executor.worker_count =
      parse_env_int("SFLIGHT_WORKERS", config.executor.worker_count, false,
                    logger);

  const std::string level = env_string("SFLIGHT_LOG_LEVEL");
  if (!level.empty()) {
    if (is_valid_log_level(level)) {
      config.log_level = level;
    } else {
      warn_invalid(logger, "SFLIGHT_LOG_LEVEL", level, config.log_level);
    }
  }

  const std::string kind = env_string("SFLIGHT_EXECUTOR");
  if (kind == "manual") {
    config.executor_kind = ExecutorKind::Manual;
  } else if (!kind.empty() && kind != "threadpool") {
    warn_invalid(logger, "SFLIGHT_EXECUTOR", kind, "threadpool");
  }

  return config;
}

std::shared_ptr<core::IExecutor>
make_executor(const RuntimeConfig &config,
              const std::shared_ptr<core::ILogger> &logger) {
  if (config.executor_kind == ExecutorKind::Manual) {
    return std::make_shared<core::ManualExecutor>();
  }
  return core::create_thread_pool_executor(config.executor, logger);
}

} // namespace sflight::infra
