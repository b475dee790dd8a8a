#pragma once

#include "core/executor.h"
#include "core/logger.h"

#include <memory>
#include <string>

namespace sflight::infra {

enum class ExecutorKind { ThreadPool, Manual };

/// Runtime configuration read from the environment:
///   SFLIGHT_WORKERS    thread-pool worker count (> 0), default auto
///   SFLIGHT_LOG_LEVEL  trace|debug|info|warn|error|off, default info
///   SFLIGHT_EXECUTOR   threadpool|manual, default threadpool
/// Invalid values are logged as warnings and replaced by the defaults.
struct RuntimeConfig {
  core::ExecutorConfig executor;
  ExecutorKind executor_kind = ExecutorKind::ThreadPool;
  std::string log_level = "info";

  static RuntimeConfig
  from_environment(const std::shared_ptr<core::ILogger> &logger = nullptr);
};

/// Integer environment variable; fallback when unset, empty or invalid.
int parse_env_int(const char *name, int fallback, bool allow_zero,
                  const std::shared_ptr<core::ILogger> &logger);

/// Build the executor selected by config.
std::shared_ptr<core::IExecutor>
make_executor(const RuntimeConfig &config,
              const std::shared_ptr<core::ILogger> &logger);

} // namespace sflight::infra
