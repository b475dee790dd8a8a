#pragma once

#include <string>

namespace sflight::core {

/// Logger interface used by the lock, the executors and the state machines.
/// The spdlog implementation lives in infra; core code only logs when a
/// logger was injected.
///
/// trace_id correlates every line of one run ("run-3/1f0c..."), component
/// names the emitter ("lock", "machine:<name>", "executor:<name>").
class ILogger {
public:
  virtual ~ILogger() = default;

  virtual void info(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void warn(const std::string &trace_id, const std::string &component,
                    const std::string &event, const std::string &msg) = 0;

  virtual void error(const std::string &trace_id, const std::string &component,
                     const std::string &event, const std::string &msg) = 0;
};

} // namespace sflight::core
