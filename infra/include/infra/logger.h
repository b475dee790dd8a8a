#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace sflight::infra {

/// Console logger backed by spdlog (stdout, colored).
/// Format: [ts] [level] [trace_id] [component] event: msg
///
/// level is one of trace|debug|info|warn|error|off; anything else falls back
/// to info.
std::unique_ptr<core::ILogger> create_console_logger(
    const std::string &level = "info");

/// True if level names an spdlog level accepted by create_console_logger().
bool is_valid_log_level(const std::string &level);

} // namespace sflight::infra
