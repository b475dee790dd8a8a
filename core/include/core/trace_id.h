#pragma once

#include <string>

namespace sflight::core {

/// Random UUIDv4-shaped identifier used to correlate the log lines of one
/// run (and stored as Failed::trace).
std::string generate_trace_id();

} // namespace sflight::core
