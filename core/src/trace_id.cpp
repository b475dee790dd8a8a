#include "core/trace_id.h"

#include <cstdint>
#include <mutex>
#include <random>
#include <sstream>

namespace sflight::core {

std::string generate_trace_id() {
  static std::mutex mutex;
  static std::mt19937 gen{std::random_device{}()};
  static std::uniform_int_distribution<uint32_t> dis;

  uint32_t words[6];
  {
    std::lock_guard<std::mutex> lock(mutex);
    for (auto &w : words) {
      w = dis(gen);
    }
  }

  std::stringstream ss;
  ss << std::hex;
  ss << words[0];
  ss << "-";
  ss << (words[1] & 0xFFFF);
  ss << "-4"; // Version 4
  ss << (words[2] & 0x0FFF);
  ss << "-";
  ss << ((words[3] & 0x3FFF) | 0x8000);
  ss << "-";
  ss << (words[4] & 0xFFFF);
  ss << words[5];
  return ss.str();
}

} // namespace sflight::core
