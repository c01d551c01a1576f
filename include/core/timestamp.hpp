#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace mission_agent::core {

// Wall clock in whole unix seconds. Cooldowns and report timestamps use it.
using Clock = std::function<std::int64_t()>;

inline std::int64_t unix_timestamp_now_s() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::int64_t>(std::chrono::duration_cast<std::chrono::seconds>(now).count());
}

inline Clock system_clock() { return &unix_timestamp_now_s; }

}  // namespace mission_agent::core
