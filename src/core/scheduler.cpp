#include "core/scheduler.hpp"

#include <cmath>
#include <limits>

namespace mission_agent::core {

CycleScheduler::CycleScheduler(const std::uint64_t every_n_ticks) noexcept
    : every_n_ticks_(every_n_ticks == 0 ? 1 : every_n_ticks) {}

std::uint64_t CycleScheduler::ticks_for_interval(const double interval_seconds,
                                                 const std::chrono::milliseconds tick) noexcept {
  if (tick.count() <= 0 || !std::isfinite(interval_seconds) || interval_seconds <= 0.0) {
    return 1;
  }
  const double ticks = std::round((interval_seconds * 1000.0) / static_cast<double>(tick.count()));
  if (ticks < 1.0) {
    return 1;
  }
  // 2^64 is the first double past the uint64_t range.
  constexpr double kTickLimit = 18446744073709551616.0;
  if (ticks >= kTickLimit) {
    return std::numeric_limits<std::uint64_t>::max();
  }
  return static_cast<std::uint64_t>(ticks);
}

std::uint64_t CycleScheduler::tick() const noexcept { return tick_count_; }

std::uint64_t CycleScheduler::every_n_ticks() const noexcept { return every_n_ticks_; }

bool CycleScheduler::due() const noexcept { return (tick_count_ % every_n_ticks_) == 0; }

void CycleScheduler::advance() noexcept { ++tick_count_; }

}  // namespace mission_agent::core
