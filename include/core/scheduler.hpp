#pragma once

#include <chrono>
#include <cstdint>

namespace mission_agent::core {

// Tick counter that marks every Nth tick as a monitoring cycle.
class CycleScheduler {
 public:
  explicit CycleScheduler(std::uint64_t every_n_ticks = 1) noexcept;

  // Number of ticks between cycles for an interval; never less than 1.
  [[nodiscard]] static std::uint64_t ticks_for_interval(double interval_seconds, std::chrono::milliseconds tick) noexcept;

  [[nodiscard]] std::uint64_t tick() const noexcept;
  [[nodiscard]] std::uint64_t every_n_ticks() const noexcept;

  [[nodiscard]] bool due() const noexcept;

  void advance() noexcept;

 private:
  std::uint64_t every_n_ticks_{1};
  std::uint64_t tick_count_{0};
};

}  // namespace mission_agent::core
