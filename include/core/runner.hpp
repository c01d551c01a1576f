#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#include "core/agent.hpp"

namespace mission_agent::core {

struct RunnerOptions {
  std::chrono::milliseconds tick_interval{1000};
  // 0 runs until `stop` is raised.
  std::uint64_t max_cycles{0};
};

// Drives one agent on its own thread of control: a fixed tick, with a
// monitoring cycle every mission interval. Returns the agent's final stats.
AgentStats run_agent_loop(MissionAgent& agent, const RunnerOptions& options, const std::atomic<bool>& stop);

}  // namespace mission_agent::core
