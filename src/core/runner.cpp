#include "core/runner.hpp"

#include <iostream>
#include <thread>

#include "core/scheduler.hpp"

namespace mission_agent::core {

AgentStats run_agent_loop(MissionAgent& agent, const RunnerOptions& options, const std::atomic<bool>& stop) {
  const model::MissionProfile* mission = agent.mission();
  if (mission == nullptr) {
    std::cerr << "[agent " << agent.agent_id() << "] no mission loaded; not starting\n";
    return agent.stats();
  }

  CycleScheduler scheduler(CycleScheduler::ticks_for_interval(mission->monitoring_interval_seconds,
                                                               options.tick_interval));
  std::uint64_t cycles = 0;
  auto next_wakeup = std::chrono::steady_clock::now();

  while (!stop.load(std::memory_order_relaxed) && (options.max_cycles == 0 || cycles < options.max_cycles)) {
    if (scheduler.due()) {
      agent.run_cycle();
      ++cycles;
    }
    scheduler.advance();

    next_wakeup += options.tick_interval;
    std::this_thread::sleep_until(next_wakeup);
  }

  const AgentStats& stats = agent.stats();
  std::cerr << "[agent " << agent.agent_id() << "] stopped after " << stats.cycles_executed << " cycles, "
            << stats.reports_sent << " reports, " << stats.sensor_failures << " sensor failures, "
            << stats.send_failures << " send failures\n";
  return stats;
}

}  // namespace mission_agent::core
