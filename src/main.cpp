#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "comms/gateway.hpp"
#include "core/agent.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/runner.hpp"
#include "mission/loader.hpp"
#include "orchestrator/orchestrator.hpp"
#include "security/security_context.hpp"
#include "sensors/electrical_simulator.hpp"
#include "sensors/file_sensor.hpp"
#include "sinks/redis_reports.hpp"
#include "sinks/stdout_debug.hpp"
#include "transports/transport.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_config_settings(const mission_agent::core::AgentConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[main] loaded config from " << config_path
         << " | mission_file=" << config.mission_file
         << " | tick_ms=" << config.tick_interval.count()
         << " | max_cycles=" << config.max_cycles
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | agents=" << config.agents.size()
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");

  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

std::shared_ptr<mission_agent::sensors::SensorReader> make_sensor(const mission_agent::core::AgentEntry& entry) {
  if (entry.sensor == mission_agent::core::sensor_kind::FILE) {
    return std::make_shared<mission_agent::sensors::FileSensor>(entry.sensor_path, entry.sensor_scale);
  }
  return std::make_shared<mission_agent::sensors::ElectricalSimulator>(entry.scenario, entry.seed);
}

std::unique_ptr<mission_agent::sinks::RedisReportSink> make_redis_sink(const mission_agent::core::RedisConfig& redis) {
  mission_agent::sinks::RedisReportOptions options{};
  options.host = redis.host;
  options.port = redis.port;
  options.unix_socket = redis.unix_socket;
  options.password = redis.password;
  options.db = redis.db;
  options.stream = redis.stream;

  auto sink = std::make_unique<mission_agent::sinks::RedisReportSink>(options);
  if (sink->check_connectivity()) {
    std::cerr << "[redis] connectivity confirmed for stream " << options.stream << '\n';
  } else {
    std::cerr << "[redis] connectivity check failed; reports will be retried per publish\n";
  }
  return sink;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace mission_agent;

  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  const std::string config_path = argc > 1 ? argv[1] : "configs/mission-agent.yaml";

  core::AgentConfig config{};
  std::vector<model::MissionProfile> missions;
  std::shared_ptr<const security::SecurityContext> security_context;
  try {
    config = core::load_agent_config(config_path);
    missions = mission::load_missions(config.mission_file);

    security::SecurityOptions options{};
    options.key_base64 = config.security.key_base64;
    options.salt = config.security.salt;
    security_context = security::shared_security_context(options);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  orchestrator::MissionOrchestrator registry;
  for (auto& profile : missions) {
    if (profile.agent_id_target.empty()) {
      std::cerr << "[main] mission " << profile.mission_id << " has no agent_id_target; ignored\n";
      continue;
    }
    const std::string target = profile.agent_id_target;
    registry.assign_mission(target, std::move(profile));
  }

  const auto gateway = std::make_shared<const comms::CommunicationsGateway>(security_context);

  std::vector<std::unique_ptr<core::MissionAgent>> agents;
  for (const auto& [agent_id, assigned] : registry.active_assignments()) {
    const auto entry_it = config.agents.find(agent_id);
    if (entry_it == config.agents.end()) {
      std::cerr << "[main] no agent configured for " << agent_id << "; mission " << assigned.mission_id
                << " stays assigned\n";
      continue;
    }
    const core::AgentEntry& entry = entry_it->second;

    try {
      core::AgentOptions options{};
      options.agent_id = agent_id;
      options.destination = entry.destination;
      auto agent = std::make_unique<core::MissionAgent>(options, make_sensor(entry), gateway,
                                                        transports::make_transport(entry.transport));
      if (config.stdout_debug) {
        agent->add_sink(std::make_unique<sinks::StdoutDebugSink>());
      }
      if (config.redis.enabled) {
        agent->add_sink(make_redis_sink(config.redis));
      }
      agent->load_mission(assigned);
      std::cerr << "[main] agent " << agent_id << " on " << transports::to_string(entry.transport) << " -> "
                << entry.destination << ", priority " << assigned.priority << '\n';
      agents.push_back(std::move(agent));
    } catch (const std::exception& ex) {
      std::cerr << "[main] agent " << agent_id << " not started: " << ex.what() << '\n';
    }
  }

  if (agents.empty()) {
    std::cerr << "[main] no runnable agents; exiting\n";
    return 1;
  }

  core::RunnerOptions runner_options{};
  runner_options.tick_interval = config.tick_interval;
  runner_options.max_cycles = config.max_cycles;

  std::atomic<bool> stop{false};
  std::atomic<std::size_t> finished{0};
  std::vector<std::thread> workers;
  workers.reserve(agents.size());
  for (auto& agent : agents) {
    workers.emplace_back([&agent, &runner_options, &stop, &finished]() {
      core::run_agent_loop(*agent, runner_options, stop);
      finished.fetch_add(1);
    });
  }

  while (g_shutdown_requested == 0 && finished.load() < workers.size()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  if (g_shutdown_requested != 0) {
    std::cerr << "[main] shutdown signal received; stopping agents\n";
  }
  stop.store(true);

  for (auto& worker : workers) {
    worker.join();
  }

  return 0;
}
