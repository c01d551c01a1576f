#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "sensors/electrical_simulator.hpp"
#include "transports/transport.hpp"

namespace mission_agent::core {

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string stream{"mission:reports"};
  bool enabled{false};
};

struct SecurityConfig {
  std::optional<std::string> key_base64{};
  std::optional<std::string> salt{};
};

enum class sensor_kind : std::uint8_t {
  SIMULATED = 0,
  FILE = 1,
};

struct AgentEntry {
  transports::transport_kind transport{transports::transport_kind::GIBBERLINK_RF};
  std::string destination{"remote"};
  sensor_kind sensor{sensor_kind::SIMULATED};
  sensors::simulation_scenario scenario{sensors::simulation_scenario::NORMAL};
  std::string sensor_path{};
  double sensor_scale{1.0};
  std::uint64_t seed{0};
};

struct AgentConfig {
  std::string mission_file{"configs/missions.json"};
  std::chrono::milliseconds tick_interval{1000};
  std::uint64_t max_cycles{0};
  bool stdout_debug{true};
  SecurityConfig security{};
  RedisConfig redis{};
  // Keyed by agent ID.
  std::map<std::string, AgentEntry> agents{};
};

// Parses the indentation-nested "key: value" file format. Throws ConfigError
// (or std::invalid_argument / std::out_of_range from numeric fields).
AgentConfig load_agent_config(const std::string& path);

}  // namespace mission_agent::core
