#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "comms/gateway.hpp"
#include "core/errors.hpp"

namespace mission_agent::core {
namespace {

constexpr const char* kAgentsPrefix = "agents.";

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

// Values may be quoted to carry '#' or leading spaces.
std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (const char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = std::stoi(value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw ConfigError("redis.address port must be in range 1..65535");
  }
  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_agent_value(AgentEntry& entry, const std::string& key, const std::string& field, const std::string& value) {
  if (field == "transport") {
    const auto kind = transports::parse_transport_kind(value);
    if (!kind.has_value()) {
      throw ConfigError(key + ": unknown transport '" + value + "'");
    }
    entry.transport = *kind;
    return;
  }

  if (field == "destination") {
    if (value != comms::kDestinationLocal && value != comms::kDestinationRemote) {
      throw ConfigError(key + ": unsupported destination '" + value + "'");
    }
    entry.destination = value;
    return;
  }

  if (field == "sensor") {
    if (value == "simulated") {
      entry.sensor = sensor_kind::SIMULATED;
    } else if (value == "file") {
      entry.sensor = sensor_kind::FILE;
    } else {
      throw ConfigError(key + ": sensor must be 'simulated' or 'file'");
    }
    return;
  }

  if (field == "scenario") {
    const auto scenario = sensors::parse_scenario(value);
    if (!scenario.has_value()) {
      throw ConfigError(key + ": unknown scenario '" + value + "'");
    }
    entry.scenario = *scenario;
    return;
  }

  if (field == "sensor_path") {
    entry.sensor_path = value;
    return;
  }

  if (field == "sensor_scale") {
    entry.sensor_scale = std::stod(value);
    return;
  }

  if (field == "seed") {
    const auto parsed = std::stoll(value);
    if (parsed < 0) {
      throw ConfigError(key + " must be greater than or equal to 0");
    }
    entry.seed = static_cast<std::uint64_t>(parsed);
  }
}

void apply_key_value(AgentConfig& config, const std::string& key, const std::string& value) {
  if (key == "mission_file") {
    config.mission_file = value;
    return;
  }

  if (key == "tick_ms") {
    const auto ms = std::stoll(value);
    if (ms <= 0) {
      throw ConfigError("tick_ms must be greater than 0");
    }
    if (ms > 60000) {
      throw ConfigError("tick_ms must be less than or equal to 60000");
    }
    config.tick_interval = std::chrono::milliseconds(ms);
    return;
  }

  if (key == "max_cycles") {
    const auto parsed = std::stoll(value);
    if (parsed < 0) {
      throw ConfigError("max_cycles must be greater than or equal to 0");
    }
    config.max_cycles = static_cast<std::uint64_t>(parsed);
    return;
  }

  if (key == "agent.stdout_debug") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "security.key") {
    config.security.key_base64 = value;
    return;
  }

  if (key == "security.salt") {
    config.security.salt = value;
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    config.redis.db = std::stoi(value);
    return;
  }

  if (key == "redis.stream") {
    if (value.empty()) {
      throw ConfigError("redis.stream must not be empty");
    }
    config.redis.stream = value;
    return;
  }

  if (key.rfind(kAgentsPrefix, 0) == 0) {
    const std::string rest = key.substr(std::string(kAgentsPrefix).size());
    const auto split = rest.rfind('.');
    if (split == std::string::npos || split == 0) {
      throw ConfigError(key + ": expected agents.<agent_id>.<field>");
    }
    const std::string agent_id = rest.substr(0, split);
    apply_agent_value(config.agents[agent_id], key, rest.substr(split + 1), value);
  }
}

}  // namespace

AgentConfig load_agent_config(const std::string& path) {
  AgentConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw ConfigError("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    // Comments start at a '#' outside of quotes.
    char quote = '\0';
    for (std::size_t i = 0; i < line.size(); ++i) {
      const char c = line[i];
      if (quote != '\0') {
        if (c == quote) {
          quote = '\0';
        }
      } else if (c == '"' || c == '\'') {
        quote = c;
      } else if (c == '#') {
        line.erase(i);
        break;
      }
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = unquote(trim(stripped.substr(colon_pos + 1)));

    if (sections.size() > depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      if (sections.size() == depth) {
        sections.push_back(key);
      } else {
        sections[depth] = key;
      }
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  return config;
}

}  // namespace mission_agent::core
