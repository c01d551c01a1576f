#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mission_agent::model {

enum class condition_subject : std::uint8_t {
  VALUE = 0,
  CHANGE_PERCENT = 1,
};

enum class comparison_op : std::uint8_t {
  LESS = 0,
  GREATER = 1,
  LESS_EQUAL = 2,
  GREATER_EQUAL = 3,
  EQUAL = 4,
};

// Parsed trigger condition: "<subject> <op> <threshold>".
struct Condition {
  condition_subject subject{condition_subject::VALUE};
  comparison_op op{comparison_op::GREATER};
  double threshold{0.0};
};

struct TriggerSpec {
  std::string trigger_name{};
  std::string condition_text{};
  Condition condition{};
  std::string report_level{};
  double cooldown_seconds{0.0};
};

struct CommunicationSpec {
  std::string protocol{};
  std::string target{};
};

// Lower priority value means more urgent; 1 is the highest priority.
struct MissionProfile {
  std::string mission_id{};
  std::string agent_id_target{};
  std::string function_name{};
  int priority{1};
  bool active{true};
  std::string value_to_monitor{};
  double monitoring_interval_seconds{0.0};
  nlohmann::json parameters = nlohmann::json::object();
  std::vector<TriggerSpec> triggers{};
  CommunicationSpec communication{};
};

enum class agent_state : std::uint8_t {
  IDLE = 0,
  MONITORING = 1,
  REPORTING = 2,
};

const char* to_string(agent_state state) noexcept;
const char* to_string(comparison_op op) noexcept;

}  // namespace mission_agent::model
