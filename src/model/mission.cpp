#include "model/mission.hpp"

namespace mission_agent::model {

const char* to_string(const agent_state state) noexcept {
  switch (state) {
    case agent_state::IDLE:
      return "IDLE";
    case agent_state::MONITORING:
      return "MONITORING";
    case agent_state::REPORTING:
      return "REPORTING";
  }
  return "UNKNOWN";
}

const char* to_string(const comparison_op op) noexcept {
  switch (op) {
    case comparison_op::LESS:
      return "<";
    case comparison_op::GREATER:
      return ">";
    case comparison_op::LESS_EQUAL:
      return "<=";
    case comparison_op::GREATER_EQUAL:
      return ">=";
    case comparison_op::EQUAL:
      return "==";
  }
  return "?";
}

}  // namespace mission_agent::model
