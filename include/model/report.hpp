#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace mission_agent::model {

struct ReportPacket {
  std::int64_t timestamp{0};
  std::string agent_id{};
  std::string mission_id{};
  std::string trigger_fired{};
  std::string report_level{};
  double measured_value{0.0};
  std::string mission_function{};
};

nlohmann::json report_to_json(const ReportPacket& report);

// Throws std::invalid_argument when a required field is missing or mistyped.
ReportPacket report_from_json(const nlohmann::json& value);

}  // namespace mission_agent::model
