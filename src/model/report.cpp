#include "model/report.hpp"

#include <stdexcept>

namespace mission_agent::model {

namespace {

const nlohmann::json& require(const nlohmann::json& value, const char* key) {
  const auto it = value.find(key);
  if (it == value.end()) {
    throw std::invalid_argument(std::string("report is missing \"") + key + "\"");
  }
  return *it;
}

std::string require_string(const nlohmann::json& value, const char* key) {
  const auto& field = require(value, key);
  if (!field.is_string()) {
    throw std::invalid_argument(std::string("report field \"") + key + "\" must be a string");
  }
  return field.get<std::string>();
}

}  // namespace

nlohmann::json report_to_json(const ReportPacket& report) {
  return nlohmann::json{{"timestamp", report.timestamp},
                        {"agent_id", report.agent_id},
                        {"mission_id", report.mission_id},
                        {"report_level", report.report_level},
                        {"trigger_fired", report.trigger_fired},
                        {"measured_value", report.measured_value},
                        {"mission_function", report.mission_function}};
}

ReportPacket report_from_json(const nlohmann::json& value) {
  if (!value.is_object()) {
    throw std::invalid_argument("report must be a JSON object");
  }

  const auto& timestamp = require(value, "timestamp");
  if (!timestamp.is_number_integer()) {
    throw std::invalid_argument("report field \"timestamp\" must be an integer");
  }
  const auto& measured = require(value, "measured_value");
  if (!measured.is_number()) {
    throw std::invalid_argument("report field \"measured_value\" must be a number");
  }

  ReportPacket report{};
  report.timestamp = timestamp.get<std::int64_t>();
  report.agent_id = require_string(value, "agent_id");
  report.mission_id = require_string(value, "mission_id");
  report.report_level = require_string(value, "report_level");
  report.trigger_fired = require_string(value, "trigger_fired");
  report.measured_value = measured.get<double>();
  if (const auto it = value.find("mission_function"); it != value.end() && it->is_string()) {
    report.mission_function = it->get<std::string>();
  }
  return report;
}

}  // namespace mission_agent::model
