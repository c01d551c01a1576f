#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/scheduler.hpp"
#include "mission/condition.hpp"
#include "mission/loader.hpp"
#include "model/report.hpp"
#include "orchestrator/orchestrator.hpp"

using namespace mission_agent;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

std::string write_temp_file(const std::string& content) {
  static int counter = 0;
  const auto path = std::filesystem::temp_directory_path() /
                    ("mission_agent_" + std::to_string(::getpid()) + "_" + std::to_string(counter++) + ".tmp");
  std::ofstream output(path);
  output << content;
  return path.string();
}

nlohmann::json substation_mission_json() {
  return nlohmann::json::parse(R"({
    "mission_id": "M-ELECTRICAL-SUBSTATION-01",
    "agent_id_target": "SENSOR-UHF-GBL-007",
    "function_name": "voltage_stability_monitoring",
    "priority": 1,
    "parameters": {
      "value_to_monitor": "voltage_rms",
      "monitoring_interval_seconds": 5,
      "nominal_voltage": 220
    },
    "triggers": [
      {"trigger_name": "critical_overvoltage", "condition": "value > 245.0", "report_level": "CRITICAL", "cooldown_seconds": 300},
      {"trigger_name": "abrupt_change_warning", "condition": "change_percent > 5.0", "report_level": "WARNING", "cooldown_seconds": 60}
    ],
    "communication": {"protocol": "GibberLink-RF", "target": "NEXUSOPTIM_IA_CENTRAL"}
  })");
}

model::MissionProfile mission_with_priority(const std::string& id, const int priority, const bool active) {
  model::MissionProfile profile = mission::parse_mission(substation_mission_json());
  profile.mission_id = id;
  profile.priority = priority;
  profile.active = active;
  return profile;
}

int test_condition_parser_accepts_closed_forms() {
  const auto gt = mission::parse_condition("value > 245.0");
  if (!gt.has_value() || gt->subject != model::condition_subject::VALUE || gt->op != model::comparison_op::GREATER ||
      gt->threshold != 245.0) {
    return fail("test_condition_parser_accepts_closed_forms", "value > 245.0");
  }

  const auto le = mission::parse_condition("value<=-3.5");
  if (!le.has_value() || le->op != model::comparison_op::LESS_EQUAL || le->threshold != -3.5) {
    return fail("test_condition_parser_accepts_closed_forms", "whitespace between tokens is optional");
  }

  const auto eq = mission::parse_condition("  value == 60  ");
  if (!eq.has_value() || eq->op != model::comparison_op::EQUAL || eq->threshold != 60.0) {
    return fail("test_condition_parser_accepts_closed_forms", "value == 60");
  }

  const auto ge = mission::parse_condition("value >= 1e2");
  if (!ge.has_value() || ge->op != model::comparison_op::GREATER_EQUAL || ge->threshold != 100.0) {
    return fail("test_condition_parser_accepts_closed_forms", "exponent thresholds");
  }

  const auto change = mission::parse_condition("change_percent > 5.0");
  if (!change.has_value() || change->subject != model::condition_subject::CHANGE_PERCENT ||
      change->threshold != 5.0) {
    return fail("test_condition_parser_accepts_closed_forms", "change_percent > 5.0");
  }

  return 0;
}

int test_condition_parser_rejects_everything_else() {
  const char* rejected[] = {
      "",
      "value",
      "value >",
      "value > abc",
      "value > 5 extra",
      "value != 5",
      "value => 5",
      "voltage > 5",
      "change_percent < 5",
      "change_percent >= 5",
      "__import__('os').system('id')",
      "value > 5; rm -rf /",
  };
  for (const char* text : rejected) {
    if (mission::parse_condition(text).has_value()) {
      std::cerr << "  accepted: \"" << text << "\"\n";
      return fail("test_condition_parser_rejects_everything_else", "malformed condition was accepted");
    }
  }
  return 0;
}

int test_condition_evaluation() {
  const auto over = *mission::parse_condition("value > 245.0");
  if (!mission::condition_met(over, 250.0, std::nullopt) || mission::condition_met(over, 245.0, std::nullopt)) {
    return fail("test_condition_evaluation", "strict greater-than");
  }

  const auto under = *mission::parse_condition("value <= 200");
  if (!mission::condition_met(under, 200.0, std::nullopt) || mission::condition_met(under, 200.5, 180.0)) {
    return fail("test_condition_evaluation", "less-or-equal");
  }

  const auto change = *mission::parse_condition("change_percent > 5.0");
  if (mission::condition_met(change, 230.0, std::nullopt)) {
    return fail("test_condition_evaluation", "change_percent without a baseline must not fire");
  }
  if (mission::condition_met(change, 10.0, 0.0)) {
    return fail("test_condition_evaluation", "change_percent against a zero baseline must not fire");
  }
  if (!mission::condition_met(change, 210.0, 200.0) || !mission::condition_met(change, 189.0, 200.0)) {
    return fail("test_condition_evaluation", "change_percent is an absolute relative change");
  }
  if (mission::condition_met(change, 205.0, 200.0)) {
    return fail("test_condition_evaluation", "2.5% change must not exceed 5%");
  }

  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  if (mission::condition_met(over, nan, std::nullopt) || mission::condition_met(change, inf, 200.0)) {
    return fail("test_condition_evaluation", "non-finite values must not fire");
  }

  return 0;
}

int test_parse_mission_reads_all_fields() {
  const auto profile = mission::parse_mission(substation_mission_json());
  if (profile.mission_id != "M-ELECTRICAL-SUBSTATION-01" || profile.agent_id_target != "SENSOR-UHF-GBL-007" ||
      profile.function_name != "voltage_stability_monitoring" || profile.priority != 1 || !profile.active) {
    return fail("test_parse_mission_reads_all_fields", "identity fields mismatch");
  }
  if (profile.value_to_monitor != "voltage_rms" || profile.monitoring_interval_seconds != 5.0) {
    return fail("test_parse_mission_reads_all_fields", "parameters mismatch");
  }
  if (profile.parameters.value("nominal_voltage", 0) != 220) {
    return fail("test_parse_mission_reads_all_fields", "extra parameters must be preserved");
  }
  if (profile.triggers.size() != 2 || profile.triggers[0].trigger_name != "critical_overvoltage" ||
      profile.triggers[0].cooldown_seconds != 300.0 || profile.triggers[1].condition.subject !=
                                                           model::condition_subject::CHANGE_PERCENT) {
    return fail("test_parse_mission_reads_all_fields", "triggers mismatch");
  }
  if (profile.communication.protocol != "GibberLink-RF" || profile.communication.target != "NEXUSOPTIM_IA_CENTRAL") {
    return fail("test_parse_mission_reads_all_fields", "communication mismatch");
  }
  return 0;
}

bool rejected_as_invalid(const nlohmann::json& value) {
  try {
    (void)mission::parse_mission(value);
  } catch (const InvalidMission&) {
    return true;
  }
  return false;
}

int test_parse_mission_rejects_invalid_profiles() {
  auto duplicate = substation_mission_json();
  duplicate["triggers"][1]["trigger_name"] = "critical_overvoltage";
  if (!rejected_as_invalid(duplicate)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "duplicate trigger names");
  }

  auto no_triggers = substation_mission_json();
  no_triggers["triggers"] = nlohmann::json::array();
  if (!rejected_as_invalid(no_triggers)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "empty trigger list");
  }

  auto no_value = substation_mission_json();
  no_value["parameters"].erase("value_to_monitor");
  if (!rejected_as_invalid(no_value)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "missing value_to_monitor");
  }

  auto zero_interval = substation_mission_json();
  zero_interval["parameters"]["monitoring_interval_seconds"] = 0;
  if (!rejected_as_invalid(zero_interval)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "non-positive interval");
  }

  auto text_interval = substation_mission_json();
  text_interval["parameters"]["monitoring_interval_seconds"] = "5";
  if (!rejected_as_invalid(text_interval)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "non-numeric interval");
  }

  auto negative_cooldown = substation_mission_json();
  negative_cooldown["triggers"][0]["cooldown_seconds"] = -1;
  if (!rejected_as_invalid(negative_cooldown)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "negative cooldown");
  }

  auto bad_condition = substation_mission_json();
  bad_condition["triggers"][0]["condition"] = "value >> 3";
  if (!rejected_as_invalid(bad_condition)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "malformed condition");
  }

  auto spaced_target = substation_mission_json();
  spaced_target["communication"]["target"] = "NEXUSOPTIM IA CENTRAL";
  if (!rejected_as_invalid(spaced_target)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "target with whitespace");
  }

  auto wide_priority = substation_mission_json();
  wide_priority["priority"] = 4294967297LL;
  if (!rejected_as_invalid(wide_priority)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "priority beyond int range");
  }
  auto negative_priority = substation_mission_json();
  negative_priority["priority"] = -4294967297LL;
  if (!rejected_as_invalid(negative_priority)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "priority below int range");
  }
  auto urgent = substation_mission_json();
  urgent["priority"] = 0;
  if (rejected_as_invalid(urgent)) {
    return fail("test_parse_mission_rejects_invalid_profiles", "in-range priority must load");
  }

  if (!rejected_as_invalid(nlohmann::json::array())) {
    return fail("test_parse_mission_rejects_invalid_profiles", "non-object profile");
  }

  return 0;
}

int test_load_missions_accepts_object_or_array() {
  const std::string single = write_temp_file(substation_mission_json().dump());
  nlohmann::json both = nlohmann::json::array({substation_mission_json(), substation_mission_json()});
  both[1]["mission_id"] = "M-SECOND";
  const std::string many = write_temp_file(both.dump());
  const std::string broken = write_temp_file("{ not json");

  const auto one = mission::load_missions(single);
  const auto two = mission::load_missions(many);
  std::remove(single.c_str());
  std::remove(many.c_str());

  if (one.size() != 1 || two.size() != 2 || two[1].mission_id != "M-SECOND") {
    std::remove(broken.c_str());
    return fail("test_load_missions_accepts_object_or_array", "unexpected mission count");
  }

  bool broken_threw = false;
  try {
    (void)mission::load_missions(broken);
  } catch (const InvalidMission&) {
    broken_threw = true;
  }
  std::remove(broken.c_str());
  if (!broken_threw) {
    return fail("test_load_missions_accepts_object_or_array", "invalid JSON must be an InvalidMission");
  }

  bool missing_threw = false;
  try {
    (void)mission::load_missions("/nonexistent/missions.json");
  } catch (const std::runtime_error&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_load_missions_accepts_object_or_array", "missing file must throw");
  }

  return 0;
}

int test_report_json_keys() {
  model::ReportPacket report{};
  report.timestamp = 1700000000;
  report.agent_id = "SENSOR-UHF-GBL-007";
  report.mission_id = "M-ELECTRICAL-SUBSTATION-01";
  report.trigger_fired = "critical_overvoltage";
  report.report_level = "CRITICAL";
  report.measured_value = 250.5;
  report.mission_function = "voltage_stability_monitoring";

  const auto json = model::report_to_json(report);
  for (const char* key : {"timestamp", "agent_id", "mission_id", "trigger_fired", "report_level", "measured_value",
                          "mission_function"}) {
    if (!json.contains(key)) {
      return fail("test_report_json_keys", "report JSON is missing a field");
    }
  }

  const auto parsed = model::report_from_json(json);
  if (parsed.agent_id != report.agent_id || parsed.measured_value != 250.5 || parsed.timestamp != 1700000000) {
    return fail("test_report_json_keys", "report_from_json lost data");
  }

  bool threw = false;
  try {
    (void)model::report_from_json(nlohmann::json{{"agent_id", "x"}});
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  if (!threw) {
    return fail("test_report_json_keys", "incomplete report must be rejected");
  }

  return 0;
}

int test_orchestrator_assignments() {
  std::int64_t now = 1000;
  orchestrator::MissionOrchestrator registry([&now]() { return now; });

  registry.assign_mission("SENSOR-B", mission_with_priority("M-B", 2, true));
  registry.assign_mission("SENSOR-A", mission_with_priority("M-A-OLD", 5, true));
  registry.assign_mission("SENSOR-A", mission_with_priority("M-A", 2, true));
  registry.assign_mission("SENSOR-C", mission_with_priority("M-C", 1, true));
  registry.assign_mission("SENSOR-D", mission_with_priority("M-D", 1, false));

  if (registry.assignment_count() != 4) {
    return fail("test_orchestrator_assignments", "reassignment must replace, not add");
  }
  const auto a = registry.assignment("SENSOR-A");
  if (!a.has_value() || a->mission_id != "M-A") {
    return fail("test_orchestrator_assignments", "last write must win");
  }
  const auto record = registry.record("SENSOR-A");
  if (!record.has_value() || record->last_status != "ASSIGNED" || record->mission_id != "M-A") {
    return fail("test_orchestrator_assignments", "assignment must set status ASSIGNED");
  }

  const auto active = registry.active_assignments();
  if (active.size() != 3 || active[0].first != "SENSOR-C" || active[1].first != "SENSOR-A" ||
      active[2].first != "SENSOR-B") {
    return fail("test_orchestrator_assignments", "active assignments must be ordered by priority then ID");
  }

  if (registry.assignment("SENSOR-Z").has_value()) {
    return fail("test_orchestrator_assignments", "unknown agent must have no assignment");
  }

  return 0;
}

int test_orchestrator_handles_incoming_reports() {
  std::int64_t now = 5000;
  orchestrator::MissionOrchestrator registry([&now]() { return now; });
  registry.assign_mission("SENSOR-UHF-GBL-007", mission::parse_mission(substation_mission_json()));

  model::ReportPacket critical{};
  critical.timestamp = 4990;
  critical.agent_id = "SENSOR-UHF-GBL-007";
  critical.mission_id = "M-ELECTRICAL-SUBSTATION-01";
  critical.trigger_fired = "critical_overvoltage";
  critical.report_level = "CRITICAL";
  critical.measured_value = 250.0;
  critical.mission_function = "voltage_stability_monitoring";

  const auto critical_actions = registry.handle_incoming_report(critical);
  if (critical_actions.size() != 2 ||
      critical_actions[0] != orchestrator::response_action::INITIATE_LOAD_BALANCING ||
      critical_actions[1] != orchestrator::response_action::NOTIFY_ADMINS) {
    return fail("test_orchestrator_handles_incoming_reports", "CRITICAL must balance load and notify admins");
  }
  auto record = registry.record("SENSOR-UHF-GBL-007");
  if (!record.has_value() || record->last_status != "REPORTED_CRITICAL" || record->last_report_time != 5000 ||
      !record->last_report.has_value() || record->last_report->measured_value != 250.0) {
    return fail("test_orchestrator_handles_incoming_reports", "record must track the last report");
  }

  now = 5060;
  model::ReportPacket warning = critical;
  warning.report_level = "WARNING";
  warning.trigger_fired = "abrupt_change_warning";
  const auto warning_actions = registry.handle_incoming_report(warning);
  if (warning_actions.size() != 1 ||
      warning_actions[0] != orchestrator::response_action::INCREASE_MONITORING_FREQUENCY) {
    return fail("test_orchestrator_handles_incoming_reports", "WARNING must increase monitoring frequency");
  }
  record = registry.record("SENSOR-UHF-GBL-007");
  if (record->last_status != "REPORTED_WARNING" || record->last_report_time != 5060) {
    return fail("test_orchestrator_handles_incoming_reports", "status must follow the latest report");
  }

  model::ReportPacket other = critical;
  other.agent_id = "SENSOR-UNKNOWN";
  other.mission_function = "thermal_watch";
  if (!registry.handle_incoming_report(other).empty()) {
    return fail("test_orchestrator_handles_incoming_reports", "other functions call for no action");
  }
  const auto unknown = registry.record("SENSOR-UNKNOWN");
  if (!unknown.has_value() || unknown->last_status != "REPORTED_CRITICAL" || unknown->mission_id != critical.mission_id) {
    return fail("test_orchestrator_handles_incoming_reports", "reports from unknown agents must be recorded");
  }
  if (registry.assignment_count() != 1) {
    return fail("test_orchestrator_handles_incoming_reports", "reports must not create assignments");
  }

  if (std::string(orchestrator::to_string(orchestrator::response_action::NOTIFY_ADMINS)) != "notify_admins") {
    return fail("test_orchestrator_handles_incoming_reports", "action names");
  }

  return 0;
}

int test_config_parses_agents_and_sections() {
  const std::string path = write_temp_file(
      "mission_file: /etc/mission-agent/missions.json\n"
      "tick_ms: 250\n"
      "max_cycles: 12\n"
      "agent:\n"
      "  stdout_debug: false\n"
      "security:\n"
      "  salt: \"pepper # not a comment\"\n"
      "redis:\n"
      "  address: 10.0.0.5:6380  # trailing comment\n"
      "  stream: field:reports\n"
      "agents:\n"
      "  SENSOR-UHF-GBL-007:\n"
      "    transport: GibberLink-RF\n"
      "    destination: remote\n"
      "    scenario: voltage_drop\n"
      "    seed: 7\n"
      "  SENSOR-LORA-002:\n"
      "    transport: lorawan\n"
      "    destination: local\n"
      "    sensor: file\n"
      "    sensor_path: /sys/class/hwmon/hwmon0/in1_input\n"
      "    sensor_scale: 0.001\n");

  core::AgentConfig config{};
  try {
    config = core::load_agent_config(path);
  } catch (const std::exception& ex) {
    std::remove(path.c_str());
    std::cerr << "  " << ex.what() << '\n';
    return fail("test_config_parses_agents_and_sections", "valid config was rejected");
  }
  std::remove(path.c_str());

  if (config.mission_file != "/etc/mission-agent/missions.json" ||
      config.tick_interval != std::chrono::milliseconds(250) || config.max_cycles != 12 || config.stdout_debug) {
    return fail("test_config_parses_agents_and_sections", "top-level keys mismatch");
  }
  if (config.security.salt != std::optional<std::string>("pepper # not a comment") ||
      config.security.key_base64.has_value()) {
    return fail("test_config_parses_agents_and_sections", "quoted values must keep '#'");
  }
  if (!config.redis.enabled || config.redis.host != "10.0.0.5" || config.redis.port != 6380 ||
      config.redis.stream != "field:reports") {
    return fail("test_config_parses_agents_and_sections", "redis section mismatch");
  }
  if (config.agents.size() != 2) {
    return fail("test_config_parses_agents_and_sections", "expected two agents");
  }

  const auto& uhf = config.agents.at("SENSOR-UHF-GBL-007");
  if (uhf.transport != transports::transport_kind::GIBBERLINK_RF || uhf.destination != "remote" ||
      uhf.sensor != core::sensor_kind::SIMULATED || uhf.scenario != sensors::simulation_scenario::VOLTAGE_DROP ||
      uhf.seed != 7) {
    return fail("test_config_parses_agents_and_sections", "first agent mismatch");
  }

  const auto& lora = config.agents.at("SENSOR-LORA-002");
  if (lora.transport != transports::transport_kind::LORAWAN || lora.destination != "local" ||
      lora.sensor != core::sensor_kind::FILE || lora.sensor_path != "/sys/class/hwmon/hwmon0/in1_input" ||
      std::fabs(lora.sensor_scale - 0.001) > 1e-12) {
    return fail("test_config_parses_agents_and_sections", "second agent mismatch");
  }

  return 0;
}

bool config_rejected(const std::string& content) {
  const std::string path = write_temp_file(content);
  bool rejected = false;
  try {
    (void)core::load_agent_config(path);
  } catch (const ConfigError&) {
    rejected = true;
  }
  std::remove(path.c_str());
  return rejected;
}

int test_config_rejects_invalid_values() {
  if (!config_rejected("tick_ms: 0\n") || !config_rejected("tick_ms: 60001\n")) {
    return fail("test_config_rejects_invalid_values", "tick_ms bounds");
  }
  if (!config_rejected("agents:\n  S1:\n    transport: wifi\n")) {
    return fail("test_config_rejects_invalid_values", "unknown transport");
  }
  if (!config_rejected("agents:\n  S1:\n    destination: mars\n")) {
    return fail("test_config_rejects_invalid_values", "unsupported destination");
  }
  if (!config_rejected("agents:\n  S1:\n    scenario: meltdown\n")) {
    return fail("test_config_rejects_invalid_values", "unknown scenario");
  }
  if (!config_rejected("redis:\n  address: localhost:70000\n")) {
    return fail("test_config_rejects_invalid_values", "redis port range");
  }

  bool missing_threw = false;
  try {
    (void)core::load_agent_config("/nonexistent/mission-agent.yaml");
  } catch (const ConfigError&) {
    missing_threw = true;
  }
  if (!missing_threw) {
    return fail("test_config_rejects_invalid_values", "missing file must be a ConfigError");
  }

  return 0;
}

int test_cycle_scheduler() {
  if (core::CycleScheduler::ticks_for_interval(5.0, std::chrono::milliseconds(500)) != 10) {
    return fail("test_cycle_scheduler", "5s at 500ms ticks is every 10 ticks");
  }
  if (core::CycleScheduler::ticks_for_interval(0.1, std::chrono::milliseconds(1000)) != 1) {
    return fail("test_cycle_scheduler", "intervals shorter than a tick run every tick");
  }

  if (core::CycleScheduler::ticks_for_interval(1e300, std::chrono::milliseconds(1)) !=
          std::numeric_limits<std::uint64_t>::max() ||
      core::CycleScheduler::ticks_for_interval(1e17, std::chrono::milliseconds(1)) !=
          std::numeric_limits<std::uint64_t>::max()) {
    return fail("test_cycle_scheduler", "huge intervals must saturate instead of wrapping to every tick");
  }
  if (core::CycleScheduler::ticks_for_interval(86400.0 * 365, std::chrono::milliseconds(1000)) != 31536000) {
    return fail("test_cycle_scheduler", "long intervals must keep their tick count");
  }

  core::CycleScheduler scheduler(3);
  int due = 0;
  for (int i = 0; i < 9; ++i) {
    if (scheduler.due()) {
      ++due;
    }
    scheduler.advance();
  }
  if (due != 3 || scheduler.tick() != 9) {
    return fail("test_cycle_scheduler", "every third tick must be due");
  }

  const core::CycleScheduler zero(0);
  if (zero.every_n_ticks() != 1 || !zero.due()) {
    return fail("test_cycle_scheduler", "zero period must clamp to every tick");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_condition_parser_accepts_closed_forms(); rc != 0) return rc;
  if (int rc = test_condition_parser_rejects_everything_else(); rc != 0) return rc;
  if (int rc = test_condition_evaluation(); rc != 0) return rc;
  if (int rc = test_parse_mission_reads_all_fields(); rc != 0) return rc;
  if (int rc = test_parse_mission_rejects_invalid_profiles(); rc != 0) return rc;
  if (int rc = test_load_missions_accepts_object_or_array(); rc != 0) return rc;
  if (int rc = test_report_json_keys(); rc != 0) return rc;
  if (int rc = test_orchestrator_assignments(); rc != 0) return rc;
  if (int rc = test_orchestrator_handles_incoming_reports(); rc != 0) return rc;
  if (int rc = test_config_parses_agents_and_sections(); rc != 0) return rc;
  if (int rc = test_config_rejects_invalid_values(); rc != 0) return rc;
  if (int rc = test_cycle_scheduler(); rc != 0) return rc;

  std::cout << "[PASS] mission unit tests\n";
  return 0;
}
