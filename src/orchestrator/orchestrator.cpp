#include "orchestrator/orchestrator.hpp"

#include <algorithm>
#include <iostream>

namespace mission_agent::orchestrator {

namespace {
constexpr const char* kVoltageStabilityFunction = "voltage_stability_monitoring";
}

const char* to_string(const response_action action) noexcept {
  switch (action) {
    case response_action::INITIATE_LOAD_BALANCING:
      return "initiate_load_balancing";
    case response_action::NOTIFY_ADMINS:
      return "notify_admins";
    case response_action::INCREASE_MONITORING_FREQUENCY:
      return "increase_monitoring_frequency";
  }
  return "unknown";
}

MissionOrchestrator::MissionOrchestrator(core::Clock clock)
    : clock_(clock ? std::move(clock) : core::system_clock()) {}

void MissionOrchestrator::assign_mission(const std::string& agent_id, model::MissionProfile profile) {
  std::lock_guard<std::mutex> lock(mutex_);

  std::cerr << "[orchestrator] assigned mission " << profile.mission_id << " to " << agent_id << '\n';

  AgentRecord& record = records_[agent_id];
  record.mission_id = profile.mission_id;
  record.last_status = "ASSIGNED";
  assignments_[agent_id] = std::move(profile);
}

std::optional<model::MissionProfile> MissionOrchestrator::assignment(const std::string& agent_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = assignments_.find(agent_id);
  if (it == assignments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::pair<std::string, model::MissionProfile>> MissionOrchestrator::active_assignments() const {
  std::vector<std::pair<std::string, model::MissionProfile>> active;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [agent_id, profile] : assignments_) {
      if (profile.active) {
        active.emplace_back(agent_id, profile);
      }
    }
  }

  std::sort(active.begin(), active.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.second.priority != rhs.second.priority) {
      return lhs.second.priority < rhs.second.priority;
    }
    return lhs.first < rhs.first;
  });
  return active;
}

std::vector<response_action> MissionOrchestrator::handle_incoming_report(const model::ReportPacket& report) {
  std::vector<response_action> actions;
  if (report.mission_function == kVoltageStabilityFunction) {
    if (report.report_level == "CRITICAL") {
      actions.push_back(response_action::INITIATE_LOAD_BALANCING);
      actions.push_back(response_action::NOTIFY_ADMINS);
    } else if (report.report_level == "WARNING") {
      actions.push_back(response_action::INCREASE_MONITORING_FREQUENCY);
    }
  }

  const std::int64_t received_at = clock_();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    AgentRecord& record = records_[report.agent_id];
    if (record.mission_id.empty()) {
      record.mission_id = report.mission_id;
    }
    record.last_status = "REPORTED_" + report.report_level;
    record.last_report_time = received_at;
    record.last_report = report;
  }

  std::cerr << "[orchestrator] report from " << report.agent_id << ": level " << report.report_level << ", trigger "
            << report.trigger_fired << ", value " << report.measured_value << '\n';
  for (const auto action : actions) {
    std::cerr << "[orchestrator] -> " << to_string(action) << " for " << report.agent_id << '\n';
  }
  return actions;
}

std::optional<AgentRecord> MissionOrchestrator::record(const std::string& agent_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = records_.find(agent_id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t MissionOrchestrator::assignment_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return assignments_.size();
}

}  // namespace mission_agent::orchestrator
