#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/timestamp.hpp"
#include "model/mission.hpp"
#include "model/report.hpp"

namespace mission_agent::orchestrator {

enum class response_action : std::uint8_t {
  INITIATE_LOAD_BALANCING = 0,
  NOTIFY_ADMINS = 1,
  INCREASE_MONITORING_FREQUENCY = 2,
};

const char* to_string(response_action action) noexcept;

struct AgentRecord {
  std::string mission_id{};
  std::string last_status{};
  std::optional<std::int64_t> last_report_time{};
  std::optional<model::ReportPacket> last_report{};
};

// Registry of mission assignments keyed by agent ID. It records intent only;
// loading and cycling agents is left to the caller. Thread-safe.
class MissionOrchestrator {
 public:
  explicit MissionOrchestrator(core::Clock clock = core::system_clock());

  // Last write wins per agent ID.
  void assign_mission(const std::string& agent_id, model::MissionProfile profile);

  [[nodiscard]] std::optional<model::MissionProfile> assignment(const std::string& agent_id) const;

  // Active assignments, most urgent (lowest priority value) first, then by agent ID.
  [[nodiscard]] std::vector<std::pair<std::string, model::MissionProfile>> active_assignments() const;

  // Records the report against its agent and returns the responses it calls for.
  std::vector<response_action> handle_incoming_report(const model::ReportPacket& report);

  [[nodiscard]] std::optional<AgentRecord> record(const std::string& agent_id) const;
  [[nodiscard]] std::size_t assignment_count() const;

 private:
  core::Clock clock_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, model::MissionProfile> assignments_{};
  std::unordered_map<std::string, AgentRecord> records_{};
};

}  // namespace mission_agent::orchestrator
