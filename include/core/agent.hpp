#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "comms/gateway.hpp"
#include "core/timestamp.hpp"
#include "model/mission.hpp"
#include "model/report.hpp"
#include "sensors/sensor.hpp"
#include "sinks/report_sink.hpp"
#include "transports/transport.hpp"

namespace mission_agent::core {

struct AgentStats {
  std::size_t cycles_executed{0};
  std::size_t reports_sent{0};
  std::size_t sensor_failures{0};
  std::size_t send_failures{0};
  std::size_t cooldown_skips{0};
};

enum class cycle_outcome : std::uint8_t {
  SKIPPED = 0,
  SENSOR_UNAVAILABLE = 1,
  QUIET = 2,
  REPORTED = 3,
  SEND_FAILED = 4,
};

struct CycleResult {
  cycle_outcome outcome{cycle_outcome::SKIPPED};
  std::optional<double> sample{};
  std::optional<model::ReportPacket> report{};
};

struct AgentOptions {
  std::string agent_id{};
  std::string destination{comms::kDestinationRemote};
  Clock clock{};
};

// Mission state machine: IDLE -> MONITORING <-> REPORTING, back to IDLE only
// through unload(). run_cycle() must not be called concurrently on one agent.
class MissionAgent {
 public:
  // Throws UnsupportedDestination when options.destination is not routable.
  MissionAgent(AgentOptions options, std::shared_ptr<sensors::SensorReader> sensor,
               std::shared_ptr<const comms::CommunicationsGateway> gateway,
               std::unique_ptr<transports::Transport> transport);

  MissionAgent(const MissionAgent&) = delete;
  MissionAgent& operator=(const MissionAgent&) = delete;

  // Throws InvalidMission and leaves the agent untouched on rejection.
  void load_mission(model::MissionProfile profile);
  void unload() noexcept;

  CycleResult run_cycle();

  void add_sink(std::unique_ptr<sinks::ReportSink> sink);

  [[nodiscard]] const std::string& agent_id() const noexcept { return agent_id_; }
  [[nodiscard]] model::agent_state state() const noexcept { return state_; }
  [[nodiscard]] const model::MissionProfile* mission() const noexcept { return mission_ ? &*mission_ : nullptr; }
  [[nodiscard]] std::optional<double> previous_value() const noexcept { return previous_value_; }
  [[nodiscard]] std::optional<std::int64_t> last_fired(const std::string& trigger_name) const;
  [[nodiscard]] const AgentStats& stats() const noexcept { return stats_; }
  [[nodiscard]] const transports::Transport& transport() const noexcept { return *transport_; }

 private:
  struct SinkSlot {
    std::unique_ptr<sinks::ReportSink> sink;
    bool was_ok{true};
  };

  [[nodiscard]] bool cooldown_passed(const model::TriggerSpec& trigger, std::int64_t now) const;
  cycle_outcome report_event(const model::TriggerSpec& trigger, double value, std::int64_t now,
                             CycleResult& result);
  void publish_sinks(const model::ReportPacket& report);

  std::string agent_id_;
  std::string destination_;
  Clock clock_;
  std::shared_ptr<sensors::SensorReader> sensor_;
  std::shared_ptr<const comms::CommunicationsGateway> gateway_;
  std::unique_ptr<transports::Transport> transport_;
  std::vector<SinkSlot> sinks_{};

  model::agent_state state_{model::agent_state::IDLE};
  std::optional<model::MissionProfile> mission_{};
  std::unordered_map<std::string, std::int64_t> cooldown_ledger_{};
  std::optional<double> previous_value_{};
  AgentStats stats_{};
};

}  // namespace mission_agent::core
