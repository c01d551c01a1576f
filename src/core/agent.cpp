#include "core/agent.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>

#include "mission/condition.hpp"
#include "mission/loader.hpp"

namespace mission_agent::core {

MissionAgent::MissionAgent(AgentOptions options, std::shared_ptr<sensors::SensorReader> sensor,
                           std::shared_ptr<const comms::CommunicationsGateway> gateway,
                           std::unique_ptr<transports::Transport> transport)
    : agent_id_(std::move(options.agent_id)),
      destination_(std::move(options.destination)),
      clock_(options.clock ? std::move(options.clock) : system_clock()),
      sensor_(std::move(sensor)),
      gateway_(std::move(gateway)),
      transport_(std::move(transport)) {
  if (sensor_ == nullptr || gateway_ == nullptr || transport_ == nullptr) {
    throw std::invalid_argument("agent " + agent_id_ + " requires a sensor, a gateway and a transport");
  }
  comms::check_destination(destination_);
}

void MissionAgent::load_mission(model::MissionProfile profile) {
  model::MissionProfile validated = mission::validated_mission(std::move(profile));

  if (!validated.agent_id_target.empty() && validated.agent_id_target != agent_id_) {
    std::cerr << "[agent " << agent_id_ << "] mission " << validated.mission_id << " targets "
              << validated.agent_id_target << "; loading anyway\n";
  }

  mission_ = std::move(validated);
  cooldown_ledger_.clear();
  previous_value_.reset();
  state_ = model::agent_state::MONITORING;

  std::cerr << "[agent " << agent_id_ << "] mission '" << mission_->function_name << "' (" << mission_->mission_id
            << ") loaded with " << mission_->triggers.size() << " triggers over " << transport_->name() << '\n';
  for (const auto& trigger : mission_->triggers) {
    const bool change = trigger.condition.subject == model::condition_subject::CHANGE_PERCENT;
    std::cerr << "[agent " << agent_id_ << "]   " << trigger.trigger_name << ": "
              << (change ? "change_percent " : "value ") << model::to_string(trigger.condition.op) << ' '
              << trigger.condition.threshold << " -> " << trigger.report_level << " (cooldown "
              << trigger.cooldown_seconds << "s)\n";
  }
}

void MissionAgent::unload() noexcept {
  if (mission_.has_value()) {
    std::cerr << "[agent " << agent_id_ << "] mission " << mission_->mission_id << " unloaded from "
              << model::to_string(state_) << '\n';
  }
  mission_.reset();
  cooldown_ledger_.clear();
  previous_value_.reset();
  state_ = model::agent_state::IDLE;
}

void MissionAgent::add_sink(std::unique_ptr<sinks::ReportSink> sink) {
  if (sink != nullptr) {
    sinks_.push_back(SinkSlot{std::move(sink), true});
  }
}

std::optional<std::int64_t> MissionAgent::last_fired(const std::string& trigger_name) const {
  const auto it = cooldown_ledger_.find(trigger_name);
  if (it == cooldown_ledger_.end()) {
    return std::nullopt;
  }
  return it->second;
}

CycleResult MissionAgent::run_cycle() {
  CycleResult result{};
  if (state_ != model::agent_state::MONITORING || !mission_.has_value()) {
    return result;
  }

  ++stats_.cycles_executed;
  const std::int64_t now = clock_();

  double current = 0.0;
  try {
    current = sensor_->read(mission_->value_to_monitor);
  } catch (const std::exception& ex) {
    // Any reader fault counts as an unavailable sensor.
    ++stats_.sensor_failures;
    std::cerr << "[agent " << agent_id_ << "] " << ex.what() << "; skipping cycle\n";
    result.outcome = cycle_outcome::SENSOR_UNAVAILABLE;
    return result;
  }
  result.sample = current;
  result.outcome = cycle_outcome::QUIET;

  // Declared order is the tie-break: the first firing trigger ends the cycle.
  for (const auto& trigger : mission_->triggers) {
    if (!cooldown_passed(trigger, now)) {
      ++stats_.cooldown_skips;
      continue;
    }
    if (!mission::condition_met(trigger.condition, current, previous_value_)) {
      continue;
    }
    result.outcome = report_event(trigger, current, now, result);
    break;
  }

  previous_value_ = current;
  return result;
}

bool MissionAgent::cooldown_passed(const model::TriggerSpec& trigger, const std::int64_t now) const {
  const auto it = cooldown_ledger_.find(trigger.trigger_name);
  if (it == cooldown_ledger_.end()) {
    return true;
  }
  return static_cast<double>(now - it->second) > trigger.cooldown_seconds;
}

cycle_outcome MissionAgent::report_event(const model::TriggerSpec& trigger, const double value,
                                         const std::int64_t now, CycleResult& result) {
  state_ = model::agent_state::REPORTING;

  model::ReportPacket report{};
  report.timestamp = now;
  report.agent_id = agent_id_;
  report.mission_id = mission_->mission_id;
  report.trigger_fired = trigger.trigger_name;
  report.report_level = trigger.report_level;
  report.measured_value = value;
  report.mission_function = mission_->function_name;

  bool sent = false;
  try {
    const comms::Envelope envelope = gateway_->forward(model::report_to_json(report).dump(), destination_);
    sent = transport_->send(envelope, mission_->communication.target);
    if (!sent) {
      std::cerr << "[agent " << agent_id_ << "] " << transport_->name() << " send failed for '"
                << trigger.trigger_name << "'; retrying next cycle\n";
    }
  } catch (const std::exception& ex) {
    sent = false;
    std::cerr << "[agent " << agent_id_ << "] report '" << trigger.trigger_name << "' not sent: " << ex.what()
              << "; retrying next cycle\n";
  }

  if (sent) {
    cooldown_ledger_[trigger.trigger_name] = now;
    ++stats_.reports_sent;
    publish_sinks(report);
    std::cerr << "[agent " << agent_id_ << "] event '" << trigger.trigger_name << "' reported at "
              << trigger.report_level << " (value=" << value << ")\n";
  } else {
    ++stats_.send_failures;
  }

  result.report = std::move(report);
  state_ = model::agent_state::MONITORING;
  return sent ? cycle_outcome::REPORTED : cycle_outcome::SEND_FAILED;
}

void MissionAgent::publish_sinks(const model::ReportPacket& report) {
  for (auto& slot : sinks_) {
    bool ok = false;
    try {
      ok = slot.sink->publish(report);
    } catch (const std::exception& ex) {
      if (slot.was_ok) {
        std::cerr << "[" << slot.sink->name() << "] " << ex.what() << '\n';
      }
    }
    if (!ok && slot.was_ok) {
      std::cerr << "[" << slot.sink->name() << "] publish failed\n";
    } else if (ok && !slot.was_ok) {
      std::cerr << "[" << slot.sink->name() << "] publish recovered\n";
    }
    slot.was_ok = ok;
  }
}

}  // namespace mission_agent::core
