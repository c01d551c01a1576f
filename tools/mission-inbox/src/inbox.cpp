#include "inbox/inbox.hpp"

#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "model/report.hpp"
#include "transports/transport.hpp"

namespace mission::inbox {

namespace {

std::size_t parse_count(const std::string& text) {
  std::size_t consumed = 0;
  const unsigned long long value = std::stoull(text, &consumed);
  if (consumed != text.size() || value == 0) {
    throw std::invalid_argument("bad fragment number \"" + text + "\"");
  }
  return static_cast<std::size_t>(value);
}

}  // namespace

std::optional<Frame> parse_frame_line(const std::string& line) {
  if (line.empty() || line.front() != '[') {
    return std::nullopt;
  }
  const auto close = line.find(']');
  if (close == std::string::npos) {
    return std::nullopt;
  }

  Frame frame{};
  frame.link = line.substr(1, close - 1);
  if (!mission_agent::transports::parse_transport_kind(frame.link).has_value()) {
    return std::nullopt;
  }

  std::istringstream fields(line.substr(close + 1));
  std::string sequence;
  if (!(fields >> frame.target >> frame.protocol >> sequence)) {
    throw std::invalid_argument("truncated " + frame.link + " frame");
  }

  const auto slash = sequence.find('/');
  if (slash == std::string::npos) {
    throw std::invalid_argument("frame sequence must be <index>/<count>");
  }
  frame.index = parse_count(sequence.substr(0, slash));
  frame.count = parse_count(sequence.substr(slash + 1));
  if (frame.index > frame.count) {
    throw std::invalid_argument("frame index exceeds count");
  }

  // Chunk is everything after the single separator space.
  const auto position = fields.tellg();
  if (position != std::streampos(-1)) {
    const std::string rest = line.substr(close + 1 + static_cast<std::size_t>(position));
    frame.chunk = rest.empty() ? rest : rest.substr(1);
  }
  return frame;
}

Inbox::Inbox(std::shared_ptr<const mission_agent::comms::CommunicationsGateway> gateway,
             mission_agent::orchestrator::MissionOrchestrator& orchestrator)
    : gateway_(std::move(gateway)), orchestrator_(orchestrator) {
  if (gateway_ == nullptr) {
    throw std::invalid_argument("inbox requires a gateway");
  }
}

int Inbox::run(std::istream& in, std::ostream& out, std::ostream& err) {
  std::size_t failures = 0;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }

    try {
      const auto frame = parse_frame_line(line);
      if (!frame.has_value()) {
        continue;
      }
      const auto result = accept(*frame);
      if (result.has_value()) {
        out << result->dump() << '\n';
        out.flush();
      }
    } catch (const std::exception& ex) {
      ++failures;
      err << "mission-inbox: dropped frame: " << ex.what() << '\n';
    }
  }

  for (const auto& [key, pending] : pending_) {
    err << "mission-inbox: incomplete envelope " << key << " (" << (pending.next_index - 1) << "/" << pending.count
        << " frames)\n";
  }
  return failures == 0 && pending_.empty() ? 0 : 2;
}

std::optional<nlohmann::json> Inbox::accept(const Frame& frame) {
  const std::string key = frame.link + " " + frame.target + " " + frame.protocol;

  if (frame.index == 1) {
    // A new first fragment discards whatever was left half-received.
    pending_[key] = Pending{1, frame.count, {}};
  }

  const auto it = pending_.find(key);
  if (it == pending_.end()) {
    throw std::invalid_argument("fragment " + std::to_string(frame.index) + " without a first fragment");
  }

  Pending& pending = it->second;
  if (frame.index != pending.next_index || frame.count != pending.count) {
    pending_.erase(it);
    throw std::invalid_argument("out-of-order fragment for " + key);
  }

  pending.payload += frame.chunk;
  ++pending.next_index;
  if (frame.index < frame.count) {
    return std::nullopt;
  }

  const std::string payload = std::move(pending.payload);
  pending_.erase(it);
  return deliver(frame, payload);
}

nlohmann::json Inbox::deliver(const Frame& last, const std::string& payload) {
  const mission_agent::comms::Envelope envelope{last.protocol, payload};
  const std::string body = gateway_->receive(envelope);

  nlohmann::json parsed;
  try {
    parsed = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error& ex) {
    throw std::invalid_argument(std::string("report is not JSON: ") + ex.what());
  }
  const auto report = mission_agent::model::report_from_json(parsed);

  const auto actions = orchestrator_.handle_incoming_report(report);
  nlohmann::json action_names = nlohmann::json::array();
  for (const auto action : actions) {
    action_names.push_back(mission_agent::orchestrator::to_string(action));
  }

  const auto record = orchestrator_.record(report.agent_id);
  nlohmann::json result = mission_agent::model::report_to_json(report);
  result["link"] = last.link;
  result["protocol"] = last.protocol;
  result["status"] = record.has_value() ? record->last_status : std::string{};
  result["actions"] = std::move(action_names);
  return result;
}

}  // namespace mission::inbox
