#pragma once

#include <cstddef>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "comms/gateway.hpp"
#include "orchestrator/orchestrator.hpp"

namespace mission::inbox {

struct Frame {
  std::string link;
  std::string target;
  std::string protocol;
  std::size_t index{0};
  std::size_t count{0};
  std::string chunk;
};

// Parses "[<link>] <target> <protocol> <i>/<n> <chunk>". Lines from other
// writers (unknown link tag) yield std::nullopt; malformed frames throw
// std::invalid_argument.
std::optional<Frame> parse_frame_line(const std::string& line);

// Reassembles transport frames, opens envelopes and hands the reports to the
// orchestrator, writing one JSON result per report.
class Inbox {
 public:
  Inbox(std::shared_ptr<const mission_agent::comms::CommunicationsGateway> gateway,
        mission_agent::orchestrator::MissionOrchestrator& orchestrator);

  int run(std::istream& in, std::ostream& out, std::ostream& err);

  // Returns the result once the frame completes its envelope.
  std::optional<nlohmann::json> accept(const Frame& frame);

 private:
  struct Pending {
    std::size_t next_index{1};
    std::size_t count{0};
    std::string payload;
  };

  nlohmann::json deliver(const Frame& last, const std::string& payload);

  std::shared_ptr<const mission_agent::comms::CommunicationsGateway> gateway_;
  mission_agent::orchestrator::MissionOrchestrator& orchestrator_;
  std::map<std::string, Pending> pending_;
};

}  // namespace mission::inbox
