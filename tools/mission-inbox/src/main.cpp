#include <iostream>
#include <memory>
#include <string>
#include <utility>

#include "comms/gateway.hpp"
#include "inbox/inbox.hpp"
#include "mission/loader.hpp"
#include "orchestrator/orchestrator.hpp"
#include "security/security_context.hpp"

// Reads transport frames on stdin. Secrets come from MISSION_AGENT_AES_KEY and
// MISSION_AGENT_SALT, which must match the sending agents. An optional mission
// file pre-assigns missions so reports land on known agents.
int main(int argc, char** argv) {
  mission_agent::orchestrator::MissionOrchestrator orchestrator;
  std::shared_ptr<const mission_agent::security::SecurityContext> security;
  try {
    security = mission_agent::security::shared_security_context();
    if (argc > 1) {
      for (auto& profile : mission_agent::mission::load_missions(argv[1])) {
        if (!profile.agent_id_target.empty()) {
          const std::string target = profile.agent_id_target;
          orchestrator.assign_mission(target, std::move(profile));
        }
      }
    }
  } catch (const std::exception& ex) {
    std::cerr << "mission-inbox: " << ex.what() << '\n';
    return 1;
  }

  mission::inbox::Inbox inbox(std::make_shared<const mission_agent::comms::CommunicationsGateway>(security),
                              orchestrator);
  return inbox.run(std::cin, std::cout, std::cerr);
}
