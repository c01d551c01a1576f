#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "model/mission.hpp"

namespace mission_agent::mission {

// Builds a profile from its JSON form and validates it. Throws InvalidMission.
model::MissionProfile parse_mission(const nlohmann::json& value);

// Reads a mission file holding one profile object or an array of them.
// Throws InvalidMission for malformed content and std::runtime_error when the
// file cannot be opened.
std::vector<model::MissionProfile> load_missions(const std::string& path);

// Checks the load-time invariants and returns the profile with every trigger
// condition parsed from its text. Throws InvalidMission.
model::MissionProfile validated_mission(model::MissionProfile profile);

}  // namespace mission_agent::mission
