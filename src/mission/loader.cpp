#include "mission/loader.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "core/errors.hpp"
#include "mission/condition.hpp"

namespace mission_agent::mission {

namespace {

std::string require_string(const nlohmann::json& object, const char* key, const std::string& context) {
  const auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    throw InvalidMission(context + " requires string \"" + key + "\"");
  }
  return it->get<std::string>();
}

std::string optional_string(const nlohmann::json& object, const char* key, const std::string& context) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return {};
  }
  if (!it->is_string()) {
    throw InvalidMission(context + " field \"" + key + "\" must be a string");
  }
  return it->get<std::string>();
}

model::TriggerSpec parse_trigger(const nlohmann::json& value, const std::size_t index) {
  const std::string context = "trigger #" + std::to_string(index);
  if (!value.is_object()) {
    throw InvalidMission(context + " must be an object");
  }

  model::TriggerSpec trigger{};
  trigger.trigger_name = require_string(value, "trigger_name", context);
  trigger.condition_text = require_string(value, "condition", context);
  trigger.report_level = require_string(value, "report_level", context);

  const auto cooldown = value.find("cooldown_seconds");
  if (cooldown != value.end()) {
    if (!cooldown->is_number()) {
      throw InvalidMission(context + " field \"cooldown_seconds\" must be a number");
    }
    trigger.cooldown_seconds = cooldown->get<double>();
  }
  return trigger;
}

}  // namespace

model::MissionProfile parse_mission(const nlohmann::json& value) {
  if (!value.is_object()) {
    throw InvalidMission("mission profile must be a JSON object");
  }

  model::MissionProfile profile{};
  profile.mission_id = require_string(value, "mission_id", "mission");
  const std::string context = "mission " + profile.mission_id;
  profile.function_name = require_string(value, "function_name", context);
  profile.agent_id_target = optional_string(value, "agent_id_target", context);

  if (const auto it = value.find("priority"); it != value.end()) {
    if (!it->is_number_integer()) {
      throw InvalidMission(context + " field \"priority\" must be an integer");
    }
    const bool in_range =
        it->is_number_unsigned()
            ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            : it->get<std::int64_t>() >= std::numeric_limits<int>::min() &&
                  it->get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!in_range) {
      throw InvalidMission(context + " field \"priority\" is out of range");
    }
    profile.priority = it->get<int>();
  }

  if (const auto it = value.find("active"); it != value.end()) {
    if (!it->is_boolean()) {
      throw InvalidMission(context + " field \"active\" must be a boolean");
    }
    profile.active = it->get<bool>();
  }

  const auto parameters = value.find("parameters");
  if (parameters == value.end() || !parameters->is_object()) {
    throw InvalidMission(context + " requires a \"parameters\" object");
  }
  profile.parameters = *parameters;
  profile.value_to_monitor = optional_string(*parameters, "value_to_monitor", context);

  const auto interval = parameters->find("monitoring_interval_seconds");
  if (interval == parameters->end() || !interval->is_number()) {
    throw InvalidMission(context + " requires numeric \"monitoring_interval_seconds\"");
  }
  profile.monitoring_interval_seconds = interval->get<double>();

  const auto triggers = value.find("triggers");
  if (triggers == value.end() || !triggers->is_array()) {
    throw InvalidMission(context + " requires a \"triggers\" array");
  }
  for (std::size_t i = 0; i < triggers->size(); ++i) {
    profile.triggers.push_back(parse_trigger((*triggers)[i], i));
  }

  if (const auto it = value.find("communication"); it != value.end()) {
    if (!it->is_object()) {
      throw InvalidMission(context + " field \"communication\" must be an object");
    }
    profile.communication.protocol = optional_string(*it, "protocol", context);
    profile.communication.target = optional_string(*it, "target", context);
  }

  return validated_mission(std::move(profile));
}

model::MissionProfile validated_mission(model::MissionProfile profile) {
  const std::string context = "mission " + profile.mission_id;

  if (profile.value_to_monitor.empty()) {
    throw InvalidMission(context + " does not name a value_to_monitor");
  }
  if (!std::isfinite(profile.monitoring_interval_seconds) || profile.monitoring_interval_seconds <= 0.0) {
    throw InvalidMission(context + " monitoring_interval_seconds must be greater than 0");
  }
  // Frame lines are space-separated, so the target must be a single token.
  const auto& target = profile.communication.target;
  if (std::any_of(target.begin(), target.end(), [](unsigned char c) { return std::isspace(c) != 0; })) {
    throw InvalidMission(context + " communication target \"" + target + "\" contains whitespace");
  }
  if (profile.triggers.empty()) {
    throw InvalidMission(context + " has no triggers");
  }

  std::unordered_set<std::string> names;
  for (auto& trigger : profile.triggers) {
    if (trigger.trigger_name.empty()) {
      throw InvalidMission(context + " has a trigger without a name");
    }
    if (!names.insert(trigger.trigger_name).second) {
      throw InvalidMission(context + " declares trigger \"" + trigger.trigger_name + "\" more than once");
    }
    if (!std::isfinite(trigger.cooldown_seconds) || trigger.cooldown_seconds < 0.0) {
      throw InvalidMission(context + " trigger \"" + trigger.trigger_name + "\" has a negative cooldown");
    }

    const auto condition = parse_condition(trigger.condition_text);
    if (!condition.has_value()) {
      throw InvalidMission(context + " trigger \"" + trigger.trigger_name + "\" has malformed condition \"" +
                           trigger.condition_text + "\"");
    }
    trigger.condition = *condition;
  }

  return profile;
}

std::vector<model::MissionProfile> load_missions(const std::string& path) {
  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open mission file: " + path);
  }

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(input);
  } catch (const nlohmann::json::parse_error& ex) {
    throw InvalidMission(path + " is not valid JSON: " + ex.what());
  }

  std::vector<model::MissionProfile> missions;
  if (document.is_array()) {
    for (const auto& entry : document) {
      missions.push_back(parse_mission(entry));
    }
  } else {
    missions.push_back(parse_mission(document));
  }
  return missions;
}

}  // namespace mission_agent::mission
