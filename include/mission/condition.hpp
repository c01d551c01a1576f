#pragma once

#include <optional>
#include <string_view>

#include "model/mission.hpp"

namespace mission_agent::mission {

// Closed-form parser for trigger conditions. Accepted forms:
//   value <op> <number>          op in {<, >, <=, >=, ==}
//   change_percent > <number>
// Whitespace between tokens is optional. Returns std::nullopt for anything else.
std::optional<model::Condition> parse_condition(std::string_view text);

// Evaluates a direct-value condition, or a change_percent condition against
// `previous`. Missing or zero baselines and non-finite arithmetic are "not met".
[[nodiscard]] bool condition_met(const model::Condition& condition, double current,
                                 std::optional<double> previous) noexcept;

}  // namespace mission_agent::mission
