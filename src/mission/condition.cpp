#include "mission/condition.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

namespace mission_agent::mission {

namespace {

void skip_spaces(std::string_view text, std::size_t& pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
}

std::string_view read_identifier(std::string_view text, std::size_t& pos) {
  const std::size_t begin = pos;
  while (pos < text.size() &&
         (std::isalnum(static_cast<unsigned char>(text[pos])) != 0 || text[pos] == '_')) {
    ++pos;
  }
  return text.substr(begin, pos - begin);
}

std::optional<model::comparison_op> read_operator(std::string_view text, std::size_t& pos) {
  if (pos >= text.size()) {
    return std::nullopt;
  }

  const char first = text[pos];
  const bool has_equal = pos + 1 < text.size() && text[pos + 1] == '=';
  switch (first) {
    case '<':
      pos += has_equal ? 2 : 1;
      return has_equal ? model::comparison_op::LESS_EQUAL : model::comparison_op::LESS;
    case '>':
      pos += has_equal ? 2 : 1;
      return has_equal ? model::comparison_op::GREATER_EQUAL : model::comparison_op::GREATER;
    case '=':
      if (!has_equal) {
        return std::nullopt;
      }
      pos += 2;
      return model::comparison_op::EQUAL;
    default:
      return std::nullopt;
  }
}

std::optional<double> read_number(std::string_view text, std::size_t& pos) {
  const std::size_t begin = pos;
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) == 0) {
    ++pos;
  }
  if (pos == begin) {
    return std::nullopt;
  }

  const std::string token(text.substr(begin, pos - begin));
  char* end = nullptr;
  const double parsed = std::strtod(token.c_str(), &end);
  if (end != token.c_str() + token.size() || !std::isfinite(parsed)) {
    return std::nullopt;
  }
  return parsed;
}

bool compare(const model::comparison_op op, const double lhs, const double rhs) noexcept {
  switch (op) {
    case model::comparison_op::LESS:
      return lhs < rhs;
    case model::comparison_op::GREATER:
      return lhs > rhs;
    case model::comparison_op::LESS_EQUAL:
      return lhs <= rhs;
    case model::comparison_op::GREATER_EQUAL:
      return lhs >= rhs;
    case model::comparison_op::EQUAL:
      return lhs == rhs;
  }
  return false;
}

}  // namespace

std::optional<model::Condition> parse_condition(const std::string_view text) {
  std::size_t pos = 0;
  skip_spaces(text, pos);

  model::Condition condition{};
  const std::string_view subject = read_identifier(text, pos);
  if (subject == "value") {
    condition.subject = model::condition_subject::VALUE;
  } else if (subject == "change_percent") {
    condition.subject = model::condition_subject::CHANGE_PERCENT;
  } else {
    return std::nullopt;
  }

  skip_spaces(text, pos);
  const auto op = read_operator(text, pos);
  if (!op.has_value()) {
    return std::nullopt;
  }
  if (condition.subject == model::condition_subject::CHANGE_PERCENT && *op != model::comparison_op::GREATER) {
    return std::nullopt;
  }
  condition.op = *op;

  skip_spaces(text, pos);
  const auto threshold = read_number(text, pos);
  if (!threshold.has_value()) {
    return std::nullopt;
  }
  condition.threshold = *threshold;

  skip_spaces(text, pos);
  if (pos != text.size()) {
    return std::nullopt;
  }
  return condition;
}

bool condition_met(const model::Condition& condition, const double current,
                   const std::optional<double> previous) noexcept {
  if (!std::isfinite(current)) {
    return false;
  }

  if (condition.subject == model::condition_subject::VALUE) {
    return compare(condition.op, current, condition.threshold);
  }

  if (!previous.has_value() || *previous == 0.0 || !std::isfinite(*previous)) {
    return false;
  }
  const double change_percent = std::fabs((current - *previous) / *previous) * 100.0;
  if (!std::isfinite(change_percent)) {
    return false;
  }
  return compare(condition.op, change_percent, condition.threshold);
}

}  // namespace mission_agent::mission
