#include "sinks/redis_reports.hpp"

#include <iostream>
#include <string>
#include <utility>

#include <hiredis/hiredis.h>

namespace mission_agent::sinks {
namespace {

constexpr std::size_t kMaxCommandArgCount = 6 + (8 * 2);

}  // namespace

RedisReportSink::RedisReportSink(RedisReportOptions options) : options_(std::move(options)) {
  command_args_.reserve(kMaxCommandArgCount);
  command_argv_.reserve(kMaxCommandArgCount);
  command_argv_len_.reserve(kMaxCommandArgCount);
}

RedisReportSink::~RedisReportSink() = default;

RedisReportSink::RedisReportSink(RedisReportSink&&) noexcept = default;
RedisReportSink& RedisReportSink::operator=(RedisReportSink&&) noexcept = default;

void RedisReportSink::ContextDeleter::operator()(redisContext* context) const {
  if (context != nullptr) {
    redisFree(context);
  }
}

bool RedisReportSink::check_connectivity() { return ensure_connected(); }

bool RedisReportSink::ensure_connected() {
  if (context_ != nullptr && context_->err == REDIS_OK) {
    return true;
  }
  return reconnect();
}

bool RedisReportSink::reconnect() {
  context_.reset();

  timeval timeout{};
  timeout.tv_sec = static_cast<time_t>(options_.connect_timeout_ms / 1000);
  timeout.tv_usec = static_cast<suseconds_t>((options_.connect_timeout_ms % 1000) * 1000);

  redisContext* raw = nullptr;
  if (!options_.unix_socket.empty()) {
    raw = redisConnectUnixWithTimeout(options_.unix_socket.c_str(), timeout);
  } else {
    raw = redisConnectWithTimeout(options_.host.c_str(), static_cast<int>(options_.port), timeout);
  }
  if (raw == nullptr || raw->err != REDIS_OK) {
    if (raw != nullptr) {
      std::cerr << "[redis] connect failed: " << raw->errstr << '\n';
      redisFree(raw);
    } else {
      std::cerr << "[redis] connect failed: out of memory\n";
    }
    return false;
  }

  context_.reset(raw);
  if (!authenticate() || !select_db()) {
    context_.reset();
    return false;
  }
  return true;
}

bool RedisReportSink::authenticate() {
  if (options_.password.empty()) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "AUTH %s", options_.password.c_str()));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok) {
    std::cerr << "[redis] AUTH rejected\n";
  }
  freeReplyObject(reply);
  return ok;
}

bool RedisReportSink::select_db() {
  if (options_.db == 0) {
    return true;
  }

  redisReply* reply = static_cast<redisReply*>(redisCommand(context_.get(), "SELECT %d", options_.db));
  if (reply == nullptr) {
    return false;
  }
  const bool ok = reply->type != REDIS_REPLY_ERROR;
  freeReplyObject(reply);
  return ok;
}

bool RedisReportSink::publish(const model::ReportPacket& report) {
  if (!ensure_connected()) {
    return false;
  }

  if (publish_impl(report)) {
    return true;
  }

  if (!reconnect()) {
    return false;
  }
  return publish_impl(report);
}

bool RedisReportSink::publish_impl(const model::ReportPacket& report) {
  command_args_.clear();
  command_argv_.clear();
  command_argv_len_.clear();

  command_args_.emplace_back("XADD");
  command_args_.push_back(options_.stream);
  if (options_.max_len > 0) {
    command_args_.emplace_back("MAXLEN");
    command_args_.emplace_back("~");
    command_args_.push_back(std::to_string(options_.max_len));
  }
  command_args_.emplace_back("*");

  const auto append_field = [&](const char* field, std::string value) {
    command_args_.emplace_back(field);
    command_args_.push_back(std::move(value));
  };

  append_field("timestamp", std::to_string(report.timestamp));
  append_field("agent_id", report.agent_id);
  append_field("mission_id", report.mission_id);
  append_field("report_level", report.report_level);
  append_field("trigger_fired", report.trigger_fired);
  append_field("measured_value", std::to_string(report.measured_value));
  append_field("mission_function", report.mission_function);

  for (const auto& arg : command_args_) {
    command_argv_.push_back(arg.c_str());
    command_argv_len_.push_back(arg.size());
  }

  redisReply* reply = static_cast<redisReply*>(redisCommandArgv(
      context_.get(), static_cast<int>(command_argv_.size()), command_argv_.data(), command_argv_len_.data()));
  if (reply == nullptr) {
    return false;
  }

  const bool ok = reply->type != REDIS_REPLY_ERROR;
  if (!ok && reply->str != nullptr) {
    std::cerr << "[redis] XADD " << options_.stream << " rejected: " << reply->str << '\n';
  }
  freeReplyObject(reply);
  return ok;
}

}  // namespace mission_agent::sinks
