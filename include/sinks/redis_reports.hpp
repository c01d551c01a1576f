#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sinks/report_sink.hpp"

struct redisContext;

namespace mission_agent::sinks {

struct RedisReportOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string stream{"mission:reports"};
  // Approximate stream cap passed as XADD MAXLEN ~; 0 disables trimming.
  std::uint32_t max_len{10000};
  std::uint32_t connect_timeout_ms{1000};
};

// Appends every report to a Redis stream as one XADD entry.
class RedisReportSink final : public ReportSink {
 public:
  explicit RedisReportSink(RedisReportOptions options = {});
  ~RedisReportSink() override;

  RedisReportSink(const RedisReportSink&) = delete;
  RedisReportSink& operator=(const RedisReportSink&) = delete;
  RedisReportSink(RedisReportSink&&) noexcept;
  RedisReportSink& operator=(RedisReportSink&&) noexcept;

  const char* name() const override { return "redis"; }
  bool check_connectivity();
  bool publish(const model::ReportPacket& report) override;

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool publish_impl(const model::ReportPacket& report);

  RedisReportOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
};

}  // namespace mission_agent::sinks
