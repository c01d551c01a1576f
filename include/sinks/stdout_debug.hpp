#pragma once

#include <cstdio>

#include "sinks/report_sink.hpp"

namespace mission_agent::sinks {

class StdoutDebugSink final : public ReportSink {
 public:
  explicit StdoutDebugSink(std::FILE* out = stdout) noexcept : out_(out) {}

  const char* name() const override { return "stdout"; }
  bool publish(const model::ReportPacket& report) override;

 private:
  std::FILE* out_{nullptr};
};

}  // namespace mission_agent::sinks
