#pragma once

#include "model/report.hpp"

namespace mission_agent::sinks {

// Downstream consumer of emitted reports (dashboards, monitoring).
class ReportSink {
 public:
  virtual const char* name() const = 0;
  virtual bool publish(const model::ReportPacket& report) = 0;
  virtual ~ReportSink() = default;
};

}  // namespace mission_agent::sinks
