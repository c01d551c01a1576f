#include "sinks/stdout_debug.hpp"

#include <string>

namespace mission_agent::sinks {

bool StdoutDebugSink::publish(const model::ReportPacket& report) {
  if (out_ == nullptr) {
    return false;
  }
  const std::string body = model::report_to_json(report).dump();
  return std::fprintf(out_, "[report] %s level=%s trigger=%s value=%.3f %s\n", report.agent_id.c_str(),
                      report.report_level.c_str(), report.trigger_fired.c_str(), report.measured_value,
                      body.c_str()) >= 0;
}

}  // namespace mission_agent::sinks
