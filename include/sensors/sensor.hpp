#pragma once

#include <string>

namespace mission_agent::sensors {

class SensorReader {
 public:
  // Returns the current reading for `quantity`; throws SensorUnavailable.
  virtual double read(const std::string& quantity) = 0;
  virtual ~SensorReader() = default;
};

}  // namespace mission_agent::sensors
