#pragma once

#include <cstdio>
#include <string>

#include "sensors/sensor.hpp"

namespace mission_agent::sensors {

// Reads one numeric value per sample from a sysfs-style file, e.g.
// /sys/class/hwmon/hwmon0/in1_input with scale 0.001 for millivolts.
class FileSensor final : public SensorReader {
 public:
  explicit FileSensor(std::string path, double scale = 1.0);
  FileSensor(std::FILE* file, double scale, bool owns_file = false);
  ~FileSensor() override;

  FileSensor(const FileSensor&) = delete;
  FileSensor& operator=(const FileSensor&) = delete;

  double read(const std::string& quantity) override;

 private:
  static constexpr std::size_t kReadBufferSize = 64;

  std::string path_{};
  std::FILE* file_{nullptr};
  bool owns_file_{true};
  double scale_{1.0};
};

}  // namespace mission_agent::sensors
