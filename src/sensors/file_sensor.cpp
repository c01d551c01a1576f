#include "sensors/file_sensor.hpp"

#include <cmath>
#include <cstdlib>
#include <utility>

#include "core/errors.hpp"

namespace mission_agent::sensors {

FileSensor::FileSensor(std::string path, const double scale) : path_(std::move(path)), owns_file_(true), scale_(scale) {}

FileSensor::FileSensor(std::FILE* file, const double scale, const bool owns_file)
    : path_("<injected>"), file_(file), owns_file_(owns_file), scale_(scale) {}

FileSensor::~FileSensor() {
  if (owns_file_ && file_ != nullptr) {
    std::fclose(file_);
  }
}

double FileSensor::read(const std::string& quantity) {
  if (file_ == nullptr) {
    file_ = std::fopen(path_.c_str(), "r");
    if (file_ == nullptr) {
      throw SensorUnavailable("cannot open " + path_ + " for " + quantity);
    }
  }

  // sysfs attributes must be re-read from offset 0 to refresh.
  if (std::fseek(file_, 0L, SEEK_SET) != 0) {
    throw SensorUnavailable("cannot rewind " + path_);
  }

  char buffer[kReadBufferSize]{};
  if (std::fgets(buffer, sizeof(buffer), file_) == nullptr) {
    std::clearerr(file_);
    throw SensorUnavailable("no data in " + path_ + " for " + quantity);
  }

  char* end = nullptr;
  const double parsed = std::strtod(buffer, &end);
  if (end == buffer || !std::isfinite(parsed)) {
    throw SensorUnavailable(path_ + " does not hold a number");
  }
  return parsed * scale_;
}

}  // namespace mission_agent::sensors
