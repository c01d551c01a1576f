#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>

#include "sensors/sensor.hpp"

namespace mission_agent::sensors {

enum class simulation_scenario : std::uint8_t {
  NORMAL = 0,
  OVERLOAD = 1,
  VOLTAGE_DROP = 2,
  BAD_POWER_QUALITY = 3,
};

std::optional<simulation_scenario> parse_scenario(std::string_view text);

// Substation feeder readings with Gaussian noise around nominal values.
class ElectricalSimulator final : public SensorReader {
 public:
  struct Reading {
    double voltage_rms{0.0};
    double current_rms{0.0};
    double active_power{0.0};
    double power_factor{0.0};
    double frequency{0.0};
    double thd_voltage{0.0};
    double thd_current{0.0};
  };

  // seed == 0 seeds from std::random_device.
  explicit ElectricalSimulator(simulation_scenario scenario = simulation_scenario::NORMAL, std::uint64_t seed = 0);

  void set_scenario(simulation_scenario scenario) noexcept;
  simulation_scenario scenario() const noexcept;

  Reading generate();

  // Known quantities: voltage_rms, current_rms, active_power, power_factor,
  // frequency, thd_voltage, thd_current. Anything else reads uniform 0..100.
  double read(const std::string& quantity) override;

 private:
  double gauss(double mean, double stddev);
  double uniform(double low, double high);

  simulation_scenario scenario_{simulation_scenario::NORMAL};
  std::mt19937_64 rng_;
};

}  // namespace mission_agent::sensors
