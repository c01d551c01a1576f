#include "sensors/electrical_simulator.hpp"

namespace mission_agent::sensors {

std::optional<simulation_scenario> parse_scenario(const std::string_view text) {
  if (text == "normal") {
    return simulation_scenario::NORMAL;
  }
  if (text == "overload") {
    return simulation_scenario::OVERLOAD;
  }
  if (text == "voltage_drop") {
    return simulation_scenario::VOLTAGE_DROP;
  }
  if (text == "bad_power_quality") {
    return simulation_scenario::BAD_POWER_QUALITY;
  }
  return std::nullopt;
}

ElectricalSimulator::ElectricalSimulator(const simulation_scenario scenario, const std::uint64_t seed)
    : scenario_(scenario), rng_(seed != 0 ? seed : std::random_device{}()) {}

void ElectricalSimulator::set_scenario(const simulation_scenario scenario) noexcept { scenario_ = scenario; }

simulation_scenario ElectricalSimulator::scenario() const noexcept { return scenario_; }

double ElectricalSimulator::gauss(const double mean, const double stddev) {
  std::normal_distribution<double> distribution(mean, stddev);
  return distribution(rng_);
}

double ElectricalSimulator::uniform(const double low, const double high) {
  std::uniform_real_distribution<double> distribution(low, high);
  return distribution(rng_);
}

ElectricalSimulator::Reading ElectricalSimulator::generate() {
  Reading reading{};
  reading.voltage_rms = gauss(234.0, 1.2);
  reading.current_rms = gauss(9.5, 0.5);
  reading.power_factor = gauss(0.99, 0.01);
  reading.frequency = gauss(49.95, 0.04);
  reading.thd_voltage = gauss(3.2, 0.5);
  reading.thd_current = gauss(4.7, 0.6);

  switch (scenario_) {
    case simulation_scenario::OVERLOAD:
      reading.current_rms *= uniform(1.5, 2.0);
      break;
    case simulation_scenario::VOLTAGE_DROP:
      reading.voltage_rms *= uniform(0.85, 0.93);
      break;
    case simulation_scenario::BAD_POWER_QUALITY:
      reading.thd_voltage *= uniform(2.0, 3.0);
      reading.thd_current *= uniform(2.0, 3.0);
      break;
    case simulation_scenario::NORMAL:
      break;
  }

  reading.active_power = reading.voltage_rms * reading.current_rms * uniform(0.97, 1.01);
  return reading;
}

double ElectricalSimulator::read(const std::string& quantity) {
  if (quantity == "voltage_rms") {
    return generate().voltage_rms;
  }
  if (quantity == "current_rms") {
    return generate().current_rms;
  }
  if (quantity == "active_power") {
    return generate().active_power;
  }
  if (quantity == "power_factor") {
    return generate().power_factor;
  }
  if (quantity == "frequency") {
    return generate().frequency;
  }
  if (quantity == "thd_voltage") {
    return generate().thd_voltage;
  }
  if (quantity == "thd_current") {
    return generate().thd_current;
  }
  return uniform(0.0, 100.0);
}

}  // namespace mission_agent::sensors
