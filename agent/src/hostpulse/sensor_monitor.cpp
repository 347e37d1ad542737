#include "hostpulse/sensor_monitor.hpp"

#include <string>
#include <vector>

#include "hostpulse/rate.hpp"
#include "util/logging.hpp"

namespace hostpulse {

void SensorMonitor::update(proto::SystemInfo* info, proto::SystemStats* stats) {
  std::vector<SensorReading> readings;
  if (!_provider.temperatures(&readings)) {
    agent_log().debug("Error getting temperatures");
    return;
  }
  auto* temps = stats->mutable_temperatures();
  temps->clear();
  for (size_t i = 0; i < readings.size(); ++i) {
    const auto& reading = readings[i];
    // 同名传感器追加序号，不覆盖
    std::string key = reading.sensor_key;
    if (temps->count(key) > 0) {
      key += "_" + std::to_string(i);
    }
    (*temps)[key] = two_decimals(reading.temperature);
  }
  agent_log().debug("Temperatures: {} sensors", temps->size());
}

}  // namespace hostpulse
