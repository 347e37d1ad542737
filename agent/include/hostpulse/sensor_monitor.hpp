#pragma once

#include "hostpulse/host_provider.hpp"
#include "hostpulse/monitor.hpp"

namespace hostpulse {
class SensorMonitor : public Monitor {
 public:
  explicit SensorMonitor(HostProvider& provider) : _provider(provider) {}
  void update(proto::SystemInfo* info, proto::SystemStats* stats) override;

 private:
  HostProvider& _provider;
};
}  // namespace hostpulse
