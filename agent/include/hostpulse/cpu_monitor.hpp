#pragma once

#include "hostpulse/host_provider.hpp"
#include "hostpulse/monitor.hpp"

namespace hostpulse {
class CpuMonitor : public Monitor {
 public:
  explicit CpuMonitor(HostProvider& provider) : _provider(provider) {}
  void update(proto::SystemInfo* info, proto::SystemStats* stats) override;

 private:
  HostProvider& _provider;
};
}  // namespace hostpulse
