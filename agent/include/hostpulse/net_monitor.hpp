#pragma once

#include <utility>

#include "hostpulse/host_provider.hpp"
#include "hostpulse/monitor.hpp"
#include "hostpulse/net_registry.hpp"
#include "hostpulse/rate.hpp"

namespace hostpulse {
class NetMonitor : public Monitor {
 public:
  NetMonitor(HostProvider& provider, NetRegistry& registry, ClockFn clock,
             double anomaly_threshold_mb)
      : _provider(provider),
        _registry(registry),
        _clock(std::move(clock)),
        _anomaly_threshold_mb(anomaly_threshold_mb) {}
  void update(proto::SystemInfo* info, proto::SystemStats* stats) override;

 private:
  HostProvider& _provider;
  NetRegistry& _registry;
  ClockFn _clock;
  double _anomaly_threshold_mb;
};

}  // namespace hostpulse
