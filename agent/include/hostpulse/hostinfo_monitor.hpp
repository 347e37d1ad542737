#pragma once

#include <string>

#include "hostpulse/host_provider.hpp"
#include "hostpulse/monitor.hpp"

namespace hostpulse {

class HostInfoMonitor : public Monitor {
 public:
  explicit HostInfoMonitor(HostProvider& provider) : _provider(provider) {}
  ~HostInfoMonitor() override = default;

  void update(proto::SystemInfo* info, proto::SystemStats* stats) override;

 private:
  /**
   * 物理核心数与逻辑线程数
   * 容器内逻辑线程数受资源限制，可能小于物理核心数，
   * 此时以逻辑线程数作为核心数，threads 不填
   */
  void update_cpu_counts(proto::SystemInfo* info);

  HostProvider& _provider;
};

}  // namespace hostpulse
