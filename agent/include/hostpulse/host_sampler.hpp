#pragma once

#include <memory>
#include <vector>

#include "hostpulse.pb.h"
#include "hostpulse/fs_registry.hpp"
#include "hostpulse/host_provider.hpp"
#include "hostpulse/monitor.hpp"
#include "hostpulse/net_registry.hpp"
#include "hostpulse/rate.hpp"
#include "util/config.hpp"

namespace hostpulse {

class HostSampler {
 public:
  HostSampler(HostProvider& provider, FsRegistry& fs_registry,
              NetRegistry& net_registry, const AgentConfig& config,
              ClockFn clock = steady_now);

  // 采集一次主机指标，任何单项失败都不会让整体失败
  void sample(proto::SystemInfo* info, proto::SystemStats* stats);

 private:
  std::vector<std::unique_ptr<Monitor>> _monitors;
  // 上一周期的结果，失败的单项沿用旧值
  proto::SystemStats _last_stats;
};

}  // namespace hostpulse
