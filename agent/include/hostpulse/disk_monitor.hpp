#pragma once

#include <utility>

#include "hostpulse/fs_registry.hpp"
#include "hostpulse/host_provider.hpp"
#include "hostpulse/monitor.hpp"
#include "hostpulse/rate.hpp"

namespace hostpulse {

// 磁盘用量与磁盘 I/O 速率，状态保存在 FsRegistry 中
class DiskMonitor : public Monitor {
 public:
  DiskMonitor(HostProvider& provider, FsRegistry& registry, ClockFn clock)
      : _provider(provider), _registry(registry), _clock(std::move(clock)) {}
  void update(proto::SystemInfo* info, proto::SystemStats* stats) override;

 private:
  void update_usage(proto::SystemStats* stats);
  void update_io(proto::SystemStats* stats);

  HostProvider& _provider;
  FsRegistry& _registry;
  ClockFn _clock;
};

}  // namespace hostpulse
