#include "hostpulse/host_sampler.hpp"

#include "hostpulse/cpu_monitor.hpp"
#include "hostpulse/disk_monitor.hpp"
#include "hostpulse/hostinfo_monitor.hpp"
#include "hostpulse/memory_monitor.hpp"
#include "hostpulse/net_monitor.hpp"
#include "hostpulse/sensor_monitor.hpp"
#include "hostpulse/version.hpp"

namespace hostpulse {

HostSampler::HostSampler(HostProvider& provider, FsRegistry& fs_registry,
                         NetRegistry& net_registry, const AgentConfig& config,
                         ClockFn clock) {
  // 初始化所有监控器
  _monitors.push_back(std::make_unique<CpuMonitor>(provider));
  _monitors.push_back(std::make_unique<MemoryMonitor>(provider));
  _monitors.push_back(std::make_unique<DiskMonitor>(provider, fs_registry, clock));
  _monitors.push_back(std::make_unique<NetMonitor>(provider, net_registry, clock,
                                                   config.net_anomaly_threshold_mb));
  _monitors.push_back(std::make_unique<SensorMonitor>(provider));
  _monitors.push_back(std::make_unique<HostInfoMonitor>(provider));
}

void HostSampler::sample(proto::SystemInfo* info, proto::SystemStats* stats) {
  if (!info || !stats) {
    return;
  }
  info->Clear();
  *stats = _last_stats;
  stats->clear_extra_fs();

  for (auto& monitor : _monitors) {
    monitor->update(info, stats);
  }

  info->set_cpu(stats->cpu());
  info->set_mem_pct(stats->mem_pct());
  info->set_disk_pct(stats->disk_pct());
  info->set_agent_version(kAgentVersion);
  _last_stats = *stats;
}

}  // namespace hostpulse
