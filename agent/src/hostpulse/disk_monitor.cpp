#include "hostpulse/disk_monitor.hpp"

#include <vector>

#include "util/logging.hpp"

namespace hostpulse {

void DiskMonitor::update(proto::SystemInfo* info, proto::SystemStats* stats) {
  update_usage(stats);
  update_io(stats);
}

// 逐个挂载点查询用量；查询失败（多半已卸载）时清零，避免残留旧值
void DiskMonitor::update_usage(proto::SystemStats* stats) {
  for (auto& [name, entry] : _registry.entries()) {
    DiskUsage usage;
    if (!_provider.disk_usage(entry.mountpoint, &usage)) {
      agent_log().error("Error getting disk stats for {} ({})", name, entry.mountpoint);
      entry.reset();
      if (entry.root) {
        stats->set_disk_total(0);
        stats->set_disk_used(0);
        stats->set_disk_pct(0);
      }
      continue;
    }
    entry.stats.set_disk_total(bytes_to_gigabytes(usage.total));
    entry.stats.set_disk_used(bytes_to_gigabytes(usage.used));
    if (entry.root) {
      stats->set_disk_total(entry.stats.disk_total());
      stats->set_disk_used(entry.stats.disk_used());
      stats->set_disk_pct(two_decimals(usage.used_percent));
    }
  }
}

void DiskMonitor::update_io(proto::SystemStats* stats) {
  if (_registry.io_names().empty()) {
    return;
  }
  std::vector<DiskIoCounters> counters;
  if (!_provider.disk_io_counters(_registry.io_names(), &counters)) {
    agent_log().error("Error getting disk io counters");
    return;
  }
  TimePoint now = _clock();
  for (const auto& c : counters) {
    FsEntry* entry = _registry.find(c.name);
    if (entry == nullptr) {
      continue;
    }
    double read_ps = 0;
    double write_ps = 0;
    if (entry->initialized) {
      read_ps = per_second(entry->total_read, entry->time, c.read_bytes, now);
      write_ps = per_second(entry->total_write, entry->time, c.write_bytes, now);
    }
    entry->total_read = c.read_bytes;
    entry->total_write = c.write_bytes;
    entry->time = now;
    entry->initialized = true;
    entry->stats.set_disk_read_ps(bytes_to_megabytes(read_ps));
    entry->stats.set_disk_write_ps(bytes_to_megabytes(write_ps));
    if (entry->root) {
      stats->set_disk_read_ps(entry->stats.disk_read_ps());
      stats->set_disk_write_ps(entry->stats.disk_write_ps());
    }
  }
}

}  // namespace hostpulse
