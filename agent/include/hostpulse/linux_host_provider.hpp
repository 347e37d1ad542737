#pragma once

#include <cstdint>
#include <string>

#include "hostpulse/host_provider.hpp"

namespace hostpulse {

/// 基于 /proc、/sys 与系统调用的 HostProvider 实现
class LinuxHostProvider : public HostProvider {
 public:
  explicit LinuxHostProvider(std::string proc_root = "/proc",
                             std::string sys_root = "/sys");

  bool cpu_percent(double* percent) override;
  bool virtual_memory(MemoryUsage* usage) override;
  bool disk_usage(const std::string& mountpoint, DiskUsage* usage) override;
  bool disk_io_counters(const std::vector<std::string>& names,
                        std::vector<DiskIoCounters>* counters) override;
  bool net_io_counters(std::vector<NetIoCounters>* counters) override;
  bool temperatures(std::vector<SensorReading>* readings) override;
  bool host_info(HostInfo* info) override;
  bool cpu_model(std::string* model) override;
  bool cpu_counts(bool logical, int* count) override;
  bool partitions(std::vector<Partition>* parts) override;

 private:
  std::string proc_path(const std::string& name) const;

  std::string _proc_root;
  std::string _sys_root;

  // 上一次 /proc/stat 的累计值，用于零间隔 CPU 采样
  uint64_t _last_cpu_busy = 0;
  uint64_t _last_cpu_total = 0;
  bool _has_last_cpu = false;
};

}  // namespace hostpulse
