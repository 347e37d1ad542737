#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hostpulse {

struct MemoryUsage {
  uint64_t total = 0;
  uint64_t free = 0;
  uint64_t used = 0;
  double used_percent = 0;
  uint64_t swap_total = 0;
  uint64_t swap_free = 0;
};

struct DiskUsage {
  uint64_t total = 0;
  uint64_t free = 0;
  uint64_t used = 0;
  double used_percent = 0;
};

struct DiskIoCounters {
  std::string name;
  uint64_t read_bytes = 0;
  uint64_t write_bytes = 0;
};

struct NetIoCounters {
  std::string name;
  uint64_t bytes_sent = 0;
  uint64_t bytes_recv = 0;
};

struct SensorReading {
  std::string sensor_key;
  double temperature = 0;
};

struct HostInfo {
  std::string hostname;
  std::string kernel_version;
  uint64_t uptime = 0;
};

struct Partition {
  std::string device;
  std::string mountpoint;
  std::string fstype;
};

/// 操作系统指标来源，每个查询同步执行、可独立失败
class HostProvider {
 public:
  virtual ~HostProvider() = default;

  // 非阻塞的 CPU 使用率，基于上一次调用以来的增量
  virtual bool cpu_percent(double* percent) = 0;
  virtual bool virtual_memory(MemoryUsage* usage) = 0;
  virtual bool disk_usage(const std::string& mountpoint, DiskUsage* usage) = 0;
  // names 为空时返回全部设备
  virtual bool disk_io_counters(const std::vector<std::string>& names,
                                std::vector<DiskIoCounters>* counters) = 0;
  virtual bool net_io_counters(std::vector<NetIoCounters>* counters) = 0;
  virtual bool temperatures(std::vector<SensorReading>* readings) = 0;
  virtual bool host_info(HostInfo* info) = 0;
  virtual bool cpu_model(std::string* model) = 0;
  // logical 为 true 时返回逻辑线程数，否则返回物理核心数
  virtual bool cpu_counts(bool logical, int* count) = 0;
  // 只返回物理设备上的分区
  virtual bool partitions(std::vector<Partition>* parts) = 0;
};

}  // namespace hostpulse
