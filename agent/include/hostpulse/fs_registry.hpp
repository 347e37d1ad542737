#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "hostpulse.pb.h"
#include "hostpulse/host_provider.hpp"
#include "hostpulse/rate.hpp"
#include "util/config.hpp"

namespace hostpulse {

/// 单个文件系统的持久状态，启动时创建，之后只更新不删除
struct FsEntry {
  std::string mountpoint;
  bool root = false;
  // 上次采样时的累计读写字节数
  uint64_t total_read = 0;
  uint64_t total_write = 0;
  TimePoint time{};
  bool initialized = false;
  // 对外输出的派生值
  proto::FsStats stats;

  // 卸载等读取失败时清零，下次采样重新建立基线
  void reset() {
    total_read = 0;
    total_write = 0;
    initialized = false;
    stats.set_disk_total(0);
    stats.set_disk_used(0);
  }
};

/// 设备名 -> 文件系统状态
class FsRegistry {
 public:
  // 已存在时覆盖
  FsEntry& set(const std::string& name, const std::string& mountpoint, bool root);
  FsEntry* find(const std::string& name);
  bool contains(const std::string& name) const { return _entries.count(name) > 0; }
  bool has_root() const;

  std::map<std::string, FsEntry>& entries() { return _entries; }
  const std::map<std::string, FsEntry>& entries() const { return _entries; }

  // 批量查询磁盘 I/O 时使用的设备名
  const std::vector<std::string>& io_names() const { return _io_names; }
  void add_io_name(const std::string& name) { _io_names.push_back(name); }

 private:
  std::map<std::string, FsEntry> _entries;
  std::vector<std::string> _io_names;
};

// 启动时根据 FILESYSTEM / EXTRA_FILESYSTEMS 与分区表发现需要跟踪的文件系统，
// 并为 /proc/diskstats 中存在的设备建立 I/O 基线
void discover_filesystems(HostProvider& provider, const AgentConfig& config,
                          FsRegistry* registry, TimePoint now);

}  // namespace hostpulse
