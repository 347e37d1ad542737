#include "hostpulse/fs_registry.hpp"

#include <filesystem>
#include <unordered_map>
#include <unordered_set>

#include "util/logging.hpp"

namespace hostpulse {

namespace {
std::string base_name(const std::string& path) {
  return std::filesystem::path(path).filename().string();
}

bool ends_with(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() &&
         s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix) {
  return s.rfind(prefix, 0) == 0;
}

// 找不到根分区时，从 diskstats 中挑一个设备当作根设备
std::string fallback_io_device(const std::string& filesystem,
                               const std::vector<DiskIoCounters>& counters) {
  for (const auto& c : counters) {
    if (!filesystem.empty() && c.name == filesystem) {
      return c.name;
    }
  }
  std::string best;
  uint64_t most_read = 0;
  for (const auto& c : counters) {
    if (best.empty() || c.read_bytes > most_read) {
      best = c.name;
      most_read = c.read_bytes;
    }
  }
  return best.empty() ? "root" : best;
}
}  // namespace

FsEntry& FsRegistry::set(const std::string& name, const std::string& mountpoint, bool root) {
  FsEntry& entry = _entries[name];
  entry = FsEntry{};
  entry.mountpoint = mountpoint;
  entry.root = root;
  return entry;
}

FsEntry* FsRegistry::find(const std::string& name) {
  auto it = _entries.find(name);
  return it == _entries.end() ? nullptr : &it->second;
}

bool FsRegistry::has_root() const {
  for (const auto& [name, entry] : _entries) {
    if (entry.root) return true;
  }
  return false;
}

void discover_filesystems(HostProvider& provider, const AgentConfig& config,
                          FsRegistry* registry, TimePoint now) {
  auto& log = agent_log();
  std::vector<Partition> parts;
  if (!provider.partitions(&parts)) {
    log.error("Error getting disk partitions");
  }
  std::vector<DiskIoCounters> io_counters;
  if (!provider.disk_io_counters({}, &io_counters)) {
    log.error("Error getting disk io counters");
  }

  bool has_root = false;
  DiskUsage usage;

  // FILESYSTEM 指定根设备（设备名后缀匹配），否则尝试当作路径
  if (!config.filesystem.empty()) {
    for (const auto& p : parts) {
      if (ends_with(p.device, config.filesystem)) {
        registry->set(base_name(p.device), p.mountpoint, true);
        has_root = true;
      }
    }
    if (!has_root) {
      if (provider.disk_usage(config.filesystem, &usage)) {
        registry->set(base_name(config.filesystem), config.filesystem, true);
        has_root = true;
      } else {
        log.error("Invalid FILESYSTEM: {}", config.filesystem);
      }
    }
  }

  // EXTRA_FILESYSTEMS：设备名后缀或挂载点匹配
  for (const auto& extra : config.extra_filesystems) {
    bool found = false;
    for (const auto& p : parts) {
      if (ends_with(p.device, extra) || p.mountpoint == extra) {
        registry->set(base_name(p.device), p.mountpoint, false);
        found = true;
        break;
      }
    }
    if (!found) {
      if (provider.disk_usage(extra, &usage)) {
        registry->set(base_name(extra), extra, false);
      } else {
        log.error("Invalid filesystem: {}", extra);
      }
    }
  }

  for (const auto& p : parts) {
    // 二进制部署时挂载在 /，容器部署时通过 /etc/hosts 的 bind mount 找到宿主设备
    bool docker_root = p.mountpoint == "/etc/hosts" && starts_with(p.device, "/dev") &&
                       p.device.find("mapper") == std::string::npos;
    if (!has_root && (p.mountpoint == "/" || docker_root)) {
      std::string name = base_name(p.device);
      registry->set(name, "/", true);
      has_root = true;
      log.info("Root filesystem: {}", name);
    }
    if (starts_with(p.mountpoint, config.extra_fs_dir)) {
      std::string name = base_name(p.device);
      if (!registry->contains(name)) {
        registry->set(name, p.mountpoint, false);
      }
    }
  }

  // extra-filesystems 目录下的子目录
  std::error_code ec;
  std::unordered_set<std::string> mountpoints;
  for (const auto& [name, entry] : registry->entries()) {
    mountpoints.insert(entry.mountpoint);
  }
  for (std::filesystem::directory_iterator it(config.extra_fs_dir, ec), end;
       !ec && it != end; it.increment(ec)) {
    if (!it->is_directory(ec)) continue;
    std::string mountpoint = it->path().string();
    if (mountpoints.count(mountpoint) == 0) {
      registry->set(it->path().filename().string(), mountpoint, false);
    }
  }

  if (!has_root) {
    std::string name = fallback_io_device(base_name(config.filesystem), io_counters);
    registry->set(name, "/", true);
    log.warn("Root filesystem not found in partitions, using io device: {}", name);
  }

  // 建立磁盘 I/O 基线
  std::unordered_map<std::string, const DiskIoCounters*> by_name;
  for (const auto& c : io_counters) {
    by_name[c.name] = &c;
  }
  for (auto& [name, entry] : registry->entries()) {
    auto it = by_name.find(name);
    if (it == by_name.end()) {
      log.warn("Device not found in diskstats: {}", name);
      continue;
    }
    entry.total_read = it->second->read_bytes;
    entry.total_write = it->second->write_bytes;
    entry.time = now;
    entry.initialized = true;
    registry->add_io_name(name);
    log.info("Tracking filesystem {} at {} (root: {})", name, entry.mountpoint, entry.root);
  }
}

}  // namespace hostpulse
