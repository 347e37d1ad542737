#pragma once

#include <cstdint>
#include <string>
#include <unordered_set>

#include "hostpulse/host_provider.hpp"
#include "hostpulse/rate.hpp"
#include "util/config.hpp"

namespace hostpulse {

/// 白名单网卡上一次采样的累计收发字节
struct NetIoStats {
  uint64_t bytes_sent = 0;
  uint64_t bytes_recv = 0;
  TimePoint time{};
  bool initialized = false;
};

class NetRegistry {
 public:
  bool tracks(const std::string& name) const { return _interfaces.count(name) > 0; }
  void track(const std::string& name) { _interfaces.insert(name); }
  void clear_interfaces() { _interfaces.clear(); }
  const std::unordered_set<std::string>& interfaces() const { return _interfaces; }

  const NetIoStats& io() const { return _io; }
  // 以新的累计值作为基线
  void rebaseline(uint64_t bytes_sent, uint64_t bytes_recv, TimePoint now);

 private:
  std::unordered_set<std::string> _interfaces;
  NetIoStats _io;
};

// 回环、docker、网桥、veth 以及没有收发流量的网卡不参与统计
bool skip_interface(const NetIoCounters& counters);

// 启动时确定网卡白名单（NICS 优先），并以当前累计值建立基线
void discover_interfaces(HostProvider& provider, const AgentConfig& config,
                         NetRegistry* registry, TimePoint now);

}  // namespace hostpulse
