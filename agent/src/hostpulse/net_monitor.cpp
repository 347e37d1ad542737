#include "hostpulse/net_monitor.hpp"

#include <vector>

#include "util/logging.hpp"

namespace hostpulse {

void NetMonitor::update(proto::SystemInfo* info, proto::SystemStats* stats) {
  std::vector<NetIoCounters> counters;
  if (!_provider.net_io_counters(&counters)) {
    agent_log().error("Error getting network io counters");
    return;
  }
  TimePoint now = _clock();

  // 只累加白名单中的网卡
  uint64_t bytes_sent = 0;
  uint64_t bytes_recv = 0;
  for (const auto& c : counters) {
    if (!_registry.tracks(c.name)) continue;
    bytes_sent += c.bytes_sent;
    bytes_recv += c.bytes_recv;
  }

  const NetIoStats& prev = _registry.io();
  double sent_ps = 0;
  double recv_ps = 0;
  if (prev.initialized) {
    sent_ps = per_second(prev.bytes_sent, prev.time, bytes_sent, now);
    recv_ps = per_second(prev.bytes_recv, prev.time, bytes_recv, now);
  }
  double sent_mb = bytes_to_megabytes(sent_ps);
  double recv_mb = bytes_to_megabytes(recv_ps);

  // 计数器突变会产生离谱的速率：丢弃本周期结果并以当前值重建基线
  if (sent_mb > _anomaly_threshold_mb || recv_mb > _anomaly_threshold_mb) {
    agent_log().warn("Invalid network stats, resetting (sent: {} MB/s, recv: {} MB/s)",
                     sent_mb, recv_mb);
    for (const auto& c : counters) {
      if (!_registry.tracks(c.name)) continue;
      agent_log().info("{} recv: {} sent: {}", c.name, c.bytes_recv, c.bytes_sent);
    }
    stats->set_network_sent(0);
    stats->set_network_recv(0);
    _registry.rebaseline(bytes_sent, bytes_recv, now);
    return;
  }

  stats->set_network_sent(sent_mb);
  stats->set_network_recv(recv_mb);
  _registry.rebaseline(bytes_sent, bytes_recv, now);
}

}  // namespace hostpulse
