#include "hostpulse/net_registry.hpp"

#include <unordered_set>
#include <vector>

#include "util/logging.hpp"

namespace hostpulse {

void NetRegistry::rebaseline(uint64_t bytes_sent, uint64_t bytes_recv, TimePoint now) {
  _io.bytes_sent = bytes_sent;
  _io.bytes_recv = bytes_recv;
  _io.time = now;
  _io.initialized = true;
}

bool skip_interface(const NetIoCounters& counters) {
  const std::string& name = counters.name;
  return name.rfind("lo", 0) == 0 || name.rfind("docker", 0) == 0 ||
         name.rfind("br-", 0) == 0 || name.rfind("veth", 0) == 0 ||
         counters.bytes_recv == 0 || counters.bytes_sent == 0;
}

void discover_interfaces(HostProvider& provider, const AgentConfig& config,
                         NetRegistry* registry, TimePoint now) {
  registry->clear_interfaces();
  std::unordered_set<std::string> nics(config.nics.begin(), config.nics.end());

  std::vector<NetIoCounters> counters;
  if (!provider.net_io_counters(&counters)) {
    agent_log().error("Error getting network io counters");
    registry->rebaseline(0, 0, now);
    return;
  }

  uint64_t sent = 0;
  uint64_t recv = 0;
  for (const auto& c : counters) {
    if (config.nics_set ? nics.count(c.name) == 0 : skip_interface(c)) {
      continue;
    }
    agent_log().info("Detected network interface {} (sent: {}, recv: {})", c.name,
                     c.bytes_sent, c.bytes_recv);
    sent += c.bytes_sent;
    recv += c.bytes_recv;
    registry->track(c.name);
  }
  registry->rebaseline(sent, recv, now);
}

}  // namespace hostpulse
