#include "hostpulse/cpu_monitor.hpp"

#include "hostpulse/rate.hpp"
#include "util/logging.hpp"

namespace hostpulse {

// 零间隔采样，失败时保留上一周期的值
void CpuMonitor::update(proto::SystemInfo* info, proto::SystemStats* stats) {
  double pct = 0;
  if (!_provider.cpu_percent(&pct)) {
    agent_log().error("Error getting cpu percent");
    return;
  }
  stats->set_cpu(two_decimals(pct));
}

}  // namespace hostpulse
