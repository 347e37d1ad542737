#include "hostpulse/hostinfo_monitor.hpp"

#include "util/logging.hpp"

namespace hostpulse {

void HostInfoMonitor::update(proto::SystemInfo* info, proto::SystemStats* stats) {
  if (!info) {
    return;
  }

  HostInfo host;
  if (_provider.host_info(&host)) {
    info->set_hostname(host.hostname);
    info->set_kernel_version(host.kernel_version);
    info->set_uptime(host.uptime);
  } else {
    agent_log().error("Failed to get host info");
  }

  std::string model;
  if (_provider.cpu_model(&model)) {
    info->set_cpu_model(model);
  }
  update_cpu_counts(info);
}

void HostInfoMonitor::update_cpu_counts(proto::SystemInfo* info) {
  int cores = 0;
  if (_provider.cpu_counts(false, &cores)) {
    info->set_cores(cores);
  }
  int threads = 0;
  if (_provider.cpu_counts(true, &threads)) {
    if (threads > 0 && threads < info->cores()) {
      info->set_cores(threads);
      info->clear_threads();
    } else {
      info->set_threads(threads);
    }
  }
}

}  // namespace hostpulse
