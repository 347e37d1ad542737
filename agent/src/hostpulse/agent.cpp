#include "hostpulse/agent.hpp"

#include <utility>
#include <vector>

#include "util/logging.hpp"

namespace hostpulse {

Agent::Agent(const AgentConfig& config, HostProvider& provider, DockerClient& client,
             ClockFn clock)
    : _config(config),
      _provider(provider),
      _clock(clock),
      _sampler(provider, _fs_registry, _net_registry, _config, clock),
      _collector(client, _container_registry, _config, clock) {}

void Agent::initialize() {
  discover_filesystems(_provider, _config, &_fs_registry, _clock());
  discover_interfaces(_provider, _config, &_net_registry, _clock());
}

void Agent::gather_stats(proto::CombinedData* data) {
  if (!data) {
    return;
  }
  std::lock_guard<std::mutex> lock(_cycle_mtx);
  data->Clear();

  _sampler.sample(data->mutable_info(), data->mutable_stats());

  std::vector<proto::ContainerStats> containers;
  if (_collector.collect(&containers)) {
    for (auto& c : containers) {
      *data->add_containers() = std::move(c);
    }
  }

  // 根文件系统已经并入 SystemStats，其余有容量的进入 extra_fs
  auto* extra_fs = data->mutable_stats()->mutable_extra_fs();
  for (const auto& [name, entry] : _fs_registry.entries()) {
    if (!entry.root && entry.stats.disk_total() > 0) {
      (*extra_fs)[name] = entry.stats;
    }
  }

  agent_log().debug("Gathered stats: cpu {}%, mem {}%, disk {}%, {} containers",
                    data->info().cpu(), data->info().mem_pct(), data->info().disk_pct(),
                    data->containers_size());
}

}  // namespace hostpulse
