#pragma once

#include <mutex>

#include "container/container_collector.hpp"
#include "container/container_registry.hpp"
#include "container/docker_client.hpp"
#include "hostpulse.pb.h"
#include "hostpulse/fs_registry.hpp"
#include "hostpulse/host_provider.hpp"
#include "hostpulse/host_sampler.hpp"
#include "hostpulse/net_registry.hpp"
#include "hostpulse/rate.hpp"
#include "util/config.hpp"

namespace hostpulse {

/**
 * 快照编排器
 *
 * 持有所有注册表与采集组件，每次 gather_stats() 依次采集主机与容器指标，
 * 合并为一个 CombinedData。并发调用按顺序执行。
 */
class Agent {
 public:
  Agent(const AgentConfig& config, HostProvider& provider, DockerClient& client,
        ClockFn clock = steady_now);

  // 启动时发现文件系统与网卡并建立基线
  void initialize();

  void gather_stats(proto::CombinedData* data);

  FsRegistry& fs_registry() { return _fs_registry; }
  NetRegistry& net_registry() { return _net_registry; }
  ContainerRegistry& container_registry() { return _container_registry; }
  ContainerCollector& container_collector() { return _collector; }

 private:
  AgentConfig _config;
  HostProvider& _provider;
  ClockFn _clock;

  FsRegistry _fs_registry;
  NetRegistry _net_registry;
  ContainerRegistry _container_registry;

  HostSampler _sampler;
  ContainerCollector _collector;

  std::mutex _cycle_mtx;
};

}  // namespace hostpulse
