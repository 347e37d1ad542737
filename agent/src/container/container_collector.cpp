#include "container/container_collector.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <system_error>
#include <thread>
#include <unordered_set>

#include "util/logging.hpp"

namespace hostpulse {

namespace {
constexpr size_t kShortIdLength = 12;

google::protobuf::util::JsonParseOptions lenient_options() {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return options;
}

uint64_t memory_cache(const proto::ApiStats::MemoryStats& memory) {
  const auto& stats = memory.stats();
  auto it = stats.find("inactive_file");
  if (it != stats.end()) {
    return it->second;
  }
  it = stats.find("cache");
  return it != stats.end() ? it->second : 0;
}
}  // namespace

bool decode_container_list(const std::string& body, std::vector<ContainerInfo>* containers,
                           std::string* error) {
  // 运行时返回顶层数组，包装成对象再解析
  proto::ApiContainerList list;
  auto status = google::protobuf::util::JsonStringToMessage("{\"containers\":" + body + "}",
                                                           &list, lenient_options());
  if (!status.ok()) {
    *error = status.ToString();
    return false;
  }
  containers->clear();
  containers->reserve(list.containers_size());
  for (const auto& c : list.containers()) {
    ContainerInfo info;
    info.id = c.id();
    info.short_id = c.id().substr(0, kShortIdLength);
    info.status = c.status();
    if (c.names_size() > 0) {
      info.name = c.names(0);
      if (!info.name.empty() && info.name[0] == '/') {
        info.name.erase(0, 1);
      }
    }
    if (info.name.empty()) {
      info.name = info.short_id;
    }
    containers->push_back(std::move(info));
  }
  return true;
}

ContainerCollector::ContainerCollector(DockerClient& client, ContainerRegistry& registry,
                                       const AgentConfig& config, ClockFn clock)
    : _client(client),
      _registry(registry),
      _restart_marker(config.restart_marker),
      _clock(std::move(clock)),
      _gate(static_cast<size_t>(config.max_concurrency)) {}

bool ContainerCollector::list_containers(std::vector<ContainerInfo>* containers) {
  std::string body;
  ClientError error;
  if (!_client.get("/containers/json", &body, &error)) {
    agent_log().error("Error getting containers: {}", error.message);
    _client.close_idle_connections();
    return false;
  }
  std::string decode_error;
  if (!decode_container_list(body, containers, &decode_error)) {
    agent_log().error("Error decoding containers: {}", decode_error);
    _client.close_idle_connections();
    return false;
  }
  return true;
}

bool ContainerCollector::sample_container(const ContainerInfo& container,
                                          proto::ContainerStats* stats, SampleError* error) {
  std::string body;
  ClientError client_error;
  if (!_client.get("/containers/" + container.short_id + "/stats?stream=0&one-shot=1", &body,
                   &client_error)) {
    error->kind = SampleError::kRequest;
    error->timeout = client_error.timeout;
    error->message = client_error.message;
    return false;
  }

  proto::ApiStats api;
  auto status = google::protobuf::util::JsonStringToMessage(body, &api, lenient_options());
  if (!status.ok()) {
    error->kind = SampleError::kDecode;
    error->timeout = false;
    error->message = status.ToString();
    return false;
  }

  uint64_t usage = api.memory_stats().usage();
  if (usage == 0) {
    error->kind = SampleError::kInvalid;
    error->timeout = false;
    error->message = container.name + " - no memory stats";
    return false;
  }
  uint64_t cache = memory_cache(api.memory_stats());
  uint64_t used = usage > cache ? usage - cache : 0;

  ContainerCounters counters;
  counters.cpu_container = api.cpu_stats().cpu_usage().total_usage();
  counters.cpu_system = api.cpu_stats().system_cpu_usage();
  for (const auto& [iface, net] : api.networks()) {
    counters.net_sent += net.tx_bytes();
    counters.net_recv += net.rx_bytes();
  }

  ContainerRates rates;
  double rejected_cpu = 0;
  if (!_registry.derive(container.short_id, counters, _clock(), &rates, &rejected_cpu)) {
    error->kind = SampleError::kRejected;
    error->timeout = false;
    error->message = container.name + " - cpu pct greater than 100: " + std::to_string(rejected_cpu);
    return false;
  }

  stats->set_name(container.name);
  stats->set_cpu(two_decimals(rates.cpu));
  stats->set_mem(bytes_to_megabytes(static_cast<double>(used)));
  stats->set_network_sent(bytes_to_megabytes(rates.net_sent_ps));
  stats->set_network_recv(bytes_to_megabytes(rates.net_recv_ps));
  return true;
}

void ContainerCollector::run_task(const ContainerInfo& container,
                                  std::vector<std::pair<size_t, proto::ContainerStats>>* results,
                                  size_t index) {
  SampleError last_error;
  bool done = _retry.run(
      [&](int) {
        proto::ContainerStats stats;
        SampleError error;
        if (sample_container(container, &stats, &error)) {
          std::lock_guard<std::mutex> lock(_results_mtx);
          results->emplace_back(index, std::move(stats));
          return true;
        }
        last_error = error;
        return false;
      },
      [&](int attempt) {
        agent_log().warn("Error getting container stats {} (attempt {}): {}", container.name,
                         attempt, last_error.message);
        _client.close_idle_connections();
        if (!last_error.timeout && last_error.kind != SampleError::kRejected &&
            last_error.kind != SampleError::kInvalid) {
          _registry.erase(container.short_id);
        }
      },
      // 内存为 0 的样本重试也没有意义
      [&]() { return last_error.kind != SampleError::kInvalid; });
  if (!done) {
    agent_log().error("Dropping container {} this cycle: {}", container.name, last_error.message);
  }
}

bool ContainerCollector::collect(std::vector<proto::ContainerStats>* results) {
  results->clear();
  std::vector<ContainerInfo> containers;
  if (!list_containers(&containers)) {
    return false;
  }

  std::vector<std::pair<size_t, proto::ContainerStats>> indexed;
  indexed.reserve(containers.size());
  std::unordered_set<std::string> valid_ids;
  std::vector<std::thread> workers;
  workers.reserve(containers.size());

  for (size_t i = 0; i < containers.size(); ++i) {
    const ContainerInfo& container = containers[i];
    valid_ids.insert(container.short_id);

    // 一分钟内重启过的容器计数器已经归零，丢弃旧状态
    if (container.status.find(_restart_marker) != std::string::npos) {
      agent_log().debug("Container {} restarted recently, resetting stats", container.name);
      _registry.erase(container.short_id);
    }

    AdmissionGate::Slot slot = _gate.enter();
    try {
      workers.emplace_back([this, &container, &indexed, i, slot = std::move(slot)]() mutable {
        run_task(container, &indexed, i);
        slot.release();
      });
    } catch (const std::system_error& e) {
      agent_log().error("Failed to start sampling thread for {}: {}", container.name, e.what());
    }
  }

  for (auto& worker : workers) {
    worker.join();
  }

  std::sort(indexed.begin(), indexed.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  results->reserve(indexed.size());
  for (auto& [index, stats] : indexed) {
    results->push_back(std::move(stats));
  }

  size_t removed = _registry.prune(valid_ids);
  agent_log().debug("Collected {} of {} containers, pruned {} stale entries", results->size(),
                    containers.size(), removed);
  return true;
}

}  // namespace hostpulse
