#include "container/container_registry.hpp"

#include <algorithm>

namespace hostpulse {

namespace {
// 计数器回退时按 0 处理
uint64_t delta(uint64_t current, uint64_t previous) {
  return current >= previous ? current - previous : 0;
}
}  // namespace

bool ContainerRegistry::derive(const std::string& id, const ContainerCounters& counters,
                               TimePoint now, ContainerRates* rates, double* rejected_cpu) {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _stats.find(id);
  bool initialized = it != _stats.end();
  PrevContainerStats prev = initialized ? it->second : PrevContainerStats{};

  uint64_t cpu_delta = delta(counters.cpu_container, prev.cpu_container);
  uint64_t system_delta = delta(counters.cpu_system, prev.cpu_system);
  double cpu = system_delta == 0
                   ? 0.0
                   : static_cast<double>(cpu_delta) / static_cast<double>(system_delta) * 100.0;
  if (cpu > 100.0) {
    if (rejected_cpu) {
      *rejected_cpu = cpu;
    }
    return false;
  }

  rates->cpu = cpu;
  if (initialized) {
    rates->net_sent_ps = per_second(prev.net_sent, prev.net_time, counters.net_sent, now);
    rates->net_recv_ps = per_second(prev.net_recv, prev.net_time, counters.net_recv, now);
  } else {
    rates->net_sent_ps = 0;
    rates->net_recv_ps = 0;
  }

  PrevContainerStats& entry = _stats[id];
  entry.cpu_container = counters.cpu_container;
  entry.cpu_system = counters.cpu_system;
  entry.net_sent = counters.net_sent;
  entry.net_recv = counters.net_recv;
  entry.net_time = now;
  return true;
}

void ContainerRegistry::erase(const std::string& id) {
  std::lock_guard<std::mutex> lock(_mtx);
  _stats.erase(id);
}

size_t ContainerRegistry::prune(const std::unordered_set<std::string>& valid_ids) {
  std::lock_guard<std::mutex> lock(_mtx);
  size_t removed = 0;
  for (auto it = _stats.begin(); it != _stats.end();) {
    if (valid_ids.count(it->first) == 0) {
      it = _stats.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

bool ContainerRegistry::find(const std::string& id, PrevContainerStats* stats) const {
  std::lock_guard<std::mutex> lock(_mtx);
  auto it = _stats.find(id);
  if (it == _stats.end()) {
    return false;
  }
  *stats = it->second;
  return true;
}

bool ContainerRegistry::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _stats.count(id) > 0;
}

size_t ContainerRegistry::size() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _stats.size();
}

std::vector<std::string> ContainerRegistry::ids() const {
  std::lock_guard<std::mutex> lock(_mtx);
  std::vector<std::string> ids;
  ids.reserve(_stats.size());
  for (const auto& [id, stats] : _stats) {
    ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

}  // namespace hostpulse
