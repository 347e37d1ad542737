#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "hostpulse/rate.hpp"

namespace hostpulse {

/// 单个容器上一次成功采样的累计值
struct PrevContainerStats {
  uint64_t cpu_container = 0;  // cpu_stats.cpu_usage.total_usage
  uint64_t cpu_system = 0;     // cpu_stats.system_cpu_usage
  uint64_t net_sent = 0;
  uint64_t net_recv = 0;
  TimePoint net_time{};
};

/// 一次采样读到的累计计数
struct ContainerCounters {
  uint64_t cpu_container = 0;
  uint64_t cpu_system = 0;
  uint64_t net_sent = 0;
  uint64_t net_recv = 0;
};

struct ContainerRates {
  double cpu = 0;          // 百分比
  double net_sent_ps = 0;  // 字节/秒
  double net_recv_ps = 0;
};

/**
 * 短 id -> 上次采样状态
 *
 * 所有读改写都在内部互斥锁内完成，可被多个采样线程同时调用。
 */
class ContainerRegistry {
 public:
  // 根据上次状态计算速率并更新状态；CPU 超过 100% 时返回 false，状态保持不变
  bool derive(const std::string& id, const ContainerCounters& counters, TimePoint now,
              ContainerRates* rates, double* rejected_cpu = nullptr);

  void erase(const std::string& id);
  // 删除不在 valid_ids 中的条目，返回删除数量
  size_t prune(const std::unordered_set<std::string>& valid_ids);

  bool find(const std::string& id, PrevContainerStats* stats) const;
  bool contains(const std::string& id) const;
  size_t size() const;
  std::vector<std::string> ids() const;

 private:
  mutable std::mutex _mtx;
  std::unordered_map<std::string, PrevContainerStats> _stats;
};

}  // namespace hostpulse
