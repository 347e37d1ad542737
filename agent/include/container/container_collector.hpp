#pragma once

#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "container/admission_gate.hpp"
#include "container/container_registry.hpp"
#include "container/docker_client.hpp"
#include "container/retry_policy.hpp"
#include "hostpulse.pb.h"
#include "hostpulse/rate.hpp"
#include "util/config.hpp"

namespace hostpulse {

struct ContainerInfo {
  std::string id;
  std::string short_id;  // id 前 12 个字符
  std::string name;      // Names[0] 去掉开头的 '/'
  std::string status;
};

struct SampleError {
  enum Kind {
    kRequest,   // 请求失败（连接、超时、非 2xx）
    kDecode,    // 响应无法解析
    kInvalid,   // 内存为 0，容器可能处于重启循环，不重试
    kRejected,  // CPU 超过 100%，不更新状态
  };
  Kind kind = kRequest;
  bool timeout = false;
  std::string message;
};

/**
 * 容器指标采集
 *
 * 列出运行中的容器后，每个容器一个线程，通过 AdmissionGate 限制同时在途的请求数，
 * 全部 join 之后清理已经不存在的容器状态。
 */
class ContainerCollector {
 public:
  ContainerCollector(DockerClient& client, ContainerRegistry& registry,
                     const AgentConfig& config, ClockFn clock = steady_now);

  // 返回 false 表示列表请求或解析失败，本周期没有容器数据
  bool collect(std::vector<proto::ContainerStats>* results);

  bool list_containers(std::vector<ContainerInfo>* containers);
  bool sample_container(const ContainerInfo& container, proto::ContainerStats* stats,
                        SampleError* error);

  AdmissionGate& gate() { return _gate; }
  const RetryPolicy& retry_policy() const { return _retry; }

 private:
  // 单个容器的采集任务，失败时按策略清理连接与状态并重试
  void run_task(const ContainerInfo& container,
                std::vector<std::pair<size_t, proto::ContainerStats>>* results, size_t index);

  DockerClient& _client;
  ContainerRegistry& _registry;
  std::string _restart_marker;
  ClockFn _clock;
  AdmissionGate _gate;
  RetryPolicy _retry;
  std::mutex _results_mtx;
};

// 解析 /containers/json 的响应体
bool decode_container_list(const std::string& body, std::vector<ContainerInfo>* containers,
                           std::string* error);

}  // namespace hostpulse
