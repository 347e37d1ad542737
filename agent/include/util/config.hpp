#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace hostpulse {

constexpr char kDefaultListenAddress[] = "0.0.0.0:45876";
constexpr char kDefaultDockerHost[] = "unix:///var/run/docker.sock";
constexpr char kDefaultSysRoot[] = "/sys";
constexpr char kDefaultExtraFsDir[] = "/extra-filesystems";
constexpr char kDefaultRestartMarker[] = "second";
constexpr int kDefaultDockerTimeoutMs = 1000;
constexpr int kDefaultMaxConcurrency = 15;
constexpr double kDefaultNetAnomalyThresholdMb = 10000.0;

/// agent 运行配置，来源为环境变量与命令行参数
struct AgentConfig {
  std::string listen_address = kDefaultListenAddress;
  std::string log_level = "info";
  std::string log_dir = "/tmp/hostpulse_logs/agent";

  // 传感器读取的 sys 根目录（沙箱/虚拟化环境下可重定位）
  std::string sys_root = kDefaultSysRoot;
  std::string proc_root = "/proc";

  std::string filesystem;                      // FILESYSTEM
  std::vector<std::string> extra_filesystems;  // EXTRA_FILESYSTEMS
  std::string extra_fs_dir = kDefaultExtraFsDir;
  std::vector<std::string> nics;               // NICS
  bool nics_set = false;

  std::string docker_host = kDefaultDockerHost;
  int docker_timeout_ms = kDefaultDockerTimeoutMs;

  int max_concurrency = kDefaultMaxConcurrency;
  // 网卡速率超过该值（MB/s）视为计数器异常
  double net_anomaly_threshold_mb = kDefaultNetAnomalyThresholdMb;
  // 容器状态包含该字符串时视为一分钟内重启过
  std::string restart_marker = kDefaultRestartMarker;
};

// 按逗号切分并去掉空白，空项丢弃
std::vector<std::string> split_list(const std::string& value);

// 读取环境变量与 argv（argv[1] 为监听地址）
AgentConfig load_config(int argc, char* argv[]);

}  // namespace hostpulse
