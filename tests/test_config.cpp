#include <catch2/catch.hpp>

#include <cstdlib>
#include <string>
#include <vector>

#include "util/config.hpp"
#include "util/logging.hpp"

namespace {
const std::vector<std::string> kEnvNames = {"PORT",       "LISTEN",            "LOG_LEVEL",
                                            "LOG_DIR",    "SYS_SENSORS",       "FILESYSTEM",
                                            "NICS",       "EXTRA_FILESYSTEMS", "DOCKER_HOST"};

// 测试结束后清空相关环境变量
struct EnvGuard {
  EnvGuard() { clear(); }
  ~EnvGuard() { clear(); }
  void clear() {
    for (const auto& name : kEnvNames) {
      ::unsetenv(name.c_str());
    }
  }
  void set(const char* name, const char* value) { ::setenv(name, value, 1); }
};

hostpulse::AgentConfig load(std::vector<std::string> args = {}) {
  std::vector<char*> argv;
  static std::string program = "hostpulse_agent";
  argv.push_back(program.data());
  for (auto& a : args) {
    argv.push_back(a.data());
  }
  return hostpulse::load_config(static_cast<int>(argv.size()), argv.data());
}
}  // namespace

TEST_CASE("defaults without environment") {
  EnvGuard env;
  auto config = load();
  REQUIRE(config.listen_address == "0.0.0.0:45876");
  REQUIRE(config.docker_host == "unix:///var/run/docker.sock");
  REQUIRE(config.sys_root == "/sys");
  REQUIRE(config.max_concurrency == 15);
  REQUIRE(config.docker_timeout_ms == 1000);
  REQUIRE(config.net_anomaly_threshold_mb == Approx(10000.0));
  REQUIRE(config.restart_marker == "second");
  REQUIRE(config.extra_fs_dir == "/extra-filesystems");
  REQUIRE_FALSE(config.nics_set);
  REQUIRE(config.extra_filesystems.empty());
}

TEST_CASE("listen address precedence") {
  EnvGuard env;
  env.set("PORT", "9000");
  REQUIRE(load().listen_address == "0.0.0.0:9000");

  env.set("PORT", "127.0.0.1:9001");
  REQUIRE(load().listen_address == "127.0.0.1:9001");

  env.set("LISTEN", "[::]:9100");
  REQUIRE(load().listen_address == "[::]:9100");

  REQUIRE(load({"10.0.0.1:7000"}).listen_address == "10.0.0.1:7000");
}

TEST_CASE("list variables are split and trimmed") {
  EnvGuard env;
  env.set("EXTRA_FILESYSTEMS", "sdb1, /mnt/data ,,nvme0n1p2");
  env.set("NICS", "eth0,wlan0");
  env.set("FILESYSTEM", " sda1 ");
  env.set("SYS_SENSORS", "/host/sys");
  env.set("DOCKER_HOST", "tcp://127.0.0.1:2375");
  auto config = load();
  REQUIRE(config.extra_filesystems == std::vector<std::string>{"sdb1", "/mnt/data", "nvme0n1p2"});
  REQUIRE(config.nics_set);
  REQUIRE(config.nics == std::vector<std::string>{"eth0", "wlan0"});
  REQUIRE(config.filesystem == "sda1");
  REQUIRE(config.sys_root == "/host/sys");
  REQUIRE(config.docker_host == "tcp://127.0.0.1:2375");
}

TEST_CASE("empty NICS still restricts interfaces") {
  EnvGuard env;
  env.set("NICS", "");
  auto config = load();
  REQUIRE(config.nics_set);
  REQUIRE(config.nics.empty());
}

TEST_CASE("log level parsing") {
  REQUIRE(hostpulse::parse_log_level("debug") == fastlog::LogLevel::Debug);
  REQUIRE(hostpulse::parse_log_level("WARN") == fastlog::LogLevel::Warn);
  REQUIRE(hostpulse::parse_log_level("error") == fastlog::LogLevel::Error);
  REQUIRE(hostpulse::parse_log_level("info") == fastlog::LogLevel::Info);
  REQUIRE(hostpulse::parse_log_level("verbose") == fastlog::LogLevel::Info);
}
