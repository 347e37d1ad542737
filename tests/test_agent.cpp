#include <catch2/catch.hpp>

#include <thread>

#include "fakes.hpp"
#include "hostpulse/agent.hpp"

using hostpulse::test::FakeDockerClient;
using hostpulse::test::FakeHostProvider;
using hostpulse::test::ManualClock;
using hostpulse::test::stats_json;

namespace {
constexpr uint64_t kGiB = 1073741824ULL;
constexpr uint64_t kMiB = 1048576ULL;

struct AgentFixture {
  FakeHostProvider provider;
  FakeDockerClient docker;
  ManualClock clock;
  hostpulse::AgentConfig config;

  AgentFixture() {
    config.extra_fs_dir = "/nonexistent/hostpulse-extra-filesystems";
    config.extra_filesystems = {"sdb1", "sdc1"};
    provider.parts = {{"/dev/sda1", "/", "ext4"},
                      {"/dev/sdb1", "/mnt/data", "xfs"},
                      {"/dev/sdc1", "/mnt/backup", "ext4"}};
    provider.set_disk("/", 100 * kGiB, 50 * kGiB);
    provider.set_disk("/mnt/data", 200 * kGiB, 20 * kGiB);
    provider.set_disk("/mnt/backup", 500 * kGiB, 100 * kGiB);
    provider.set_disk_io("sda1", 0, 0);
    provider.set_disk_io("sdb1", 0, 0);
    provider.set_disk_io("sdc1", 0, 0);
    provider.set_net_io("eth0", 1000, 1000);
    provider.memory.total = 8 * kGiB;
    provider.memory.used = 2 * kGiB;
    provider.memory.free = 4 * kGiB;
    provider.memory.used_percent = 25.0;

    docker.set("/containers/json",
               {true, "[{\"Id\":\"aaaaaaaaaaaa1\",\"Names\":[\"/web\"],\"Status\":\"Up 1 hour\"}]"});
    docker.set("/containers/aaaaaaaaaaaa/stats?stream=0&one-shot=1",
               {true, stats_json(32 * kMiB, 0, 1000, 100000, 0, 0)});
  }
};
}  // namespace

TEST_CASE_METHOD(AgentFixture, "snapshot merges host, filesystems and containers") {
  hostpulse::Agent agent(config, provider, docker, clock.fn());
  agent.initialize();

  // 模拟 sdc1 被卸载
  provider.disks.erase("/mnt/backup");

  hostpulse::proto::CombinedData data;
  agent.gather_stats(&data);

  REQUIRE(data.stats().disk_pct() == Approx(50.0));
  REQUIRE(data.info().disk_pct() == Approx(50.0));
  REQUIRE(data.info().mem_pct() == Approx(25.0));
  REQUIRE(data.info().hostname() == "testhost");

  const auto& extra = data.stats().extra_fs();
  REQUIRE(extra.size() == 1);
  REQUIRE(extra.count("sda1") == 0);
  REQUIRE(extra.count("sdc1") == 0);
  REQUIRE(extra.at("sdb1").disk_total() == Approx(200.0));
  REQUIRE(extra.at("sdb1").disk_used() == Approx(20.0));

  REQUIRE(data.containers_size() == 1);
  REQUIRE(data.containers(0).name() == "web");
  REQUIRE(data.containers(0).mem() == Approx(32.0));
}

TEST_CASE_METHOD(AgentFixture, "container listing failure keeps host data") {
  docker.set("/containers/json", {false, "", false, "connect: connection refused"});
  hostpulse::Agent agent(config, provider, docker, clock.fn());
  agent.initialize();

  hostpulse::proto::CombinedData data;
  agent.gather_stats(&data);
  REQUIRE(data.containers_size() == 0);
  REQUIRE(data.stats().disk_total() == Approx(100.0));
  REQUIRE(data.stats().extra_fs().size() == 2);
}

TEST_CASE_METHOD(AgentFixture, "concurrent callers are served one cycle at a time") {
  hostpulse::Agent agent(config, provider, docker, clock.fn());
  agent.initialize();
  docker.set_delay(std::chrono::milliseconds(10));

  hostpulse::proto::CombinedData a;
  hostpulse::proto::CombinedData b;
  std::thread first([&] { agent.gather_stats(&a); });
  std::thread second([&] { agent.gather_stats(&b); });
  first.join();
  second.join();

  REQUIRE(a.containers_size() == 1);
  REQUIRE(b.containers_size() == 1);
  REQUIRE(docker.peak_in_flight() == 1);
  REQUIRE(agent.container_registry().size() == 1);
}
