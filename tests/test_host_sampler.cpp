#include <catch2/catch.hpp>

#include "fakes.hpp"
#include "hostpulse/fs_registry.hpp"
#include "hostpulse/host_sampler.hpp"
#include "hostpulse/net_registry.hpp"
#include "hostpulse/version.hpp"

using hostpulse::test::FakeHostProvider;
using hostpulse::test::ManualClock;

namespace {
constexpr uint64_t kGiB = 1073741824ULL;
constexpr uint64_t kMiB = 1048576ULL;

struct SamplerFixture {
  FakeHostProvider provider;
  ManualClock clock;
  hostpulse::AgentConfig config;
  hostpulse::FsRegistry fs;
  hostpulse::NetRegistry net;

  SamplerFixture() {
    config.extra_fs_dir = "/nonexistent/hostpulse-extra-filesystems";
    provider.parts = {{"/dev/sda1", "/", "ext4"}, {"/dev/sdb1", "/mnt/data", "xfs"}};
    provider.set_disk("/", 100 * kGiB, 50 * kGiB);
    provider.set_disk("/mnt/data", 200 * kGiB, 20 * kGiB);
    provider.set_disk_io("sda1", 0, 0);
    provider.set_disk_io("sdb1", 0, 0);
    provider.set_net_io("lo", 100, 100);
    provider.set_net_io("eth0", 1000, 1000);
    provider.memory.total = 16 * kGiB;
    provider.memory.free = 4 * kGiB;
    provider.memory.used = 8 * kGiB;
    provider.memory.used_percent = 50.0;
    provider.memory.swap_total = 2 * kGiB;
    provider.memory.swap_free = kGiB;
    provider.cpu = 12.3456;
  }

  void discover() {
    config.extra_filesystems = {"sdb1"};
    hostpulse::discover_filesystems(provider, config, &fs, clock.now());
    hostpulse::discover_interfaces(provider, config, &net, clock.now());
  }
};
}  // namespace

TEST_CASE_METHOD(SamplerFixture, "root filesystem usage and read rate") {
  discover();
  hostpulse::HostSampler sampler(provider, fs, net, config, clock.fn());
  hostpulse::proto::SystemInfo info;
  hostpulse::proto::SystemStats stats;

  sampler.sample(&info, &stats);
  REQUIRE(stats.disk_total() == Approx(100.0));
  REQUIRE(stats.disk_used() == Approx(50.0));
  REQUIRE(stats.disk_pct() == Approx(50.00));
  REQUIRE(info.disk_pct() == Approx(50.00));
  REQUIRE(stats.disk_read_ps() == 0.0);

  clock.advance(10);
  provider.set_disk_io("sda1", 1000000, 0);
  sampler.sample(&info, &stats);
  REQUIRE(stats.disk_read_ps() == Approx(0.10));
  REQUIRE(stats.disk_write_ps() == 0.0);
  REQUIRE(fs.find("sda1")->stats.disk_read_ps() == Approx(0.10));
}

TEST_CASE_METHOD(SamplerFixture, "discovery registers root and extra filesystems") {
  discover();
  REQUIRE(fs.entries().size() == 2);
  REQUIRE(fs.find("sda1")->root);
  REQUIRE(fs.find("sda1")->mountpoint == "/");
  REQUIRE_FALSE(fs.find("sdb1")->root);
  REQUIRE(fs.find("sdb1")->mountpoint == "/mnt/data");
  REQUIRE(fs.io_names().size() == 2);
}

TEST_CASE_METHOD(SamplerFixture, "root falls back to the busiest io device") {
  provider.parts.clear();
  provider.set_disk_io("sda1", 10, 0);
  provider.set_disk_io("nvme0n1", 5000, 0);
  hostpulse::discover_filesystems(provider, config, &fs, clock.now());
  REQUIRE(fs.find("nvme0n1") != nullptr);
  REQUIRE(fs.find("nvme0n1")->root);
  REQUIRE(fs.find("nvme0n1")->mountpoint == "/");
}

TEST_CASE_METHOD(SamplerFixture, "unmounted filesystem is zeroed and re-baselined") {
  discover();
  hostpulse::HostSampler sampler(provider, fs, net, config, clock.fn());
  hostpulse::proto::SystemInfo info;
  hostpulse::proto::SystemStats stats;
  sampler.sample(&info, &stats);
  REQUIRE(fs.find("sdb1")->stats.disk_total() == Approx(200.0));

  provider.disks.erase("/mnt/data");
  provider.set_disk_io("sdb1", 50 * kMiB, 0);
  clock.advance(10);
  sampler.sample(&info, &stats);
  const auto* entry = fs.find("sdb1");
  REQUIRE(entry->stats.disk_total() == 0.0);
  REQUIRE(entry->stats.disk_used() == 0.0);
  // 基线已清零，本周期不计算速率
  REQUIRE(entry->stats.disk_read_ps() == 0.0);
  REQUIRE(stats.extra_fs().empty());

  provider.set_disk("/mnt/data", 200 * kGiB, 30 * kGiB);
  provider.set_disk_io("sdb1", 70 * kMiB, 0);
  clock.advance(10);
  sampler.sample(&info, &stats);
  REQUIRE(fs.find("sdb1")->stats.disk_total() == Approx(200.0));
  REQUIRE(fs.find("sdb1")->stats.disk_used() == Approx(30.0));
  REQUIRE(fs.find("sdb1")->stats.disk_read_ps() == Approx(2.0));
}

TEST_CASE_METHOD(SamplerFixture, "network rate over tracked interfaces") {
  discover();
  REQUIRE(net.tracks("eth0"));
  REQUIRE_FALSE(net.tracks("lo"));

  hostpulse::HostSampler sampler(provider, fs, net, config, clock.fn());
  hostpulse::proto::SystemInfo info;
  hostpulse::proto::SystemStats stats;
  clock.advance(2);
  provider.set_net_io("eth0", 1000 + 4 * kMiB, 1000 + 2 * kMiB);
  provider.set_net_io("lo", 100 + 100 * kMiB, 100 + 100 * kMiB);
  sampler.sample(&info, &stats);
  REQUIRE(stats.network_sent() == Approx(2.0));
  REQUIRE(stats.network_recv() == Approx(1.0));
}

TEST_CASE_METHOD(SamplerFixture, "implausible network rate is discarded and re-baselined") {
  discover();
  hostpulse::HostSampler sampler(provider, fs, net, config, clock.fn());
  hostpulse::proto::SystemInfo info;
  hostpulse::proto::SystemStats stats;

  clock.advance(1);
  uint64_t spike = 1000 + 20000 * kMiB;
  provider.set_net_io("eth0", spike, 1000);
  sampler.sample(&info, &stats);
  REQUIRE(stats.network_sent() == 0.0);
  REQUIRE(stats.network_recv() == 0.0);
  REQUIRE(net.io().bytes_sent == spike);
  REQUIRE(net.io().bytes_recv == 1000);
  REQUIRE(net.io().time == clock.now());

  clock.advance(1);
  provider.set_net_io("eth0", spike + kMiB, 1000);
  sampler.sample(&info, &stats);
  REQUIRE(stats.network_sent() == Approx(1.0));
}

TEST_CASE_METHOD(SamplerFixture, "NICS whitelist overrides auto detection") {
  config.nics_set = true;
  config.nics = {"lo"};
  hostpulse::discover_interfaces(provider, config, &net, clock.now());
  REQUIRE(net.tracks("lo"));
  REQUIRE_FALSE(net.tracks("eth0"));
  REQUIRE(net.io().bytes_sent == 100);
}

TEST_CASE("interface skip rules") {
  REQUIRE(hostpulse::skip_interface({"lo", 10, 10}));
  REQUIRE(hostpulse::skip_interface({"docker0", 10, 10}));
  REQUIRE(hostpulse::skip_interface({"br-1a2b", 10, 10}));
  REQUIRE(hostpulse::skip_interface({"veth12ab", 10, 10}));
  REQUIRE(hostpulse::skip_interface({"eth1", 0, 10}));
  REQUIRE(hostpulse::skip_interface({"eth1", 10, 0}));
  REQUIRE_FALSE(hostpulse::skip_interface({"eth1", 10, 10}));
}

TEST_CASE_METHOD(SamplerFixture, "duplicate sensor keys get an index suffix") {
  discover();
  provider.temps = {{"nvme", 38.0}, {"nvme", 39.126}, {"coretemp", 45.0}};
  hostpulse::HostSampler sampler(provider, fs, net, config, clock.fn());
  hostpulse::proto::SystemInfo info;
  hostpulse::proto::SystemStats stats;
  sampler.sample(&info, &stats);
  const auto& temps = stats.temperatures();
  REQUIRE(temps.size() == 3);
  REQUIRE(temps.at("nvme") == Approx(38.0));
  REQUIRE(temps.at("nvme_1") == Approx(39.13));
  REQUIRE(temps.at("coretemp") == Approx(45.0));
}

TEST_CASE_METHOD(SamplerFixture, "cores and threads reporting") {
  discover();
  hostpulse::HostSampler sampler(provider, fs, net, config, clock.fn());
  hostpulse::proto::SystemInfo info;
  hostpulse::proto::SystemStats stats;

  SECTION("both reported") {
    sampler.sample(&info, &stats);
    REQUIRE(info.cores() == 4);
    REQUIRE(info.threads() == 8);
  }
  SECTION("fewer threads than cores") {
    provider.physical_cores = 8;
    provider.logical_threads = 4;
    sampler.sample(&info, &stats);
    REQUIRE(info.cores() == 4);
    REQUIRE(info.threads() == 0);
  }
}

TEST_CASE_METHOD(SamplerFixture, "host info and memory fields") {
  discover();
  hostpulse::HostSampler sampler(provider, fs, net, config, clock.fn());
  hostpulse::proto::SystemInfo info;
  hostpulse::proto::SystemStats stats;
  sampler.sample(&info, &stats);
  REQUIRE(info.hostname() == "testhost");
  REQUIRE(info.kernel_version() == "6.1.0-test");
  REQUIRE(info.uptime() == 3600);
  REQUIRE(info.cpu_model() == "Test CPU @ 3.00GHz");
  REQUIRE(info.agent_version() == hostpulse::kAgentVersion);
  REQUIRE(info.cpu() == Approx(12.35));
  REQUIRE(stats.cpu() == Approx(12.35));
  REQUIRE(stats.mem() == Approx(16.0));
  REQUIRE(stats.mem_used() == Approx(8.0));
  REQUIRE(stats.mem_buff_cache() == Approx(4.0));
  REQUIRE(stats.mem_pct() == Approx(50.0));
  REQUIRE(stats.swap() == Approx(2.0));
  REQUIRE(stats.swap_used() == Approx(1.0));
}

TEST_CASE_METHOD(SamplerFixture, "failed sub-metrics keep the previous values") {
  discover();
  hostpulse::HostSampler sampler(provider, fs, net, config, clock.fn());
  hostpulse::proto::SystemInfo info;
  hostpulse::proto::SystemStats stats;
  sampler.sample(&info, &stats);

  provider.cpu_ok = false;
  provider.memory_ok = false;
  provider.temps_ok = false;
  provider.temps.clear();
  provider.cpu = 99.0;
  provider.memory.used_percent = 90.0;
  sampler.sample(&info, &stats);
  REQUIRE(stats.cpu() == Approx(12.35));
  REQUIRE(stats.mem_pct() == Approx(50.0));
  REQUIRE(info.mem_pct() == Approx(50.0));
  REQUIRE(stats.disk_pct() == Approx(50.0));
}
