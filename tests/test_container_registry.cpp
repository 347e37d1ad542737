#include <catch2/catch.hpp>

#include "container/admission_gate.hpp"
#include "container/container_registry.hpp"
#include "container/retry_policy.hpp"
#include "fakes.hpp"

using hostpulse::ContainerCounters;
using hostpulse::ContainerRates;
using hostpulse::test::ManualClock;

TEST_CASE("first observation reports cpu since start and zero network rate") {
  ManualClock clock;
  hostpulse::ContainerRegistry registry;
  ContainerRates rates;
  REQUIRE(registry.derive("abc", {1000, 10000, 5000, 7000}, clock.now(), &rates));
  REQUIRE(rates.cpu == Approx(10.0));
  REQUIRE(rates.net_sent_ps == 0.0);
  REQUIRE(rates.net_recv_ps == 0.0);
  REQUIRE(registry.contains("abc"));

  clock.advance(5);
  REQUIRE(registry.derive("abc", {1500, 20000, 10000, 7500}, clock.now(), &rates));
  REQUIRE(rates.cpu == Approx(5.0));
  REQUIRE(rates.net_sent_ps == Approx(1000.0));
  REQUIRE(rates.net_recv_ps == Approx(100.0));
}

TEST_CASE("cpu above 100 percent leaves the stored pair unchanged") {
  ManualClock clock;
  hostpulse::ContainerRegistry registry;
  ContainerRates rates;
  REQUIRE(registry.derive("abc", {1000, 10000, 0, 0}, clock.now(), &rates));

  clock.advance(1);
  double rejected = 0;
  REQUIRE_FALSE(registry.derive("abc", {3000, 11000, 50, 50}, clock.now(), &rates, &rejected));
  REQUIRE(rejected == Approx(200.0));

  hostpulse::PrevContainerStats prev;
  REQUIRE(registry.find("abc", &prev));
  REQUIRE(prev.cpu_container == 1000);
  REQUIRE(prev.cpu_system == 10000);
  REQUIRE(prev.net_sent == 0);
}

TEST_CASE("rejected first sample is not stored") {
  ManualClock clock;
  hostpulse::ContainerRegistry registry;
  ContainerRates rates;
  REQUIRE_FALSE(registry.derive("abc", {5000, 1000, 0, 0}, clock.now(), &rates));
  REQUIRE_FALSE(registry.contains("abc"));
}

TEST_CASE("zero system delta gives zero cpu") {
  ManualClock clock;
  hostpulse::ContainerRegistry registry;
  ContainerRates rates;
  REQUIRE(registry.derive("abc", {1000, 10000, 0, 0}, clock.now(), &rates));
  clock.advance(1);
  REQUIRE(registry.derive("abc", {2000, 10000, 0, 0}, clock.now(), &rates));
  REQUIRE(rates.cpu == 0.0);
}

TEST_CASE("prune keeps only listed ids") {
  ManualClock clock;
  hostpulse::ContainerRegistry registry;
  ContainerRates rates;
  for (const char* id : {"a", "b", "c"}) {
    REQUIRE(registry.derive(id, {1, 100, 0, 0}, clock.now(), &rates));
  }
  REQUIRE(registry.prune({"a", "c", "z"}) == 1);
  REQUIRE(registry.ids() == std::vector<std::string>{"a", "c"});
  registry.erase("a");
  REQUIRE(registry.size() == 1);
}

TEST_CASE("retry policy stops on success or when not retryable") {
  hostpulse::RetryPolicy policy;
  REQUIRE(policy.max_attempts() == 2);

  int attempts = 0;
  int failures = 0;
  REQUIRE(policy.run([&](int n) { attempts = n; return n == 2; }, [&](int) { ++failures; }));
  REQUIRE(attempts == 2);
  REQUIRE(failures == 1);

  attempts = failures = 0;
  REQUIRE_FALSE(policy.run([&](int n) { attempts = n; return false; }, [&](int) { ++failures; }));
  REQUIRE(attempts == 2);
  REQUIRE(failures == 2);

  attempts = failures = 0;
  REQUIRE_FALSE(policy.run([&](int n) { attempts = n; return false; }, [&](int) { ++failures; },
                           [] { return false; }));
  REQUIRE(attempts == 1);
  REQUIRE(failures == 1);
}

TEST_CASE("admission gate slots are released on destruction") {
  hostpulse::AdmissionGate gate(2);
  {
    auto a = gate.enter();
    auto b = gate.enter();
    REQUIRE(gate.in_flight() == 2);
    auto moved = std::move(a);
    REQUIRE_FALSE(a.held());
    REQUIRE(moved.held());
    REQUIRE(gate.in_flight() == 2);
    b.release();
    REQUIRE(gate.in_flight() == 1);
  }
  REQUIRE(gate.in_flight() == 0);
  REQUIRE(gate.peak() == 2);
  gate.reset_peak();
  REQUIRE(gate.peak() == 0);
}

TEST_CASE("admission gate blocks until a slot is free") {
  hostpulse::AdmissionGate gate(1);
  auto held = gate.enter();
  std::atomic<bool> entered{false};
  std::thread waiter([&] {
    auto slot = gate.enter();
    entered = true;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  REQUIRE_FALSE(entered.load());
  held.release();
  waiter.join();
  REQUIRE(entered.load());
  REQUIRE(gate.peak() == 1);
}
