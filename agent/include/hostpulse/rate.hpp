#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace hostpulse {

using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
// 可注入的时钟，测试中替换为手动时钟
using ClockFn = std::function<TimePoint()>;

inline TimePoint steady_now() { return Clock::now(); }

/// 累计计数器的一次观测（基线）
struct CounterBaseline {
  uint64_t value = 0;
  TimePoint time{};
  bool initialized = false;

  void reset() {
    value = 0;
    initialized = false;
  }
  void update(uint64_t new_value, TimePoint now) {
    value = new_value;
    time = now;
    initialized = true;
  }
};

// (p1 - p0) / (t1 - t0)；基线未初始化、时间未前进或计数器回退时返回 0
double per_second(uint64_t p0, TimePoint t0, uint64_t p1, TimePoint t1);
double per_second(const CounterBaseline& prev, uint64_t current, TimePoint now);

double seconds_between(TimePoint from, TimePoint to);

// 四舍五入到两位小数
double two_decimals(double value);
double bytes_to_megabytes(double bytes);
double bytes_to_gigabytes(uint64_t bytes);

}  // namespace hostpulse
