#include "hostpulse/rate.hpp"

#include <cmath>

namespace hostpulse {

double seconds_between(TimePoint from, TimePoint to) {
  return std::chrono::duration<double>(to - from).count();
}

double per_second(uint64_t p0, TimePoint t0, uint64_t p1, TimePoint t1) {
  double dt = seconds_between(t0, t1);
  if (dt <= 0 || p1 < p0) {
    return 0;
  }
  return static_cast<double>(p1 - p0) / dt;
}

double per_second(const CounterBaseline& prev, uint64_t current, TimePoint now) {
  if (!prev.initialized) {
    return 0;
  }
  return per_second(prev.value, prev.time, current, now);
}

double two_decimals(double value) {
  return std::round(value * 100) / 100;
}

double bytes_to_megabytes(double bytes) {
  return two_decimals(bytes / 1048576);
}

double bytes_to_gigabytes(uint64_t bytes) {
  return two_decimals(static_cast<double>(bytes) / 1073741824);
}

}  // namespace hostpulse
