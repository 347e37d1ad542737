#pragma once

namespace hostpulse {

/// 固定次数、无退避的重试
class RetryPolicy {
 public:
  explicit RetryPolicy(int max_attempts = 2) : _max_attempts(max_attempts < 1 ? 1 : max_attempts) {}

  // attempt(n) 返回 true 表示成功；每次失败后调用 on_failure(n)，n 从 1 开始。
  // retryable() 返回 false 时不再继续尝试
  template <typename Attempt, typename OnFailure, typename Retryable>
  bool run(Attempt&& attempt, OnFailure&& on_failure, Retryable&& retryable) const {
    for (int n = 1; n <= _max_attempts; ++n) {
      if (attempt(n)) {
        return true;
      }
      on_failure(n);
      if (!retryable()) {
        break;
      }
    }
    return false;
  }

  template <typename Attempt, typename OnFailure>
  bool run(Attempt&& attempt, OnFailure&& on_failure) const {
    return run(attempt, on_failure, [] { return true; });
  }

  int max_attempts() const { return _max_attempts; }

 private:
  int _max_attempts;
};

}  // namespace hostpulse
