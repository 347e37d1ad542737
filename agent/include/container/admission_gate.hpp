#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace hostpulse {

/**
 * 固定容量的准入闸门
 *
 * enter() 在没有空闲名额时阻塞，返回的 Slot 析构时归还名额。
 * 同时记录当前占用数与历史峰值，便于观测并发上限。
 */
class AdmissionGate {
 public:
  class Slot {
   public:
    Slot() = default;
    explicit Slot(AdmissionGate* gate) : _gate(gate) {}
    ~Slot() { release(); }

    Slot(Slot&& other) noexcept : _gate(other._gate) { other._gate = nullptr; }
    Slot& operator=(Slot&& other) noexcept;
    Slot(const Slot&) = delete;
    Slot& operator=(const Slot&) = delete;

    void release();
    bool held() const { return _gate != nullptr; }

   private:
    AdmissionGate* _gate = nullptr;
  };

  explicit AdmissionGate(size_t capacity);

  AdmissionGate(const AdmissionGate&) = delete;
  AdmissionGate& operator=(const AdmissionGate&) = delete;

  Slot enter();

  size_t capacity() const { return _capacity; }
  size_t in_flight() const;
  size_t peak() const;
  void reset_peak();

 private:
  void leave();

  const size_t _capacity;
  mutable std::mutex _mtx;
  std::condition_variable _cv;
  size_t _in_flight = 0;
  size_t _peak = 0;
};

}  // namespace hostpulse
