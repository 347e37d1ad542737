#include "container/admission_gate.hpp"

#include <algorithm>

namespace hostpulse {

AdmissionGate::Slot& AdmissionGate::Slot::operator=(Slot&& other) noexcept {
  if (this != &other) {
    release();
    _gate = other._gate;
    other._gate = nullptr;
  }
  return *this;
}

void AdmissionGate::Slot::release() {
  if (_gate) {
    _gate->leave();
    _gate = nullptr;
  }
}

AdmissionGate::AdmissionGate(size_t capacity) : _capacity(std::max<size_t>(capacity, 1)) {}

AdmissionGate::Slot AdmissionGate::enter() {
  std::unique_lock<std::mutex> lock(_mtx);
  _cv.wait(lock, [this] { return _in_flight < _capacity; });
  ++_in_flight;
  _peak = std::max(_peak, _in_flight);
  return Slot(this);
}

void AdmissionGate::leave() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    --_in_flight;
  }
  _cv.notify_one();
}

size_t AdmissionGate::in_flight() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _in_flight;
}

size_t AdmissionGate::peak() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _peak;
}

void AdmissionGate::reset_peak() {
  std::lock_guard<std::mutex> lock(_mtx);
  _peak = _in_flight;
}

}  // namespace hostpulse
