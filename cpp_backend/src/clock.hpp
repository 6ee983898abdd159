#pragma once

#include <chrono>

namespace soulwar {

// Source of simulation time in seconds. Every timer in the world compares
// against this value, so tests drive time through ManualClock.
class Clock {
 public:
  virtual ~Clock() = default;
  virtual double now() const = 0;
};

class SteadyClock final : public Clock {
 public:
  SteadyClock() : start_(std::chrono::steady_clock::now()) {}

  double now() const override {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
  }

 private:
  std::chrono::steady_clock::time_point start_;
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(double start = 0.0) : now_(start) {}

  double now() const override {
    return now_;
  }

  void set(double value) {
    now_ = value;
  }

  void advance(double seconds) {
    now_ += seconds;
  }

 private:
  double now_;
};

}  // namespace soulwar
