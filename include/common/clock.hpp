#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>

// Source of "now" in Unix seconds.
class Clock {
public:
  virtual ~Clock() = default;
  virtual std::uint64_t Now() const = 0;
};

class SystemClock : public Clock {
public:
  std::uint64_t Now() const override;
};

// Test and simulation clock; only moves when told to.
class ManualClock : public Clock {
public:
  explicit ManualClock(std::uint64_t start = 0) : now_(start) {}
  std::uint64_t Now() const override { return now_; }
  void Set(std::uint64_t t) { now_ = t; }
  void Advance(std::uint64_t seconds) {
    if (seconds > std::numeric_limits<std::uint64_t>::max() - now_) throw std::overflow_error("clock overflow");
    now_ += seconds;
  }
private:
  std::uint64_t now_;
};
