#pragma once

#include <picstash/internal.hpp>

#include <cstdint>

namespace picstash {

/**
 * Wall-clock source for age decisions (sweep grace periods).
 * Production code uses SystemClock; tests inject testing::FakeClock.
 */
class Clock {
 public:
  virtual ~Clock() = default;
  virtual uint64_t WallClockMicros() const = 0;
};

class SystemClock : public Clock {
 public:
  uint64_t WallClockMicros() const override { return internal::WallClockMicros(); }
};

}  // namespace picstash
