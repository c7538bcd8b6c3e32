// Clock.h
// Abstract time source. Millisecond ticks for timeouts and idle tracking,
// wall-clock seconds for capture stamps.

#pragma once

#include <stdint.h>
#include <time.h>

class Clock {
 public:
  virtual ~Clock() = default;

  // Monotonic milliseconds; wraps like millis().
  virtual uint32_t nowMs() const = 0;

  // Blocks the calling task for `ms` milliseconds.
  virtual void delayMs(uint32_t ms) = 0;

  // Epoch seconds, or 0 when wall-clock time is not available.
  virtual time_t epochNow() const = 0;
};
