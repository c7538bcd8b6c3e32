// SystemClock.h
// millis()-based Clock plus SNTP-backed wall-clock time for capture stamps
// and SD file timestamps.

#pragma once

#include <Arduino.h>

#include "src/domain/Clock.h"

class SystemClock : public Clock {
 public:
  // Initialize SNTP with timezone. Non-blocking; call waitForTime() to ensure sync.
  void begin(const char* tz);

  // Poll for time availability with timeoutMs. Returns true if time is set.
  bool waitForTime(uint32_t timeoutMs);

  uint32_t nowMs() const override { return millis(); }

  // vTaskDelay underneath, so other tasks keep running.
  void delayMs(uint32_t ms) override { delay(ms); }

  // Current epoch seconds or 0 if SNTP has not synced yet.
  time_t epochNow() const override;
};
