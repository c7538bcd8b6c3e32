// SystemClock.cpp

#include "SystemClock.h"

#include <time.h>

#include "src/infrastructure/Logger.h"

namespace {
// Anything earlier is the unsynced RTC counting up from 1970.
const time_t kMinValidEpoch = 1609459200;  // 2021-01-01
}  // namespace

void SystemClock::begin(const char* tz) {
  configTzTime(tz, "pool.ntp.org", "time.nist.gov");
  Logger::info("Clock: SNTP started (TZ=%s)", tz);
}

bool SystemClock::waitForTime(uint32_t timeoutMs) {
  const uint32_t start = millis();
  while (epochNow() == 0 && (millis() - start < timeoutMs)) {
    delay(50);
  }
  const bool synced = epochNow() != 0;
  if (!synced) Logger::warn("Clock: no SNTP time after %lu ms, file stamps will be 1970", (unsigned long)timeoutMs);
  return synced;
}

time_t SystemClock::epochNow() const {
  time_t t = time(nullptr);
  return t >= kMinValidEpoch ? t : 0;
}
