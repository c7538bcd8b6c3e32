// WifiManagerEsp32.cpp

#include "WifiManagerEsp32.h"

#include "src/infrastructure/Logger.h"

void WifiManagerEsp32::begin(const char* ssid, const char* pass) {
  ssid_ = ssid ? ssid : "";
  pass_ = pass ? pass : "";
  if (ssid_.length() == 0) {
    Logger::warn("WiFi: no SSID configured, requests will fail");
    state_ = STATE_DISABLED;
    return;
  }

  WiFi.mode(WIFI_STA);
  WiFi.setAutoReconnect(false);  // retries are ours
  WiFi.persistent(false);
  WiFi.setSleep(false);  // modem sleep stalls large TLS uploads

  attemptCount_ = 0;
  Logger::info("WiFi: connecting to '%s'", ssid_.c_str());
  startAttempt();
}

bool WifiManagerEsp32::waitConnected(uint32_t timeoutMs) {
  const uint32_t start = millis();
  while (state_ != STATE_DISABLED && millis() - start < timeoutMs) {
    service();
    if (state_ == STATE_CONNECTED) return true;
    delay(100);
  }
  return isConnected();
}

void WifiManagerEsp32::service() {
  const uint32_t now = millis();
  const wl_status_t s = WiFi.status();

  switch (state_) {
    case STATE_DISABLED:
      break;
    case STATE_CONNECTED:
      if (s != WL_CONNECTED) {
        Logger::warn("WiFi: lost connection, scheduling retry");
        attemptCount_ = 0;
        scheduleNextAttempt();
      }
      break;
    case STATE_CONNECTING:
      if (s == WL_CONNECTED) {
        Logger::info("WiFi: connected, IP=%s RSSI=%d", WiFi.localIP().toString().c_str(), WiFi.RSSI());
        attemptCount_ = 0;
        state_ = STATE_CONNECTED;
      } else if (s == WL_CONNECT_FAILED || s == WL_NO_SSID_AVAIL || now - attemptStartMs_ >= kConnectTimeoutMs) {
        Logger::warn("WiFi: connect status=%d, scheduling retry", static_cast<int>(s));
        scheduleNextAttempt();
      }
      break;
    case STATE_WAIT_BACKOFF:
      if ((int32_t)(now - nextAttemptMs_) >= 0) {
        Logger::info("WiFi: retrying (attempt %lu)", (unsigned long)attemptCount_ + 1);
        WiFi.disconnect(true);
        startAttempt();
      }
      break;
  }
}

void WifiManagerEsp32::startAttempt() {
  WiFi.begin(ssid_.c_str(), pass_.c_str());
  attemptStartMs_ = millis();
  state_ = STATE_CONNECTING;
}

void WifiManagerEsp32::scheduleNextAttempt() {
  // delay = min(max, base * 2^attempt) +/- jitter
  uint32_t expDelay = kBaseDelayMs << min<uint32_t>(attemptCount_, 6u);
  if (expDelay > kMaxDelayMs) expDelay = kMaxDelayMs;

  int32_t jitter = (int32_t)(random(0, kJitterMs * 2 + 1)) - (int32_t)kJitterMs;
  int32_t delayWithJitter = (int32_t)expDelay + jitter;
  if (delayWithJitter < 0) delayWithJitter = 0;

  nextAttemptMs_ = millis() + (uint32_t)delayWithJitter;
  attemptCount_++;
  state_ = STATE_WAIT_BACKOFF;
  Logger::debug("WiFi: backoff %ld ms (attempt %lu)", (long)delayWithJitter, (unsigned long)attemptCount_);
}
