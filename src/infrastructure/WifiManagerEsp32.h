// WifiManagerEsp32.h
// Station-mode WiFi for the analysis requests.
// - Non-blocking reconnects with exponential backoff and jitter, advanced
//   from the UI loop
// - The worker task only reads isConnected() before an attempt

#pragma once

#include <Arduino.h>
#include <WiFi.h>

class WifiManagerEsp32 {
 public:
  // Stores credentials and starts the first association. Does not block.
  void begin(const char* ssid, const char* pass);

  // Blocks up to `timeoutMs` for the first association (boot only).
  bool waitConnected(uint32_t timeoutMs);

  // Advances the reconnect state machine. Call from every loop pass.
  void service();

  bool isConnected() const { return WiFi.status() == WL_CONNECTED; }

 private:
  enum ConnectState {
    STATE_DISABLED,
    STATE_CONNECTED,
    STATE_CONNECTING,
    STATE_WAIT_BACKOFF,
  };

  String ssid_;
  String pass_;
  ConnectState state_ = STATE_DISABLED;
  uint32_t attemptCount_ = 0;
  uint32_t attemptStartMs_ = 0;
  uint32_t nextAttemptMs_ = 0;

  static constexpr uint32_t kBaseDelayMs = 1000;
  static constexpr uint32_t kMaxDelayMs = 60 * 1000;
  static constexpr uint32_t kJitterMs = 250;
  static constexpr uint32_t kConnectTimeoutMs = 15000;

  void startAttempt();
  void scheduleNextAttempt();
};
