// ButtonDebouncer.h
// Turns raw key samples into logical presses. Keys are debounced
// independently and every completed press is queued, so presses that
// complete in the same sampling pass are all delivered in key order.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "InputSource.h"

class ButtonDebouncer {
 public:
  static constexpr uint32_t kDebounceMs = 30;
  static constexpr uint32_t kLongPressMs = 800;
  static constexpr int kMaxKeys = 8;
  static constexpr size_t kQueueDepth = 8;

  // Registers a key. A key already pressed must be released before it
  // counts. Returns the key index, or -1 when every slot is taken.
  int addKey(Button button, bool pressedNow);

  // Feeds one raw sample for `key`.
  void sample(int key, bool pressed, uint32_t nowMs);

  // Oldest queued press, or Button::None.
  Button next();

  size_t pending() const { return count_; }

 private:
  struct Key {
    Button button = Button::None;
    bool stablePressed = false;
    bool lastRaw = false;
    uint32_t changedMs = 0;
    uint32_t pressedMs = 0;
    bool longFired = false;
  };

  Key keys_[kMaxKeys];
  int keyCount_ = 0;
  Button queue_[kQueueDepth] = {};
  size_t head_ = 0;
  size_t count_ = 0;

  void push(Button button);
};
