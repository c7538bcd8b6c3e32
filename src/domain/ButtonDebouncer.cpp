// ButtonDebouncer.cpp

#include "ButtonDebouncer.h"

#include "src/infrastructure/Logger.h"

int ButtonDebouncer::addKey(Button button, bool pressedNow) {
  if (keyCount_ >= kMaxKeys) return -1;
  Key& key = keys_[keyCount_];
  key = Key();
  key.button = button;
  key.lastRaw = key.stablePressed = pressedNow;
  key.longFired = pressedNow;
  return keyCount_++;
}

void ButtonDebouncer::sample(int index, bool raw, uint32_t now) {
  if (index < 0 || index >= keyCount_) return;
  Key& key = keys_[index];
  if (raw != key.lastRaw) {
    key.lastRaw = raw;
    key.changedMs = now;
    return;
  }
  if (now - key.changedMs < kDebounceMs) return;

  if (raw && !key.stablePressed) {
    key.stablePressed = true;
    key.pressedMs = now;
    key.longFired = false;
    // Only the shutter has a second gesture; the others fire on press.
    if (key.button != Button::CaptureShort) push(key.button);
    return;
  }
  if (raw && key.stablePressed && key.button == Button::CaptureShort && !key.longFired &&
      now - key.pressedMs >= kLongPressMs) {
    key.longFired = true;
    push(Button::CaptureLong);
    return;
  }
  if (!raw && key.stablePressed) {
    key.stablePressed = false;
    if (key.button == Button::CaptureShort && !key.longFired) push(Button::CaptureShort);
  }
}

Button ButtonDebouncer::next() {
  if (count_ == 0) return Button::None;
  const Button b = queue_[head_];
  head_ = (head_ + 1) % kQueueDepth;
  --count_;
  return b;
}

void ButtonDebouncer::push(Button button) {
  if (count_ == kQueueDepth) {
    Logger::warn("Buttons: queue full, %s dropped", buttonName(button));
    return;
  }
  queue_[(head_ + count_) % kQueueDepth] = button;
  ++count_;
}
