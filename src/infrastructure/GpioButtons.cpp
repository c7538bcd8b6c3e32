// GpioButtons.cpp

#include "GpioButtons.h"

#include "src/infrastructure/Logger.h"

void GpioButtons::begin(const Pins& pins) {
  const int pinList[kKeyCount] = {pins.shutter, pins.left, pins.right, pins.up, pins.down, pins.select, pins.confirm};
  const Button buttons[kKeyCount] = {Button::CaptureShort, Button::Left, Button::Right, Button::Up,
                                     Button::Down, Button::Select, Button::Confirm};
  debouncer_ = ButtonDebouncer();
  for (int i = 0; i < kKeyCount; ++i) {
    pins_[i] = pinList[i];
    keyIndex_[i] = -1;
    if (pinList[i] < 0) continue;
    pinMode(pinList[i], INPUT_PULLUP);
    keyIndex_[i] = debouncer_.addKey(buttons[i], digitalRead(pinList[i]) == LOW);
  }
  Logger::info("Buttons: ready");
}

Button GpioButtons::poll() {
  const uint32_t now = millis();
  for (int i = 0; i < kKeyCount; ++i) {
    if (keyIndex_[i] < 0) continue;
    debouncer_.sample(keyIndex_[i], digitalRead(pins_[i]) == LOW, now);
  }
  return debouncer_.next();
}
