// GpioFillLight.h
// Fill light LED on a single GPIO. Supports active-LOW drivers.

#pragma once

#include <Arduino.h>

#include "src/domain/FillLight.h"

class GpioFillLight : public FillLight {
 public:
  explicit GpioFillLight(bool activeLow = false) : activeLow_(activeLow) {}

  // Configures the pin and leaves the light off.
  void begin(uint8_t pin) {
    pin_ = pin;
    pinMode(pin_, OUTPUT);
    isOn_ = true;
    setOn(false);
  }

  void setOn(bool on) override {
    if (pin_ == 255 || on == isOn_) return;
    isOn_ = on;
    uint8_t level = activeLow_ ? (on ? LOW : HIGH) : (on ? HIGH : LOW);
    digitalWrite(pin_, level);
  }

  bool isOn() const override { return isOn_; }

 private:
  uint8_t pin_ = 255;
  bool activeLow_ = false;
  bool isOn_ = false;
};
