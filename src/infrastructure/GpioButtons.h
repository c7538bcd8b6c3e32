// GpioButtons.h
// Active-LOW push buttons mapped to logical Buttons. Pins are sampled on
// every poll and fed to a ButtonDebouncer; the shutter distinguishes a short
// press (reported on release) from a long press (reported once when the
// hold time is reached).

#pragma once

#include <Arduino.h>

#include "src/domain/ButtonDebouncer.h"
#include "src/domain/InputSource.h"

class GpioButtons : public InputSource {
 public:
  struct Pins {
    int shutter;
    int left;
    int right;
    int up;
    int down;
    int select;
    int confirm;
  };

  // Configures every pin with INPUT_PULLUP. Negative pins are skipped.
  void begin(const Pins& pins);

  // Samples all keys, then returns the oldest queued press.
  Button poll() override;

 private:
  static const int kKeyCount = 7;
  int pins_[kKeyCount] = {-1, -1, -1, -1, -1, -1, -1};
  int keyIndex_[kKeyCount] = {-1, -1, -1, -1, -1, -1, -1};
  ButtonDebouncer debouncer_;
};
