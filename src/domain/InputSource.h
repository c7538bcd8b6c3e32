// InputSource.h
// Logical buttons. Physical mapping and debouncing belong to the driver.

#pragma once

enum class Button {
  None,
  CaptureShort,
  CaptureLong,
  Left,
  Right,
  Up,
  Down,
  Select,   // browse / cancel / close
  Confirm,
};

class InputSource {
 public:
  virtual ~InputSource() = default;

  // Returns the next completed press, or Button::None. Never blocks.
  virtual Button poll() = 0;
};

const char* buttonName(Button button);
