// FillLight.h
// Abstract supplemental light switched on for dark captures.

#pragma once

class FillLight {
 public:
  virtual ~FillLight() = default;

  // Idempotent.
  virtual void setOn(bool on) = 0;
  virtual bool isOn() const = 0;
};
