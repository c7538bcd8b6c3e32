// EspCamera.h
// esp32-camera driver in JPEG mode. Captures are copied out of the driver's
// frame buffer so the buffer goes straight back to the driver; previews are
// decoded with jpg2rgb565 at a scale that fits the screen width.
// The driver has no loader for the OV5640 focus firmware, so every
// sensor is treated as fixed focus.

#pragma once

#include <Arduino.h>
#include <esp_camera.h>

#include "src/domain/CameraDevice.h"

class EspCamera : public CameraDevice {
 public:
  struct Config {
    int pinPwdn;
    int pinReset;
    int pinXclk;
    int pinSiod;
    int pinSioc;
    int pinD[8];  // D0..D7
    int pinVsync;
    int pinHref;
    int pinPclk;
    int initialResolution;
    int jpegQuality;     // 0..63, lower is better
    int previewMaxWidth;  // decoded preview width limit in pixels
  };

  // Initializes the sensor. Returns false when the camera does not respond.
  bool begin(const Config& config);

  bool setResolution(int resolutionCode) override;
  CaptureError capture(CaptureResult& out) override;
  bool preview(Frame& out) override;
  bool hasAutofocus() const override { return false; }
  bool autofocus() override;

 private:
  bool ready_ = false;
  int resolution_ = -1;
  int previewMaxWidth_ = 240;

  // Drops the stale frame queued before a resolution change.
  void flushFrame();
};
