// CameraDevice.h
// Abstract camera: full-resolution JPEG capture plus a small decoded
// preview for brightness sampling and the viewfinder.

#pragma once

#include "CaptureResult.h"
#include "Frame.h"

enum class CaptureError {
  None,
  NotReady,      // driver not initialized
  Resolution,    // driver rejected the resolution code
  Hardware,      // frame grab failed
  OutOfMemory,   // buffer copy failed
};

class CameraDevice {
 public:
  virtual ~CameraDevice() = default;

  // Applies a driver resolution code. Returns false when it is rejected.
  virtual bool setResolution(int resolutionCode) = 0;

  // Grabs one encoded JPEG and copies it into `out`.
  virtual CaptureError capture(CaptureResult& out) = 0;

  // Grabs a small RGB565 preview. Returns false when none is available.
  virtual bool preview(Frame& out) = 0;

  // True when the sensor can drive its lens.
  virtual bool hasAutofocus() const = 0;

  // Runs one autofocus cycle and returns when the lens has settled.
  // Returns false when focusing failed or the sensor has no autofocus.
  virtual bool autofocus() = 0;
};
