// CaptureResult.h
// Encoded JPEG bytes of one capture. Move-only: the buffer travels from the
// camera to the archive and the analysis worker and is released by the last
// stage that needs it.

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <time.h>

#include <vector>

struct CaptureResult {
  std::vector<uint8_t> bytes;
  time_t capturedAt = 0;  // wall-clock seconds, 0 when the clock is not set

  CaptureResult() = default;
  CaptureResult(CaptureResult&&) = default;
  CaptureResult& operator=(CaptureResult&&) = default;
  CaptureResult(const CaptureResult&) = delete;
  CaptureResult& operator=(const CaptureResult&) = delete;

  size_t size() const { return bytes.size(); }
  bool empty() const { return bytes.empty(); }

  // Frees the buffer (clear() alone keeps the capacity).
  void release() { std::vector<uint8_t>().swap(bytes); }
};
