// BrightnessSampler.h
// Decides whether the fill light is needed before a capture by averaging the
// luma of a fixed 3x3 grid of viewfinder pixels.

#pragma once

#include <stdint.h>

#include "Frame.h"

class BrightnessSampler {
 public:
  static constexpr int kGridSize = 3;  // samples per axis

  explicit BrightnessSampler(uint8_t darkThreshold) : threshold_(darkThreshold) {}

  // Returns true when the sampled average luma is below the threshold.
  // Unreadable frames are never dark so the capture is not held up.
  bool isDark(const Frame& frame) const;

  // Integer luma (0..255) of one RGB565 pixel:
  // (77 R + 151 G + 28 B) >> 8, i.e. 0.30 R + 0.59 G + 0.11 B.
  static uint8_t luma(uint16_t rgb565);

  // Average luma of the sample grid, or -1 for an unreadable frame.
  static int averageLuma(const Frame& frame);

 private:
  uint8_t threshold_;
};
