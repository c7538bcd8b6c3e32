// BrightnessSampler.cpp

#include "BrightnessSampler.h"

#include "src/infrastructure/Logger.h"

uint8_t BrightnessSampler::luma(uint16_t rgb565) {
  // Expand 5/6-bit channels to 8 bits before weighting.
  const uint32_t r = ((rgb565 >> 11) & 0x1F) * 255u / 31u;
  const uint32_t g = ((rgb565 >> 5) & 0x3F) * 255u / 63u;
  const uint32_t b = (rgb565 & 0x1F) * 255u / 31u;
  return static_cast<uint8_t>((77u * r + 151u * g + 28u * b) >> 8);
}

int BrightnessSampler::averageLuma(const Frame& frame) {
  if (!frame.readable()) return -1;

  uint32_t sum = 0;
  int samples = 0;
  for (int gy = 0; gy < kGridSize; ++gy) {
    // Sample at the centre of each grid cell.
    const uint32_t y = (static_cast<uint32_t>(frame.height) * (2 * gy + 1)) / (2 * kGridSize);
    for (int gx = 0; gx < kGridSize; ++gx) {
      const uint32_t x = (static_cast<uint32_t>(frame.width) * (2 * gx + 1)) / (2 * kGridSize);
      sum += luma(frame.pixels[y * frame.width + x]);
      ++samples;
    }
  }
  return static_cast<int>(sum / samples);
}

bool BrightnessSampler::isDark(const Frame& frame) const {
  const int avg = averageLuma(frame);
  if (avg < 0) {
    Logger::debug("Brightness: unreadable frame, treating as not dark");
    return false;
  }
  Logger::debug("Brightness: average luma %d (threshold %u)", avg, (unsigned)threshold_);
  return avg < threshold_;
}
