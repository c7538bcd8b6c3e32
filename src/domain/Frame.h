// Frame.h
// Small decoded viewfinder frame used for brightness sampling and preview.
//
// Pixel layout: RGB565, one uint16_t per pixel in native integer order,
// red in bits 15..11, green in bits 10..5, blue in bits 4..0. Rows are stored
// top to bottom with no padding.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <vector>

struct Frame {
  uint16_t width = 0;
  uint16_t height = 0;
  std::vector<uint16_t> pixels;

  // True when the buffer holds exactly width * height pixels.
  bool readable() const {
    return width > 0 && height > 0 && pixels.size() == static_cast<size_t>(width) * height;
  }
};
