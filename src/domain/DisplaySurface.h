// DisplaySurface.h
// Abstract render target. Coordinates are pixels from the top-left corner;
// colors are RGB565.

#pragma once

#include <stdint.h>

#include <string>

#include "Frame.h"

namespace Colors {
static const uint16_t kBlack = 0x0000;
static const uint16_t kWhite = 0xFFFF;
static const uint16_t kGray = 0x8410;
static const uint16_t kRed = 0xF800;
static const uint16_t kGreen = 0x07E0;
static const uint16_t kYellow = 0xFFE0;
static const uint16_t kCyan = 0x07FF;
static const uint16_t kPanel = 0x2104;
}  // namespace Colors

class DisplaySurface {
 public:
  virtual ~DisplaySurface() = default;

  virtual int width() const = 0;
  virtual int height() const = 0;
  virtual int lineHeight() const = 0;  // pixels per text line

  virtual void clear(uint16_t color) = 0;
  virtual void fillRect(int x, int y, int w, int h, uint16_t color) = 0;
  virtual void drawText(int x, int y, const std::string& text, uint16_t color) = 0;
  virtual void blit(int x, int y, const Frame& frame) = 0;

  // Backlight and panel power.
  virtual void setPower(bool on) = 0;
};
