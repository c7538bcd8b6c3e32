// TftDisplay.h
// DisplaySurface on an SPI TFT through TFT_eSPI (panel and pins come from the
// library's User_Setup). Text uses built-in font 2.

#pragma once

#include <Arduino.h>
#include <TFT_eSPI.h>

#include "src/domain/DisplaySurface.h"

class TftDisplay : public DisplaySurface {
 public:
  static const int kFont = 2;

  void begin(uint8_t rotation);

  int width() const override { return width_; }
  int height() const override { return height_; }
  int lineHeight() const override { return lineHeight_; }

  void clear(uint16_t color) override;
  void fillRect(int x, int y, int w, int h, uint16_t color) override;
  void drawText(int x, int y, const std::string& text, uint16_t color) override;
  void blit(int x, int y, const Frame& frame) override;
  void setPower(bool on) override;

  // Full-screen diagnostic used when startup halts.
  void showFatal(const char* title, const char* detail);

 private:
  TFT_eSPI tft_;
  int width_ = 0;
  int height_ = 0;
  int lineHeight_ = 16;
  bool powered_ = true;
};
