// TftDisplay.cpp

#include "TftDisplay.h"

#include "src/infrastructure/Logger.h"

void TftDisplay::begin(uint8_t rotation) {
  tft_.begin();
  tft_.setRotation(rotation);
  tft_.setSwapBytes(false);  // Frame pixels are native uint16_t
  tft_.setTextFont(kFont);
  tft_.setTextDatum(TL_DATUM);
  tft_.fillScreen(TFT_BLACK);
  width_ = tft_.width();
  height_ = tft_.height();
  lineHeight_ = tft_.fontHeight(kFont);
  if (lineHeight_ <= 0) lineHeight_ = 16;
#ifdef TFT_BL
  pinMode(TFT_BL, OUTPUT);
  digitalWrite(TFT_BL, TFT_BACKLIGHT_ON);
#endif
  Logger::info("Display: %dx%d, %d px lines", width_, height_, lineHeight_);
}

void TftDisplay::clear(uint16_t color) { tft_.fillScreen(color); }

void TftDisplay::fillRect(int x, int y, int w, int h, uint16_t color) { tft_.fillRect(x, y, w, h, color); }

void TftDisplay::drawText(int x, int y, const std::string& text, uint16_t color) {
  // Transparent background; callers clear the row first.
  tft_.setTextColor(color);
  tft_.drawString(text.c_str(), x, y, kFont);
}

void TftDisplay::blit(int x, int y, const Frame& frame) {
  if (!frame.readable()) return;
  int w = frame.width;
  int h = frame.height;
  if (x + w > width_) w = width_ - x;
  if (y + h > height_) h = height_ - y;
  if (w <= 0 || h <= 0) return;

  tft_.startWrite();
  if (w == frame.width) {
    tft_.pushImage(x, y, w, h, frame.pixels.data());
  } else {
    // Clip row by row; pushImage expects contiguous rows.
    for (int row = 0; row < h; ++row) {
      tft_.pushImage(x, y + row, w, 1, frame.pixels.data() + static_cast<size_t>(row) * frame.width);
    }
  }
  tft_.endWrite();
}

void TftDisplay::setPower(bool on) {
  if (on == powered_) return;
  powered_ = on;
#ifdef TFT_BL
  digitalWrite(TFT_BL, on ? TFT_BACKLIGHT_ON : !TFT_BACKLIGHT_ON);
#endif
  tft_.writecommand(on ? TFT_DISPON : TFT_DISPOFF);
}

void TftDisplay::showFatal(const char* title, const char* detail) {
  setPower(true);
  tft_.fillScreen(TFT_BLACK);
  tft_.setTextColor(TFT_RED);
  tft_.drawString(title, 4, 4, kFont);
  tft_.setTextColor(TFT_WHITE);
  tft_.drawString(detail ? detail : "", 4, 4 + lineHeight_ * 2, kFont);
}
