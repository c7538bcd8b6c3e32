// EspCamera.cpp

#include "EspCamera.h"

#include <img_converters.h>

#include <new>

#include "src/infrastructure/Logger.h"

bool EspCamera::begin(const Config& cfg) {
  camera_config_t config = {};
  config.ledc_channel = LEDC_CHANNEL_0;
  config.ledc_timer = LEDC_TIMER_0;
  config.pin_d0 = cfg.pinD[0];
  config.pin_d1 = cfg.pinD[1];
  config.pin_d2 = cfg.pinD[2];
  config.pin_d3 = cfg.pinD[3];
  config.pin_d4 = cfg.pinD[4];
  config.pin_d5 = cfg.pinD[5];
  config.pin_d6 = cfg.pinD[6];
  config.pin_d7 = cfg.pinD[7];
  config.pin_xclk = cfg.pinXclk;
  config.pin_pclk = cfg.pinPclk;
  config.pin_vsync = cfg.pinVsync;
  config.pin_href = cfg.pinHref;
  config.pin_sccb_sda = cfg.pinSiod;
  config.pin_sccb_scl = cfg.pinSioc;
  config.pin_pwdn = cfg.pinPwdn;
  config.pin_reset = cfg.pinReset;
  config.xclk_freq_hz = 20000000;
  config.pixel_format = PIXFORMAT_JPEG;
  config.frame_size = static_cast<framesize_t>(cfg.initialResolution);
  config.jpeg_quality = cfg.jpegQuality;
  config.fb_location = psramFound() ? CAMERA_FB_IN_PSRAM : CAMERA_FB_IN_DRAM;
  config.fb_count = psramFound() ? 2 : 1;
  config.grab_mode = CAMERA_GRAB_LATEST;

  esp_err_t err = esp_camera_init(&config);
  if (err != ESP_OK) {
    Logger::error("Camera: init failed (0x%x)", static_cast<unsigned>(err));
    return false;
  }
  sensor_t* sensor = esp_camera_sensor_get();
  if (sensor) {
    Logger::info("Camera: sensor PID=0x%x, fixed focus", sensor->id.PID);
  }
  resolution_ = cfg.initialResolution;
  previewMaxWidth_ = cfg.previewMaxWidth > 0 ? cfg.previewMaxWidth : 240;
  ready_ = true;
  return true;
}

bool EspCamera::setResolution(int resolutionCode) {
  if (!ready_) return false;
  if (resolutionCode == resolution_) return true;
  sensor_t* sensor = esp_camera_sensor_get();
  if (!sensor || resolutionCode < 0 || resolutionCode >= FRAMESIZE_INVALID) return false;
  if (sensor->set_framesize(sensor, static_cast<framesize_t>(resolutionCode)) != 0) {
    Logger::error("Camera: framesize %d rejected", resolutionCode);
    return false;
  }
  resolution_ = resolutionCode;
  flushFrame();
  Logger::debug("Camera: framesize %d", resolutionCode);
  return true;
}

CaptureError EspCamera::capture(CaptureResult& out) {
  if (!ready_) return CaptureError::NotReady;
  // With fb_count 2 the queued frame predates the fill light.
  flushFrame();
  camera_fb_t* fb = esp_camera_fb_get();
  if (!fb) return CaptureError::Hardware;
  if (fb->format != PIXFORMAT_JPEG || fb->len == 0) {
    esp_camera_fb_return(fb);
    return CaptureError::Hardware;
  }

  CaptureError result = CaptureError::None;
  try {
    out.bytes.assign(fb->buf, fb->buf + fb->len);
  } catch (const std::bad_alloc&) {
    out.release();
    result = CaptureError::OutOfMemory;
  }
  esp_camera_fb_return(fb);
  return result;
}

bool EspCamera::preview(Frame& out) {
  if (!ready_) return false;
  camera_fb_t* fb = esp_camera_fb_get();
  if (!fb) return false;

  int div = 1;
  jpg_scale_t scale = JPG_SCALE_NONE;
  while (fb->width / div > previewMaxWidth_ && div < 8) {
    div *= 2;
  }
  if (div == 2) scale = JPG_SCALE_2X;
  if (div == 4) scale = JPG_SCALE_4X;
  if (div == 8) scale = JPG_SCALE_8X;

  const uint16_t w = fb->width / div;
  const uint16_t h = fb->height / div;
  std::vector<uint8_t> rgb(static_cast<size_t>(w) * h * 2);
  const bool ok = jpg2rgb565(fb->buf, fb->len, rgb.data(), scale);
  esp_camera_fb_return(fb);
  if (!ok) return false;

  // The decoder emits big-endian pixels; Frame holds native values.
  out.width = w;
  out.height = h;
  out.pixels.resize(static_cast<size_t>(w) * h);
  for (size_t i = 0; i < out.pixels.size(); ++i) {
    out.pixels[i] = static_cast<uint16_t>((rgb[2 * i] << 8) | rgb[2 * i + 1]);
  }
  return true;
}

bool EspCamera::autofocus() {
  Logger::debug("Camera: autofocus requested on a fixed-focus sensor");
  return false;
}

void EspCamera::flushFrame() {
  camera_fb_t* fb = esp_camera_fb_get();
  if (fb) esp_camera_fb_return(fb);
}
