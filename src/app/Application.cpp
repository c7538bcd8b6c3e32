// Application.cpp
// See Application.h for high-level responsibilities.

#include "Application.h"

#include "src/domain/SettingsValidator.h"

Application::Application()
    : settings_(makeDeviceSettings(SECRETS_API_KEY, SECRETS_MODEL)),
      client_(transport_, clock_, settings_.service),
      worker_(client_),
      archivist_(files_, settings_.archive),
      controller_(settings_, camera_, display_, buttons_, light_, clock_, archivist_, worker_, selections_) {}

void Application::begin() {
  if (initialized_) return;

  initializeLogger();

  // Portrait, USB at the bottom.
  display_.begin(0);

  if (!validateSettings()) halt("Invalid settings", "See serial log");

  if (!initializeCamera()) halt("Camera not found", "Check ribbon cable");

  if (!initializeStorage()) halt("No SD card", "Insert a FAT32 card and reboot");

  initializeInputAndLight();

  initializeWifiAndTime();

  if (!worker_.begin(BUILD_WORKER_STACK_BYTES, BUILD_WORKER_PRIORITY, BUILD_WORKER_CORE)) {
    halt("Out of memory", "Worker task");
  }

  controller_.begin();
  Logger::info("Application initialized (heap %u, psram %u)", (unsigned)ESP.getFreeHeap(),
               (unsigned)ESP.getFreePsram());
  initialized_ = true;
}

void Application::runLoop() {
  if (!initialized_) return;
#if BUILD_ENABLE_WIFI
  wifi_.service();
#endif
  controller_.tick();
  delay(BUILD_LOOP_DELAY_MS);
}

void Application::serialSink(const char* level, const char* line) {
  Serial.printf("[%s] %s\n", level, line);
}

void Application::initializeLogger() {
  Serial.begin(BUILD_LOG_BAUD_RATE);
  const uint32_t start = millis();
  // Native USB boards enumerate late; do not stall boot without a host.
  while (!Serial && millis() - start < 2000) {
    delay(10);
  }
  Logger::setSink(&Application::serialSink);
  Logger::setLevel(BUILD_LOG_DEBUG ? LOG_LEVEL_DEBUG : LOG_LEVEL_INFO);
  Logger::info("Logger initialized (baud=%d)", BUILD_LOG_BAUD_RATE);
}

bool Application::validateSettings() {
  const ValidationReport report = SettingsValidator::validate(settings_);
  SettingsValidator::log(report);
  return report.ok();
}

void Application::initializeWifiAndTime() {
#if BUILD_ENABLE_WIFI
  wifi_.begin(SECRETS_WIFI_SSID, SECRETS_WIFI_PASSWORD);
  // Short bootstrap window; the loop keeps retrying in the background.
  if (!wifi_.waitConnected(5000)) {
    Logger::warn("WiFi not connected yet; continuing with background retries");
  }
#if BUILD_ENABLE_SNTP
  clock_.begin(BUILD_TZ_INFO);
  if (wifi_.isConnected()) clock_.waitForTime(3000);
#endif
#else
  Logger::warn("WiFi disabled at build time");
#endif
}

bool Application::initializeCamera() {
  EspCamera::Config cfg;
  cfg.pinPwdn = PIN_CAM_PWDN;
  cfg.pinReset = PIN_CAM_RESET;
  cfg.pinXclk = PIN_CAM_XCLK;
  cfg.pinSiod = PIN_CAM_SIOD;
  cfg.pinSioc = PIN_CAM_SIOC;
  cfg.pinD[0] = PIN_CAM_D0;
  cfg.pinD[1] = PIN_CAM_D1;
  cfg.pinD[2] = PIN_CAM_D2;
  cfg.pinD[3] = PIN_CAM_D3;
  cfg.pinD[4] = PIN_CAM_D4;
  cfg.pinD[5] = PIN_CAM_D5;
  cfg.pinD[6] = PIN_CAM_D6;
  cfg.pinD[7] = PIN_CAM_D7;
  cfg.pinVsync = PIN_CAM_VSYNC;
  cfg.pinHref = PIN_CAM_HREF;
  cfg.pinPclk = PIN_CAM_PCLK;
  cfg.initialResolution = settings_.qualityModes[settings_.defaultQuality].resolutionCode;
  cfg.jpegQuality = 12;
  cfg.previewMaxWidth = display_.width();
  return camera_.begin(cfg);
}

bool Application::initializeStorage() {
  if (!files_.begin(PIN_SD_CS)) return false;
  // A mounted card that cannot be written disables archiving and capture.
  if (!archivist_.begin()) {
    Logger::warn("Archive disabled: card is not writable, capture off");
  }
  return true;
}

void Application::initializeInputAndLight() {
  GpioButtons::Pins pins;
  pins.shutter = PIN_BTN_SHUTTER;
  pins.left = PIN_BTN_LEFT;
  pins.right = PIN_BTN_RIGHT;
  pins.up = PIN_BTN_UP;
  pins.down = PIN_BTN_DOWN;
  pins.select = PIN_BTN_SELECT;
  pins.confirm = PIN_BTN_CONFIRM;
  buttons_.begin(pins);

  light_.begin(PIN_FILL_LIGHT);
}

void Application::halt(const char* reason, const char* detail) {
  Logger::error("HALT: %s (%s)", reason, detail);
  display_.showFatal(reason, detail);
  for (;;) {
    delay(1000);
  }
}
