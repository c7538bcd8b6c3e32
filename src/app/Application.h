// Application.h
// High-level composition root for the CloudCam firmware. Builds the device
// settings, brings up the drivers, and hands them to the DeviceController,
// which Arduino loop() then drives one tick at a time.

#pragma once

#include <Arduino.h>

#include "src/config/BuildConfig.h"
#include "src/config/DeviceProfile.h"
#include "src/config/Pins.h"
#include "src/config/Secrets.h"
#include "src/domain/AnalysisClient.h"
#include "src/domain/Archivist.h"
#include "src/domain/DeviceController.h"
#include "src/domain/Settings.h"
#include "src/infrastructure/AnalysisTaskEsp32.h"
#include "src/infrastructure/EspCamera.h"
#include "src/infrastructure/GpioButtons.h"
#include "src/infrastructure/GpioFillLight.h"
#include "src/infrastructure/HttpsTransportEsp32.h"
#include "src/infrastructure/Logger.h"
#include "src/infrastructure/SdFileStore.h"
#include "src/infrastructure/SettingsStore.h"
#include "src/infrastructure/SystemClock.h"
#include "src/infrastructure/TftDisplay.h"
#include "src/infrastructure/WifiManagerEsp32.h"

class Application {
 public:
  Application();

  // Initializes logging, validates settings and brings up every subsystem.
  // Halts with a diagnostic when the device cannot run. Safe to call only
  // once from Arduino setup().
  void begin();

  // Runs a single iteration of the main loop. Never blocks on the network.
  void runLoop();

 private:
  bool initialized_ = false;

  // Declared first: the members below keep references into it.
  DeviceSettings settings_;

  SystemClock clock_;
  WifiManagerEsp32 wifi_;
  TftDisplay display_;
  EspCamera camera_;
  GpioButtons buttons_;
  GpioFillLight light_;
  SdFileStore files_;
  SettingsStore selections_;
  HttpsTransportEsp32 transport_;
  AnalysisClient client_;
  AnalysisTaskEsp32 worker_;
  Archivist archivist_;
  DeviceController controller_;

  void initializeLogger();
  bool validateSettings();
  void initializeWifiAndTime();
  bool initializeCamera();
  bool initializeStorage();
  void initializeInputAndLight();

  // Logs and shows `reason`, then never returns.
  void halt(const char* reason, const char* detail);

  static void serialSink(const char* level, const char* line);
};
