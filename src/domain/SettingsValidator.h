// SettingsValidator.h
// Startup check of a DeviceSettings value. Errors halt startup; warnings are
// logged and the device continues.

#pragma once

#include <string>
#include <vector>

#include "Settings.h"

struct ValidationReport {
  std::vector<std::string> errors;
  std::vector<std::string> warnings;

  bool ok() const { return errors.empty(); }
};

class SettingsValidator {
 public:
  static ValidationReport validate(const DeviceSettings& settings);

  // Writes every error and warning through the Logger.
  static void log(const ValidationReport& report);
};
