// SettingsStore.h
// Flash-backed persistence of the selected prompt and quality mode using
// ESP32 NVS (Preferences).
//
// - Values are stored under the namespace `cloudcam` with a schema version so
//   a changed layout reads as "nothing stored" instead of garbage.
// - The controller debounces calls to save() to limit flash wear.

#pragma once

#include <Arduino.h>

#include "src/domain/SelectionStore.h"

class SettingsStore : public SelectionStore {
 public:
  // Leaves the outputs unchanged when no valid record exists so the caller's
  // defaults remain in effect.
  bool load(size_t& promptIndex, size_t& qualityIndex) override;

  // Skips the flash write when the stored values already match.
  bool save(size_t promptIndex, size_t qualityIndex) override;
};
