// SettingsStore.cpp

#include "SettingsStore.h"

#include <Preferences.h>

#include "src/infrastructure/Logger.h"

static const char* kNs = "cloudcam";
static const uint16_t kSchemaV = 1;

bool SettingsStore::load(size_t& promptIndex, size_t& qualityIndex) {
  Preferences pref;
  // Read-only open fails when the namespace was never written.
  if (!pref.begin(kNs, true)) return false;
  bool ok = false;
  if (pref.getUShort("sel_v", 0) == kSchemaV) {
    promptIndex = pref.getUShort("prompt", static_cast<uint16_t>(promptIndex));
    qualityIndex = pref.getUShort("quality", static_cast<uint16_t>(qualityIndex));
    ok = true;
  }
  pref.end();
  return ok;
}

bool SettingsStore::save(size_t promptIndex, size_t qualityIndex) {
  Preferences pref;
  if (!pref.begin(kNs, false)) {
    Logger::error("SettingsStore: NVS open failed");
    return false;
  }
  bool ok = true;
  const bool same = pref.getUShort("sel_v", 0) == kSchemaV &&
                    pref.getUShort("prompt", 0xFFFF) == promptIndex &&
                    pref.getUShort("quality", 0xFFFF) == qualityIndex;
  if (!same) {
    ok = pref.putUShort("prompt", static_cast<uint16_t>(promptIndex)) > 0 &&
         pref.putUShort("quality", static_cast<uint16_t>(qualityIndex)) > 0 &&
         pref.putUShort("sel_v", kSchemaV) > 0;
    Logger::info("SettingsStore: saved prompt=%u quality=%u", (unsigned)promptIndex, (unsigned)qualityIndex);
  }
  pref.end();
  return ok;
}
