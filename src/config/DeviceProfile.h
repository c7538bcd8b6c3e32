// DeviceProfile.h
// The device's built-in configuration: quality modes, prompt table and
// order, thresholds, timeouts, retry policy and layouts. Credentials are
// passed in from Secrets.h by the Application so this table stays free of
// secrets and builds on the host.

#pragma once

#include "src/domain/Settings.h"

// `modelOverride` may be null or empty to keep the default model.
DeviceSettings makeDeviceSettings(const char* apiKey, const char* modelOverride);

extern const char* const kDefaultModel;
