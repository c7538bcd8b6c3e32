// Secrets.example.h
// Copy to Secrets.h and fill in your Wi-Fi credentials and analysis API key.

#pragma once

// Wi-Fi credentials
#define SECRETS_WIFI_SSID      ""
#define SECRETS_WIFI_PASSWORD  ""

// Vision analysis service (Anthropic Messages API).
#define SECRETS_API_KEY        ""

// Optional override of the model in DeviceProfile.cpp; empty keeps the default.
#define SECRETS_MODEL          ""
