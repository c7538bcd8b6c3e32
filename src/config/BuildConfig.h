// BuildConfig.h
// Central build-time configuration and feature flags.

#pragma once

#define BUILD_LOG_BAUD_RATE 115200

// Debug-level logging (button presses, transport details). Off by default to
// keep the serial console readable.
#ifndef BUILD_LOG_DEBUG
#define BUILD_LOG_DEBUG 0
#endif

// Analysis worker task. The TLS handshake and the JSON document need a
// generous stack; core 0 keeps the UI loop on core 1 responsive.
#ifndef BUILD_WORKER_STACK_BYTES
#define BUILD_WORKER_STACK_BYTES 16384
#endif
#ifndef BUILD_WORKER_PRIORITY
#define BUILD_WORKER_PRIORITY 1
#endif
#ifndef BUILD_WORKER_CORE
#define BUILD_WORKER_CORE 0
#endif

// Join WiFi at boot. With 0 the device still captures and archives; every
// request then fails with a network error.
#ifndef BUILD_ENABLE_WIFI
#define BUILD_ENABLE_WIFI 1
#endif

// SNTP time for file modification stamps. Needs BUILD_ENABLE_WIFI.
#ifndef BUILD_ENABLE_SNTP
#define BUILD_ENABLE_SNTP 1
#endif
#define BUILD_TZ_INFO "UTC0"

// Main loop pacing; bounds cancel-button latency.
#define BUILD_LOOP_DELAY_MS 10
