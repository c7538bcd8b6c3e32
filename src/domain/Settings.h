// Settings.h
// Immutable device configuration handed to the core at startup. Values are
// produced by DeviceProfile (compile-time tables + Secrets) and checked by
// SettingsValidator before the main loop starts.

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

// A named bundle of capture resolution and byte-size budget.
struct QualityMode {
  std::string id;          // e.g. "MEDIUM"
  int resolutionCode = 0;  // camera driver frame size code
  size_t targetBytes = 0;
  size_t maxBytes = 0;
  std::string label;       // short label shown in the status bar
};

// A named instruction template sent alongside the image.
struct PromptMode {
  std::string id;
  std::string label;
  std::string instruction;
  int rating = 0;              // optional complexity rating, 0 when unset
  bool neverTruncate = false;  // BRIEF renders the full text (e.g. poetry)
};

struct ServiceSettings {
  std::string endpoint = "https://api.anthropic.com/v1/messages";
  std::string apiVersion = "2023-06-01";
  std::string apiKey;
  std::string model;
  int maxTokens = 1024;
  uint32_t timeoutMs = 30000;
  int maxAttempts = 3;
  uint32_t retryDelayMs = 2000;
};

struct PresenterLayout {
  size_t briefCharLimit = 200;
  size_t columns = 26;
  size_t linesPerPage = 9;
  std::string continuationMarker = "...";
};

struct ArchiveSettings {
  std::string imageDir = "/images";
  std::string responseDir = "/responses";
  std::string imageExtension = "JPG";
  bool embedPromptLabel = true;
};

struct DeviceSettings {
  std::vector<QualityMode> qualityModes;
  size_t defaultQuality = 0;
  std::vector<PromptMode> prompts;  // already in configured order
  size_t defaultPrompt = 0;

  // Global safety ceiling, independent of the selected mode.
  size_t hardCeilingBytes = 2 * 1024 * 1024;
  int maxResolutionCode = 13;

  bool fillLightEnabled = true;
  uint8_t darkThreshold = 60;  // average luma 0..255

  uint32_t idleTimeoutMs = 120000;  // 0 disables the screensaver
  uint32_t previewIntervalMs = 250;  // 0 disables the viewfinder preview
  uint32_t messageDurationMs = 2000;
  uint32_t selectionSaveDelayMs = 3000;

  ServiceSettings service;
  PresenterLayout layout;
  ArchiveSettings archive;
};
