// DeviceProfile.cpp

#include "DeviceProfile.h"

const char* const kDefaultModel = "claude-3-haiku-20240307";

namespace {

// esp32-camera framesize_t codes.
enum FrameSizeCode {
  kFrameVga = 8,    // 640x480
  kFrameXga = 10,   // 1024x768
  kFrameSxga = 12,  // 1280x1024
  kFrameUxga = 13,  // 1600x1200
};

QualityMode mode(const char* id, int resolution, size_t targetKb, size_t maxKb, const char* label) {
  QualityMode m;
  m.id = id;
  m.resolutionCode = resolution;
  m.targetBytes = targetKb * 1024;
  m.maxBytes = maxKb * 1024;
  m.label = label;
  return m;
}

PromptMode prompt(const char* id, const char* label, const char* instruction, int rating = 0,
                  bool neverTruncate = false) {
  PromptMode p;
  p.id = id;
  p.label = label;
  p.instruction = instruction;
  p.rating = rating;
  p.neverTruncate = neverTruncate;
  return p;
}

}  // namespace

DeviceSettings makeDeviceSettings(const char* apiKey, const char* modelOverride) {
  DeviceSettings s;

  s.qualityModes.push_back(mode("LOW", kFrameVga, 60, 150, "LO"));
  s.qualityModes.push_back(mode("MEDIUM", kFrameXga, 200, 800, "MED"));
  s.qualityModes.push_back(mode("HIGH", kFrameSxga, 400, 1200, "HI"));
  s.qualityModes.push_back(mode("ULTRA", kFrameUxga, 600, 1800, "MAX"));
  s.defaultQuality = 1;
  s.hardCeilingBytes = 2 * 1024 * 1024;
  s.maxResolutionCode = kFrameUxga;

  // Display order.
  s.prompts.push_back(prompt("DESCRIBE", "Describe",
                             "Describe what you see in this image in two or three short sentences.", 1));
  s.prompts.push_back(prompt("READ", "Read Text",
                             "Transcribe all legible text in this image exactly as written. "
                             "If there is no text, say so.",
                             2));
  s.prompts.push_back(prompt("IDENTIFY", "Identify",
                             "Identify the main object, plant or animal in this image and give one "
                             "interesting fact about it.",
                             2));
  s.prompts.push_back(prompt("HAIKU", "Haiku", "Write a haiku inspired by this image. Reply with the poem only.", 1,
                             true));
  s.prompts.push_back(prompt("ALT", "Alt Text",
                             "Write concise alt text for this image suitable for a screen reader.", 1));
  s.defaultPrompt = 0;

  s.fillLightEnabled = true;
  s.darkThreshold = 60;

  s.idleTimeoutMs = 120000;
  s.previewIntervalMs = 250;
  s.messageDurationMs = 2000;
  s.selectionSaveDelayMs = 3000;

  s.service.apiKey = apiKey ? apiKey : "";
  s.service.model = (modelOverride && modelOverride[0]) ? modelOverride : kDefaultModel;
  s.service.maxTokens = 1024;
  s.service.timeoutMs = 30000;
  s.service.maxAttempts = 3;
  s.service.retryDelayMs = 2000;

  // 240x320 portrait TFT, TFT_eSPI font 2 (16 px rows): 20 rows minus the
  // header and message rows, with one spare.
  s.layout.briefCharLimit = 200;
  s.layout.columns = 26;
  s.layout.linesPerPage = 17;

  s.archive.imageDir = "/images";
  s.archive.responseDir = "/responses";
  s.archive.imageExtension = "JPG";
  s.archive.embedPromptLabel = true;
  return s;
}
