// SettingsValidator.cpp

#include "SettingsValidator.h"

#include <stdarg.h>
#include <stdio.h>

#include "src/infrastructure/Logger.h"

namespace {

void add(std::vector<std::string>& into, const char* fmt, ...) {
  char buffer[160];
  va_list args;
  va_start(args, fmt);
  vsnprintf(buffer, sizeof(buffer), fmt, args);
  va_end(args);
  into.push_back(buffer);
}

void checkQualityModes(const DeviceSettings& s, ValidationReport& r) {
  if (s.qualityModes.empty()) {
    add(r.errors, "no quality modes configured");
    return;
  }
  for (size_t i = 0; i < s.qualityModes.size(); ++i) {
    const QualityMode& m = s.qualityModes[i];
    const char* id = m.id.empty() ? "?" : m.id.c_str();
    if (m.id.empty()) add(r.errors, "quality mode %u has no id", (unsigned)i);
    if (m.targetBytes > m.maxBytes) {
      add(r.errors, "quality %s: target %u > maximum %u", id, (unsigned)m.targetBytes, (unsigned)m.maxBytes);
    }
    if (m.resolutionCode < 0 || m.resolutionCode > s.maxResolutionCode) {
      add(r.errors, "quality %s: resolution %d outside 0..%d", id, m.resolutionCode, s.maxResolutionCode);
    }
    if (m.maxBytes > s.hardCeilingBytes) {
      add(r.errors, "quality %s: maximum %u above hard ceiling %u", id, (unsigned)m.maxBytes,
          (unsigned)s.hardCeilingBytes);
    }
  }
  if (s.defaultQuality >= s.qualityModes.size()) {
    add(r.errors, "default quality %u out of range", (unsigned)s.defaultQuality);
  }
}

void checkPrompts(const DeviceSettings& s, ValidationReport& r) {
  if (s.prompts.empty()) {
    add(r.errors, "no prompts configured");
    return;
  }
  for (size_t i = 0; i < s.prompts.size(); ++i) {
    const PromptMode& p = s.prompts[i];
    const char* id = p.id.empty() ? "?" : p.id.c_str();
    if (p.label.empty() || p.instruction.empty()) add(r.errors, "prompt %s missing label or instruction", id);
    for (size_t j = 0; j < i; ++j) {
      if (!p.id.empty() && s.prompts[j].id == p.id) add(r.warnings, "prompt %s listed twice", id);
    }
  }
  if (s.defaultPrompt >= s.prompts.size()) {
    add(r.errors, "default prompt %u out of range", (unsigned)s.defaultPrompt);
  }
}

void checkService(const ServiceSettings& svc, ValidationReport& r) {
  if (svc.apiKey.empty()) add(r.errors, "API key not set");
  else if (svc.apiKey.compare(0, 7, "sk-ant-") != 0) add(r.warnings, "API key does not look like an Anthropic key");
  if (svc.endpoint.compare(0, 8, "https://") != 0) add(r.errors, "endpoint must be https");
  if (svc.model.empty()) add(r.errors, "model not set");
  if (svc.maxTokens < 1) add(r.errors, "max tokens must be positive");
  if (svc.maxAttempts < 1) add(r.errors, "attempts must be at least 1");
  if (svc.timeoutMs == 0) add(r.errors, "network timeout must be positive");
}

}  // namespace

ValidationReport SettingsValidator::validate(const DeviceSettings& settings) {
  ValidationReport report;
  checkQualityModes(settings, report);
  checkPrompts(settings, report);
  checkService(settings.service, report);

  const PresenterLayout& layout = settings.layout;
  if (layout.columns == 0) add(report.errors, "wrap width must be positive");
  if (layout.linesPerPage == 0) add(report.errors, "lines per page must be positive");
  if (layout.briefCharLimit == 0) add(report.errors, "brief limit must be positive");
  if (layout.columns > 0 && layout.briefCharLimit > layout.columns * layout.linesPerPage) {
    add(report.warnings, "brief limit %u exceeds one page", (unsigned)layout.briefCharLimit);
  }

  if (settings.archive.imageDir.empty() || settings.archive.responseDir.empty()) {
    add(report.errors, "archive directories not set");
  }
  if (settings.archive.imageExtension.empty()) add(report.errors, "image extension not set");

  if (settings.idleTimeoutMs > 0 && settings.idleTimeoutMs < settings.service.timeoutMs) {
    add(report.warnings, "idle timeout %lu ms shorter than network timeout %lu ms",
        (unsigned long)settings.idleTimeoutMs, (unsigned long)settings.service.timeoutMs);
  }
  return report;
}

void SettingsValidator::log(const ValidationReport& report) {
  for (size_t i = 0; i < report.errors.size(); ++i) Logger::error("Settings: %s", report.errors[i].c_str());
  for (size_t i = 0; i < report.warnings.size(); ++i) Logger::warn("Settings: %s", report.warnings[i].c_str());
  if (report.ok()) Logger::info("Settings: ok (%u warning(s))", (unsigned)report.warnings.size());
}
