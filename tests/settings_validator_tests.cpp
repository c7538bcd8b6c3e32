#include <catch2/catch.hpp>

#include "src/config/DeviceProfile.h"
#include "src/domain/SettingsValidator.h"

namespace settings_validator {

bool mentions(const std::vector<std::string>& messages, const std::string& needle) {
  for (size_t i = 0; i < messages.size(); ++i) {
    if (messages[i].find(needle) != std::string::npos) return true;
  }
  return false;
}

DeviceSettings valid() { return makeDeviceSettings("sk-ant-api03-test", nullptr); }

TEST_CASE("The built-in profile validates cleanly with a key", "[settings]") {
  const DeviceSettings s = valid();
  const ValidationReport report = SettingsValidator::validate(s);
  CHECK(report.ok());
  CHECK(report.warnings.empty());
  CHECK(s.service.model == kDefaultModel);
  CHECK(s.qualityModes[s.defaultQuality].id == "MEDIUM");
}

TEST_CASE("Model override replaces the default model", "[settings]") {
  CHECK(makeDeviceSettings("k", "claude-3-5-sonnet-20241022").service.model == "claude-3-5-sonnet-20241022");
  CHECK(makeDeviceSettings("k", "").service.model == kDefaultModel);
}

TEST_CASE("Missing credentials stop startup", "[settings][errors]") {
  const ValidationReport report = SettingsValidator::validate(makeDeviceSettings("", nullptr));
  CHECK_FALSE(report.ok());
  CHECK(mentions(report.errors, "API key not set"));
}

TEST_CASE("Quality table errors", "[settings][errors]") {
  DeviceSettings s = valid();

  SECTION("target above maximum") {
    s.qualityModes[0].targetBytes = s.qualityModes[0].maxBytes + 1;
    CHECK(mentions(SettingsValidator::validate(s).errors, "quality LOW: target"));
  }
  SECTION("resolution out of range") {
    s.qualityModes[2].resolutionCode = 99;
    CHECK(mentions(SettingsValidator::validate(s).errors, "resolution 99 outside 0..13"));
  }
  SECTION("maximum above the hard ceiling") {
    s.qualityModes[3].maxBytes = s.hardCeilingBytes + 1;
    CHECK(mentions(SettingsValidator::validate(s).errors, "above hard ceiling"));
  }
  SECTION("default index out of range") {
    s.defaultQuality = s.qualityModes.size();
    CHECK(mentions(SettingsValidator::validate(s).errors, "default quality"));
  }
  SECTION("empty table") {
    s.qualityModes.clear();
    CHECK(mentions(SettingsValidator::validate(s).errors, "no quality modes"));
  }
}

TEST_CASE("Prompt table errors and warnings", "[settings]") {
  DeviceSettings s = valid();

  SECTION("missing instruction") {
    s.prompts[1].instruction.clear();
    CHECK(mentions(SettingsValidator::validate(s).errors, "prompt READ missing"));
  }
  SECTION("duplicate id is only a warning") {
    s.prompts.push_back(s.prompts[0]);
    const ValidationReport report = SettingsValidator::validate(s);
    CHECK(report.ok());
    CHECK(mentions(report.warnings, "prompt DESCRIBE listed twice"));
  }
  SECTION("no prompts") {
    s.prompts.clear();
    CHECK(mentions(SettingsValidator::validate(s).errors, "no prompts"));
  }
}

TEST_CASE("Service settings errors", "[settings][errors]") {
  DeviceSettings s = valid();
  s.service.endpoint = "http://api.anthropic.com/v1/messages";
  s.service.maxAttempts = 0;
  s.service.timeoutMs = 0;
  s.service.maxTokens = 0;
  const ValidationReport report = SettingsValidator::validate(s);
  CHECK(mentions(report.errors, "endpoint must be https"));
  CHECK(mentions(report.errors, "attempts must be at least 1"));
  CHECK(mentions(report.errors, "network timeout"));
  CHECK(mentions(report.errors, "max tokens"));
}

TEST_CASE("Layout and archive errors", "[settings][errors]") {
  DeviceSettings s = valid();
  s.layout.columns = 0;
  s.archive.responseDir.clear();
  s.archive.imageExtension.clear();
  const ValidationReport report = SettingsValidator::validate(s);
  CHECK(mentions(report.errors, "wrap width"));
  CHECK(mentions(report.errors, "archive directories"));
  CHECK(mentions(report.errors, "image extension"));
}

TEST_CASE("Suspicious but workable values warn", "[settings][warnings]") {
  DeviceSettings s = valid();
  s.service.apiKey = "not-a-real-key";
  s.layout.briefCharLimit = s.layout.columns * s.layout.linesPerPage + 1;
  s.idleTimeoutMs = 10000;
  const ValidationReport report = SettingsValidator::validate(s);
  CHECK(report.ok());
  CHECK(mentions(report.warnings, "does not look like"));
  CHECK(mentions(report.warnings, "exceeds one page"));
  CHECK(mentions(report.warnings, "idle timeout 10000 ms"));

  SECTION("a disabled screensaver never conflicts") {
    s.idleTimeoutMs = 0;
    CHECK_FALSE(mentions(SettingsValidator::validate(s).warnings, "idle timeout"));
  }
}

}  // namespace settings_validator
