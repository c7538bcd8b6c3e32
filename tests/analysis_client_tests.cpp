#include <catch2/catch.hpp>

#include <ArduinoJson.h>
#include <mbedtls/base64.h>

#include "src/domain/AnalysisClient.h"
#include "support/TestDoubles.h"

namespace analysis_client {

using testing::ManualClock;
using testing::ScriptedHttpTransport;
using testing::successBody;

struct TestSubject {
  ManualClock clock;
  ScriptedHttpTransport transport;
  ServiceSettings settings;
  QualityMode quality;
  AnalysisClient client{transport, clock, settings};

  TestSubject() {
    settings.apiKey = "sk-ant-test";
    settings.model = "claude-3-haiku-20240307";
    settings.maxAttempts = 3;
    settings.retryDelayMs = 2000;
    settings.timeoutMs = 30000;
    quality.id = "MEDIUM";
    transport.fallback.error = TransportError::ConnectFailed;
  }

  AnalysisOutcome run(size_t imageBytes = 64) {
    CaptureResult image;
    image.bytes.assign(imageBytes, 0x5A);
    return client.analyze(image, "Describe this.", quality);
  }
};

TEST_CASE("Request carries model, token limit, image then prompt", "[analysis][request]") {
  TestSubject t;
  t.transport.pushStatus(200, successBody("ok"));
  CaptureResult image;
  image.bytes.push_back('M');
  image.bytes.push_back('a');
  image.bytes.push_back('n');
  const AnalysisOutcome outcome = t.client.analyze(image, "What is this?", t.quality);
  REQUIRE(outcome.ok());
  CHECK(image.empty());

  const HttpRequest& req = t.transport.lastRequest;
  CHECK(req.url == "https://api.anthropic.com/v1/messages");
  CHECK(req.timeoutMs == 30000);
  bool sawKey = false;
  bool sawVersion = false;
  for (size_t i = 0; i < req.headers.size(); ++i) {
    if (req.headers[i].first == "x-api-key") sawKey = req.headers[i].second == "sk-ant-test";
    if (req.headers[i].first == "anthropic-version") sawVersion = req.headers[i].second == "2023-06-01";
  }
  CHECK(sawKey);
  CHECK(sawVersion);

  JsonDocument doc;
  REQUIRE_FALSE(deserializeJson(doc, req.body));
  CHECK(doc["model"].as<std::string>() == "claude-3-haiku-20240307");
  CHECK(doc["max_tokens"].as<int>() == 1024);
  JsonArrayConst messages = doc["messages"];
  REQUIRE(messages.size() == 1);
  CHECK(messages[0]["role"].as<std::string>() == "user");
  JsonArrayConst content = messages[0]["content"];
  REQUIRE(content.size() == 2);
  CHECK(content[0]["type"].as<std::string>() == "image");
  CHECK(content[0]["source"]["type"].as<std::string>() == "base64");
  CHECK(content[0]["source"]["media_type"].as<std::string>() == "image/jpeg");
  CHECK(content[0]["source"]["data"].as<std::string>() == "TWFu");
  CHECK(content[1]["type"].as<std::string>() == "text");
  CHECK(content[1]["text"].as<std::string>() == "What is this?");
}

TEST_CASE("A large image is encoded whole into the request body", "[analysis][request]") {
  CaptureResult image;
  for (size_t i = 0; i < 1000; ++i) image.bytes.push_back(static_cast<uint8_t>(i * 7 + 3));
  const std::vector<uint8_t> original = image.bytes;
  const std::string prompt = "Quote \"data\":\"\" verbatim.";

  std::string body;
  REQUIRE(AnalysisClient::buildRequestBody(image, prompt, "claude-3-haiku-20240307", 256, body));
  CHECK(image.empty());

  JsonDocument doc;
  REQUIRE_FALSE(deserializeJson(doc, body));
  CHECK(doc["max_tokens"].as<int>() == 256);
  const std::string data = doc["messages"][0]["content"][0]["source"]["data"].as<std::string>();
  CHECK(data.size() == 4 * ((original.size() + 2) / 3));
  CHECK(doc["messages"][0]["content"][1]["text"].as<std::string>() == prompt);

  std::vector<uint8_t> decoded(original.size() + 3);
  size_t decodedLen = 0;
  REQUIRE(mbedtls_base64_decode(decoded.data(), decoded.size(), &decodedLen,
                                reinterpret_cast<const unsigned char*>(data.data()), data.size()) == 0);
  decoded.resize(decodedLen);
  CHECK(decoded == original);

  // Nothing but the envelope surrounds the encoded image.
  CHECK(body.size() < data.size() + 400);
}

TEST_CASE("Two failures then success takes exactly three attempts", "[analysis][retry]") {
  TestSubject t;
  t.transport.pushError(TransportError::ConnectFailed);
  t.transport.pushError(TransportError::Timeout);
  t.transport.pushStatus(200, successBody("A cat."));

  const AnalysisOutcome outcome = t.run();
  REQUIRE(outcome.kind == OutcomeKind::Success);
  CHECK(outcome.text == "A cat.");
  CHECK(outcome.attempts == 3);
  CHECK(t.transport.calls == 3);
}

TEST_CASE("Persistent failure stops at the configured attempt count", "[analysis][retry]") {
  for (int attempts = 1; attempts <= 4; ++attempts) {
    TestSubject t;
    t.settings.maxAttempts = attempts;
    const AnalysisOutcome outcome = t.run();
    CHECK(outcome.kind == OutcomeKind::Failed);
    CHECK(outcome.failure == FailureKind::Network);
    CHECK(outcome.attempts == attempts);
    CHECK(t.transport.calls == attempts);
  }
}

TEST_CASE("The retry pause is the flat configured delay", "[analysis][retry]") {
  TestSubject t;
  t.settings.retryDelayMs = 1000;
  t.run();
  REQUIRE(t.transport.calls == 3);
  uint32_t total = 0;
  for (size_t i = 0; i < t.clock.delays.size(); ++i) {
    CHECK(t.clock.delays[i] <= AnalysisClient::kCancelPollMs);
    total += t.clock.delays[i];
  }
  CHECK(total == 2 * 1000);
}

TEST_CASE("Cancel during the retry pause skips the next attempt", "[analysis][cancel]") {
  TestSubject t;
  t.transport.pushError(TransportError::Timeout);
  t.transport.pushStatus(200, successBody("never seen"));
  t.clock.onDelay = [&t]() {
    if (t.clock.delays.size() == 3) t.client.cancel();
  };

  const AnalysisOutcome outcome = t.run();
  CHECK(outcome.kind == OutcomeKind::Cancelled);
  CHECK(outcome.attempts == 1);
  CHECK(t.transport.calls == 1);
}

TEST_CASE("Cancel while the request is in flight", "[analysis][cancel]") {
  TestSubject t;
  t.transport.onPost = [&t]() { t.client.cancel(); };
  const AnalysisOutcome outcome = t.run();
  CHECK(outcome.kind == OutcomeKind::Cancelled);
  CHECK(t.transport.calls == 1);
}

TEST_CASE("Cancel before start sends nothing", "[analysis][cancel]") {
  TestSubject t;
  t.client.cancel();
  CaptureResult image;
  image.bytes.assign(100, 1);
  const AnalysisOutcome outcome = t.client.analyze(image, "x", t.quality);
  CHECK(outcome.kind == OutcomeKind::Cancelled);
  CHECK(t.transport.calls == 0);
  CHECK(image.empty());

  t.client.resetCancel();
  CHECK_FALSE(t.client.cancelRequested());
}

TEST_CASE("Service rejections are not retried", "[analysis][service]") {
  TestSubject t;
  t.transport.pushStatus(400, "{\"type\":\"error\",\"error\":{\"type\":\"invalid_request_error\","
                              "\"message\":\"image too large\"}}");
  const AnalysisOutcome outcome = t.run();
  CHECK(outcome.kind == OutcomeKind::Failed);
  CHECK(outcome.failure == FailureKind::Service);
  CHECK(outcome.message == "Service error 400: image too large");
  CHECK(t.transport.calls == 1);
}

TEST_CASE("Overload and server errors are retried", "[analysis][service]") {
  TestSubject t;
  t.transport.pushStatus(529, "{\"error\":{\"message\":\"Overloaded\"}}");
  t.transport.pushStatus(429, "");
  t.transport.pushStatus(200, successBody("fine"));
  const AnalysisOutcome outcome = t.run();
  CHECK(outcome.ok());
  CHECK(outcome.attempts == 3);

  CHECK(AnalysisClient::isRetryableStatus(500));
  CHECK(AnalysisClient::isRetryableStatus(503));
  CHECK_FALSE(AnalysisClient::isRetryableStatus(401));
  CHECK_FALSE(AnalysisClient::isRetryableStatus(404));
}

TEST_CASE("Malformed replies are a distinct failure", "[analysis][parse]") {
  const char* bodies[] = {
      "not json",
      "{\"content\":[]}",
      "{\"content\":[{\"type\":\"text\"}]}",
      "{\"id\":\"msg\"}",
  };
  for (size_t i = 0; i < sizeof(bodies) / sizeof(bodies[0]); ++i) {
    TestSubject t;
    t.transport.pushStatus(200, bodies[i]);
    const AnalysisOutcome outcome = t.run();
    CHECK(outcome.kind == OutcomeKind::Failed);
    CHECK(outcome.failure == FailureKind::Malformed);
    CHECK(t.transport.calls == 1);
  }
}

TEST_CASE("Timeouts are reported as such", "[analysis][failure]") {
  TestSubject t;
  t.transport.fallback.error = TransportError::Timeout;
  const AnalysisOutcome outcome = t.run();
  CHECK(outcome.failure == FailureKind::Timeout);
  CHECK(std::string(failureKindName(outcome.failure)) == "timeout");
}

TEST_CASE("An empty image cannot be encoded", "[analysis][failure]") {
  TestSubject t;
  CaptureResult image;
  const AnalysisOutcome outcome = t.client.analyze(image, "x", t.quality);
  CHECK(outcome.failure == FailureKind::Encoding);
  CHECK(t.transport.calls == 0);
}

TEST_CASE("Text extraction reads the first content block", "[analysis][parse]") {
  std::string text;
  REQUIRE(AnalysisClient::extractText(successBody("Hello \"world\"\nbye"), text));
  CHECK(text == "Hello \"world\"\nbye");
  CHECK(AnalysisClient::extractErrorMessage("{\"error\":{\"message\":\"nope\"}}") == "nope");
  CHECK(AnalysisClient::extractErrorMessage("<html>") == "");
}

}  // namespace analysis_client
