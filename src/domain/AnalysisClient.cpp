// AnalysisClient.cpp

#include "AnalysisClient.h"

#include <stdio.h>

#include <new>

#include <ArduinoJson.h>
#include <mbedtls/base64.h>

#include "src/infrastructure/Logger.h"

const char* failureKindName(FailureKind kind) {
  switch (kind) {
    case FailureKind::None: return "none";
    case FailureKind::Network: return "network";
    case FailureKind::Timeout: return "timeout";
    case FailureKind::Service: return "service";
    case FailureKind::Malformed: return "malformed";
    case FailureKind::Encoding: return "encoding";
  }
  return "unknown";
}

AnalysisClient::AnalysisClient(HttpTransport& transport, Clock& clock, const ServiceSettings& settings)
    : transport_(transport), clock_(clock), settings_(settings) {}

bool AnalysisClient::buildRequestBody(CaptureResult& image, const std::string& promptText, const std::string& model,
                                      int maxTokens, std::string& outBody) {
  if (image.empty()) {
    Logger::error("Analysis: no image bytes to send");
    return false;
  }

  // The envelope is serialized with an empty image field and the base64 is
  // written straight into the body, so only one encoded copy ever exists.
  JsonDocument doc;
  doc["model"] = model;
  doc["max_tokens"] = maxTokens;
  JsonObject message = doc["messages"].add<JsonObject>();
  message["role"] = "user";
  JsonArray content = message["content"].to<JsonArray>();

  JsonObject imageBlock = content.add<JsonObject>();
  imageBlock["type"] = "image";
  JsonObject source = imageBlock["source"].to<JsonObject>();
  source["type"] = "base64";
  source["media_type"] = "image/jpeg";
  source["data"] = "";

  JsonObject textBlock = content.add<JsonObject>();
  textBlock["type"] = "text";
  textBlock["text"] = promptText;

  const size_t imageBytes = image.size();
  if (doc.overflowed()) {
    Logger::error("Analysis: out of memory building request for %u byte image", (unsigned)imageBytes);
    return false;
  }
  std::string envelope;
  serializeJson(doc, envelope);
  doc.clear();

  // Keys are never escaped, so the first match is the image field.
  static const char kDataField[] = "\"data\":\"";
  const size_t field = envelope.find(kDataField);
  if (field == std::string::npos) {
    Logger::error("Analysis: request envelope has no image field");
    return false;
  }
  const size_t prefixLen = field + sizeof(kDataField) - 1;

  // First call only sizes the output (including the terminating NUL).
  size_t encodedLen = 0;
  mbedtls_base64_encode(nullptr, 0, &encodedLen, image.bytes.data(), image.size());

  outBody.clear();
  try {
    outBody.reserve(envelope.size() + encodedLen);
    outBody.assign(envelope, 0, prefixLen);
    outBody.resize(prefixLen + encodedLen);
  } catch (const std::bad_alloc&) {
    std::string().swap(outBody);
    Logger::error("Analysis: out of memory encoding %u byte image", (unsigned)imageBytes);
    return false;
  }
  size_t written = 0;
  const int rc = mbedtls_base64_encode(reinterpret_cast<unsigned char*>(&outBody[prefixLen]), encodedLen, &written,
                                       image.bytes.data(), image.size());
  if (rc != 0) {
    std::string().swap(outBody);
    Logger::error("Analysis: base64 encode failed (rc=%d)", rc);
    return false;
  }
  image.release();
  outBody.resize(prefixLen + written);
  outBody.append(envelope, prefixLen, std::string::npos);
  Logger::debug("Analysis: request body %u bytes for %u byte image", (unsigned)outBody.size(), (unsigned)imageBytes);
  return true;
}

bool AnalysisClient::extractText(const std::string& body, std::string& outText) {
  // Keep only the field we read; replies can carry long usage metadata.
  JsonDocument filter;
  filter["content"][0]["text"] = true;

  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, body, DeserializationOption::Filter(filter));
  if (err) {
    Logger::warn("Analysis: response is not valid JSON (%s)", err.c_str());
    return false;
  }
  JsonVariantConst text = doc["content"][0]["text"];
  if (!text.is<const char*>()) {
    Logger::warn("Analysis: response has no content[0].text");
    return false;
  }
  outText = text.as<const char*>();
  return true;
}

std::string AnalysisClient::extractErrorMessage(const std::string& body) {
  JsonDocument filter;
  filter["error"]["message"] = true;

  JsonDocument doc;
  if (deserializeJson(doc, body, DeserializationOption::Filter(filter))) return std::string();
  JsonVariantConst message = doc["error"]["message"];
  if (!message.is<const char*>()) return std::string();
  return std::string(message.as<const char*>());
}

bool AnalysisClient::waitCancellable(uint32_t ms) {
  const uint32_t start = clock_.nowMs();
  for (;;) {
    const uint32_t waited = clock_.nowMs() - start;
    if (waited >= ms) break;
    if (cancelled_.load()) return false;
    uint32_t slice = kCancelPollMs;
    if (ms - waited < slice) slice = ms - waited;
    clock_.delayMs(slice);
  }
  return !cancelled_.load();
}

AnalysisOutcome AnalysisClient::analyze(CaptureResult& image, const std::string& promptText,
                                        const QualityMode& quality) {
  const uint32_t startMs = clock_.nowMs();
  if (cancelled_.load()) {
    image.release();
    return AnalysisOutcome::cancelled(0, 0);
  }

  HttpRequest request;
  request.url = settings_.endpoint;
  request.timeoutMs = settings_.timeoutMs;
  request.headers.push_back(std::make_pair(std::string("x-api-key"), settings_.apiKey));
  request.headers.push_back(std::make_pair(std::string("anthropic-version"), settings_.apiVersion));
  request.headers.push_back(std::make_pair(std::string("content-type"), std::string("application/json")));

  Logger::info("Analysis: preparing %u byte image (%s)", (unsigned)image.size(), quality.id.c_str());
  if (!buildRequestBody(image, promptText, settings_.model, settings_.maxTokens, request.body)) {
    image.release();
    return AnalysisOutcome::failed(FailureKind::Encoding, "Could not prepare image", clock_.nowMs() - startMs, 0);
  }

  const int maxAttempts = settings_.maxAttempts < 1 ? 1 : settings_.maxAttempts;
  FailureKind lastFailure = FailureKind::Network;
  std::string lastMessage;
  int attempts = 0;

  for (int attempt = 1; attempt <= maxAttempts; ++attempt) {
    if (cancelled_.load()) break;
    attempts = attempt;
    Logger::info("Analysis: attempt %d/%d", attempt, maxAttempts);

    HttpResponse response = transport_.post(request, cancelled_);
    if (response.error == TransportError::Cancelled || cancelled_.load()) break;

    bool retryable = true;
    if (response.error == TransportError::Timeout) {
      lastFailure = FailureKind::Timeout;
      lastMessage = "Request timed out";
    } else if (response.error != TransportError::None) {
      lastFailure = FailureKind::Network;
      lastMessage = "Network error";
    } else if (response.status >= 200 && response.status <= 299) {
      std::string text;
      if (!extractText(response.body, text)) {
        return AnalysisOutcome::failed(FailureKind::Malformed, "Unexpected reply from service",
                                       clock_.nowMs() - startMs, attempts);
      }
      const uint32_t elapsed = clock_.nowMs() - startMs;
      Logger::info("Analysis: %u chars in %lu ms after %d attempt(s)", (unsigned)text.size(), (unsigned long)elapsed,
                   attempts);
      return AnalysisOutcome::success(std::move(text), elapsed, attempts);
    } else {
      lastFailure = FailureKind::Service;
      char buf[48];
      snprintf(buf, sizeof(buf), "Service error %d", response.status);
      lastMessage = buf;
      std::string detail = extractErrorMessage(response.body);
      if (!detail.empty()) lastMessage += ": " + detail;
      retryable = isRetryableStatus(response.status);
    }

    Logger::warn("Analysis: attempt %d failed (%s: %s)", attempt, failureKindName(lastFailure), lastMessage.c_str());
    if (!retryable) {
      return AnalysisOutcome::failed(lastFailure, lastMessage, clock_.nowMs() - startMs, attempts);
    }
    if (attempt < maxAttempts) {
      Logger::info("Analysis: retrying in %lu ms", (unsigned long)settings_.retryDelayMs);
      if (!waitCancellable(settings_.retryDelayMs)) break;
    }
  }

  const uint32_t elapsed = clock_.nowMs() - startMs;
  if (cancelled_.load()) {
    Logger::info("Analysis: cancelled after %d attempt(s)", attempts);
    return AnalysisOutcome::cancelled(elapsed, attempts);
  }
  Logger::error("Analysis: giving up after %d attempt(s)", attempts);
  return AnalysisOutcome::failed(lastFailure, lastMessage, elapsed, attempts);
}
