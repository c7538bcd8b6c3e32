// AnalysisClient.h
// Sends one image + prompt to the remote vision service and turns the reply
// into an AnalysisOutcome.
//
// Request shape (JSON, POST to ServiceSettings::endpoint):
//   {model, max_tokens, messages:[{role:"user", content:[
//     {type:"image", source:{type:"base64", media_type:"image/jpeg", data}},
//     {type:"text", text:<prompt>}]}]}
// The analysis text is read from content[0].text of the reply.
//
// Retry policy: connection failures, timeouts, HTTP 429 and HTTP 5xx are
// retried up to maxAttempts with a flat retryDelayMs pause. Other statuses
// and malformed bodies fail immediately.
//
// Threading: analyze() runs on the worker task; cancel() may be called from
// the UI task at any time and is honoured before each attempt, during the
// retry pause and inside the transport.

#pragma once

#include <stdint.h>

#include <atomic>
#include <string>

#include "AnalysisOutcome.h"
#include "CaptureResult.h"
#include "Clock.h"
#include "HttpTransport.h"
#include "Settings.h"

class AnalysisClient {
 public:
  // Granularity of the cancellable retry pause.
  static constexpr uint32_t kCancelPollMs = 50;

  AnalysisClient(HttpTransport& transport, Clock& clock, const ServiceSettings& settings);

  // Consumes `image`: its buffer is released as soon as the request body
  // holds the encoded copy.
  AnalysisOutcome analyze(CaptureResult& image, const std::string& promptText, const QualityMode& quality);

  void cancel() { cancelled_.store(true); }
  void resetCancel() { cancelled_.store(false); }
  bool cancelRequested() const { return cancelled_.load(); }

  // Serializes the request JSON with `image` base64-encoded straight into
  // `outBody`, then releases the image.
  static bool buildRequestBody(CaptureResult& image, const std::string& promptText, const std::string& model,
                               int maxTokens, std::string& outBody);

  // Reads content[0].text. Returns false on any structural mismatch.
  static bool extractText(const std::string& body, std::string& outText);

  // Best effort error.message from a service error body; empty if absent.
  static std::string extractErrorMessage(const std::string& body);

  static bool isRetryableStatus(int status) { return status == 429 || (status >= 500 && status <= 599); }

 private:
  HttpTransport& transport_;
  Clock& clock_;
  const ServiceSettings& settings_;
  std::atomic<bool> cancelled_{false};

  // Sleeps `ms` in kCancelPollMs slices. Returns false if cancelled meanwhile.
  bool waitCancellable(uint32_t ms);
};
