// AnalysisOutcome.h
// Result of one analyze() call: exactly one of Success, Cancelled, Failed.

#pragma once

#include <stdint.h>

#include <string>
#include <utility>

enum class OutcomeKind {
  Success,
  Cancelled,
  Failed,
};

enum class FailureKind {
  None,
  Network,    // connection could not be made or broke mid-transfer
  Timeout,    // no complete response within the configured timeout
  Service,    // non-2xx status from the service
  Malformed,  // 2xx but the body is not the documented JSON shape
  Encoding,   // the request could not be assembled (empty image, no memory)
};

struct AnalysisOutcome {
  OutcomeKind kind = OutcomeKind::Failed;
  std::string text;        // Success: full analysis text
  uint32_t elapsedMs = 0;  // wall time across all attempts
  FailureKind failure = FailureKind::None;
  std::string message;     // Failed: short human-readable reason
  int attempts = 0;

  static AnalysisOutcome success(std::string text, uint32_t elapsedMs, int attempts) {
    AnalysisOutcome o;
    o.kind = OutcomeKind::Success;
    o.text = std::move(text);
    o.elapsedMs = elapsedMs;
    o.attempts = attempts;
    return o;
  }

  static AnalysisOutcome cancelled(uint32_t elapsedMs, int attempts) {
    AnalysisOutcome o;
    o.kind = OutcomeKind::Cancelled;
    o.elapsedMs = elapsedMs;
    o.attempts = attempts;
    return o;
  }

  static AnalysisOutcome failed(FailureKind failure, std::string message, uint32_t elapsedMs, int attempts) {
    AnalysisOutcome o;
    o.kind = OutcomeKind::Failed;
    o.failure = failure;
    o.message = std::move(message);
    o.elapsedMs = elapsedMs;
    o.attempts = attempts;
    return o;
  }

  bool ok() const { return kind == OutcomeKind::Success; }
};

const char* failureKindName(FailureKind kind);
