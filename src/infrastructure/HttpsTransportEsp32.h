// HttpsTransportEsp32.h
// One-shot HTTPS POST over WiFiClientSecure with a hand-written HTTP/1.1
// exchange, so the body can be streamed in small writes and the cancel flag
// and deadline can be checked between them. Runs on the analysis worker.

#pragma once

#include <Arduino.h>
#include <WiFiClientSecure.h>

#include "src/domain/HttpTransport.h"

class HttpsTransportEsp32 : public HttpTransport {
 public:
  // `rootCa` may be null to skip certificate verification.
  explicit HttpsTransportEsp32(const char* rootCa = nullptr) : rootCa_(rootCa) {}

  HttpResponse post(const HttpRequest& request, const std::atomic<bool>& cancel) override;

  // Splits https://host[:port]/path. Returns false for anything else.
  static bool parseUrl(const std::string& url, std::string& host, uint16_t& port, std::string& path);

 private:
  const char* rootCa_;

  static const size_t kWriteChunk = 1024;

  // Result of one blocking step against the deadline.
  enum class Step {
    Ok,
    Timeout,
    Cancelled,
    Closed,
  };

  static TransportError toError(Step step);

  Step writeAll(WiFiClientSecure& tls, const char* data, size_t len, uint32_t deadline,
                const std::atomic<bool>& cancel);
  Step readLine(WiFiClientSecure& tls, std::string& line, uint32_t deadline, const std::atomic<bool>& cancel);
  Step readBytes(WiFiClientSecure& tls, size_t count, std::string& out, uint32_t deadline,
                 const std::atomic<bool>& cancel);
  Step readToClose(WiFiClientSecure& tls, std::string& out, uint32_t deadline, const std::atomic<bool>& cancel);
  Step readChunked(WiFiClientSecure& tls, std::string& out, uint32_t deadline, const std::atomic<bool>& cancel);
};
