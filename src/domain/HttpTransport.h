// HttpTransport.h
// Abstract HTTPS POST used by the AnalysisClient. Implementations check the
// cancel flag while connecting, uploading and waiting for the response.

#pragma once

#include <stdint.h>

#include <atomic>
#include <string>
#include <utility>
#include <vector>

struct HttpRequest {
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  uint32_t timeoutMs = 30000;
};

enum class TransportError {
  None,
  ConnectFailed,
  Timeout,
  Io,
  Cancelled,
};

struct HttpResponse {
  TransportError error = TransportError::None;
  int status = 0;  // valid only when error == None
  std::string body;
};

class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  // Performs one POST. `cancel` may be raised from another task at any time.
  virtual HttpResponse post(const HttpRequest& request, const std::atomic<bool>& cancel) = 0;
};
