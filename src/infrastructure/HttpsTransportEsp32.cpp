// HttpsTransportEsp32.cpp

#include "HttpsTransportEsp32.h"

#include <WiFi.h>
#include <stdlib.h>
#include <strings.h>

#include "src/domain/HttpChunked.h"
#include "src/infrastructure/Logger.h"

namespace {

bool expired(uint32_t deadline) { return static_cast<int32_t>(millis() - deadline) >= 0; }

HttpResponse failure(TransportError err) {
  HttpResponse r;
  r.error = err;
  return r;
}

}  // namespace

TransportError HttpsTransportEsp32::toError(Step step) {
  switch (step) {
    case Step::Timeout: return TransportError::Timeout;
    case Step::Cancelled: return TransportError::Cancelled;
    case Step::Ok:
    case Step::Closed:
      break;
  }
  return TransportError::Io;
}

bool HttpsTransportEsp32::parseUrl(const std::string& url, std::string& host, uint16_t& port, std::string& path) {
  static const char kScheme[] = "https://";
  if (url.compare(0, sizeof(kScheme) - 1, kScheme) != 0) return false;
  const size_t hostStart = sizeof(kScheme) - 1;
  size_t pathStart = url.find('/', hostStart);
  if (pathStart == std::string::npos) pathStart = url.size();
  std::string authority = url.substr(hostStart, pathStart - hostStart);
  path = pathStart < url.size() ? url.substr(pathStart) : std::string("/");

  port = 443;
  const size_t colon = authority.find(':');
  if (colon != std::string::npos) {
    const long p = strtol(authority.c_str() + colon + 1, nullptr, 10);
    if (p <= 0 || p > 65535) return false;
    port = static_cast<uint16_t>(p);
    authority.erase(colon);
  }
  host = authority;
  return !host.empty();
}

HttpResponse HttpsTransportEsp32::post(const HttpRequest& request, const std::atomic<bool>& cancel) {
  std::string host, path;
  uint16_t port = 443;
  if (!parseUrl(request.url, host, port, path)) {
    Logger::error("HTTPS: bad url %s", request.url.c_str());
    return failure(TransportError::ConnectFailed);
  }
  if (WiFi.status() != WL_CONNECTED) return failure(TransportError::ConnectFailed);
  if (cancel.load()) return failure(TransportError::Cancelled);

  const uint32_t deadline = millis() + request.timeoutMs;
  WiFiClientSecure tls;
  if (rootCa_) {
    tls.setCACert(rootCa_);
  } else {
    tls.setInsecure();
  }
  tls.setTimeout(request.timeoutMs / 1000 > 0 ? request.timeoutMs / 1000 : 1);

  // The handshake is the one step the cancel flag cannot interrupt.
  if (!tls.connect(host.c_str(), port, static_cast<int32_t>(request.timeoutMs))) {
    Logger::warn("HTTPS: connect %s:%u failed", host.c_str(), port);
    return failure(expired(deadline) ? TransportError::Timeout : TransportError::ConnectFailed);
  }
  if (cancel.load()) {
    tls.stop();
    return failure(TransportError::Cancelled);
  }

  std::string head;
  head.reserve(256);
  head += "POST " + path + " HTTP/1.1\r\n";
  head += "Host: " + host + "\r\n";
  for (size_t i = 0; i < request.headers.size(); ++i) {
    head += request.headers[i].first + ": " + request.headers[i].second + "\r\n";
  }
  char lengthLine[48];
  snprintf(lengthLine, sizeof(lengthLine), "Content-Length: %u\r\n", (unsigned)request.body.size());
  head += lengthLine;
  head += "Connection: close\r\n\r\n";

  Step step = writeAll(tls, head.data(), head.size(), deadline, cancel);
  if (step == Step::Ok) step = writeAll(tls, request.body.data(), request.body.size(), deadline, cancel);
  if (step != Step::Ok) {
    tls.stop();
    return failure(toError(step));
  }
  Logger::debug("HTTPS: sent %u body bytes", (unsigned)request.body.size());

  // Status line: HTTP/1.1 200 OK
  std::string line;
  step = readLine(tls, line, deadline, cancel);
  if (step != Step::Ok) {
    tls.stop();
    return failure(toError(step));
  }
  HttpResponse response;
  const size_t sp = line.find(' ');
  response.status = sp == std::string::npos ? 0 : atoi(line.c_str() + sp + 1);
  if (response.status < 100) {
    Logger::warn("HTTPS: bad status line '%s'", line.c_str());
    tls.stop();
    return failure(TransportError::Io);
  }

  long contentLength = -1;
  bool chunked = false;
  for (;;) {
    step = readLine(tls, line, deadline, cancel);
    if (step != Step::Ok) {
      tls.stop();
      return failure(toError(step));
    }
    if (line.empty()) break;
    const size_t colon = line.find(':');
    if (colon == std::string::npos) continue;
    std::string name = line.substr(0, colon);
    const char* value = line.c_str() + colon + 1;
    while (*value == ' ') ++value;
    if (strcasecmp(name.c_str(), "Content-Length") == 0) contentLength = strtol(value, nullptr, 10);
    if (strcasecmp(name.c_str(), "Transfer-Encoding") == 0 && strncasecmp(value, "chunked", 7) == 0) chunked = true;
  }

  if (chunked) {
    step = readChunked(tls, response.body, deadline, cancel);
  } else if (contentLength >= 0) {
    step = readBytes(tls, static_cast<size_t>(contentLength), response.body, deadline, cancel);
  } else {
    step = readToClose(tls, response.body, deadline, cancel);
  }
  tls.stop();
  if (step != Step::Ok) return failure(toError(step));
  Logger::debug("HTTPS: status %d, %u body bytes", response.status, (unsigned)response.body.size());
  return response;
}

HttpsTransportEsp32::Step HttpsTransportEsp32::writeAll(WiFiClientSecure& tls, const char* data, size_t len,
                                                        uint32_t deadline, const std::atomic<bool>& cancel) {
  size_t sent = 0;
  while (sent < len) {
    if (cancel.load()) return Step::Cancelled;
    if (expired(deadline)) return Step::Timeout;
    if (!tls.connected()) return Step::Closed;
    const size_t chunk = len - sent > kWriteChunk ? kWriteChunk : len - sent;
    const size_t n = tls.write(reinterpret_cast<const uint8_t*>(data + sent), chunk);
    if (n == 0) {
      delay(5);
      continue;
    }
    sent += n;
  }
  return Step::Ok;
}

HttpsTransportEsp32::Step HttpsTransportEsp32::readLine(WiFiClientSecure& tls, std::string& line,
                                                        uint32_t deadline, const std::atomic<bool>& cancel) {
  line.clear();
  for (;;) {
    if (cancel.load()) return Step::Cancelled;
    if (expired(deadline)) return Step::Timeout;
    if (!tls.available()) {
      if (!tls.connected()) return Step::Closed;
      delay(10);
      continue;
    }
    const int c = tls.read();
    if (c < 0) continue;
    if (c == '\n') {
      if (!line.empty() && line[line.size() - 1] == '\r') line.erase(line.size() - 1);
      return Step::Ok;
    }
    line += static_cast<char>(c);
  }
}

HttpsTransportEsp32::Step HttpsTransportEsp32::readBytes(WiFiClientSecure& tls, size_t count, std::string& out,
                                                         uint32_t deadline, const std::atomic<bool>& cancel) {
  out.reserve(out.size() + count);
  uint8_t buffer[512];
  while (count > 0) {
    if (cancel.load()) return Step::Cancelled;
    if (expired(deadline)) return Step::Timeout;
    const int avail = tls.available();
    if (avail <= 0) {
      if (!tls.connected()) return Step::Closed;
      delay(10);
      continue;
    }
    size_t want = count < sizeof(buffer) ? count : sizeof(buffer);
    if (static_cast<size_t>(avail) < want) want = avail;
    const int n = tls.read(buffer, want);
    if (n <= 0) continue;
    out.append(reinterpret_cast<const char*>(buffer), n);
    count -= n;
  }
  return Step::Ok;
}

HttpsTransportEsp32::Step HttpsTransportEsp32::readToClose(WiFiClientSecure& tls, std::string& out,
                                                           uint32_t deadline, const std::atomic<bool>& cancel) {
  uint8_t buffer[512];
  for (;;) {
    if (cancel.load()) return Step::Cancelled;
    if (expired(deadline)) return Step::Timeout;
    const int avail = tls.available();
    if (avail <= 0) {
      if (!tls.connected()) return Step::Ok;
      delay(10);
      continue;
    }
    const int n = tls.read(buffer, static_cast<size_t>(avail) < sizeof(buffer) ? avail : sizeof(buffer));
    if (n > 0) out.append(reinterpret_cast<const char*>(buffer), n);
  }
}

HttpsTransportEsp32::Step HttpsTransportEsp32::readChunked(WiFiClientSecure& tls, std::string& out,
                                                           uint32_t deadline, const std::atomic<bool>& cancel) {
  std::string line;
  for (;;) {
    Step step = readLine(tls, line, deadline, cancel);
    if (step != Step::Ok) return step;
    size_t size = 0;
    if (!HttpChunked::parseSize(line, size)) {
      Logger::warn("HTTPS: bad chunk size line \"%.16s\"", line.c_str());
      return Step::Closed;
    }
    if (size == 0) return Step::Ok;  // trailers are not needed
    step = readBytes(tls, size, out, deadline, cancel);
    if (step != Step::Ok) return step;
    step = readLine(tls, line, deadline, cancel);  // CRLF after the chunk
    if (step != Step::Ok) return step;
  }
}
