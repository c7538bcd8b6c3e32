// TestDoubles.cpp

#include "support/TestDoubles.h"

#include <ArduinoJson.h>

#include <utility>

#include "src/infrastructure/Logger.h"

namespace testing {

// ---- MemoryFileStore ----

bool MemoryFileStore::ensureDirectory(const std::string& dir) {
  if (!isMounted || failWrites) return false;
  dirs.insert(dir);
  return true;
}

bool MemoryFileStore::list(const std::string& dir, std::vector<FileEntry>& out) {
  out.clear();
  if (!isMounted || failList || dirs.count(dir) == 0) return false;
  const std::string prefix = dir + "/";
  for (std::map<std::string, Stored>::const_iterator it = files.begin(); it != files.end(); ++it) {
    const std::string& path = it->first;
    if (path.compare(0, prefix.size(), prefix) != 0) continue;
    const std::string name = path.substr(prefix.size());
    if (name.find('/') != std::string::npos) continue;
    FileEntry e;
    e.name = name;
    e.path = path;
    e.size = it->second.data.size();
    e.modifiedTime = it->second.modifiedTime;
    out.push_back(e);
  }
  return true;
}

bool MemoryFileStore::writeFile(const std::string& path, const uint8_t* data, size_t len) {
  if (!isMounted || failWrites) return false;
  Stored s;
  s.data.assign(data, data + len);
  s.modifiedTime = nextTime++;
  files[path] = s;
  return true;
}

bool MemoryFileStore::readFile(const std::string& path, std::vector<uint8_t>& out) {
  std::map<std::string, Stored>::const_iterator it = files.find(path);
  if (!isMounted || it == files.end()) return false;
  out = it->second.data;
  return true;
}

void MemoryFileStore::put(const std::string& path, const std::string& content, time_t modifiedTime) {
  const size_t slash = path.find_last_of('/');
  if (slash != std::string::npos && slash > 0) dirs.insert(path.substr(0, slash));
  Stored s;
  s.data.assign(content.begin(), content.end());
  s.modifiedTime = modifiedTime;
  files[path] = s;
}

std::string MemoryFileStore::text(const std::string& path) const {
  std::map<std::string, Stored>::const_iterator it = files.find(path);
  if (it == files.end()) return std::string();
  return std::string(it->second.data.begin(), it->second.data.end());
}

size_t MemoryFileStore::countIn(const std::string& dir) const {
  std::vector<FileEntry> entries;
  if (!const_cast<MemoryFileStore*>(this)->list(dir, entries)) return 0;
  return entries.size();
}

// ---- ScriptedHttpTransport ----

HttpResponse ScriptedHttpTransport::post(const HttpRequest& request, const std::atomic<bool>& cancel) {
  ++calls;
  lastRequest = request;
  if (onPost) onPost();
  if (cancel.load()) {
    HttpResponse r;
    r.error = TransportError::Cancelled;
    return r;
  }
  if (script.empty()) return fallback;
  HttpResponse r = script.front();
  script.pop_front();
  return r;
}

void ScriptedHttpTransport::pushStatus(int status, const std::string& body) {
  HttpResponse r;
  r.status = status;
  r.body = body;
  script.push_back(r);
}

void ScriptedHttpTransport::pushError(TransportError error) {
  HttpResponse r;
  r.error = error;
  script.push_back(r);
}

// ---- FakeCamera ----

FakeCamera::FakeCamera() { setPreviewColor(0xFFFF); }

bool FakeCamera::setResolution(int resolutionCode) {
  if (rejectResolution) return false;
  resolution = resolutionCode;
  return true;
}

CaptureError FakeCamera::capture(CaptureResult& out) {
  ++captures;
  if (onCapture) onCapture();
  if (captureError != CaptureError::None) return captureError;
  out.bytes.assign(captureBytes, 0xAB);
  if (captureBytes >= 2) {
    out.bytes[0] = 0xFF;
    out.bytes[1] = 0xD8;
  }
  return CaptureError::None;
}

bool FakeCamera::preview(Frame& out) {
  if (!previewAvailable) return false;
  out = previewFrame;
  return true;
}

void FakeCamera::setPreviewColor(uint16_t rgb565) {
  previewFrame.width = 24;
  previewFrame.height = 18;
  previewFrame.pixels.assign(24 * 18, rgb565);
}

// ---- RecordingDisplay ----

bool RecordingDisplay::shows(const std::string& needle) const {
  for (size_t i = 0; i < texts.size(); ++i) {
    if (texts[i].find(needle) != std::string::npos) return true;
  }
  return false;
}

// ---- InlineAnalysisRunner ----

bool InlineAnalysisRunner::start(AnalysisJob& job) {
  if (pending_) return false;
  ++started;
  done_ = false;
  lastPrompt = job.promptText;
  lastImageBytes = job.image.size();
  job_ = std::move(job);
  client_.resetCancel();
  pending_ = true;
  if (!deferred) finish();
  return true;
}

void InlineAnalysisRunner::finish() {
  if (!pending_) return;
  outcome_ = client_.analyze(job_.image, job_.promptText, job_.quality);
  job_ = AnalysisJob();
  pending_ = false;
  done_ = true;
}

bool InlineAnalysisRunner::poll(AnalysisOutcome& out) {
  if (!done_) return false;
  done_ = false;
  out = std::move(outcome_);
  return true;
}

// ---- LogCapture ----

namespace {

std::vector<std::string>& capturedLines() {
  static std::vector<std::string> lines;
  return lines;
}

void captureSink(const char* level, const char* line) {
  capturedLines().push_back(std::string(level) + " " + line);
}

}  // namespace

LogCapture::LogCapture() {
  capturedLines().clear();
  Logger::setSink(&captureSink);
}

LogCapture::~LogCapture() { Logger::setSink(nullptr); }

const std::vector<std::string>& LogCapture::lines() const { return capturedLines(); }

bool LogCapture::contains(const std::string& needle) const { return count(needle) > 0; }

size_t LogCapture::count(const std::string& needle) const {
  size_t n = 0;
  for (size_t i = 0; i < capturedLines().size(); ++i) {
    if (capturedLines()[i].find(needle) != std::string::npos) ++n;
  }
  return n;
}

std::string successBody(const std::string& text) {
  JsonDocument doc;
  doc["id"] = "msg_test";
  doc["type"] = "message";
  doc["role"] = "assistant";
  JsonObject block = doc["content"].add<JsonObject>();
  block["type"] = "text";
  block["text"] = text;
  doc["stop_reason"] = "end_turn";
  std::string out;
  serializeJson(doc, out);
  return out;
}

}  // namespace testing
