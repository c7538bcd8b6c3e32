// Archivist.cpp

#include "Archivist.h"

#include <ctype.h>
#include <stdio.h>
#include <string.h>

#include <algorithm>

#include "src/infrastructure/Logger.h"

namespace {

const char kImagePrefix[] = "IMG_";
const char kResponsePrefix[] = "RSP_";
const char kResponseExtension[] = ".TXT";
const char kHeaderSeparator[] = "---";
const size_t kMaxLabelChars = 16;
const int kMaxResponseCopies = 999;

bool startsWithNoCase(const std::string& s, const char* prefix) {
  size_t i = 0;
  for (; prefix[i] != '\0'; ++i) {
    if (i >= s.size() || toupper(static_cast<unsigned char>(s[i])) != prefix[i]) return false;
  }
  return true;
}

bool endsWithNoCase(const std::string& s, const char* suffix) {
  const size_t n = strlen(suffix);
  if (s.size() < n) return false;
  for (size_t i = 0; i < n; ++i) {
    if (toupper(static_cast<unsigned char>(s[s.size() - n + i])) != toupper(static_cast<unsigned char>(suffix[i]))) {
      return false;
    }
  }
  return true;
}

std::string baseName(const std::string& path) {
  const size_t slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

// Part of a response name that ties it to its image: the zero-padded
// sequence, or the sanitized image stem for images without one.
std::string responseKey(int sequence, const std::string& imagePath) {
  if (sequence > 0) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%04d", sequence);
    return buf;
  }
  std::string stem = baseName(imagePath);
  const size_t dot = stem.find_last_of('.');
  if (dot != std::string::npos) stem.erase(dot);
  return Archivist::fileSafeLabel(stem);
}

// Copy number from a trailing "_<n>" added when a response name was taken;
// 1 for the first copy. Only the part after `keyEnd` is considered.
int copyNumber(const std::string& name, size_t keyEnd) {
  std::string stem = name;
  const size_t dot = stem.find_last_of('.');
  if (dot != std::string::npos) stem.erase(dot);
  const size_t underscore = stem.find_last_of('_');
  if (underscore == std::string::npos || underscore < keyEnd || underscore + 1 >= stem.size()) return 1;
  int n = 0;
  for (size_t i = underscore + 1; i < stem.size(); ++i) {
    if (!isdigit(static_cast<unsigned char>(stem[i]))) return 1;
    n = n * 10 + (stem[i] - '0');
    if (n > kMaxResponseCopies) return 1;
  }
  return n >= 2 ? n : 1;
}

}  // namespace

Archivist::Archivist(FileStore& store, const ArchiveSettings& settings) : store_(store), settings_(settings) {}

bool Archivist::begin() {
  if (!store_.mounted()) {
    Logger::error("Archive: storage not mounted, archiving disabled");
    available_ = false;
    return false;
  }
  if (!store_.ensureDirectory(settings_.imageDir) || !store_.ensureDirectory(settings_.responseDir)) {
    Logger::error("Archive: cannot create %s / %s, archiving disabled", settings_.imageDir.c_str(),
                  settings_.responseDir.c_str());
    available_ = false;
    return false;
  }
  available_ = true;
  Logger::info("Archive: ready (images=%s, responses=%s)", settings_.imageDir.c_str(), settings_.responseDir.c_str());
  return true;
}

void Archivist::markUnavailable(const char* what, const std::string& path) {
  if (available_) {
    Logger::error("Archive: %s failed for %s, archiving disabled for this session", what, path.c_str());
  }
  available_ = false;
}

bool Archivist::isImageName(const std::string& name) const {
  return endsWithNoCase(name, ".jpg") || endsWithNoCase(name, ".jpeg") ||
         endsWithNoCase(name, ("." + settings_.imageExtension).c_str());
}

int Archivist::sequenceFromName(const std::string& name) {
  if (!startsWithNoCase(name, kImagePrefix)) return 0;
  size_t i = sizeof(kImagePrefix) - 1;
  int value = 0;
  size_t digits = 0;
  while (i < name.size() && isdigit(static_cast<unsigned char>(name[i]))) {
    if (digits >= 9) return 0;
    value = value * 10 + (name[i] - '0');
    ++digits;
    ++i;
  }
  if (digits == 0 || i >= name.size() || name[i] != '.') return 0;
  return value;
}

std::string Archivist::fileSafeLabel(const std::string& label) {
  std::string out;
  for (size_t i = 0; i < label.size() && out.size() < kMaxLabelChars; ++i) {
    const unsigned char c = static_cast<unsigned char>(label[i]);
    if (isalnum(c)) out += static_cast<char>(toupper(c));
  }
  return out;
}

std::string Archivist::imagePathFor(int sequence) const {
  char name[32];
  snprintf(name, sizeof(name), "%s%04d.", kImagePrefix, sequence);
  return settings_.imageDir + "/" + name + settings_.imageExtension;
}

std::string Archivist::responsePathFor(int sequence, const std::string& promptLabel) const {
  char name[32];
  snprintf(name, sizeof(name), "%s%04d", kResponsePrefix, sequence);
  std::string path = settings_.responseDir + "/" + name;
  const std::string label = fileSafeLabel(promptLabel);
  if (settings_.embedPromptLabel && !label.empty()) path += "_" + label;
  return path + kResponseExtension;
}

int Archivist::nextSequence() {
  if (!available_) return 0;
  if (!scanned_) {
    std::vector<FileEntry> entries;
    if (!store_.list(settings_.imageDir, entries)) {
      markUnavailable("scan", settings_.imageDir);
      return 0;
    }
    int maxFound = 0;
    for (size_t i = 0; i < entries.size(); ++i) {
      if (!isImageName(entries[i].name)) continue;
      maxFound = std::max(maxFound, sequenceFromName(entries[i].name));
    }
    lastSequence_ = std::max(lastSequence_, maxFound);
    scanned_ = true;
    Logger::info("Archive: highest existing sequence %d", maxFound);
  }
  return ++lastSequence_;
}

bool Archivist::saveImage(const CaptureResult& image, int sequence, std::string& outPath) {
  if (!available_ || sequence <= 0) return false;
  const std::string path = imagePathFor(sequence);
  if (!store_.writeFile(path, image.bytes.data(), image.size())) {
    markUnavailable("image write", path);
    return false;
  }
  Logger::info("Archive: saved %s (%u bytes)", path.c_str(), (unsigned)image.size());
  outPath = path;
  return true;
}

bool Archivist::saveResponse(const std::string& text, const std::string& promptLabel, int sequence,
                             const std::string& imagePath, std::string& outPath) {
  if (!available_) return false;
  std::string path;
  if (sequence > 0) {
    path = responsePathFor(sequence, promptLabel);
  } else {
    path = settings_.responseDir + "/" + kResponsePrefix + responseKey(0, imagePath);
    const std::string label = fileSafeLabel(promptLabel);
    if (settings_.embedPromptLabel && !label.empty()) path += "_" + label;
    path += kResponseExtension;
  }

  // A re-sent image keeps its earlier answers: take the next free "_<n>".
  if (store_.exists(path)) {
    const std::string base = path.substr(0, path.size() - strlen(kResponseExtension));
    bool found = false;
    for (int n = 2; n <= kMaxResponseCopies && !found; ++n) {
      char suffix[12];
      snprintf(suffix, sizeof(suffix), "_%d", n);
      path = base + suffix + kResponseExtension;
      found = !store_.exists(path);
    }
    if (!found) {
      Logger::error("Archive: no free response name for %s", base.c_str());
      return false;
    }
  }

  std::string body;
  body.reserve(text.size() + promptLabel.size() + imagePath.size() + 32);
  body += "Prompt: ";
  body += promptLabel;
  body += "\nImage: ";
  body += imagePath;
  body += "\n";
  body += kHeaderSeparator;
  body += "\n\n";
  body += text;

  if (!store_.writeFile(path, reinterpret_cast<const uint8_t*>(body.data()), body.size())) {
    markUnavailable("response write", path);
    return false;
  }
  Logger::info("Archive: saved %s (%u chars)", path.c_str(), (unsigned)text.size());
  outPath = path;
  return true;
}

bool Archivist::listSaved(std::vector<ArchiveRecord>& out) {
  out.clear();
  if (!available_) return false;

  std::vector<FileEntry> images;
  if (!store_.list(settings_.imageDir, images)) {
    markUnavailable("list", settings_.imageDir);
    return false;
  }
  std::vector<FileEntry> responses;
  if (!store_.list(settings_.responseDir, responses)) responses.clear();

  for (size_t i = 0; i < images.size(); ++i) {
    if (!isImageName(images[i].name)) continue;
    ArchiveRecord rec;
    rec.sequence = sequenceFromName(images[i].name);
    rec.imagePath = images[i].path;
    rec.modifiedTime = images[i].modifiedTime;

    const std::string prefix = std::string(kResponsePrefix) + responseKey(rec.sequence, rec.imagePath);
    time_t newest = 0;
    int newestCopy = 0;
    for (size_t j = 0; j < responses.size(); ++j) {
      const std::string& name = responses[j].name;
      if (name.compare(0, prefix.size(), prefix) != 0 || name.size() <= prefix.size()) continue;
      const char next = name[prefix.size()];
      if (next != '_' && next != '.') continue;
      // FAT timestamps are coarse; equal times fall back to the copy number.
      const int copy = copyNumber(name, prefix.size());
      const time_t mtime = responses[j].modifiedTime;
      if (rec.responsePath.empty() || mtime > newest || (mtime == newest && copy > newestCopy)) {
        rec.responsePath = responses[j].path;
        newest = mtime;
        newestCopy = copy;
      }
    }
    out.push_back(rec);
  }

  std::sort(out.begin(), out.end(), [](const ArchiveRecord& a, const ArchiveRecord& b) {
    if (a.modifiedTime != b.modifiedTime) return a.modifiedTime > b.modifiedTime;
    return a.imagePath > b.imagePath;
  });
  return true;
}

bool Archivist::loadImage(const std::string& path, CaptureResult& out) {
  if (!available_) return false;
  if (!store_.readFile(path, out.bytes) || out.bytes.empty()) {
    Logger::warn("Archive: cannot read %s", path.c_str());
    out.release();
    return false;
  }
  return true;
}

bool Archivist::findResponse(const std::string& imagePath, std::string& outPath) {
  std::vector<ArchiveRecord> records;
  if (!listSaved(records)) return false;
  for (size_t i = 0; i < records.size(); ++i) {
    if (records[i].imagePath != imagePath) continue;
    if (records[i].responsePath.empty()) return false;
    outPath = records[i].responsePath;
    return true;
  }
  return false;
}

bool Archivist::readResponse(const std::string& path, SavedResponse& out) {
  if (!available_) return false;
  std::vector<uint8_t> raw;
  if (!store_.readFile(path, raw)) {
    Logger::warn("Archive: cannot read %s", path.c_str());
    return false;
  }
  std::string content(raw.begin(), raw.end());
  std::vector<uint8_t>().swap(raw);

  out = SavedResponse();
  const std::string marker = std::string("\n") + kHeaderSeparator + "\n";
  const size_t sep = content.find(marker);
  if (content.compare(0, 8, "Prompt: ") != 0 || sep == std::string::npos) {
    out.text = content;  // no header; show as-is
    return true;
  }

  const std::string header = content.substr(0, sep);
  size_t lineStart = 0;
  while (lineStart <= header.size()) {
    size_t lineEnd = header.find('\n', lineStart);
    if (lineEnd == std::string::npos) lineEnd = header.size();
    const std::string line = header.substr(lineStart, lineEnd - lineStart);
    if (line.compare(0, 8, "Prompt: ") == 0) out.promptLabel = line.substr(8);
    if (line.compare(0, 7, "Image: ") == 0) out.imagePath = line.substr(7);
    lineStart = lineEnd + 1;
  }

  size_t bodyStart = sep + marker.size();
  if (bodyStart < content.size() && content[bodyStart] == '\n') ++bodyStart;
  out.text = content.substr(bodyStart);
  return true;
}
