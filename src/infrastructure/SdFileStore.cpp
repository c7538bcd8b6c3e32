// SdFileStore.cpp

#include "SdFileStore.h"

#include <new>

#include "src/infrastructure/Logger.h"

bool SdFileStore::begin(uint8_t csPin) {
  if (!SD.begin(csPin)) {
    Logger::error("SD: mount failed (CS=%u)", csPin);
    mounted_ = false;
    return false;
  }
  if (SD.cardType() == CARD_NONE) {
    Logger::error("SD: no card");
    mounted_ = false;
    return false;
  }
  mounted_ = true;
  Logger::info("SD: mounted, %llu MB total, %llu MB used", SD.totalBytes() / (1024ULL * 1024ULL),
               SD.usedBytes() / (1024ULL * 1024ULL));
  return true;
}

bool SdFileStore::ensureDirectory(const std::string& dir) {
  if (!mounted_) return false;
  if (SD.exists(dir.c_str())) return true;
  if (!SD.mkdir(dir.c_str())) {
    Logger::error("SD: mkdir %s failed", dir.c_str());
    return false;
  }
  return true;
}

bool SdFileStore::list(const std::string& dir, std::vector<FileEntry>& out) {
  out.clear();
  if (!mounted_) return false;
  File root = SD.open(dir.c_str());
  if (!root || !root.isDirectory()) {
    if (root) root.close();
    return false;
  }
  std::string prefix = dir;
  if (prefix.empty() || prefix[prefix.size() - 1] != '/') prefix += '/';

  File f = root.openNextFile();
  while (f) {
    if (!f.isDirectory()) {
      FileEntry e;
      // name() is the bare name on core 2.x+, a full path on 1.x.
      std::string name = f.name();
      const size_t slash = name.find_last_of('/');
      if (slash != std::string::npos) name = name.substr(slash + 1);
      e.name = name;
      e.path = prefix + name;
      e.size = f.size();
      e.modifiedTime = f.getLastWrite();
      out.push_back(e);
    }
    f.close();
    f = root.openNextFile();
  }
  root.close();
  return true;
}

bool SdFileStore::writeFile(const std::string& path, const uint8_t* data, size_t len) {
  if (!mounted_) return false;
  File f = SD.open(path.c_str(), FILE_WRITE);
  if (!f) {
    Logger::error("SD: open %s for write failed", path.c_str());
    return false;
  }
  size_t written = 0;
  while (written < len) {
    const size_t chunk = len - written < kWriteChunk ? len - written : kWriteChunk;
    const size_t n = f.write(data + written, chunk);
    if (n != chunk) break;
    written += n;
  }
  f.close();
  if (written != len) {
    Logger::error("SD: short write %s (%u/%u)", path.c_str(), (unsigned)written, (unsigned)len);
    SD.remove(path.c_str());
    return false;
  }
  return true;
}

bool SdFileStore::readFile(const std::string& path, std::vector<uint8_t>& out) {
  out.clear();
  if (!mounted_) return false;
  File f = SD.open(path.c_str(), FILE_READ);
  if (!f || f.isDirectory()) {
    if (f) f.close();
    return false;
  }
  const size_t size = f.size();
  bool ok = true;
  try {
    out.resize(size);
  } catch (const std::bad_alloc&) {
    Logger::error("SD: no memory for %s (%u bytes)", path.c_str(), (unsigned)size);
    ok = false;
  }
  if (ok && size > 0) ok = f.read(out.data(), size) == size;
  f.close();
  if (!ok) std::vector<uint8_t>().swap(out);
  return ok;
}

bool SdFileStore::exists(const std::string& path) { return mounted_ && SD.exists(path.c_str()); }
