// FileStore.h
// Abstract flat-directory storage (the SD card on the device).

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <time.h>

#include <string>
#include <vector>

struct FileEntry {
  std::string name;  // file name without directory
  std::string path;  // absolute path
  size_t size = 0;
  time_t modifiedTime = 0;  // filesystem timestamp
};

class FileStore {
 public:
  virtual ~FileStore() = default;

  // True when the medium is mounted.
  virtual bool mounted() const = 0;

  // Creates `dir` if missing. Returns true when it exists afterwards.
  virtual bool ensureDirectory(const std::string& dir) = 0;

  // Lists regular files directly inside `dir`. Returns false if `dir` cannot
  // be opened.
  virtual bool list(const std::string& dir, std::vector<FileEntry>& out) = 0;

  // Creates or replaces `path` with `len` bytes. Returns false on any short
  // write; a partial file is removed.
  virtual bool writeFile(const std::string& path, const uint8_t* data, size_t len) = 0;

  virtual bool readFile(const std::string& path, std::vector<uint8_t>& out) = 0;

  virtual bool exists(const std::string& path) = 0;
};
