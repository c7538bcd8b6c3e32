// SdFileStore.h
// FileStore on a FAT-formatted micro-SD card over SPI (Arduino SD library).
// Modification times come from the FAT directory entries, which the core
// stamps from the SNTP-synced system time.

#pragma once

#include <Arduino.h>
#include <FS.h>
#include <SD.h>

#include "src/domain/FileStore.h"

class SdFileStore : public FileStore {
 public:
  // Mounts the card. Returns false when no card answers.
  bool begin(uint8_t csPin);

  bool mounted() const override { return mounted_; }
  bool ensureDirectory(const std::string& dir) override;
  bool list(const std::string& dir, std::vector<FileEntry>& out) override;
  bool writeFile(const std::string& path, const uint8_t* data, size_t len) override;
  bool readFile(const std::string& path, std::vector<uint8_t>& out) override;
  bool exists(const std::string& path) override;

 private:
  bool mounted_ = false;

  static const size_t kWriteChunk = 4096;  // bytes per File::write call
};
