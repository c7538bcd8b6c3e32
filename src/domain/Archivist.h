// Archivist.h
// Sequential naming and persistence of captured images and their analysis
// responses.
//
// Layout:
//   <imageDir>/IMG_<seq>.<ext>                 e.g. /images/IMG_0007.JPG
//   <responseDir>/RSP_<seq>_<LABEL>.TXT        when embedPromptLabel is set
//   <responseDir>/RSP_<seq>.TXT                otherwise
// Response body: "Prompt: <label>\nImage: <path>\n---\n\n<full text>".
//
// Sequence numbers come from one scan of the image directory on first use
// (max + 1, or 1 when empty) and then only grow for the rest of the session.
// Any write failure marks the archive unavailable until reboot.

#pragma once

#include <stddef.h>
#include <stdint.h>
#include <time.h>

#include <string>
#include <vector>

#include "CaptureResult.h"
#include "FileStore.h"
#include "Settings.h"

struct ArchiveRecord {
  int sequence = 0;  // 0 when the image name carries no sequence
  std::string imagePath;
  std::string responsePath;  // empty when no response has been saved
  time_t modifiedTime = 0;
};

struct SavedResponse {
  std::string promptLabel;
  std::string imagePath;
  std::string text;  // full text, header stripped
};

class Archivist {
 public:
  Archivist(FileStore& store, const ArchiveSettings& settings);

  // Checks the medium and creates the directories. Returns false (and
  // disables the archive) when storage cannot be written.
  bool begin();

  bool available() const { return available_; }

  // Reserves the next sequence number. Scans the image directory on the
  // first call only. Returns 0 when the archive is unavailable.
  int nextSequence();

  bool saveImage(const CaptureResult& image, int sequence, std::string& outPath);

  bool saveResponse(const std::string& text, const std::string& promptLabel, int sequence,
                    const std::string& imagePath, std::string& outPath);

  // Saved images, newest modification time first.
  bool listSaved(std::vector<ArchiveRecord>& out);

  bool loadImage(const std::string& path, CaptureResult& out);

  // Newest response saved for `imagePath`; false if there is none.
  bool findResponse(const std::string& imagePath, std::string& outPath);

  bool readResponse(const std::string& path, SavedResponse& out);

  // Sequence embedded in an IMG_<digits>.<ext> name, or 0.
  static int sequenceFromName(const std::string& name);

  std::string imagePathFor(int sequence) const;
  std::string responsePathFor(int sequence, const std::string& promptLabel) const;

  // Upper-case alphanumerics of `label`, at most 16 characters.
  static std::string fileSafeLabel(const std::string& label);

 private:
  FileStore& store_;
  const ArchiveSettings& settings_;
  bool available_ = false;
  bool scanned_ = false;
  int lastSequence_ = 0;

  bool isImageName(const std::string& name) const;
  void markUnavailable(const char* what, const std::string& path);
};
