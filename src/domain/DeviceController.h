// DeviceController.h
// The device's state machine. Owns the single DeviceState and the
// presentation state, polls buttons, runs captures, hands requests to the
// analysis worker and draws every screen.
//
// tick() never blocks on the network: the request runs on the
// AnalysisRunner and is polled here, so the cancel button is seen on the next
// tick. Capture, focus and storage are local and run inline.
//
// Button roles:
//   Viewfinder  CaptureShort capture, CaptureLong focus, Left/Right prompt,
//               Up/Down quality, Select browse
//   Sending     Select cancel (shows a cancellation notice in Viewing)
//   Viewing     Up/Down page, Left/Right/Confirm BRIEF<->VERBOSE,
//               Select/CaptureShort close (back to Viewfinder or Browsing)
//   Browsing    Up/Down entry, Left/Right prompt, Confirm re-send image,
//               CaptureShort open saved response, Select back to Viewfinder
//   Screensaver any button wakes; the press is consumed

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "AnalysisRunner.h"
#include "Archivist.h"
#include "BrightnessSampler.h"
#include "CameraDevice.h"
#include "Clock.h"
#include "DeviceState.h"
#include "DisplaySurface.h"
#include "FillLight.h"
#include "InputSource.h"
#include "PromptSelector.h"
#include "QualityManager.h"
#include "ResponsePresenter.h"
#include "SelectionStore.h"
#include "Settings.h"

class DeviceController {
 public:
  DeviceController(const DeviceSettings& settings, CameraDevice& camera, DisplaySurface& display,
                   InputSource& input, FillLight& light, Clock& clock, Archivist& archivist,
                   AnalysisRunner& runner, SelectionStore& selections);

  // Restores the persisted selection and draws the first screen. The
  // archivist must already have been started.
  void begin();

  // One pass of the main loop: input, idle timer, request polling, render.
  void tick();

  DeviceState state() const { return state_; }
  const QualityManager& quality() const { return quality_; }
  const PromptSelector& prompts() const { return prompts_; }
  const ResponsePresenter& presenter() const { return presenter_; }
  const std::vector<ArchiveRecord>& browseEntries() const { return entries_; }
  size_t browseIndex() const { return browseIndex_; }

  // Currently visible transient message, empty when none.
  const std::string& message() const { return message_; }

 private:
  enum class Origin {
    Live,
    Browse,
  };

  struct PendingRequest {
    bool active = false;
    Origin origin = Origin::Live;
    int sequence = 0;
    std::string imagePath;
    std::string promptLabel;
    bool neverTruncate = false;
    uint32_t startedMs = 0;
  };

  const DeviceSettings& settings_;
  CameraDevice& camera_;
  DisplaySurface& display_;
  InputSource& input_;
  FillLight& light_;
  Clock& clock_;
  Archivist& archivist_;
  AnalysisRunner& runner_;
  SelectionStore& selections_;

  QualityManager quality_;
  PromptSelector prompts_;
  BrightnessSampler brightness_;
  ResponsePresenter presenter_;

  DeviceState state_ = DeviceState::Viewfinder;
  DeviceState resumeState_ = DeviceState::Viewfinder;  // restored on wake
  uint32_t lastInputMs_ = 0;

  PendingRequest request_;
  Origin viewerOrigin_ = Origin::Live;
  std::string viewerTitle_;

  std::vector<ArchiveRecord> entries_;
  size_t browseIndex_ = 0;

  std::string message_;
  uint16_t messageColor_ = Colors::kWhite;
  uint32_t messageUntilMs_ = 0;

  bool selectionDirty_ = false;
  uint32_t selectionChangedMs_ = 0;

  bool dirty_ = true;
  uint32_t lastPreviewMs_ = 0;
  uint32_t lastSendingSecond_ = 0;
  Frame previewFrame_;

  // Input dispatch
  void handleButton(Button button);
  void onViewfinder(Button button);
  void onSending(Button button);
  void onViewing(Button button);
  void onBrowsing(Button button);

  // Operations
  void capture();
  void focus();
  void openBrowse();
  void moveBrowse(int direction);
  void resendSelected();
  void openSavedResponse();
  bool startRequest(CaptureResult& image, Origin origin, int sequence, const std::string& imagePath);
  void pollRequest();
  void finishRequest(const AnalysisOutcome& outcome);
  void cancelRequest();
  void showInViewer(const std::string& title, const std::string& text, bool allowTruncation, Origin origin);
  void closeViewer();
  void enterScreensaver();
  void wake();
  void recover(const char* what);

  void setState(DeviceState next);
  void showMessage(const std::string& text, uint16_t color);
  void cyclePrompt(int direction);
  void cycleQuality(int direction);
  void flushSelection(bool force);
  bool promptNeverTruncates(const std::string& label) const;

  // Rendering
  void render(uint32_t nowMs);
  void drawStatusBar();
  void drawViewfinder();
  void drawBusy(const char* title);
  void drawSending(uint32_t nowMs);
  void drawViewing();
  void drawBrowsing();
  void drawMessage();
  void drawLine(int row, const std::string& text, uint16_t color);
  int rows() const;
};
