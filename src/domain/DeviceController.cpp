// DeviceController.cpp

#include "DeviceController.h"

#include <stdio.h>

#include <exception>
#include <utility>

#include "SelectionCycle.h"
#include "src/infrastructure/Logger.h"

const char* deviceStateName(DeviceState state) {
  switch (state) {
    case DeviceState::Viewfinder: return "Viewfinder";
    case DeviceState::Focusing: return "Focusing";
    case DeviceState::Capturing: return "Capturing";
    case DeviceState::Sending: return "Sending";
    case DeviceState::Viewing: return "Viewing";
    case DeviceState::Browsing: return "Browsing";
    case DeviceState::Screensaver: return "Screensaver";
  }
  return "?";
}

const char* buttonName(Button button) {
  switch (button) {
    case Button::None: return "none";
    case Button::CaptureShort: return "capture";
    case Button::CaptureLong: return "capture-long";
    case Button::Left: return "left";
    case Button::Right: return "right";
    case Button::Up: return "up";
    case Button::Down: return "down";
    case Button::Select: return "select";
    case Button::Confirm: return "confirm";
  }
  return "?";
}

namespace {

const char kCancelledNotice[] = "Request cancelled.";

// Keeps the fill light from staying on if the capture path throws.
class LightGuard {
 public:
  explicit LightGuard(FillLight& light) : light_(light) {}
  ~LightGuard() {
    if (on_) light_.setOn(false);
  }
  void turnOn() {
    light_.setOn(true);
    on_ = true;
  }

 private:
  FillLight& light_;
  bool on_ = false;
};

const char* captureErrorMessage(CaptureError err) {
  switch (err) {
    case CaptureError::None: return "";
    case CaptureError::NotReady: return "Camera not ready";
    case CaptureError::Resolution: return "Resolution not supported";
    case CaptureError::Hardware: return "Capture failed";
    case CaptureError::OutOfMemory: return "Out of memory";
  }
  return "Capture failed";
}

}  // namespace

DeviceController::DeviceController(const DeviceSettings& settings, CameraDevice& camera, DisplaySurface& display,
                                   InputSource& input, FillLight& light, Clock& clock, Archivist& archivist,
                                   AnalysisRunner& runner, SelectionStore& selections)
    : settings_(settings),
      camera_(camera),
      display_(display),
      input_(input),
      light_(light),
      clock_(clock),
      archivist_(archivist),
      runner_(runner),
      selections_(selections),
      quality_(settings.qualityModes, settings.hardCeilingBytes, settings.defaultQuality),
      prompts_(settings.prompts, settings.defaultPrompt),
      brightness_(settings.darkThreshold),
      presenter_(settings.layout) {}

void DeviceController::begin() {
  size_t promptIndex = prompts_.index();
  size_t qualityIndex = quality_.index();
  if (selections_.load(promptIndex, qualityIndex)) {
    // Tables may have shrunk since the indices were saved.
    if (!prompts_.select(promptIndex)) Logger::warn("Controller: stored prompt %u out of range", (unsigned)promptIndex);
    if (!quality_.select(qualityIndex)) {
      Logger::warn("Controller: stored quality %u out of range", (unsigned)qualityIndex);
    }
  }
  Logger::info("Controller: prompt '%s', quality '%s', archive %s", prompts_.current().label.c_str(),
               quality_.current().label.c_str(), archivist_.available() ? "on" : "off");

  state_ = DeviceState::Viewfinder;
  lastInputMs_ = clock_.nowMs();
  display_.setPower(true);
  dirty_ = true;
  render(lastInputMs_);
}

void DeviceController::tick() {
  const uint32_t now = clock_.nowMs();
  try {
    const Button button = input_.poll();
    if (button != Button::None) {
      lastInputMs_ = now;
      Logger::debug("Controller: %s in %s", buttonName(button), deviceStateName(state_));
      if (state_ == DeviceState::Screensaver) {
        wake();
      } else {
        handleButton(button);
      }
    } else if (settings_.idleTimeoutMs > 0 && state_ != DeviceState::Screensaver &&
               now - lastInputMs_ >= settings_.idleTimeoutMs) {
      enterScreensaver();
    }

    pollRequest();

    if (!message_.empty() && clock_.nowMs() - messageUntilMs_ < 0x80000000u) {
      message_.clear();
      dirty_ = true;
    }
    flushSelection(false);
    render(clock_.nowMs());
  } catch (const std::exception& e) {
    recover(e.what());
  }
}

void DeviceController::handleButton(Button button) {
  switch (state_) {
    case DeviceState::Viewfinder: onViewfinder(button); break;
    case DeviceState::Sending: onSending(button); break;
    case DeviceState::Viewing: onViewing(button); break;
    case DeviceState::Browsing: onBrowsing(button); break;
    // Focusing and Capturing complete within the tick that entered them.
    case DeviceState::Focusing:
    case DeviceState::Capturing:
    case DeviceState::Screensaver:
      break;
  }
}

void DeviceController::onViewfinder(Button button) {
  switch (button) {
    case Button::CaptureShort: capture(); break;
    case Button::CaptureLong: focus(); break;
    case Button::Left: cyclePrompt(-1); break;
    case Button::Right: cyclePrompt(1); break;
    case Button::Up: cycleQuality(1); break;
    case Button::Down: cycleQuality(-1); break;
    case Button::Select: openBrowse(); break;
    default: break;
  }
}

void DeviceController::onSending(Button button) {
  if (button == Button::Select) cancelRequest();
}

void DeviceController::onViewing(Button button) {
  switch (button) {
    case Button::Up:
      presenter_.scroll(-1);
      dirty_ = true;
      break;
    case Button::Down:
      presenter_.scroll(1);
      dirty_ = true;
      break;
    case Button::Left:
    case Button::Right:
    case Button::Confirm:
      presenter_.toggleVerbosity();
      dirty_ = true;
      break;
    case Button::Select:
    case Button::CaptureShort:
      closeViewer();
      break;
    default:
      break;
  }
}

void DeviceController::onBrowsing(Button button) {
  switch (button) {
    case Button::Up: moveBrowse(-1); break;
    case Button::Down: moveBrowse(1); break;
    case Button::Left: cyclePrompt(-1); break;
    case Button::Right: cyclePrompt(1); break;
    case Button::Confirm: resendSelected(); break;
    case Button::CaptureShort: openSavedResponse(); break;
    case Button::Select:
      entries_.clear();
      setState(DeviceState::Viewfinder);
      break;
    default:
      break;
  }
}

void DeviceController::capture() {
  if (runner_.busy()) {
    showMessage("Busy, try again", Colors::kYellow);
    return;
  }
  // Every sent image must be on the card first.
  if (!archivist_.available()) {
    Logger::warn("Capture: refused, archive unavailable");
    showMessage("No storage", Colors::kYellow);
    return;
  }
  setState(DeviceState::Capturing);
  render(clock_.nowMs());

  const QualityMode& mode = quality_.current();
  if (!camera_.setResolution(mode.resolutionCode)) {
    Logger::error("Capture: resolution %d rejected", mode.resolutionCode);
    setState(DeviceState::Viewfinder);
    showMessage(captureErrorMessage(CaptureError::Resolution), Colors::kRed);
    return;
  }

  CaptureResult shot;
  CaptureError err = CaptureError::None;
  {
    LightGuard guard(light_);
    if (settings_.fillLightEnabled && camera_.preview(previewFrame_) && brightness_.isDark(previewFrame_)) {
      Logger::info("Capture: low light, fill light on");
      guard.turnOn();
    }
    err = camera_.capture(shot);
  }
  if (err != CaptureError::None) {
    Logger::error("Capture: %s", captureErrorMessage(err));
    setState(DeviceState::Viewfinder);
    showMessage(captureErrorMessage(err), Colors::kRed);
    return;
  }
  if (shot.capturedAt == 0) shot.capturedAt = clock_.epochNow();

  if (quality_.validate(shot.size()) == SizeVerdict::Oversized) {
    Logger::error("Capture: %u bytes exceeds ceiling %u", (unsigned)shot.size(), (unsigned)quality_.hardCeilingBytes());
    shot.release();
    setState(DeviceState::Viewfinder);
    showMessage("Image too large", Colors::kRed);
    return;
  }
  if (quality_.exceedsModeBudget(shot.size())) {
    Logger::warn("Capture: %u bytes over %s budget (%u)", (unsigned)shot.size(), mode.id.c_str(),
                 (unsigned)mode.maxBytes);
  } else {
    Logger::info("Capture: %u bytes (%s)", (unsigned)shot.size(), mode.id.c_str());
  }

  const int sequence = archivist_.nextSequence();
  std::string imagePath;
  if (sequence == 0 || !archivist_.saveImage(shot, sequence, imagePath)) {
    Logger::error("Capture: image not saved, request dropped");
    shot.release();
    setState(DeviceState::Viewfinder);
    showMessage("Storage error", Colors::kRed);
    return;
  }
  startRequest(shot, Origin::Live, sequence, imagePath);
}

void DeviceController::focus() {
  if (!camera_.hasAutofocus()) {
    showMessage("No autofocus", Colors::kYellow);
    return;
  }
  setState(DeviceState::Focusing);
  render(clock_.nowMs());
  const bool ok = camera_.autofocus();
  setState(DeviceState::Viewfinder);
  if (!ok) showMessage("Focus failed", Colors::kYellow);
}

bool DeviceController::startRequest(CaptureResult& image, Origin origin, int sequence, const std::string& imagePath) {
  const PromptMode& prompt = prompts_.current();
  AnalysisJob job;
  job.image = std::move(image);
  job.promptText = prompt.instruction;
  job.quality = quality_.current();

  if (!runner_.start(job)) {
    setState(origin == Origin::Browse ? DeviceState::Browsing : DeviceState::Viewfinder);
    showMessage("Busy, try again", Colors::kYellow);
    return false;
  }

  request_ = PendingRequest();
  request_.active = true;
  request_.origin = origin;
  request_.sequence = sequence;
  request_.imagePath = imagePath;
  request_.promptLabel = prompt.label;
  request_.neverTruncate = prompt.neverTruncate;
  request_.startedMs = clock_.nowMs();
  Logger::info("Request: started (%s, image=%s)", prompt.label.c_str(),
               imagePath.empty() ? "unsaved" : imagePath.c_str());
  setState(DeviceState::Sending);
  return true;
}

void DeviceController::pollRequest() {
  AnalysisOutcome outcome;
  if (!runner_.poll(outcome)) return;
  if (!request_.active) {
    Logger::info("Request: dropping late outcome of a cancelled request");
    return;
  }
  request_.active = false;
  finishRequest(outcome);
}

void DeviceController::finishRequest(const AnalysisOutcome& outcome) {
  switch (outcome.kind) {
    case OutcomeKind::Success: {
      if (archivist_.available()) {
        std::string responsePath;
        if (!archivist_.saveResponse(outcome.text, request_.promptLabel, request_.sequence, request_.imagePath,
                                     responsePath)) {
          showMessage("Storage error, reply not saved", Colors::kYellow);
        }
      }
      showInViewer(request_.promptLabel, outcome.text, !request_.neverTruncate, request_.origin);
      break;
    }
    case OutcomeKind::Cancelled:
      showInViewer(request_.promptLabel, kCancelledNotice, false, request_.origin);
      break;
    case OutcomeKind::Failed: {
      Logger::warn("Request: failed (%s) %s", failureKindName(outcome.failure), outcome.message.c_str());
      std::string notice = "Analysis failed.\n";
      notice += outcome.message;
      showInViewer("Error", notice, false, request_.origin);
      break;
    }
  }
}

void DeviceController::cancelRequest() {
  if (!request_.active) return;
  Logger::info("Request: cancelled by user");
  runner_.cancel();
  request_.active = false;
  showInViewer(request_.promptLabel, kCancelledNotice, false, request_.origin);
}

void DeviceController::showInViewer(const std::string& title, const std::string& text, bool allowTruncation,
                                    Origin origin) {
  presenter_.load(text, allowTruncation);
  viewerTitle_ = title;
  viewerOrigin_ = origin;
  if (state_ == DeviceState::Screensaver) {
    resumeState_ = DeviceState::Viewing;
  } else {
    setState(DeviceState::Viewing);
  }
}

void DeviceController::closeViewer() {
  presenter_.clear();
  viewerTitle_.clear();
  if (viewerOrigin_ == Origin::Browse && archivist_.available()) {
    // Refresh: a response may have been saved meanwhile.
    const std::string selected = browseIndex_ < entries_.size() ? entries_[browseIndex_].imagePath : std::string();
    archivist_.listSaved(entries_);
    browseIndex_ = 0;
    for (size_t i = 0; i < entries_.size(); ++i) {
      if (entries_[i].imagePath == selected) browseIndex_ = i;
    }
    setState(DeviceState::Browsing);
    return;
  }
  setState(DeviceState::Viewfinder);
}

void DeviceController::openBrowse() {
  if (!archivist_.available()) {
    showMessage("No storage", Colors::kYellow);
    return;
  }
  if (!archivist_.listSaved(entries_)) {
    showMessage("Cannot read storage", Colors::kRed);
    return;
  }
  browseIndex_ = 0;
  Logger::info("Browse: %u saved image(s)", (unsigned)entries_.size());
  setState(DeviceState::Browsing);
}

void DeviceController::moveBrowse(int direction) {
  browseIndex_ = SelectionCycle::step(browseIndex_, entries_.size(), direction);
  dirty_ = true;
}

void DeviceController::resendSelected() {
  if (entries_.empty()) return;
  if (runner_.busy()) {
    showMessage("Busy, try again", Colors::kYellow);
    return;
  }
  const ArchiveRecord entry = entries_[browseIndex_];
  CaptureResult image;
  if (!archivist_.loadImage(entry.imagePath, image)) {
    showMessage("Cannot read image", Colors::kRed);
    return;
  }
  if (quality_.validate(image.size()) == SizeVerdict::Oversized) {
    image.release();
    showMessage("Image too large", Colors::kRed);
    return;
  }
  image.capturedAt = entry.modifiedTime;
  startRequest(image, Origin::Browse, entry.sequence, entry.imagePath);
}

void DeviceController::openSavedResponse() {
  if (entries_.empty()) return;
  const ArchiveRecord& entry = entries_[browseIndex_];
  std::string path = entry.responsePath;
  if (path.empty() && !archivist_.findResponse(entry.imagePath, path)) {
    showMessage("No saved reply", Colors::kYellow);
    return;
  }
  SavedResponse saved;
  if (!archivist_.readResponse(path, saved)) {
    showMessage("Cannot read reply", Colors::kRed);
    return;
  }
  const std::string title = saved.promptLabel.empty() ? std::string("Saved") : saved.promptLabel;
  showInViewer(title, saved.text, !promptNeverTruncates(saved.promptLabel), Origin::Browse);
}

void DeviceController::enterScreensaver() {
  Logger::info("Controller: idle, screensaver on");
  flushSelection(true);
  resumeState_ = state_;
  setState(DeviceState::Screensaver);
  display_.setPower(false);
}

void DeviceController::wake() {
  display_.setPower(true);
  setState(resumeState_);
  dirty_ = true;
}

void DeviceController::recover(const char* what) {
  Logger::error("Controller: %s in %s, returning to viewfinder", what, deviceStateName(state_));
  light_.setOn(false);
  if (request_.active) {
    runner_.cancel();
    request_.active = false;
  }
  presenter_.clear();
  entries_.clear();
  if (state_ == DeviceState::Screensaver) display_.setPower(true);
  lastInputMs_ = clock_.nowMs();
  setState(DeviceState::Viewfinder);
  showMessage("Something went wrong", Colors::kRed);
}

void DeviceController::setState(DeviceState next) {
  if (next == state_) return;
  Logger::info("State: %s -> %s", deviceStateName(state_), deviceStateName(next));
  state_ = next;
  dirty_ = true;
}

void DeviceController::showMessage(const std::string& text, uint16_t color) {
  message_ = text;
  messageColor_ = color;
  messageUntilMs_ = clock_.nowMs() + settings_.messageDurationMs;
  dirty_ = true;
}

void DeviceController::cyclePrompt(int direction) {
  prompts_.cycle(direction);
  Logger::info("Controller: prompt -> %s", prompts_.current().label.c_str());
  selectionDirty_ = true;
  selectionChangedMs_ = clock_.nowMs();
  dirty_ = true;
}

void DeviceController::cycleQuality(int direction) {
  quality_.cycle(direction);
  Logger::info("Controller: quality -> %s", quality_.current().label.c_str());
  selectionDirty_ = true;
  selectionChangedMs_ = clock_.nowMs();
  dirty_ = true;
}

void DeviceController::flushSelection(bool force) {
  if (!selectionDirty_) return;
  if (!force && clock_.nowMs() - selectionChangedMs_ < settings_.selectionSaveDelayMs) return;
  if (!selections_.save(prompts_.index(), quality_.index())) {
    Logger::warn("Controller: could not persist selection");
  }
  selectionDirty_ = false;
}

bool DeviceController::promptNeverTruncates(const std::string& label) const {
  for (size_t i = 0; i < settings_.prompts.size(); ++i) {
    if (settings_.prompts[i].label == label) return settings_.prompts[i].neverTruncate;
  }
  return false;
}

// ---- rendering ----

int DeviceController::rows() const {
  const int lh = display_.lineHeight() > 0 ? display_.lineHeight() : 1;
  return display_.height() / lh;
}

void DeviceController::drawLine(int row, const std::string& text, uint16_t color) {
  display_.drawText(2, row * display_.lineHeight(), text, color);
}

void DeviceController::render(uint32_t nowMs) {
  if (state_ == DeviceState::Screensaver) return;

  if (state_ == DeviceState::Viewfinder && settings_.previewIntervalMs > 0 &&
      nowMs - lastPreviewMs_ >= settings_.previewIntervalMs) {
    lastPreviewMs_ = nowMs;
    if (camera_.preview(previewFrame_)) {
      display_.blit(0, display_.lineHeight(), previewFrame_);
      drawStatusBar();
      drawMessage();
    }
  }
  if (state_ == DeviceState::Sending && (nowMs - request_.startedMs) / 1000 != lastSendingSecond_) {
    dirty_ = true;
  }
  if (!dirty_) return;
  dirty_ = false;

  display_.clear(Colors::kBlack);
  switch (state_) {
    case DeviceState::Viewfinder: drawViewfinder(); break;
    case DeviceState::Focusing: drawBusy("Focusing..."); break;
    case DeviceState::Capturing: drawBusy("Capturing..."); break;
    case DeviceState::Sending: drawSending(nowMs); break;
    case DeviceState::Viewing: drawViewing(); break;
    case DeviceState::Browsing: drawBrowsing(); break;
    case DeviceState::Screensaver: break;
  }
  drawMessage();
}

void DeviceController::drawStatusBar() {
  display_.fillRect(0, 0, display_.width(), display_.lineHeight(), Colors::kPanel);
  std::string bar = prompts_.current().label + " | " + quality_.current().label;
  if (!archivist_.available()) bar += " | NO SD";
  drawLine(0, bar, Colors::kCyan);
}

void DeviceController::drawViewfinder() {
  drawStatusBar();
  if (settings_.previewIntervalMs > 0 && previewFrame_.readable()) {
    display_.blit(0, display_.lineHeight(), previewFrame_);
    return;
  }
  drawLine(2, "Shutter: capture", Colors::kWhite);
  drawLine(3, "Hold: focus", Colors::kWhite);
  drawLine(4, "L/R: prompt  U/D: quality", Colors::kGray);
  drawLine(5, "Select: browse", Colors::kGray);
}

void DeviceController::drawBusy(const char* title) {
  drawStatusBar();
  drawLine(rows() / 2, title, Colors::kYellow);
}

void DeviceController::drawSending(uint32_t nowMs) {
  lastSendingSecond_ = (nowMs - request_.startedMs) / 1000;
  drawStatusBar();
  char elapsed[24];
  snprintf(elapsed, sizeof(elapsed), "%lus", (unsigned long)lastSendingSecond_);
  drawLine(2, "Sending...", Colors::kYellow);
  drawLine(3, request_.promptLabel, Colors::kWhite);
  drawLine(4, elapsed, Colors::kGray);
  drawLine(rows() - 2, "Select: cancel", Colors::kGray);
}

void DeviceController::drawViewing() {
  char header[64];
  snprintf(header, sizeof(header), "%s %u/%u", presenter_.verbosity() == Verbosity::Brief ? "BRIEF" : "FULL",
           (unsigned)(presenter_.pageIndex() + 1), (unsigned)presenter_.pageCount());
  display_.fillRect(0, 0, display_.width(), display_.lineHeight(), Colors::kPanel);
  drawLine(0, viewerTitle_ + "  " + header, Colors::kCyan);

  const std::vector<std::string> lines = presenter_.currentPage();
  for (size_t i = 0; i < lines.size(); ++i) drawLine(static_cast<int>(i) + 1, lines[i], Colors::kWhite);
}

void DeviceController::drawBrowsing() {
  char header[48];
  if (entries_.empty()) {
    snprintf(header, sizeof(header), "Saved 0/0");
  } else {
    snprintf(header, sizeof(header), "Saved %u/%u", (unsigned)(browseIndex_ + 1), (unsigned)entries_.size());
  }
  display_.fillRect(0, 0, display_.width(), display_.lineHeight(), Colors::kPanel);
  drawLine(0, std::string(header) + "  " + prompts_.current().label, Colors::kCyan);

  if (entries_.empty()) {
    drawLine(2, "No saved images", Colors::kGray);
    return;
  }
  // Keep the selection inside a window of visible rows.
  const int visible = rows() > 3 ? rows() - 2 : 1;
  size_t first = 0;
  if (browseIndex_ >= static_cast<size_t>(visible)) first = browseIndex_ - visible + 1;
  for (int r = 0; r < visible && first + r < entries_.size(); ++r) {
    const ArchiveRecord& rec = entries_[first + r];
    const size_t slash = rec.imagePath.find_last_of('/');
    std::string name = slash == std::string::npos ? rec.imagePath : rec.imagePath.substr(slash + 1);
    if (!rec.responsePath.empty()) name += " *";
    const bool selected = first + r == browseIndex_;
    drawLine(r + 1, (selected ? "> " : "  ") + name, selected ? Colors::kYellow : Colors::kWhite);
  }
  drawLine(rows() - 1, "OK: resend  Shutter: reply", Colors::kGray);
}

void DeviceController::drawMessage() {
  if (message_.empty()) return;
  const int lh = display_.lineHeight();
  const int y = display_.height() - lh;
  display_.fillRect(0, y, display_.width(), lh, Colors::kPanel);
  display_.drawText(2, y, message_, messageColor_);
}
