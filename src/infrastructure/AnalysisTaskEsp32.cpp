// AnalysisTaskEsp32.cpp

#include "AnalysisTaskEsp32.h"

#include <exception>
#include <utility>

#include "src/infrastructure/Logger.h"

bool AnalysisTaskEsp32::begin(uint32_t stackBytes, UBaseType_t priority, BaseType_t core) {
  // ESP-IDF's FreeRTOS takes the stack depth in bytes.
  const BaseType_t rc = xTaskCreatePinnedToCore(&AnalysisTaskEsp32::taskEntry, "analysis", stackBytes, this,
                                                priority, &task_, core);
  if (rc != pdPASS) {
    Logger::error("Worker: task create failed (%d)", static_cast<int>(rc));
    task_ = nullptr;
    return false;
  }
  Logger::info("Worker: started on core %d", static_cast<int>(core));
  return true;
}

bool AnalysisTaskEsp32::start(AnalysisJob& job) {
  if (!task_ || busy_.load()) return false;
  // An unread outcome of a cancelled job is dropped here.
  done_.store(false);
  outcome_ = AnalysisOutcome();
  job_ = std::move(job);
  client_.resetCancel();
  busy_.store(true);
  xTaskNotifyGive(task_);
  return true;
}

bool AnalysisTaskEsp32::poll(AnalysisOutcome& out) {
  if (!done_.exchange(false)) return false;
  out = std::move(outcome_);
  return true;
}

void AnalysisTaskEsp32::cancel() {
  if (busy_.load()) client_.cancel();
}

void AnalysisTaskEsp32::taskEntry(void* arg) { static_cast<AnalysisTaskEsp32*>(arg)->run(); }

void AnalysisTaskEsp32::run() {
  for (;;) {
    ulTaskNotifyTake(pdTRUE, portMAX_DELAY);
    if (!busy_.load()) continue;

    AnalysisOutcome outcome;
    try {
      outcome = client_.analyze(job_.image, job_.promptText, job_.quality);
    } catch (const std::exception& e) {
      Logger::error("Worker: %s", e.what());
      outcome = AnalysisOutcome::failed(FailureKind::Encoding, "Out of memory", 0, 0);
    }
    job_ = AnalysisJob();
    outcome_ = std::move(outcome);
    Logger::debug("Worker: stack high water %u bytes", (unsigned)uxTaskGetStackHighWaterMark(nullptr));
    done_.store(true);
    busy_.store(false);
  }
}
