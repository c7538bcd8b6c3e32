// AnalysisTaskEsp32.h
// AnalysisRunner on a dedicated FreeRTOS task. The task sleeps on a task
// notification, runs one AnalysisClient::analyze() per job and publishes the
// outcome through an atomic flag that the UI loop polls. Cancellation goes
// straight to the client's atomic flag.

#pragma once

#include <Arduino.h>

#include <atomic>

#include "src/domain/AnalysisClient.h"
#include "src/domain/AnalysisRunner.h"

class AnalysisTaskEsp32 : public AnalysisRunner {
 public:
  explicit AnalysisTaskEsp32(AnalysisClient& client) : client_(client) {}

  // Creates the worker task. Returns false when FreeRTOS cannot allocate it.
  bool begin(uint32_t stackBytes, UBaseType_t priority, BaseType_t core);

  bool start(AnalysisJob& job) override;
  bool poll(AnalysisOutcome& out) override;
  void cancel() override;
  bool busy() const override { return busy_.load(); }

 private:
  AnalysisClient& client_;
  TaskHandle_t task_ = nullptr;

  // Owned by the worker between start() and done_; by the UI otherwise.
  AnalysisJob job_;
  AnalysisOutcome outcome_;

  std::atomic<bool> busy_{false};
  std::atomic<bool> done_{false};

  static void taskEntry(void* arg);
  void run();
};
