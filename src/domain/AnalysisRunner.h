// AnalysisRunner.h
// Runs AnalysisClient::analyze() away from the UI loop. The UI side only
// starts jobs, polls for the outcome and raises cancellation; it never
// touches the job while the worker owns it.

#pragma once

#include <string>

#include "AnalysisOutcome.h"
#include "CaptureResult.h"
#include "Settings.h"

struct AnalysisJob {
  CaptureResult image;
  std::string promptText;
  QualityMode quality;
};

class AnalysisRunner {
 public:
  virtual ~AnalysisRunner() = default;

  // Hands `job` to the worker. Returns false (job untouched) while a
  // previous job is still running.
  virtual bool start(AnalysisJob& job) = 0;

  // Moves the finished outcome into `out` once; false while still running
  // or when idle.
  virtual bool poll(AnalysisOutcome& out) = 0;

  // Requests cancellation of the running job. Safe when idle.
  virtual void cancel() = 0;

  // True from start() until the worker has finished the job.
  virtual bool busy() const = 0;
};
