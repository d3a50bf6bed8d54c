#include "progress_tracker.h"
#include <algorithm>
#include <iostream>

namespace {

constexpr int kEtaFloorPercent = 5;

} // namespace

const char *phaseName(ExtractionPhase phase) {
  switch (phase) {
  case ExtractionPhase::Init:
    return "init";
  case ExtractionPhase::LocatingRoi:
    return "locating_roi";
  case ExtractionPhase::Sampling:
    return "sampling";
  case ExtractionPhase::Recognizing:
    return "recognizing";
  case ExtractionPhase::Grouping:
    return "grouping";
  case ExtractionPhase::Done:
    return "done";
  }
  return "unknown";
}

ProgressTracker::ProgressTracker(int task_id, ProgressCallback callback)
    : task_id_(task_id), callback_(std::move(callback)),
      started_(Clock::now()) {}

void ProgressTracker::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  started_ = Clock::now();
  last_percentage_ = 0;
}

int ProgressTracker::phaseWeight(ExtractionPhase phase) {
  switch (phase) {
  case ExtractionPhase::Init:
    return 5;
  case ExtractionPhase::LocatingRoi:
    return 10;
  case ExtractionPhase::Sampling:
    return 15;
  case ExtractionPhase::Recognizing:
    return 60;
  case ExtractionPhase::Grouping:
    return 10;
  case ExtractionPhase::Done:
    return 0;
  }
  return 0;
}

int ProgressTracker::phaseOffset(ExtractionPhase phase) {
  switch (phase) {
  case ExtractionPhase::Init:
    return 0;
  case ExtractionPhase::LocatingRoi:
    return 5;
  case ExtractionPhase::Sampling:
    return 15;
  case ExtractionPhase::Recognizing:
    return 30;
  case ExtractionPhase::Grouping:
    return 90;
  case ExtractionPhase::Done:
    return 100;
  }
  return 0;
}

int ProgressTracker::overallPercentage(ExtractionPhase phase,
                                       double fraction) {
  fraction = std::max(0.0, std::min(1.0, fraction));
  int pct = phaseOffset(phase) +
            static_cast<int>(phaseWeight(phase) * fraction);
  return std::min(100, pct);
}

std::optional<double> ProgressTracker::estimateEta(double elapsed_sec,
                                                   int pct) {
  if (pct <= kEtaFloorPercent || elapsed_sec <= 0.0)
    return std::nullopt;
  if (pct >= 100)
    return 0.0;
  return elapsed_sec / (pct / 100.0) - elapsed_sec;
}

void ProgressTracker::report(ExtractionPhase phase, double fraction,
                             const std::string &message) {
  ProgressEvent event;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_percentage_ =
        std::max(last_percentage_, overallPercentage(phase, fraction));
    double elapsed =
        std::chrono::duration<double>(Clock::now() - started_).count();
    event.taskId = task_id_;
    event.phase = phase;
    event.percentage = last_percentage_;
    event.message = message;
    event.eta_seconds = estimateEta(elapsed, last_percentage_);
  }

  if (!callback_)
    return;
  try {
    callback_(event);
  } catch (const std::exception &e) {
    std::cerr << "[WARN] Progress callback threw: " << e.what() << std::endl;
  }
}

int ProgressTracker::percentage() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_percentage_;
}
