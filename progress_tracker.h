#pragma once
#include "models.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

using ProgressCallback = std::function<void(const ProgressEvent &)>;

const char *phaseName(ExtractionPhase phase);

// 按阶段权重把阶段内进度折算为整体百分比, 并估算剩余时间.
// Weights: init 5, ROI 10, sampling 15, recognition 60, grouping 10.
class ProgressTracker {
public:
  using Clock = std::chrono::steady_clock;

  ProgressTracker(int task_id, ProgressCallback callback);

  // Resets the start time used for ETA.
  void start();

  // fraction is progress within phase, clamped to [0, 1]. The reported
  // percentage never goes backwards.
  void report(ExtractionPhase phase, double fraction,
              const std::string &message);

  int percentage() const;

  static int phaseWeight(ExtractionPhase phase);
  static int phaseOffset(ExtractionPhase phase);
  static int overallPercentage(ExtractionPhase phase, double fraction);

  // elapsed / (pct / 100) - elapsed, only once pct > 5.
  static std::optional<double> estimateEta(double elapsed_sec, int pct);

private:
  int task_id_;
  ProgressCallback callback_;
  Clock::time_point started_;
  int last_percentage_ = 0;
  mutable std::mutex mutex_;
};
