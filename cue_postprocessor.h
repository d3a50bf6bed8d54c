#pragma once
#include "extraction_config.h"
#include "models.hpp"
#include <vector>

// 字幕后处理: 时间窗口内的重复合并, 重叠合并, 最短时长保证, 排序与重新编号.
// process() is idempotent: feeding its output back in returns it unchanged.
class CuePostprocessor {
public:
  CuePostprocessor(long long dedup_window_ms, long long min_duration_ms);
  explicit CuePostprocessor(const ExtractionConfig &config);

  std::vector<SubtitleCue> process(std::vector<SubtitleCue> cues) const;

  // Chain-merges cues more than 90% similar to any member of a group whose
  // first cue ended at most dedup_window_ms before the candidate starts.
  std::vector<SubtitleCue>
  mergeWindowDuplicates(const std::vector<SubtitleCue> &sorted) const;

  // Merges time-overlapping cues more than 80% similar, keeping the longer
  // text.
  std::vector<SubtitleCue>
  mergeOverlapping(const std::vector<SubtitleCue> &sorted) const;

  static constexpr double kDuplicateSimilarity = 0.90;
  static constexpr double kOverlapSimilarity = 0.80;

private:
  void enforceMinDuration(std::vector<SubtitleCue> &cues) const;

  long long dedup_window_ms_;
  long long min_duration_ms_;
};
