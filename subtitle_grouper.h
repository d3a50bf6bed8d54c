#pragma once
#include "extraction_config.h"
#include "models.hpp"
#include <optional>
#include <vector>

// 将逐帧识别结果聚合为字幕条目
class SubtitleGrouper {
public:
  SubtitleGrouper(float similarity_threshold, long long min_duration_ms,
                  long long max_gap_ms, int gap_factor = 3);
  explicit SubtitleGrouper(const ExtractionConfig &config);

  // Sorts by timestamp, drops frames without text, joins consecutive similar
  // frames and returns renumbered cues.
  std::vector<SubtitleCue>
  group(const std::vector<FrameRecognitionResult> &frame_results) const;

  // Up to two lines rebuilt from detection geometry, or the best single text.
  static std::string multilineText(const FrameRecognitionResult &frame);
  static std::optional<cv::Rect>
  unionBox(const FrameRecognitionResult &frame);

  std::vector<SubtitleCue> mergeShortCues(std::vector<SubtitleCue> cues) const;

private:
  std::vector<std::vector<const FrameRecognitionResult *>>
  groupSimilarFrames(
      const std::vector<const FrameRecognitionResult *> &frames) const;
  std::optional<SubtitleCue>
  makeCue(const std::vector<const FrameRecognitionResult *> &group) const;
  std::string
  selectText(const std::vector<const FrameRecognitionResult *> &group) const;

  float similarity_threshold_;
  long long min_duration_ms_;
  long long max_gap_ms_;
  int gap_factor_;
};
