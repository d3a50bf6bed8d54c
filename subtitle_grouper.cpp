#include "subtitle_grouper.h"
#include "text_similarity.h"
#include "text_utils.h"
#include <algorithm>
#include <cstdlib>

SubtitleGrouper::SubtitleGrouper(float similarity_threshold,
                                 long long min_duration_ms,
                                 long long max_gap_ms, int gap_factor)
    : similarity_threshold_(similarity_threshold),
      min_duration_ms_(min_duration_ms), max_gap_ms_(max_gap_ms),
      gap_factor_(gap_factor) {}

SubtitleGrouper::SubtitleGrouper(const ExtractionConfig &config)
    : SubtitleGrouper(config.similarity_threshold, config.minDurationMs(),
                      config.maxGapMs(), config.grouping_gap_factor) {}

std::vector<SubtitleCue> SubtitleGrouper::group(
    const std::vector<FrameRecognitionResult> &frame_results) const {
  std::vector<const FrameRecognitionResult *> valid;
  valid.reserve(frame_results.size());
  for (const auto &r : frame_results) {
    if (!isBlank(r.bestText()))
      valid.push_back(&r);
  }
  std::stable_sort(valid.begin(), valid.end(),
                   [](const FrameRecognitionResult *a,
                      const FrameRecognitionResult *b) {
                     return a->frame.timestamp_ms < b->frame.timestamp_ms;
                   });
  if (valid.empty())
    return {};

  std::vector<SubtitleCue> cues;
  for (const auto &g : groupSimilarFrames(valid)) {
    std::optional<SubtitleCue> cue = makeCue(g);
    if (cue)
      cues.push_back(std::move(*cue));
  }

  cues = mergeShortCues(std::move(cues));
  for (size_t i = 0; i < cues.size(); ++i) {
    cues[i].index = static_cast<int>(i) + 1;
  }
  return cues;
}

std::vector<std::vector<const FrameRecognitionResult *>>
SubtitleGrouper::groupSimilarFrames(
    const std::vector<const FrameRecognitionResult *> &frames) const {
  std::vector<std::vector<const FrameRecognitionResult *>> groups;
  std::vector<const FrameRecognitionResult *> current{frames.front()};
  const long long max_join_gap = max_gap_ms_ * gap_factor_;

  for (size_t i = 1; i < frames.size(); ++i) {
    const FrameRecognitionResult *cur = frames[i];
    const FrameRecognitionResult *prev = frames[i - 1];
    double sim = TextSimilarity::similarity(cur->bestText(), prev->bestText());
    long long gap = cur->frame.timestamp_ms - prev->frame.timestamp_ms;

    if (sim >= similarity_threshold_ && gap <= max_join_gap) {
      current.push_back(cur);
    } else {
      groups.push_back(std::move(current));
      current = {cur};
    }
  }
  groups.push_back(std::move(current));
  return groups;
}

std::optional<SubtitleCue> SubtitleGrouper::makeCue(
    const std::vector<const FrameRecognitionResult *> &group) const {
  if (group.empty())
    return std::nullopt;

  SubtitleCue cue;
  cue.start_ms = group.front()->frame.timestamp_ms;
  cue.end_ms = group.back()->frame.timestamp_ms;
  if (cue.end_ms - cue.start_ms < min_duration_ms_) {
    cue.end_ms = cue.start_ms + min_duration_ms_;
  }

  cue.text = selectText(group);
  if (isBlank(cue.text))
    return std::nullopt;

  cue.bbox = unionBox(*group.front());
  return cue;
}

std::string SubtitleGrouper::selectText(
    const std::vector<const FrameRecognitionResult *> &group) const {
  // 平均置信度最高的帧, 并列时取最早的一帧
  const FrameRecognitionResult *best = group.front();
  for (const auto *r : group) {
    if (r->averageConfidence() > best->averageConfidence())
      best = r;
  }

  std::string text = multilineText(*best);
  if (!isBlank(text))
    return cleanRecognizedText(text);

  const FrameRecognitionResult *fallback = nullptr;
  for (const auto *r : group) {
    if (isBlank(r->bestText()))
      continue;
    if (!fallback || r->averageConfidence() > fallback->averageConfidence())
      fallback = r;
  }
  return fallback ? cleanRecognizedText(fallback->bestText()) : std::string();
}

std::string SubtitleGrouper::multilineText(const FrameRecognitionResult &frame) {
  if (frame.results.size() <= 1)
    return frame.bestText();

  std::vector<const RecognitionResult *> sorted;
  for (const auto &r : frame.results)
    sorted.push_back(&r);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const RecognitionResult *a, const RecognitionResult *b) {
                     return a->bbox.y < b->bbox.y;
                   });

  // 按垂直中心聚类为行, 容差为字高的一半
  std::vector<std::vector<const RecognitionResult *>> lines;
  std::vector<const RecognitionResult *> current{sorted.front()};
  int current_center = sorted.front()->bbox.y + sorted.front()->bbox.height / 2;
  for (size_t i = 1; i < sorted.size(); ++i) {
    const RecognitionResult *r = sorted[i];
    int center = r->bbox.y + r->bbox.height / 2;
    double threshold = r->bbox.height * 0.5;
    if (std::abs(center - current_center) <= threshold) {
      current.push_back(r);
    } else {
      lines.push_back(std::move(current));
      current = {r};
      current_center = center;
    }
  }
  lines.push_back(std::move(current));

  if (lines.size() < 2)
    return frame.bestText();

  auto joinLine = [](std::vector<const RecognitionResult *> line) {
    std::stable_sort(line.begin(), line.end(),
                     [](const RecognitionResult *a, const RecognitionResult *b) {
                       return a->bbox.x < b->bbox.x;
                     });
    std::string joined;
    for (const auto *r : line) {
      if (!joined.empty())
        joined += " ";
      joined += r->text;
    }
    return trim(joined);
  };

  std::string first = joinLine(lines[0]);
  std::string second = joinLine(lines[1]);
  if (first.empty() || second.empty())
    return frame.bestText();
  return first + "\n" + second;
}

std::optional<cv::Rect>
SubtitleGrouper::unionBox(const FrameRecognitionResult &frame) {
  if (frame.results.empty())
    return std::nullopt;
  cv::Rect box = frame.results.front().bbox;
  for (const auto &r : frame.results)
    box |= r.bbox;
  return box;
}

std::vector<SubtitleCue>
SubtitleGrouper::mergeShortCues(std::vector<SubtitleCue> cues) const {
  std::vector<SubtitleCue> merged;
  size_t i = 0;
  while (i < cues.size()) {
    SubtitleCue current = cues[i];
    if (current.durationMs() < min_duration_ms_) {
      if (i + 1 < cues.size() &&
          cues[i + 1].start_ms - current.end_ms <= max_gap_ms_) {
        const SubtitleCue &next = cues[i + 1];
        current.end_ms = next.end_ms;
        current.text += " " + next.text;
        merged.push_back(std::move(current));
        i += 2;
        continue;
      }
      if (!merged.empty() &&
          current.start_ms - merged.back().end_ms <= max_gap_ms_) {
        SubtitleCue &prev = merged.back();
        prev.end_ms = current.end_ms;
        prev.text += " " + current.text;
        ++i;
        continue;
      }
      current.end_ms = current.start_ms + min_duration_ms_;
    }
    merged.push_back(std::move(current));
    ++i;
  }
  return merged;
}
