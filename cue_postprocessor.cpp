#include "cue_postprocessor.h"
#include "text_similarity.h"
#include "text_utils.h"
#include <algorithm>

namespace {

void sortByStart(std::vector<SubtitleCue> &cues) {
  std::stable_sort(cues.begin(), cues.end(),
                   [](const SubtitleCue &a, const SubtitleCue &b) {
                     return a.start_ms < b.start_ms;
                   });
}

void renumber(std::vector<SubtitleCue> &cues) {
  for (size_t i = 0; i < cues.size(); ++i)
    cues[i].index = static_cast<int>(i) + 1;
}

} // namespace

CuePostprocessor::CuePostprocessor(long long dedup_window_ms,
                                   long long min_duration_ms)
    : dedup_window_ms_(dedup_window_ms), min_duration_ms_(min_duration_ms) {}

CuePostprocessor::CuePostprocessor(const ExtractionConfig &config)
    : CuePostprocessor(config.dedup_window_ms, config.minDurationMs()) {}

std::vector<SubtitleCue>
CuePostprocessor::process(std::vector<SubtitleCue> cues) const {
  sortByStart(cues);

  // 合并可能产生新的可合并对, 重复直到条目数不再减少
  while (true) {
    const size_t before = cues.size();
    cues = mergeWindowDuplicates(cues);
    enforceMinDuration(cues);
    cues = mergeOverlapping(cues);
    sortByStart(cues);
    if (cues.size() == before)
      break;
  }

  renumber(cues);
  return cues;
}

std::vector<SubtitleCue> CuePostprocessor::mergeWindowDuplicates(
    const std::vector<SubtitleCue> &sorted) const {
  std::vector<SubtitleCue> out;
  out.reserve(sorted.size());
  std::vector<bool> consumed(sorted.size(), false);

  for (size_t i = 0; i < sorted.size(); ++i) {
    if (consumed[i])
      continue;
    consumed[i] = true;
    std::vector<size_t> members{i};

    for (size_t j = i + 1; j < sorted.size(); ++j) {
      if (consumed[j])
        continue;
      if (sorted[j].start_ms - sorted[i].end_ms > dedup_window_ms_)
        break;

      bool similar = false;
      for (size_t m : members) {
        if (TextSimilarity::similarity(sorted[m].text, sorted[j].text) >
            kDuplicateSimilarity) {
          similar = true;
          break;
        }
      }
      if (similar) {
        members.push_back(j);
        consumed[j] = true;
      }
    }

    SubtitleCue merged = sorted[i];
    for (size_t m : members) {
      merged.start_ms = std::min(merged.start_ms, sorted[m].start_ms);
      merged.end_ms = std::max(merged.end_ms, sorted[m].end_ms);
    }
    out.push_back(std::move(merged));
  }
  return out;
}

std::vector<SubtitleCue>
CuePostprocessor::mergeOverlapping(const std::vector<SubtitleCue> &sorted) const {
  std::vector<SubtitleCue> accepted;
  for (const auto &cue : sorted) {
    bool merged = false;
    for (auto &existing : accepted) {
      bool overlap =
          cue.start_ms < existing.end_ms && cue.end_ms > existing.start_ms;
      if (!overlap)
        continue;
      if (TextSimilarity::similarity(cue.text, existing.text) <=
          kOverlapSimilarity)
        continue;

      existing.start_ms = std::min(existing.start_ms, cue.start_ms);
      existing.end_ms = std::max(existing.end_ms, cue.end_ms);
      if (utf8Length(cue.text) > utf8Length(existing.text))
        existing.text = cue.text;
      merged = true;
      break;
    }
    if (!merged)
      accepted.push_back(cue);
  }
  return accepted;
}

void CuePostprocessor::enforceMinDuration(std::vector<SubtitleCue> &cues) const {
  for (auto &cue : cues) {
    if (cue.durationMs() < min_duration_ms_)
      cue.end_ms = cue.start_ms + min_duration_ms_;
  }
}
