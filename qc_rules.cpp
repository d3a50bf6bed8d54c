#include "qc_rules.h"
#include "text_utils.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <map>

namespace {

std::vector<std::string> splitLines(const std::string &text) {
  std::vector<std::string> lines;
  size_t start = 0;
  while (true) {
    size_t end = text.find('\n', start);
    if (end == std::string::npos) {
      lines.push_back(text.substr(start));
      break;
    }
    lines.push_back(text.substr(start, end - start));
    start = end + 1;
  }
  return lines;
}

std::string seconds(long long ms) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1fs", ms / 1000.0);
  return buf;
}

std::string lowerAscii(std::string text) {
  for (auto &c : text) {
    if (c >= 'A' && c <= 'Z')
      c = static_cast<char>(c - 'A' + 'a');
  }
  return text;
}

} // namespace

const char *qcSeverityName(QcSeverity severity) {
  switch (severity) {
  case QcSeverity::Error:
    return "error";
  case QcSeverity::Warning:
    return "warning";
  case QcSeverity::Info:
    return "info";
  }
  return "unknown";
}

LineLengthRule::LineLengthRule(size_t max_chars)
    : QcRule("line_length", true), max_chars_(max_chars) {}

std::vector<QcIssue>
LineLengthRule::check(const std::vector<SubtitleCue> &cues) const {
  std::vector<QcIssue> issues;
  for (size_t i = 0; i < cues.size(); ++i) {
    auto lines = splitLines(cues[i].text);
    for (size_t n = 0; n < lines.size(); ++n) {
      size_t length = utf8Length(lines[n]);
      if (length > max_chars_) {
        issues.push_back({static_cast<int>(i), "line_too_long",
                          "line " + std::to_string(n + 1) + ": " +
                              std::to_string(length) + " chars (limit " +
                              std::to_string(max_chars_) + ")",
                          QcSeverity::Warning});
      }
    }
  }
  return issues;
}

MaxLinesRule::MaxLinesRule(size_t max_lines)
    : QcRule("max_lines", true), max_lines_(max_lines) {}

std::vector<QcIssue>
MaxLinesRule::check(const std::vector<SubtitleCue> &cues) const {
  std::vector<QcIssue> issues;
  for (size_t i = 0; i < cues.size(); ++i) {
    size_t count = splitLines(cues[i].text).size();
    if (count > max_lines_) {
      issues.push_back({static_cast<int>(i), "too_many_lines",
                        std::to_string(count) + " lines (limit " +
                            std::to_string(max_lines_) + ")",
                        QcSeverity::Warning});
    }
  }
  return issues;
}

DurationRule::DurationRule(long long min_duration_ms, long long max_duration_ms)
    : QcRule("duration", true), min_duration_ms_(min_duration_ms),
      max_duration_ms_(max_duration_ms) {}

std::vector<QcIssue>
DurationRule::check(const std::vector<SubtitleCue> &cues) const {
  std::vector<QcIssue> issues;
  for (size_t i = 0; i < cues.size(); ++i) {
    long long duration = cues[i].durationMs();
    if (duration < min_duration_ms_) {
      issues.push_back({static_cast<int>(i), "duration_too_short",
                        "shown " + seconds(duration) + " (min " +
                            seconds(min_duration_ms_) + ")",
                        QcSeverity::Warning});
    } else if (duration > max_duration_ms_) {
      issues.push_back({static_cast<int>(i), "duration_too_long",
                        "shown " + seconds(duration) + " (max " +
                            seconds(max_duration_ms_) + ")",
                        QcSeverity::Info});
    }
  }
  return issues;
}

TimeOverlapRule::TimeOverlapRule() : QcRule("time_overlap", true) {}

std::vector<QcIssue>
TimeOverlapRule::check(const std::vector<SubtitleCue> &cues) const {
  std::vector<QcIssue> issues;
  for (size_t i = 0; i < cues.size(); ++i) {
    for (size_t j = i + 1; j < cues.size(); ++j) {
      const auto &a = cues[i];
      const auto &b = cues[j];
      if (a.start_ms < b.end_ms && a.end_ms > b.start_ms) {
        long long overlap = std::min(a.end_ms, b.end_ms) -
                            std::max(a.start_ms, b.start_ms);
        issues.push_back({static_cast<int>(i), "time_overlap",
                          "overlaps cue " + std::to_string(j + 1) + " by " +
                              seconds(overlap),
                          QcSeverity::Error});
      }
    }
  }
  return issues;
}

TimeOrderRule::TimeOrderRule() : QcRule("time_order", true) {}

std::vector<QcIssue>
TimeOrderRule::check(const std::vector<SubtitleCue> &cues) const {
  std::vector<QcIssue> issues;
  for (size_t i = 0; i < cues.size(); ++i) {
    if (cues[i].start_ms >= cues[i].end_ms) {
      issues.push_back({static_cast<int>(i), "invalid_time_order",
                        "start >= end", QcSeverity::Error});
    }
  }
  return issues;
}

EmptyTextRule::EmptyTextRule() : QcRule("empty_text", true) {}

std::vector<QcIssue>
EmptyTextRule::check(const std::vector<SubtitleCue> &cues) const {
  std::vector<QcIssue> issues;
  for (size_t i = 0; i < cues.size(); ++i) {
    if (isBlank(cues[i].text)) {
      issues.push_back({static_cast<int>(i), "empty_text", "text is empty",
                        QcSeverity::Error});
    }
  }
  return issues;
}

DuplicateTextRule::DuplicateTextRule() : QcRule("duplicate_text", true) {}

std::vector<QcIssue>
DuplicateTextRule::check(const std::vector<SubtitleCue> &cues) const {
  std::vector<QcIssue> issues;
  std::map<std::string, size_t> seen;
  for (size_t i = 0; i < cues.size(); ++i) {
    std::string key = lowerAscii(trim(cues[i].text));
    auto it = seen.find(key);
    if (it == seen.end()) {
      seen.emplace(key, i);
      continue;
    }
    const auto &prev = cues[it->second];
    if (std::llabs(cues[i].start_ms - prev.end_ms) < 5000) {
      issues.push_back({static_cast<int>(i), "duplicate_text",
                        "same text as cue " + std::to_string(it->second + 1),
                        QcSeverity::Warning});
    }
  }
  return issues;
}

ReadingSpeedRule::ReadingSpeedRule(double max_chars_per_second)
    : QcRule("reading_speed", true),
      max_chars_per_second_(max_chars_per_second) {}

std::vector<QcIssue>
ReadingSpeedRule::check(const std::vector<SubtitleCue> &cues) const {
  std::vector<QcIssue> issues;
  for (size_t i = 0; i < cues.size(); ++i) {
    double duration_sec = cues[i].durationMs() / 1000.0;
    if (duration_sec <= 0.0)
      continue;
    size_t chars = 0;
    for (char32_t c : utf8ToU32(cues[i].text)) {
      if (c != U'\n' && c != U' ')
        ++chars;
    }
    double speed = chars / duration_sec;
    if (speed > max_chars_per_second_) {
      char buf[96];
      std::snprintf(buf, sizeof(buf), "%.1f chars/s (max %.1f)", speed,
                    max_chars_per_second_);
      issues.push_back({static_cast<int>(i), "reading_speed_too_fast", buf,
                        QcSeverity::Warning});
    }
  }
  return issues;
}

std::vector<std::unique_ptr<QcRule>> defaultQcRules() {
  std::vector<std::unique_ptr<QcRule>> rules;
  rules.push_back(std::make_unique<LineLengthRule>(42));
  rules.push_back(std::make_unique<MaxLinesRule>(2));
  rules.push_back(std::make_unique<DurationRule>(1200, 10000));
  rules.push_back(std::make_unique<TimeOverlapRule>());
  rules.push_back(std::make_unique<TimeOrderRule>());
  rules.push_back(std::make_unique<EmptyTextRule>());
  rules.push_back(std::make_unique<DuplicateTextRule>());
  rules.push_back(std::make_unique<ReadingSpeedRule>(20.0));
  return rules;
}

std::vector<QcIssue>
runQcRules(const std::vector<SubtitleCue> &cues,
           const std::vector<std::unique_ptr<QcRule>> &rules) {
  std::vector<QcIssue> all;
  for (const auto &rule : rules) {
    if (!rule || !rule->enabled())
      continue;
    try {
      auto issues = rule->check(cues);
      all.insert(all.end(), issues.begin(), issues.end());
    } catch (const std::exception &e) {
      std::cerr << "[WARN] QC rule '" << rule->name() << "' failed: " << e.what()
                << std::endl;
    }
  }
  return all;
}
