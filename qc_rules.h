#pragma once
#include "models.hpp"
#include <memory>
#include <string>
#include <vector>

enum class QcSeverity { Error, Warning, Info };

const char *qcSeverityName(QcSeverity severity);

struct QcIssue {
  int cue_position = 0; // 0-based position in the checked list
  std::string type;
  std::string message;
  QcSeverity severity = QcSeverity::Warning;
};

// 字幕质量检查规则
class QcRule {
public:
  QcRule(std::string name, bool enabled) : name_(std::move(name)), enabled_(enabled) {}
  virtual ~QcRule() = default;

  const std::string &name() const { return name_; }
  bool enabled() const { return enabled_; }
  void setEnabled(bool enabled) { enabled_ = enabled; }

  virtual std::vector<QcIssue>
  check(const std::vector<SubtitleCue> &cues) const = 0;

private:
  std::string name_;
  bool enabled_;
};

class LineLengthRule : public QcRule {
public:
  explicit LineLengthRule(size_t max_chars = 42);
  std::vector<QcIssue> check(const std::vector<SubtitleCue> &cues) const override;

private:
  size_t max_chars_;
};

class MaxLinesRule : public QcRule {
public:
  explicit MaxLinesRule(size_t max_lines = 2);
  std::vector<QcIssue> check(const std::vector<SubtitleCue> &cues) const override;

private:
  size_t max_lines_;
};

class DurationRule : public QcRule {
public:
  DurationRule(long long min_duration_ms = 1200, long long max_duration_ms = 10000);
  std::vector<QcIssue> check(const std::vector<SubtitleCue> &cues) const override;

private:
  long long min_duration_ms_;
  long long max_duration_ms_;
};

class TimeOverlapRule : public QcRule {
public:
  TimeOverlapRule();
  std::vector<QcIssue> check(const std::vector<SubtitleCue> &cues) const override;
};

class TimeOrderRule : public QcRule {
public:
  TimeOrderRule();
  std::vector<QcIssue> check(const std::vector<SubtitleCue> &cues) const override;
};

class EmptyTextRule : public QcRule {
public:
  EmptyTextRule();
  std::vector<QcIssue> check(const std::vector<SubtitleCue> &cues) const override;
};

// Same text repeated within 5 s of the earlier cue's end.
class DuplicateTextRule : public QcRule {
public:
  DuplicateTextRule();
  std::vector<QcIssue> check(const std::vector<SubtitleCue> &cues) const override;
};

class ReadingSpeedRule : public QcRule {
public:
  explicit ReadingSpeedRule(double max_chars_per_second = 20.0);
  std::vector<QcIssue> check(const std::vector<SubtitleCue> &cues) const override;

private:
  double max_chars_per_second_;
};

std::vector<std::unique_ptr<QcRule>> defaultQcRules();

// Runs every enabled rule. A rule that throws is logged and skipped.
std::vector<QcIssue>
runQcRules(const std::vector<SubtitleCue> &cues,
           const std::vector<std::unique_ptr<QcRule>> &rules);
