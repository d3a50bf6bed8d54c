// Quality checks over finished cue lists.
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "qc_rules.h"
#include "test_utils.hpp"

using test_utils::cue;

namespace {

bool check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "[qc_unit] FAIL: " << msg << "\n";
  }
  return cond;
}

int countType(const std::vector<QcIssue> &issues, const std::string &type) {
  int n = 0;
  for (const auto &issue : issues) {
    if (issue.type == type)
      ++n;
  }
  return n;
}

class ThrowingRule : public QcRule {
public:
  ThrowingRule() : QcRule("throwing", true) {}
  std::vector<QcIssue> check(const std::vector<SubtitleCue> &) const override {
    throw std::runtime_error("rule exploded");
  }
};

bool test_clean_list() {
  std::vector<SubtitleCue> cues = {cue(0, 2000, "こんにちは"),
                                   cue(2500, 5000, "元気ですか\nはい")};
  auto issues = runQcRules(cues, defaultQcRules());
  return check(issues.empty(), "well formed cues raise no issues");
}

bool test_text_rules() {
  std::vector<SubtitleCue> cues = {
      cue(0, 4000, std::string(43, 'a')), cue(5000, 8000, "one\ntwo\nthree"),
      cue(9000, 11000, "  ")};
  auto issues = runQcRules(cues, defaultQcRules());
  bool ok = check(countType(issues, "line_too_long") == 1, "43 chars too long");
  ok &= check(countType(issues, "too_many_lines") == 1, "three lines");
  ok &= check(countType(issues, "empty_text") == 1, "blank text");

  auto lines = LineLengthRule(42).check({cue(0, 4000, std::string(42, 'b'))});
  ok &= check(lines.empty(), "exactly 42 chars is fine");
  auto wide = LineLengthRule(5).check({cue(0, 4000, "日本語の字幕")});
  ok &= check(wide.size() == 1, "length counts code points");
  return ok;
}

bool test_timing_rules() {
  std::vector<SubtitleCue> cues = {cue(0, 800, "short"),
                                   cue(700, 12000, "long and overlapping"),
                                   cue(13000, 13000, "zero")};
  auto issues = runQcRules(cues, defaultQcRules());
  bool ok = check(countType(issues, "duration_too_short") == 2,
                  "short and zero length cues");
  ok &= check(countType(issues, "duration_too_long") == 1, "11.3s cue");
  ok &= check(countType(issues, "time_overlap") == 1, "one overlapping pair");
  ok &= check(countType(issues, "invalid_time_order") == 1, "start >= end");
  for (const auto &issue : issues) {
    if (issue.type == "time_overlap" || issue.type == "invalid_time_order")
      ok &= check(issue.severity == QcSeverity::Error, "timing errors");
    if (issue.type == "duration_too_long")
      ok &= check(issue.severity == QcSeverity::Info, "long cue is info");
  }
  return ok;
}

bool test_duplicate_and_speed() {
  std::vector<SubtitleCue> cues = {cue(0, 2000, "Hello"), cue(3000, 5000, "hello "),
                                   cue(60000, 62000, "Hello")};
  auto issues = DuplicateTextRule().check(cues);
  bool ok = check(issues.size() == 1 && issues[0].cue_position == 1,
                  "repeat within 5s is flagged once");

  auto fast = ReadingSpeedRule(20.0).check(
      {cue(0, 1000, std::string(25, 'x')), cue(2000, 4000, "ten chars!")});
  ok &= check(fast.size() == 1 && fast[0].cue_position == 0,
              "25 chars in 1s is too fast");
  return ok;
}

bool test_disabled_and_throwing_rules() {
  std::vector<std::unique_ptr<QcRule>> rules;
  rules.push_back(std::make_unique<EmptyTextRule>());
  rules.push_back(std::make_unique<ThrowingRule>());
  rules.front()->setEnabled(false);
  auto issues = runQcRules({cue(0, 2000, "")}, rules);
  bool ok = check(issues.empty(), "disabled rule skipped, throwing rule logged");
  ok &= check(std::string(qcSeverityName(QcSeverity::Warning)) == "warning",
              "severity names");
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok &= test_clean_list();
  ok &= test_text_rules();
  ok &= test_timing_rules();
  ok &= test_duplicate_and_speed();
  ok &= test_disabled_and_throwing_rules();
  return ok ? 0 : 1;
}
