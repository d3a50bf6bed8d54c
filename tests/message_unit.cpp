// JSON payloads published to the message queue.
#include <iostream>
#include <string>

#include "message_proxy.h"
#include "test_utils.hpp"

using test_utils::cue;

namespace {

bool check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "[message_unit] FAIL: " << msg << "\n";
  }
  return cond;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

bool test_escape() {
  bool ok = check(MessageProxy::escapeJson("say \"hi\"\\") == "say \\\"hi\\\"\\\\",
                  "quotes and backslashes");
  ok &= check(MessageProxy::escapeJson("a\nb\tc") == "a\\nb\\tc", "line breaks");
  ok &= check(MessageProxy::escapeJson(std::string("x\x01y")) == "x\\u0001y",
              "control characters");
  ok &= check(MessageProxy::escapeJson("字幕") == "字幕", "UTF-8 passes through");
  return ok;
}

bool test_cue_message() {
  SubtitleCue c = cue(1000, 2200, "上の行\n下の行", 3);
  c.bbox = cv::Rect(10, 900, 500, 80);
  std::string json = MessageProxy::cueJson(12, c);
  bool ok = check(contains(json, "\"taskId\":\"12\""), "task id");
  ok &= check(contains(json, "\"type\":\"10\""), "cue type");
  ok &= check(contains(json, "\"index\":3"), "index");
  ok &= check(contains(json, "\"start_ms\":1000") &&
                  contains(json, "\"end_ms\":2200"),
              "timing");
  ok &= check(contains(json, "上の行\\n下の行"), "two line text escaped");
  ok &= check(contains(json, "\"bbox\":[10,900,500,80]"), "bbox");

  c.bbox.reset();
  ok &= check(!contains(MessageProxy::cueJson(12, c), "bbox"),
              "bbox omitted when unknown");
  return ok;
}

bool test_progress_and_failure() {
  ProgressEvent event;
  event.taskId = 5;
  event.phase = ExtractionPhase::Recognizing;
  event.percentage = 60;
  event.message = "Recognized 10/20 frames";
  std::string json = MessageProxy::progressJson(event);
  bool ok = check(contains(json, "\"type\":\"20\""), "progress type");
  ok &= check(contains(json, "\"phase\":\"recognizing\""), "phase name");
  ok &= check(contains(json, "\"percentage\":60"), "percentage");
  ok &= check(contains(json, "\"eta\":null"), "no ETA yet");

  event.eta_seconds = 12.5;
  ok &= check(contains(MessageProxy::progressJson(event), "\"eta\":12.5"),
              "ETA seconds");

  json = MessageProxy::failureJson(5, "FileOpen", "Could not open \"a.mp4\"");
  ok &= check(contains(json, "\"type\":\"40\""), "failure type");
  ok &= check(contains(json, "\"kind\":\"FileOpen\""), "error kind");
  ok &= check(contains(json, "open \\\"a.mp4\\\""), "message escaped");
  return ok;
}

bool test_summary() {
  DetectionInfo info;
  info.roi_mode = "auto";
  RoiRegion roi;
  roi.x = 0;
  roi.y = 756;
  roi.width = 1920;
  roi.height = 324;
  info.roi = roi;
  info.engine.name = "opencv-dnn-db-crnn";
  info.engine.initializations = 1;
  info.frames_sampled = 300;
  info.frames_with_text = 120;
  info.cues = 14;
  std::string json = MessageProxy::summaryJson(9, info);
  bool ok = check(contains(json, "\"event\":\"summary\""), "summary marker");
  ok &= check(contains(json, "\"cues\":14"), "cue count");
  ok &= check(contains(json, "\"roi\":[0,756,1920,324]"), "roi");
  ok &= check(contains(json, "\"frames_with_text\":120"), "counters");
  ok &= check(json.front() == '{' && json.back() == '}', "one JSON object");
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok &= test_escape();
  ok &= test_cue_message();
  ok &= test_progress_and_failure();
  ok &= test_summary();
  return ok ? 0 : 1;
}
