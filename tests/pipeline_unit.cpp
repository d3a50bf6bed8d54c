// Extractor lifecycle: failure states, cancellation, concurrent recognition
// and full runs over a generated clip.
#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "extraction_error.h"
#include "fake_engine.hpp"
#include "subtitle_extractor.h"
#include "subtitle_grouper.h"
#include "synthetic_clip.hpp"
#include "test_utils.hpp"

using test_utils::inProcessConfig;
using test_utils::isolatedConfig;
using test_utils::markedImage;

namespace {

bool check(bool cond, const std::string &msg) {
  if (!cond) {
    std::cerr << "[pipeline_unit] FAIL: " << msg << "\n";
  }
  return cond;
}

// marker 0: no text, 1: greeting, 2: farewell, 77: fatal engine error,
// 99: hangs.
EngineOutput subtitleScript(const cv::Mat &image) {
  int marker = image.at<cv::Vec3b>(0, 0)[0];
  if (marker == 99)
    std::this_thread::sleep_for(std::chrono::seconds(3));
  if (marker == 77)
    throw ExtractionError(ErrorKind::Decode, "corrupt tensor");

  std::vector<EngineLine> lines;
  if (marker == 0)
    return lines;
  EngineLine line;
  line.polygon = {cv::Point(20, 20), cv::Point(220, 20), cv::Point(220, 50),
                  cv::Point(20, 50)};
  line.text = marker == 1 ? "こんにちは" : "さようなら";
  line.score = 0.9f;
  lines.push_back(line);
  return lines;
}

VideoFrame frameAt(long long timestamp_ms, int marker) {
  VideoFrame f;
  f.timestamp_ms = timestamp_ms;
  f.frame_number = static_cast<int>(timestamp_ms * 30 / 1000);
  f.image = markedImage(marker);
  return f;
}

struct Harness {
  std::shared_ptr<FakeEngineStats> stats = std::make_shared<FakeEngineStats>();
  std::vector<ProgressEvent> events;
  std::mutex events_mutex;
  std::unique_ptr<SubtitleExtractor> extractor;

  explicit Harness(ExtractionConfig config = inProcessConfig()) {
    extractor = std::make_unique<SubtitleExtractor>(
        7, config, fakeFactory(subtitleScript, stats),
        [this](const ProgressEvent &event) {
          std::lock_guard<std::mutex> lock(events_mutex);
          events.push_back(event);
        });
  }
};

template <typename Fn> bool throwsKind(Fn fn, ErrorKind kind) {
  try {
    fn();
  } catch (const ExtractionError &e) {
    return e.kind() == kind;
  }
  return false;
}

bool test_missing_file() {
  Harness h;
  bool ok = check(h.extractor->state() == ExtractorState::Init, "starts in Init");
  ok &= check(throwsKind([&h]() { h.extractor->extract("/no/such/video.mp4"); },
                         ErrorKind::FileOpen),
              "missing file is FileOpen");
  ok &= check(h.extractor->state() == ExtractorState::Failed, "state Failed");
  ok &= check(std::string(h.extractor->stateName()) == "Failed", "state name");
  ok &= check(h.stats->constructed.load() == 0,
              "engine not built for an unreadable file");
  return ok;
}

bool test_bad_configuration() {
  ExtractionConfig config = inProcessConfig();
  config.roi_mode = "sideways";
  Harness h(config);
  bool ok =
      check(throwsKind([&h]() { h.extractor->extract("/no/such/video.mp4"); },
                       ErrorKind::Config),
            "unknown roi mode is a Config error even for a missing file");
  ok &= check(h.extractor->state() == ExtractorState::Failed, "state Failed");

  ExtractionConfig manual = inProcessConfig();
  manual.roi_mode = "manual";
  Harness m(manual);
  ok &= check(throwsKind([&m]() { m.extractor->extract("/no/such/video.mp4"); },
                         ErrorKind::Config),
              "manual mode without a rectangle");
  return ok;
}

bool test_cancel_before_start() {
  Harness h;
  h.extractor->cancel();
  h.extractor->cancel();
  bool ok = check(h.extractor->cancelRequested(), "cancel recorded");
  bool cancelled = false;
  try {
    h.extractor->extract("/no/such/video.mp4");
  } catch (const ExtractionCancelled &) {
    cancelled = true;
  }
  ok &= check(cancelled, "extract raises ExtractionCancelled");
  ok &= check(h.extractor->state() == ExtractorState::Cancelled,
              "state Cancelled");

  std::vector<VideoFrame> frames = {frameAt(0, 1), frameAt(333, 1)};
  cancelled = false;
  try {
    h.extractor->recognizeFrames(frames);
  } catch (const ExtractionCancelled &) {
    cancelled = true;
  }
  ok &= check(cancelled, "recognition stops after cancel");
  return ok;
}

bool test_recognize_frames() {
  ExtractionConfig config = inProcessConfig();
  config.max_workers = 3;
  Harness h(config);
  std::vector<VideoFrame> frames = {
      frameAt(1333, 2), frameAt(0, 1),    frameAt(666, 1), frameAt(333, 1),
      frameAt(1000, 2), frameAt(2000, 0), frameAt(2333, 77)};
  auto results = h.extractor->recognizeFrames(frames);
  bool ok = check(results.size() == 5, "frames without text dropped");
  for (size_t i = 1; i < results.size(); ++i) {
    ok &= check(results[i - 1].frame.timestamp_ms <=
                    results[i].frame.timestamp_ms,
                "results sorted by timestamp");
  }
  ok &= check(h.stats->calls.load() == 7, "every frame sent to the engine");

  DetectionInfo info = h.extractor->detectionInfo();
  ok &= check(info.frames_with_text == 5, "frames with text counted");
  ok &= check(info.frames_failed == 1, "fatal engine error counted");
  ok &= check(info.frames_timed_out == 0, "no timeouts");
  ok &= check(info.engine.name == "fake-engine" &&
                  info.engine.initializations == 1,
              "engine identity reported");

  SubtitleGrouper grouper(config);
  auto cues = grouper.group(results);
  ok &= check(cues.size() == 2, "two subtitles recovered");
  if (cues.size() == 2) {
    ok &= check(cues[0].text == "こんにちは" && cues[0].start_ms == 0,
                "first subtitle");
    ok &= check(cues[1].text == "さようなら" && cues[1].start_ms == 1000,
                "second subtitle");
  }

  int last = -1;
  bool monotonic = true;
  {
    std::lock_guard<std::mutex> lock(h.events_mutex);
    for (const auto &e : h.events) {
      monotonic = monotonic && e.percentage >= last;
      last = e.percentage;
    }
  }
  ok &= check(monotonic, "progress never decreases");
  ok &= check(h.extractor->recognizeFrames({}).empty(), "no frames");
  return ok;
}

bool test_isolated_timeout_counted() {
  ExtractionConfig config = isolatedConfig(1000);
  config.max_workers = 2;
  Harness h(config);
  std::vector<VideoFrame> frames = {frameAt(0, 1), frameAt(333, 99),
                                    frameAt(666, 1)};
  auto results = h.extractor->recognizeFrames(frames);
  bool ok = check(results.size() == 2, "timed out frame dropped");
  DetectionInfo info = h.extractor->detectionInfo();
  ok &= check(info.frames_timed_out == 1, "timeout counted");
  ok &= check(info.frames_failed == 0, "timeout is not a failure");
  ok &= check(info.engine.isolated, "isolation reported");
  ok &= check(info.engine.initializations >= 1, "engine initialized");
  return ok;
}

bool test_preview_failures() {
  Harness h;
  bool ok = check(
      throwsKind([&h]() { h.extractor->previewFrame("/no/such/video.mp4", 0, true); },
                 ErrorKind::FileOpen),
      "preview of a missing file is FileOpen");
  ok &= check(
      throwsKind([&h]() { h.extractor->previewFrame("/no/such/video.mp4", -5, false); },
                 ErrorKind::Config),
      "negative preview time is a Config error");
  ok &= check(h.stats->constructed.load() == 0, "preview never builds the engine");
  return ok;
}

// Flat gray frames: dark (no text) for frames 0-14, mid gray 15-44, bright
// 45-89. The engine reads the brightness of the cropped band.
EngineOutput brightnessScript(const cv::Mat &image) {
  double level = cv::mean(image)[0];
  std::vector<EngineLine> lines;
  if (level < 50.0)
    return lines;
  EngineLine line;
  line.polygon = {cv::Point(20, 20), cv::Point(220, 20), cv::Point(220, 50),
                  cv::Point(20, 50)};
  line.text = level < 150.0 ? "こんにちは" : "さようなら";
  line.score = 0.9f;
  lines.push_back(line);
  return lines;
}

bool writeTwoLineClip(const std::string &path) {
  return test_utils::writeSyntheticClip(path, 640, 360, 30, 90, [](int i) {
    int level = i < 15 ? 20 : (i < 45 ? 100 : 200);
    return test_utils::grayFrame(640, 360, level);
  });
}

ExtractionConfig clipConfig() {
  ExtractionConfig config = inProcessConfig();
  config.roi_mode = "fixed_bottom";
  config.sample_fps = 3.0;
  return config;
}

bool test_extract_clip() {
  const std::string path = test_utils::tempClipPath("pipeline_clip.avi");
  bool ok = check(writeTwoLineClip(path), "clip written");
  if (!ok)
    return ok;

  auto stats = std::make_shared<FakeEngineStats>();
  std::vector<ProgressEvent> events;
  SubtitleExtractor extractor(
      11, clipConfig(), fakeFactory(brightnessScript, stats),
      [&events](const ProgressEvent &event) { events.push_back(event); });

  const int descriptors_before = test_utils::openDescriptorCount();
  std::vector<SubtitleCue> cues;
  try {
    cues = extractor.extract(path);
  } catch (const std::exception &e) {
    ok &= check(false, std::string("extract threw: ") + e.what());
  }
  ok &= check(extractor.state() == ExtractorState::Done, "state Done");
  if (descriptors_before >= 0) {
    ok &= check(test_utils::openDescriptorCount() == descriptors_before,
                "video file released after the run");
  }

  ok &= check(cues.size() == 2, "two cues from the clip");
  const long long min_ms = clipConfig().minDurationMs();
  for (size_t i = 0; i < cues.size(); ++i) {
    ok &= check(cues[i].index == static_cast<int>(i + 1),
                "indices are 1..N");
    ok &= check(cues[i].start_ms < cues[i].end_ms, "start before end");
    ok &= check(cues[i].durationMs() >= min_ms, "minimum duration held");
    ok &= check(cues[i].bbox && cues[i].bbox->x == 20 &&
                    cues[i].bbox->y == 252 + 20,
                "box offset by the subtitle band origin");
  }
  if (cues.size() == 2) {
    ok &= check(cues[0].text == "こんにちは" && cues[0].start_ms == 666,
                "first line starts at the first mid gray sample");
    ok &= check(cues[1].text == "さようなら" && cues[1].start_ms == 1666,
                "second line starts at the first bright sample");
  }

  DetectionInfo info = extractor.detectionInfo();
  ok &= check(info.video.width == 640 && info.video.height == 360,
              "video metadata reported");
  ok &= check(info.roi.y == 252 && info.roi.height == 108 &&
                  info.roi.width == 640,
              "bottom band reported");
  ok &= check(info.frames_sampled == 9, "nine samples at 3 fps");
  ok &= check(info.frames_with_text == 7, "dark samples have no text");
  ok &= check(info.cues == 2, "cue count reported");
  ok &= check(stats->calls.load() == 9, "one engine call per sample");
  {
    std::lock_guard<std::mutex> lock(stats->mutex);
    ok &= check(stats->last_size == cv::Size(640, 108),
                "engine sees only the band");
  }
  ok &= check(!events.empty() && events.back().percentage == 100,
              "progress ends at 100");

  std::remove(path.c_str());
  return ok;
}

bool test_cancel_during_recognition() {
  const std::string path = test_utils::tempClipPath("pipeline_cancel.avi");
  bool ok = check(writeTwoLineClip(path), "clip written");
  if (!ok)
    return ok;

  auto stats = std::make_shared<FakeEngineStats>();
  SubtitleExtractor *running = nullptr;
  int recognition_reports = 0;
  ExtractionConfig config = clipConfig();
  config.max_workers = 1;
  SubtitleExtractor extractor(
      12, config, fakeFactory(brightnessScript, stats),
      [&running, &recognition_reports](const ProgressEvent &event) {
        if (running && event.phase == ExtractionPhase::Recognizing &&
            ++recognition_reports == 2) {
          running->cancel();
        }
      });
  running = &extractor;

  const int descriptors_before = test_utils::openDescriptorCount();
  bool cancelled = false;
  std::vector<SubtitleCue> cues;
  try {
    cues = extractor.extract(path);
  } catch (const ExtractionCancelled &) {
    cancelled = true;
  }
  ok &= check(cancelled, "cancel from the progress callback stops the run");
  ok &= check(cues.empty(), "no partial cues");
  ok &= check(extractor.state() == ExtractorState::Cancelled,
              "state Cancelled");
  ok &= check(recognition_reports == 2, "no reports after the cancel");
  if (descriptors_before >= 0) {
    ok &= check(test_utils::openDescriptorCount() == descriptors_before,
                "video file released after cancel");
  }

  std::remove(path.c_str());
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok &= test_missing_file();
  ok &= test_bad_configuration();
  ok &= test_cancel_before_start();
  ok &= test_recognize_frames();
  ok &= test_isolated_timeout_counted();
  ok &= test_preview_failures();
  ok &= test_extract_clip();
  ok &= test_cancel_during_recognition();
  return ok ? 0 : 1;
}
