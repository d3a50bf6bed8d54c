// Builders shared by the unit suites.
#pragma once

#include <opencv2/core.hpp>
#include <string>
#include <vector>

#include "extraction_config.h"
#include "models.hpp"

namespace test_utils {

inline RecognitionResult detection(const std::string &text, float confidence,
                                   const cv::Rect &bbox = cv::Rect(0, 0, 100,
                                                                   30)) {
  RecognitionResult r;
  r.text = text;
  r.confidence = confidence;
  r.bbox = bbox;
  return r;
}

inline FrameRecognitionResult frameResult(long long timestamp_ms,
                                          const std::string &text,
                                          float confidence = 0.9f) {
  FrameRecognitionResult fr;
  fr.frame.timestamp_ms = timestamp_ms;
  fr.frame.frame_number = static_cast<int>(timestamp_ms / 33);
  if (!text.empty())
    fr.results.push_back(detection(text, confidence));
  return fr;
}

inline SubtitleCue cue(long long start_ms, long long end_ms,
                       const std::string &text, int index = 0) {
  SubtitleCue c;
  c.index = index;
  c.start_ms = start_ms;
  c.end_ms = end_ms;
  c.text = text;
  return c;
}

// Solid BGR image whose first channel carries a marker value read back by
// the fake engine.
inline cv::Mat markedImage(int marker, int width = 320, int height = 80) {
  return cv::Mat(height, width, CV_8UC3,
                 cv::Scalar(marker, marker, marker));
}

// Engine calls stay in this process whatever the platform default is.
inline ExtractionConfig inProcessConfig() {
  ExtractionConfig config;
  config.isolate_engine_calls = false;
  return config;
}

// Isolated calls go to the engine_worker test executable.
inline ExtractionConfig isolatedConfig(int timeout_ms) {
  ExtractionConfig config;
  config.isolate_engine_calls = true;
  config.engine_timeout_ms = timeout_ms;
  config.engine_worker = SUBEX_TEST_WORKER;
  return config;
}

inline bool sameCues(const std::vector<SubtitleCue> &a,
                     const std::vector<SubtitleCue> &b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (a[i].index != b[i].index || a[i].start_ms != b[i].start_ms ||
        a[i].end_ms != b[i].end_ms || a[i].text != b[i].text)
      return false;
  }
  return true;
}

} // namespace test_utils
