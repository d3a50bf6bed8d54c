// models.hpp
#pragma once
#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <vector>

// 采样得到的视频帧
struct VideoFrame {
  int frame_number = 0; // 原始视频中的帧序号 (非采样序号)
  long long timestamp_ms = 0;
  cv::Mat image; // BGR

  double timestampSec() const { return timestamp_ms / 1000.0; }
};

// 字幕区域 (ROI)
struct RoiRegion {
  int x = 0;
  int y = 0;
  int width = 0;
  int height = 0;
  float confidence = 1.0f;

  cv::Rect rect() const { return cv::Rect(x, y, width, height); }
  long long area() const {
    return static_cast<long long>(width) * static_cast<long long>(height);
  }
};

// 单个文本区域的识别结果
struct RecognitionResult {
  std::string text;
  float confidence = 0.0f;
  cv::Rect bbox; // x, y, w, h
};

// 帧级识别结果
struct FrameRecognitionResult {
  VideoFrame frame;
  std::vector<RecognitionResult> results;

  // Text of the highest-confidence detection, empty if none.
  std::string bestText() const {
    const RecognitionResult *best = nullptr;
    for (const auto &r : results) {
      if (!best || r.confidence > best->confidence) {
        best = &r;
      }
    }
    return best ? best->text : std::string();
  }

  float averageConfidence() const {
    if (results.empty())
      return 0.0f;
    float sum = 0.0f;
    for (const auto &r : results) {
      sum += r.confidence;
    }
    return sum / static_cast<float>(results.size());
  }
};

// 最终输出的字幕条目
struct SubtitleCue {
  int index = 0; // 1-based
  long long start_ms = 0;
  long long end_ms = 0;
  std::string text; // 最多两行, '\n' 分隔
  std::optional<cv::Rect> bbox;

  long long durationMs() const { return end_ms - start_ms; }
};

// 视频元数据
struct VideoInfo {
  double fps = 0.0;
  long long frame_count = 0;
  double duration_sec = 0.0;
  int width = 0;
  int height = 0;
};

// 推理引擎信息
struct EngineIdentity {
  std::string name;
  int initializations = 0;
  bool isolated = false;
};

// 一次提取任务的诊断信息
struct DetectionInfo {
  std::optional<RoiRegion> roi;
  std::string roi_mode;
  VideoInfo video;
  EngineIdentity engine;
  int frames_sampled = 0;
  int frames_with_text = 0;
  int frames_failed = 0;
  int frames_timed_out = 0;
  int cues = 0;
};

enum class ExtractionPhase {
  Init,
  LocatingRoi,
  Sampling,
  Recognizing,
  Grouping,
  Done,
};

// 进度信息
struct ProgressEvent {
  int taskId = 0;
  int type = 20;
  ExtractionPhase phase = ExtractionPhase::Init;
  int percentage = 0;
  std::string message;
  std::optional<double> eta_seconds;
};
