#pragma once
#include "engine_handle.h"
#include "extraction_config.h"
#include "models.hpp"
#include "progress_tracker.h"
#include "qc_rules.h"
#include "roi_locator.h"
#include "text_recognizer.h"
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class FrameSampler;

enum class ExtractorState {
  Init,
  LocatingRoi,
  Sampling,
  Recognizing,
  Grouping,
  Done,
  Cancelled,
  Failed,
};

const char *extractorStateName(ExtractorState state);

// 字幕提取流程: 初始化 -> ROI 定位 -> 采样 -> 识别 -> 聚合.
// One instance runs one extraction at a time; cancel() may be called from any
// thread.
class SubtitleExtractor {
public:
  SubtitleExtractor(int task_id, const ExtractionConfig &config,
                    EngineFactory factory,
                    ProgressCallback progress = nullptr);

  // Ordered cues for video_path. Throws ExtractionError for fatal failures
  // and ExtractionCancelled after cancel(); no partial cues in either case.
  std::vector<SubtitleCue> extract(const std::string &video_path);

  void cancel();
  bool cancelRequested() const { return cancel_requested_.load(); }

  ExtractorState state() const { return state_.load(); }
  const char *stateName() const { return extractorStateName(state()); }

  DetectionInfo detectionInfo() const;
  std::vector<QcIssue> qcReport() const;

  // Recognition phase on already sampled frames: bounded pool, per-frame
  // failures counted as empty, result sorted by timestamp with empty frames
  // dropped.
  std::vector<FrameRecognitionResult>
  recognizeFrames(const std::vector<VideoFrame> &frames);

  // Frame shown at time_ms, cropped to the configured subtitle region when
  // crop_to_roi is set. Does not touch the recognition engine.
  VideoFrame previewFrame(const std::string &video_path, long long time_ms,
                          bool crop_to_roi);

  EngineHandle &engineHandle() { return *handle_; }

private:
  void setState(ExtractorState state);
  void checkCancelled(const char *where) const;

  void initialize(const std::string &video_path,
                  std::unique_ptr<FrameSampler> &sampler);
  RoiRegion locateRegion(FrameSampler &sampler, const RoiSpec &spec);
  std::vector<VideoFrame> sampleFrames(FrameSampler &sampler);
  std::vector<SubtitleCue>
  groupResults(const std::vector<FrameRecognitionResult> &results);

  int task_id_;
  ExtractionConfig config_;
  std::shared_ptr<EngineHandle> handle_;
  TextRecognizer recognizer_;
  ProgressTracker progress_;

  std::atomic<bool> cancel_requested_{false};
  std::atomic<ExtractorState> state_{ExtractorState::Init};

  mutable std::mutex info_mutex_;
  DetectionInfo info_;
  std::vector<QcIssue> qc_issues_;
};
