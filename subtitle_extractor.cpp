#include "subtitle_extractor.h"
#include "cue_postprocessor.h"
#include "extraction_error.h"
#include "frame_sampler.h"
#include "result_channel.hpp"
#include "subtitle_grouper.h"
#include "worker_pool.h"

#include <algorithm>
#include <iostream>
#include <sstream>

namespace {

// 识别任务的单帧结果
struct FrameOutcome {
  FrameRecognitionResult result;
  bool failed = false;
  bool timed_out = false;
  bool skipped = false;
};

// 任何退出路径都关闭采样器
class SamplerGuard {
public:
  explicit SamplerGuard(std::unique_ptr<FrameSampler> &sampler)
      : sampler_(sampler) {}
  ~SamplerGuard() {
    if (sampler_)
      sampler_->close();
  }

private:
  std::unique_ptr<FrameSampler> &sampler_;
};

RoiSpec roiSpecFromConfig(const ExtractionConfig &config) {
  switch (parseRoiMode(config.roi_mode)) {
  case RoiMode::FixedBottom:
    return RoiSpec::fixedBottom(config.bottom_ratio);
  case RoiMode::Manual:
    if (!config.roi_rect) {
      throw ExtractionError(ErrorKind::Config,
                            "roi_mode manual requires roi_rect");
    }
    return RoiSpec::manual(*config.roi_rect);
  case RoiMode::Auto:
    break;
  }
  return RoiSpec::automatic();
}

} // namespace

const char *extractorStateName(ExtractorState state) {
  switch (state) {
  case ExtractorState::Init:
    return "Init";
  case ExtractorState::LocatingRoi:
    return "LocatingRoi";
  case ExtractorState::Sampling:
    return "Sampling";
  case ExtractorState::Recognizing:
    return "Recognizing";
  case ExtractorState::Grouping:
    return "Grouping";
  case ExtractorState::Done:
    return "Done";
  case ExtractorState::Cancelled:
    return "Cancelled";
  case ExtractorState::Failed:
    return "Failed";
  }
  return "Unknown";
}

SubtitleExtractor::SubtitleExtractor(int task_id,
                                     const ExtractionConfig &config,
                                     EngineFactory factory,
                                     ProgressCallback progress)
    : task_id_(task_id), config_(config),
      handle_(std::make_shared<EngineHandle>(std::move(factory))),
      recognizer_(handle_, config), progress_(task_id, std::move(progress)) {}

void SubtitleExtractor::cancel() {
  if (!cancel_requested_.exchange(true)) {
    std::cout << "[INFO] Task " << task_id_ << " cancellation requested"
              << std::endl;
  }
}

void SubtitleExtractor::setState(ExtractorState state) { state_.store(state); }

void SubtitleExtractor::checkCancelled(const char *where) const {
  if (cancel_requested_.load()) {
    throw ExtractionCancelled(where);
  }
}

DetectionInfo SubtitleExtractor::detectionInfo() const {
  std::lock_guard<std::mutex> lock(info_mutex_);
  DetectionInfo info = info_;
  info.engine = handle_->identity();
  return info;
}

std::vector<QcIssue> SubtitleExtractor::qcReport() const {
  std::lock_guard<std::mutex> lock(info_mutex_);
  return qc_issues_;
}

std::vector<SubtitleCue>
SubtitleExtractor::extract(const std::string &video_path) {
  {
    std::lock_guard<std::mutex> lock(info_mutex_);
    info_ = DetectionInfo();
    info_.roi_mode = config_.roi_mode;
    qc_issues_.clear();
  }
  progress_.start();

  std::unique_ptr<FrameSampler> sampler;
  SamplerGuard guard(sampler);

  try {
    setState(ExtractorState::Init);
    checkCancelled("init");
    initialize(video_path, sampler);

    setState(ExtractorState::LocatingRoi);
    checkCancelled("roi detection");
    RoiRegion roi = locateRegion(*sampler, roiSpecFromConfig(config_));

    setState(ExtractorState::Sampling);
    checkCancelled("sampling");
    std::vector<VideoFrame> frames = sampleFrames(*sampler);
    sampler->close();

    setState(ExtractorState::Recognizing);
    checkCancelled("recognition");
    std::vector<FrameRecognitionResult> results = recognizeFrames(frames);
    frames.clear();

    // 识别框换算回整帧坐标
    for (auto &r : results) {
      for (auto &det : r.results) {
        det.bbox.x += roi.x;
        det.bbox.y += roi.y;
      }
    }

    setState(ExtractorState::Grouping);
    checkCancelled("grouping");
    std::vector<SubtitleCue> cues = groupResults(results);

    setState(ExtractorState::Done);
    progress_.report(ExtractionPhase::Done, 1.0,
                     "Extracted " + std::to_string(cues.size()) + " cues");
    return cues;
  } catch (const ExtractionCancelled &e) {
    setState(ExtractorState::Cancelled);
    std::cout << "[INFO] Task " << task_id_ << ": " << e.what() << std::endl;
    throw;
  } catch (const ExtractionError &e) {
    setState(ExtractorState::Failed);
    std::cerr << "[Error] Task " << task_id_ << " failed ("
              << errorKindName(e.kind()) << "): " << e.what() << std::endl;
    throw;
  } catch (const std::exception &e) {
    setState(ExtractorState::Failed);
    std::cerr << "[Error] Task " << task_id_ << " failed: " << e.what()
              << std::endl;
    throw;
  }
}

VideoFrame SubtitleExtractor::previewFrame(const std::string &video_path,
                                          long long time_ms,
                                          bool crop_to_roi) {
  if (time_ms < 0) {
    throw ExtractionError(ErrorKind::Config,
                          "Preview time must not be negative");
  }
  RoiSpec spec = roiSpecFromConfig(config_);
  FrameSampler sampler(video_path, config_.sample_fps);
  if (crop_to_roi) {
    locateRegion(sampler, spec);
  }
  VideoFrame frame = sampler.frameAt(time_ms);
  sampler.close();
  return frame;
}

void SubtitleExtractor::initialize(const std::string &video_path,
                                   std::unique_ptr<FrameSampler> &sampler) {
  progress_.report(ExtractionPhase::Init, 0.0, "Initializing");

  std::vector<std::string> problems = config_.validate();
  if (!problems.empty()) {
    std::ostringstream oss;
    oss << "Invalid configuration:";
    for (const auto &p : problems)
      oss << " " << p << ";";
    throw ExtractionError(ErrorKind::Config, oss.str());
  }
  parseRoiMode(config_.roi_mode);

  sampler = std::make_unique<FrameSampler>(video_path, config_.sample_fps);
  {
    std::lock_guard<std::mutex> lock(info_mutex_);
    info_.video = sampler->videoInfo();
  }
  progress_.report(ExtractionPhase::Init, 0.5, "Video opened");

  handle_->acquire();
  progress_.report(ExtractionPhase::Init, 1.0, "Recognition engine ready");
}

RoiRegion SubtitleExtractor::locateRegion(FrameSampler &sampler,
                                          const RoiSpec &spec) {
  progress_.report(ExtractionPhase::LocatingRoi, 0.0,
                   "Locating subtitle region");
  const VideoInfo &video = sampler.videoInfo();

  std::vector<VideoFrame> samples;
  if (spec.mode == RoiMode::Auto) {
    VideoFrame frame;
    while (static_cast<int>(samples.size()) < kRoiSampleFrames &&
           sampler.next(frame)) {
      checkCancelled("roi detection");
      samples.push_back(frame);
    }
  }

  RoiRegion roi = locateRoi(spec, video.width, video.height, samples);
  samples.clear();

  sampler.rewind();
  if (spec.mode == RoiMode::FixedBottom) {
    sampler.setBottomCrop(spec.bottom_ratio);
  } else {
    sampler.setCrop(roi.rect());
  }

  {
    std::lock_guard<std::mutex> lock(info_mutex_);
    info_.roi = roi;
  }
  std::cout << "[ROI] " << roiModeName(spec.mode) << " -> (" << roi.x << ","
            << roi.y << "," << roi.width << "," << roi.height
            << ") confidence " << roi.confidence << std::endl;
  progress_.report(ExtractionPhase::LocatingRoi, 1.0,
                   "Subtitle region located");
  return roi;
}

std::vector<VideoFrame> SubtitleExtractor::sampleFrames(FrameSampler &sampler) {
  const VideoInfo &video = sampler.videoInfo();
  const long long expected = std::max<long long>(
      1, video.frame_count / std::max(1, sampler.frameInterval()));

  std::vector<VideoFrame> frames;
  VideoFrame frame;
  while (true) {
    checkCancelled("sampling");
    bool got = false;
    try {
      got = sampler.next(frame);
    } catch (const cv::Exception &e) {
      std::cerr << "[Sampler] Frame skipped: " << e.what() << std::endl;
      continue;
    }
    if (!got)
      break;
    frames.push_back(frame);
    if (frames.size() % 10 == 0) {
      progress_.report(ExtractionPhase::Sampling,
                       static_cast<double>(frames.size()) / expected,
                       "Sampled " + std::to_string(frames.size()) + " frames");
    }
  }

  {
    std::lock_guard<std::mutex> lock(info_mutex_);
    info_.frames_sampled = static_cast<int>(frames.size());
  }
  std::cout << "[Sampler] " << frames.size() << " frames sampled (every "
            << sampler.frameInterval() << " native frames)" << std::endl;
  progress_.report(ExtractionPhase::Sampling, 1.0,
                   "Sampled " + std::to_string(frames.size()) + " frames");
  return frames;
}

std::vector<FrameRecognitionResult>
SubtitleExtractor::recognizeFrames(const std::vector<VideoFrame> &frames) {
  std::vector<FrameRecognitionResult> collected;
  if (frames.empty()) {
    progress_.report(ExtractionPhase::Recognizing, 1.0, "No frames to read");
    return collected;
  }

  const size_t total = frames.size();
  const size_t workers =
      std::min(static_cast<size_t>(std::max(1, config_.max_workers)), total);

  ResultChannel<FrameOutcome> channel;
  WorkerPool pool(workers);
  for (size_t i = 0; i < total; ++i) {
    pool.submit([this, &frames, &channel, i]() {
      FrameOutcome outcome;
      outcome.result.frame = frames[i];
      if (cancel_requested_.load()) {
        outcome.skipped = true;
        channel.push(std::move(outcome));
        return;
      }
      try {
        outcome.result.results = recognizer_.extract(frames[i].image);
      } catch (const ExtractionError &e) {
        if (e.kind() == ErrorKind::Timeout) {
          outcome.timed_out = true;
        } else {
          outcome.failed = true;
        }
        std::cerr << "[OCR] Frame " << frames[i].frame_number << " ("
                  << frames[i].timestamp_ms << "ms): " << e.what()
                  << std::endl;
      } catch (const std::exception &e) {
        outcome.failed = true;
        std::cerr << "[OCR] Frame " << frames[i].frame_number
                  << " failed: " << e.what() << std::endl;
      }
      channel.push(std::move(outcome));
    });
  }

  int with_text = 0;
  int failed = 0;
  int timed_out = 0;
  for (size_t done = 0; done < total; ++done) {
    FrameOutcome outcome;
    if (!channel.pop(outcome))
      break;

    if (outcome.timed_out)
      ++timed_out;
    else if (outcome.failed)
      ++failed;
    if (!outcome.result.results.empty()) {
      ++with_text;
      collected.push_back(std::move(outcome.result));
    }

    {
      std::lock_guard<std::mutex> lock(info_mutex_);
      info_.frames_with_text = with_text;
      info_.frames_failed = failed;
      info_.frames_timed_out = timed_out;
    }
    progress_.report(ExtractionPhase::Recognizing,
                     static_cast<double>(done + 1) / total,
                     "Recognized " + std::to_string(done + 1) + "/" +
                         std::to_string(total) + " frames");

    if (cancel_requested_.load()) {
      size_t dropped = pool.discardPending();
      pool.shutdown();
      std::cout << "[OCR] Recognition stopped, " << dropped
                << " queued frames discarded" << std::endl;
      throw ExtractionCancelled("recognition");
    }
  }
  pool.shutdown();
  channel.close();

  std::stable_sort(collected.begin(), collected.end(),
                   [](const FrameRecognitionResult &a,
                      const FrameRecognitionResult &b) {
                     return a.frame.timestamp_ms < b.frame.timestamp_ms;
                   });

  std::cout << "[OCR] " << with_text << "/" << total
            << " frames with text, " << failed << " failed, " << timed_out
            << " timed out" << std::endl;
  return collected;
}

std::vector<SubtitleCue> SubtitleExtractor::groupResults(
    const std::vector<FrameRecognitionResult> &results) {
  progress_.report(ExtractionPhase::Grouping, 0.0, "Grouping recognized text");

  SubtitleGrouper grouper(config_);
  std::vector<SubtitleCue> cues = grouper.group(results);
  progress_.report(ExtractionPhase::Grouping, 0.5,
                   "Grouped into " + std::to_string(cues.size()) + " cues");

  CuePostprocessor postprocessor(config_);
  cues = postprocessor.process(std::move(cues));

  std::vector<QcIssue> issues;
  if (config_.run_qc) {
    issues = runQcRules(cues, defaultQcRules());
    for (const auto &issue : issues) {
      std::cout << "[QC] " << qcSeverityName(issue.severity) << " cue "
                << issue.cue_position + 1 << " " << issue.type << ": "
                << issue.message << std::endl;
    }
  }

  {
    std::lock_guard<std::mutex> lock(info_mutex_);
    info_.cues = static_cast<int>(cues.size());
    qc_issues_ = std::move(issues);
  }
  progress_.report(ExtractionPhase::Grouping, 1.0,
                   std::to_string(cues.size()) + " cues after merge");
  return cues;
}
