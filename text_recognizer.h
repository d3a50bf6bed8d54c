#pragma once

#include "engine_handle.h"
#include "extraction_config.h"
#include "models.hpp"
#include <functional>
#include <memory>
#include <opencv2/core.hpp>
#include <vector>

// Pull-based image source: fills image and returns true, or returns false
// when exhausted.
using ImageSource = std::function<bool(cv::Mat &)>;

// 文字识别适配器: 输入规整, 降采样, 分批, 隔离执行与结果解析
class TextRecognizer {
public:
  TextRecognizer(std::shared_ptr<EngineHandle> handle,
                 const ExtractionConfig &config);

  // Single image. Throws ExtractionError{Timeout} when an isolated call is
  // killed; every other per-image failure yields an empty result.
  std::vector<RecognitionResult> extract(const cv::Mat &image);

  // Sequence paths. A timeout only empties the affected image.
  std::vector<std::vector<RecognitionResult>>
  extract(const std::vector<cv::Mat> &images);
  std::vector<std::vector<RecognitionResult>> extract(const ImageSource &source);

  EngineHandle &handle() { return *handle_; }
  bool isolated() const { return isolate_; }
  const IsolatedCommand &workerCommand() const { return worker_; }

  // 8-bit contiguous BGR copy of image, or an empty Mat when the image cannot
  // be recognized (empty, smaller than 10 px, unsupported channel count).
  static cv::Mat normalizeImage(const cv::Mat &image);

  // Factor < 1 when the image exceeds max_pixels or max_side, else 1.
  static double downscaleFactor(const cv::Size &size, long long max_pixels,
                                int max_side);

  // Converts either raw engine shape. Boxes are divided by scale to map them
  // back to the caller's coordinates.
  static std::vector<RecognitionResult>
  parseOutput(const EngineOutput &output, double scale,
              float confidence_threshold);

private:
  std::vector<std::vector<RecognitionResult>>
  processBatch(const std::vector<const cv::Mat *> &batch,
               bool propagate_timeout);
  std::vector<RecognitionResult> recognizeOne(const cv::Mat &image);

  std::shared_ptr<EngineHandle> handle_;
  long long max_pixels_;
  int max_side_;
  size_t batch_size_;
  float confidence_threshold_;
  std::chrono::milliseconds timeout_;
  bool isolate_;
  IsolatedCommand worker_;
};
