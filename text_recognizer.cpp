#include "text_recognizer.h"
#include "extraction_error.h"
#include "recognition_codec.h"
#include "recognition_worker.h"
#include "text_utils.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iterator>
#include <opencv2/imgproc.hpp>

namespace {

constexpr int kMinImageSide = 10;

RecognitionResult makeResult(const std::vector<cv::Point> &polygon,
                             const std::string &text, float score,
                             double scale) {
  RecognitionResult r;
  r.text = trim(text);
  r.confidence = std::max(0.0f, std::min(1.0f, score));
  if (!polygon.empty()) {
    cv::Rect box = cv::boundingRect(polygon);
    if (scale > 0.0 && scale != 1.0) {
      int x = static_cast<int>(std::floor(box.x / scale));
      int y = static_cast<int>(std::floor(box.y / scale));
      int x2 = static_cast<int>(std::ceil((box.x + box.width) / scale));
      int y2 = static_cast<int>(std::ceil((box.y + box.height) / scale));
      box = cv::Rect(x, y, x2 - x, y2 - y);
    }
    r.bbox = box;
  }
  return r;
}

} // namespace

TextRecognizer::TextRecognizer(std::shared_ptr<EngineHandle> handle,
                               const ExtractionConfig &config)
    : handle_(std::move(handle)), max_pixels_(config.max_pixels),
      max_side_(config.max_side),
      batch_size_(static_cast<size_t>(std::max(1, config.batch_size))),
      confidence_threshold_(config.confidence_threshold),
      timeout_(config.engine_timeout_ms),
      isolate_(config.isolate_engine_calls) {
  if (!handle_) {
    throw ExtractionError(ErrorKind::EngineInit,
                          "TextRecognizer requires an engine handle");
  }
  handle_->setIsolated(isolate_);

  worker_.program = config.engine_worker.empty() ? currentExecutablePath()
                                                 : config.engine_worker;
  worker_.args = {kRecognizeWorkerFlag};
  if (isolate_ && worker_.program.empty()) {
    throw ExtractionError(ErrorKind::Config,
                          "Engine isolation needs a worker executable");
  }
}

cv::Mat TextRecognizer::normalizeImage(const cv::Mat &image) {
  if (image.empty() || image.rows < kMinImageSide ||
      image.cols < kMinImageSide) {
    return cv::Mat();
  }

  cv::Mat eight_bit;
  if (image.depth() == CV_8U) {
    eight_bit = image;
  } else if (image.depth() == CV_16U) {
    image.convertTo(eight_bit, CV_8U, 1.0 / 257.0);
  } else if (image.depth() == CV_32F || image.depth() == CV_64F) {
    // 浮点图像视为 [0, 1]
    image.convertTo(eight_bit, CV_8U, 255.0);
  } else {
    image.convertTo(eight_bit, CV_8U);
  }

  cv::Mat bgr;
  switch (eight_bit.channels()) {
  case 1:
    cv::cvtColor(eight_bit, bgr, cv::COLOR_GRAY2BGR);
    break;
  case 3:
    bgr = eight_bit;
    break;
  case 4:
    cv::cvtColor(eight_bit, bgr, cv::COLOR_BGRA2BGR);
    break;
  default:
    return cv::Mat();
  }

  if (!bgr.isContinuous()) {
    bgr = bgr.clone();
  }
  return bgr;
}

double TextRecognizer::downscaleFactor(const cv::Size &size,
                                       long long max_pixels, int max_side) {
  const long long pixels =
      static_cast<long long>(size.width) * static_cast<long long>(size.height);
  const int longest = std::max(size.width, size.height);
  if (pixels <= 0)
    return 1.0;
  if (pixels <= max_pixels && longest <= max_side)
    return 1.0;

  double by_pixels = std::sqrt(static_cast<double>(max_pixels) / pixels);
  double by_side = static_cast<double>(max_side) / longest;
  return std::min(1.0, std::min(by_pixels, by_side));
}

std::vector<RecognitionResult>
TextRecognizer::parseOutput(const EngineOutput &output, double scale,
                            float confidence_threshold) {
  std::vector<RecognitionResult> results;

  if (const auto *arrays = std::get_if<ParallelArrays>(&output)) {
    size_t count = std::min({arrays->texts.size(), arrays->scores.size(),
                             arrays->boxes.size()});
    if (count != arrays->texts.size() || count != arrays->scores.size() ||
        count != arrays->boxes.size()) {
      std::cerr << "[OCR] Engine arrays differ in length (texts="
                << arrays->texts.size() << ", scores=" << arrays->scores.size()
                << ", boxes=" << arrays->boxes.size() << "), using " << count
                << std::endl;
    }
    for (size_t i = 0; i < count; ++i) {
      results.push_back(makeResult(arrays->boxes[i], arrays->texts[i],
                                   arrays->scores[i], scale));
    }
  } else {
    for (const auto &line : std::get<std::vector<EngineLine>>(output)) {
      results.push_back(makeResult(line.polygon, line.text, line.score, scale));
    }
  }

  results.erase(std::remove_if(results.begin(), results.end(),
                               [confidence_threshold](const RecognitionResult &r) {
                                 return r.text.empty() ||
                                        r.confidence < confidence_threshold;
                               }),
                results.end());
  return results;
}

std::vector<RecognitionResult>
TextRecognizer::recognizeOne(const cv::Mat &image) {
  cv::Mat prepared = normalizeImage(image);
  if (prepared.empty())
    return {};

  double scale = downscaleFactor(prepared.size(), max_pixels_, max_side_);
  if (scale < 1.0) {
    cv::Mat resized;
    cv::resize(prepared, resized, cv::Size(), scale, scale, cv::INTER_AREA);
    prepared = resized;
  }

  if (!isolate_) {
    return parseOutput(handle_->recognize(prepared), scale,
                       confidence_threshold_);
  }

  RecognitionRequest request;
  request.image = prepared;
  request.scale = scale;
  request.confidence_threshold = confidence_threshold_;
  IsolatedOutcome outcome = handle_->recognizeIsolated(
      worker_, encodeRecognitionRequest(request), timeout_);

  switch (outcome.status) {
  case IsolatedStatus::Completed:
    return decodeRecognitionResults(outcome.payload);
  case IsolatedStatus::TimedOut:
    throw ExtractionError(ErrorKind::Timeout,
                          "Recognition exceeded " +
                              std::to_string(timeout_.count()) + "ms");
  case IsolatedStatus::Crashed:
    std::cerr << "[OCR] Isolated recognition failed: " << outcome.detail
              << std::endl;
    return {};
  }
  return {};
}

std::vector<std::vector<RecognitionResult>>
TextRecognizer::processBatch(const std::vector<const cv::Mat *> &batch,
                             bool propagate_timeout) {
  std::vector<std::vector<RecognitionResult>> results;
  results.reserve(batch.size());
  for (const cv::Mat *image : batch) {
    try {
      results.push_back(recognizeOne(*image));
    } catch (const ExtractionError &e) {
      if (e.kind() != ErrorKind::Timeout)
        throw;
      if (propagate_timeout)
        throw;
      std::cerr << "[OCR] " << e.what() << ", image skipped" << std::endl;
      results.emplace_back();
    } catch (const cv::Exception &e) {
      std::cerr << "[OCR] OpenCV error on image: " << e.what() << std::endl;
      results.emplace_back();
    } catch (const std::exception &e) {
      std::cerr << "[OCR] Recognition failed on image: " << e.what()
                << std::endl;
      results.emplace_back();
    }
  }
  return results;
}

std::vector<RecognitionResult> TextRecognizer::extract(const cv::Mat &image) {
  std::vector<const cv::Mat *> batch{&image};
  return processBatch(batch, true).front();
}

std::vector<std::vector<RecognitionResult>>
TextRecognizer::extract(const std::vector<cv::Mat> &images) {
  std::vector<std::vector<RecognitionResult>> results;
  results.reserve(images.size());
  for (size_t begin = 0; begin < images.size(); begin += batch_size_) {
    size_t end = std::min(images.size(), begin + batch_size_);
    std::vector<const cv::Mat *> batch;
    for (size_t i = begin; i < end; ++i)
      batch.push_back(&images[i]);
    auto batch_results = processBatch(batch, false);
    std::move(batch_results.begin(), batch_results.end(),
              std::back_inserter(results));
  }
  return results;
}

std::vector<std::vector<RecognitionResult>>
TextRecognizer::extract(const ImageSource &source) {
  std::vector<std::vector<RecognitionResult>> results;
  std::vector<cv::Mat> pending;
  pending.reserve(batch_size_);
  bool exhausted = false;
  while (!exhausted) {
    pending.clear();
    cv::Mat image;
    while (pending.size() < batch_size_) {
      if (!source(image)) {
        exhausted = true;
        break;
      }
      pending.push_back(image);
      image = cv::Mat();
    }
    if (pending.empty())
      break;

    std::vector<const cv::Mat *> batch;
    for (const auto &m : pending)
      batch.push_back(&m);
    auto batch_results = processBatch(batch, false);
    std::move(batch_results.begin(), batch_results.end(),
              std::back_inserter(results));
  }
  return results;
}
