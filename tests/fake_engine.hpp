// Scriptable stand-in for the dnn text engine.
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include <opencv2/imgproc.hpp>

#include "recognition_engine.h"

struct FakeEngineStats {
  std::atomic<int> calls{0};
  std::atomic<int> constructed{0};
  std::mutex mutex;
  cv::Size last_size;
  int last_type = -1;
};

using FakeScript = std::function<EngineOutput(const cv::Mat &)>;

class FakeEngine : public RecognitionEngine {
public:
  FakeEngine(FakeScript script, std::shared_ptr<FakeEngineStats> stats)
      : script_(std::move(script)), stats_(std::move(stats)) {
    stats_->constructed++;
  }

  std::string name() const override { return "fake-engine"; }

  EngineOutput recognize(const cv::Mat &image) override {
    stats_->calls++;
    {
      std::lock_guard<std::mutex> lock(stats_->mutex);
      stats_->last_size = image.size();
      stats_->last_type = image.type();
    }
    return script_(image);
  }

private:
  FakeScript script_;
  std::shared_ptr<FakeEngineStats> stats_;
};

inline std::function<std::unique_ptr<RecognitionEngine>()>
fakeFactory(FakeScript script, std::shared_ptr<FakeEngineStats> stats) {
  return [script, stats]() -> std::unique_ptr<RecognitionEngine> {
    return std::make_unique<FakeEngine>(script, stats);
  };
}

// One line whose text is "text-<marker>", marker taken from pixel (0, 0).
inline EngineOutput markerLine(const cv::Mat &image) {
  int marker = image.at<cv::Vec3b>(0, 0)[0];
  EngineLine line;
  line.polygon = {cv::Point(10, 10), cv::Point(110, 10), cv::Point(110, 40),
                  cv::Point(10, 40)};
  line.text = "text-" + std::to_string(marker);
  line.score = 0.95f;
  return std::vector<EngineLine>{line};
}

// Script run inside the worker process. Marker 99 hangs, 66 throws, 55 runs
// multi-threaded OpenCV work (a 4K resize) before answering "parallel-ok".
inline EngineOutput isolationScript(const cv::Mat &image) {
  int marker = image.at<cv::Vec3b>(0, 0)[0];
  if (marker == 99)
    std::this_thread::sleep_for(std::chrono::seconds(3));
  if (marker == 66)
    throw std::runtime_error("engine fault");
  if (marker == 55) {
    cv::Mat uhd(2160, 3840, CV_8UC3, cv::Scalar(55, 55, 55));
    cv::Mat half;
    cv::resize(uhd, half, cv::Size(), 0.5, 0.5, cv::INTER_AREA);
    cv::Mat gray;
    cv::cvtColor(half, gray, cv::COLOR_BGR2GRAY);
    EngineOutput output = markerLine(image);
    auto &lines = std::get<std::vector<EngineLine>>(output);
    lines[0].text = gray.at<unsigned char>(0, 0) == 55 ? "parallel-ok"
                                                        : "parallel-bad";
    return output;
  }
  return markerLine(image);
}
