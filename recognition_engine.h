#pragma once
#include <opencv2/core.hpp>
#include <string>
#include <variant>
#include <vector>

// 引擎原始输出: 并行数组形式
struct ParallelArrays {
  std::vector<std::string> texts;
  std::vector<float> scores;
  std::vector<std::vector<cv::Point>> boxes;
};

// 引擎原始输出: [box, (text, score)] 列表形式
struct EngineLine {
  std::vector<cv::Point> polygon;
  std::string text;
  float score = 0.0f;
};

using EngineOutput = std::variant<ParallelArrays, std::vector<EngineLine>>;

// Native text-recognition engine. Implementations may throw on any input;
// the adapter in text_recognizer.h is responsible for containing that.
class RecognitionEngine {
public:
  virtual ~RecognitionEngine() = default;

  virtual std::string name() const = 0;

  // image is 3-channel BGR, 8-bit, contiguous.
  virtual EngineOutput recognize(const cv::Mat &image) = 0;
};
