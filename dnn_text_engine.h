#pragma once

#include "recognition_engine.h"
#include <opencv2/dnn.hpp>
#include <string>
#include <vector>

// OpenCV dnn 文本引擎: DB 检测 + CRNN(CTC) 识别, 模型路径来自环境变量
class DnnTextEngine : public RecognitionEngine {
public:
  // Throws ExtractionError{EngineInit} when a model or the vocabulary
  // cannot be loaded.
  DnnTextEngine();

  std::string name() const override;
  EngineOutput recognize(const cv::Mat &image) override;

private:
  void loadVocabularyFromEnv();
  void loadModelsFromEnv();

  cv::Mat fourPointsTransform(const cv::Mat &frame,
                              const std::vector<cv::Point> &quad) const;

  cv::dnn::TextDetectionModel_DB detector;
  cv::dnn::TextRecognitionModel recognizer;
  std::vector<std::string> vocabulary;
  cv::Size det_input_size = cv::Size(736, 736);
  cv::Size rec_input_size = cv::Size(100, 32);
  bool rec_rgb_ = false;
  bool use_cuda_ = false;
  std::string det_path_;
  std::string rec_path_;
};
