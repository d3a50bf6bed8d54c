#include "dnn_text_engine.h"
#include "extraction_error.h"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace cv::dnn;

namespace {

std::string requireEnv(const char *key) {
  const char *value = std::getenv(key);
  if (!value || !*value) {
    throw ExtractionError(ErrorKind::EngineInit, std::string(key) + " not set");
  }
  return value;
}

bool envFlag(const char *key) {
  const char *value = std::getenv(key);
  if (!value)
    return false;
  std::string v(value);
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

} // namespace

DnnTextEngine::DnnTextEngine() {
  loadVocabularyFromEnv();
  loadModelsFromEnv();
}

void DnnTextEngine::loadVocabularyFromEnv() {
  std::string vocab_path = requireEnv("SUBEX_REC_VOCAB");
  std::ifstream ifs(vocab_path);
  if (!ifs.is_open()) {
    throw ExtractionError(ErrorKind::EngineInit,
                          "Cannot open vocabulary file: " + vocab_path);
  }

  std::string line;
  while (std::getline(ifs, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    vocabulary.push_back(line);
  }
  if (vocabulary.empty()) {
    throw ExtractionError(ErrorKind::EngineInit,
                          "Vocabulary file is empty: " + vocab_path);
  }
}

void DnnTextEngine::loadModelsFromEnv() {
  det_path_ = requireEnv("SUBEX_DET_MODEL");
  rec_path_ = requireEnv("SUBEX_REC_MODEL");
  rec_rgb_ = envFlag("SUBEX_REC_RGB");

  try {
    detector = TextDetectionModel_DB(det_path_);
    detector.setBinaryThreshold(0.3f)
        .setPolygonThreshold(0.5f)
        .setUnclipRatio(2.0)
        .setMaxCandidates(200);
    detector.setInputParams(1.0 / 255.0, det_input_size,
                            Scalar(122.67891434, 116.66876762, 104.00698793));

    recognizer = TextRecognitionModel(rec_path_);
    recognizer.setDecodeType("CTC-greedy");
    recognizer.setVocabulary(vocabulary);
    recognizer.setInputParams(1.0 / 127.5, rec_input_size,
                              Scalar(127.5, 127.5, 127.5));
  } catch (const cv::Exception &e) {
    throw ExtractionError(ErrorKind::EngineInit,
                          std::string("Failed to load text models: ") +
                              e.what());
  }

  const char *backend = std::getenv("SUBEX_DNN_BACKEND");
  if (backend && std::string(backend) == "cuda") {
    try {
      detector.setPreferableBackend(DNN_BACKEND_CUDA);
      detector.setPreferableTarget(DNN_TARGET_CUDA);
      recognizer.setPreferableBackend(DNN_BACKEND_CUDA);
      recognizer.setPreferableTarget(DNN_TARGET_CUDA);
      use_cuda_ = true;
      std::cout << "[INFO] Using CUDA backend for text recognition."
                << std::endl;
    } catch (const cv::Exception &e) {
      std::cerr << "[WARN] CUDA backend unavailable, falling back to CPU: "
                << e.what() << std::endl;
    }
  }
  if (!use_cuda_) {
    detector.setPreferableBackend(DNN_BACKEND_OPENCV);
    detector.setPreferableTarget(DNN_TARGET_CPU);
    recognizer.setPreferableBackend(DNN_BACKEND_OPENCV);
    recognizer.setPreferableTarget(DNN_TARGET_CPU);
  }

  std::cout << "[INFO] Text models loaded: det=" << det_path_
            << " rec=" << rec_path_ << " vocab=" << vocabulary.size()
            << std::endl;
}

std::string DnnTextEngine::name() const {
  return use_cuda_ ? "opencv-dnn-db-crnn (cuda)" : "opencv-dnn-db-crnn";
}

// 将检测得到的四边形区域透视变换为识别模型的输入
cv::Mat DnnTextEngine::fourPointsTransform(
    const cv::Mat &frame, const std::vector<cv::Point> &quad) const {
  const Size output_size = rec_input_size;
  Point2f target[4] = {Point2f(0, output_size.height - 1),
                       Point2f(0, 0),
                       Point2f(output_size.width - 1, 0),
                       Point2f(output_size.width - 1, output_size.height - 1)};
  Point2f source[4];
  for (int i = 0; i < 4; ++i) {
    source[i] = Point2f(static_cast<float>(quad[i].x),
                        static_cast<float>(quad[i].y));
  }
  Mat transform = getPerspectiveTransform(source, target);
  Mat cropped;
  warpPerspective(frame, cropped, transform, output_size);
  return cropped;
}

EngineOutput DnnTextEngine::recognize(const cv::Mat &image) {
  std::vector<std::vector<Point>> quads;
  std::vector<float> confidences;
  detector.detect(image, quads, confidences);

  std::vector<EngineLine> lines;
  lines.reserve(quads.size());
  for (size_t i = 0; i < quads.size(); ++i) {
    if (quads[i].size() != 4)
      continue;

    Mat cropped = fourPointsTransform(image, quads[i]);
    if (!rec_rgb_) {
      cvtColor(cropped, cropped, COLOR_BGR2GRAY);
    }

    EngineLine line;
    line.polygon = quads[i];
    line.text = recognizer.recognize(cropped);
    // 识别模型不输出置信度, 使用检测得分
    line.score = i < confidences.size() ? confidences[i] : 0.0f;
    lines.push_back(std::move(line));
  }
  return lines;
}
