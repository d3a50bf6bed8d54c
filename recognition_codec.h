#pragma once
#include "models.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

// Wire format for results coming back from an isolated child process:
// u32 count, then per result: i32 x, y, w, h; f32 confidence; u32 length;
// text bytes. Host byte order (both ends run on the same machine).
std::string encodeRecognitionResults(const std::vector<RecognitionResult> &results);

// Throws std::runtime_error on a truncated or malformed payload.
std::vector<RecognitionResult> decodeRecognitionResults(const std::string &payload);

// One image handed to a recognition worker process: u32 rows, u32 cols,
// i32 cv type, f64 scale, f32 confidence threshold, then the pixel bytes.
struct RecognitionRequest {
  cv::Mat image; // 8-bit BGR, contiguous
  double scale = 1.0;
  float confidence_threshold = 0.0f;
};

// Throws std::invalid_argument for an empty or non-contiguous image.
std::string encodeRecognitionRequest(const RecognitionRequest &request);

// Throws std::runtime_error on a truncated or malformed payload.
RecognitionRequest decodeRecognitionRequest(const std::string &payload);
