#include "recognition_codec.h"
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <opencv2/core.hpp>

namespace {

template <typename T> void put(std::string &out, T value) {
  char raw[sizeof(T)];
  std::memcpy(raw, &value, sizeof(T));
  out.append(raw, sizeof(T));
}

template <typename T> T take(const std::string &in, size_t &pos) {
  if (pos + sizeof(T) > in.size()) {
    throw std::runtime_error("recognition payload truncated at offset " +
                             std::to_string(pos));
  }
  T value;
  std::memcpy(&value, in.data() + pos, sizeof(T));
  pos += sizeof(T);
  return value;
}

} // namespace

std::string
encodeRecognitionResults(const std::vector<RecognitionResult> &results) {
  std::string out;
  put<uint32_t>(out, static_cast<uint32_t>(results.size()));
  for (const auto &r : results) {
    put<int32_t>(out, r.bbox.x);
    put<int32_t>(out, r.bbox.y);
    put<int32_t>(out, r.bbox.width);
    put<int32_t>(out, r.bbox.height);
    put<float>(out, r.confidence);
    put<uint32_t>(out, static_cast<uint32_t>(r.text.size()));
    out.append(r.text);
  }
  return out;
}

std::vector<RecognitionResult>
decodeRecognitionResults(const std::string &payload) {
  size_t pos = 0;
  uint32_t count = take<uint32_t>(payload, pos);
  std::vector<RecognitionResult> results;
  results.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    RecognitionResult r;
    r.bbox.x = take<int32_t>(payload, pos);
    r.bbox.y = take<int32_t>(payload, pos);
    r.bbox.width = take<int32_t>(payload, pos);
    r.bbox.height = take<int32_t>(payload, pos);
    r.confidence = take<float>(payload, pos);
    uint32_t length = take<uint32_t>(payload, pos);
    if (pos + length > payload.size()) {
      throw std::runtime_error("recognition payload text truncated");
    }
    r.text.assign(payload.data() + pos, length);
    pos += length;
    results.push_back(std::move(r));
  }
  if (pos != payload.size()) {
    throw std::runtime_error("recognition payload has trailing bytes");
  }
  return results;
}

std::string encodeRecognitionRequest(const RecognitionRequest &request) {
  const cv::Mat &image = request.image;
  if (image.empty() || !image.isContinuous()) {
    throw std::invalid_argument(
        "recognition request needs a non-empty contiguous image");
  }
  std::string out;
  const size_t bytes = image.total() * image.elemSize();
  out.reserve(3 * sizeof(uint32_t) + sizeof(double) + sizeof(float) + bytes);
  put<uint32_t>(out, static_cast<uint32_t>(image.rows));
  put<uint32_t>(out, static_cast<uint32_t>(image.cols));
  put<int32_t>(out, image.type());
  put<double>(out, request.scale);
  put<float>(out, request.confidence_threshold);
  out.append(reinterpret_cast<const char *>(image.data), bytes);
  return out;
}

RecognitionRequest decodeRecognitionRequest(const std::string &payload) {
  size_t pos = 0;
  uint32_t rows = take<uint32_t>(payload, pos);
  uint32_t cols = take<uint32_t>(payload, pos);
  int32_t type = take<int32_t>(payload, pos);
  RecognitionRequest request;
  request.scale = take<double>(payload, pos);
  request.confidence_threshold = take<float>(payload, pos);

  if (rows == 0 || cols == 0 || type != CV_8UC3) {
    throw std::runtime_error("recognition request has an unsupported image (" +
                             std::to_string(rows) + "x" +
                             std::to_string(cols) + ", type " +
                             std::to_string(type) + ")");
  }
  const size_t bytes = static_cast<size_t>(rows) * cols * 3;
  if (payload.size() - pos != bytes) {
    throw std::runtime_error("recognition request pixel data has " +
                             std::to_string(payload.size() - pos) +
                             " bytes, expected " + std::to_string(bytes));
  }
  request.image.create(static_cast<int>(rows), static_cast<int>(cols), type);
  std::memcpy(request.image.data, payload.data() + pos, bytes);
  return request;
}
