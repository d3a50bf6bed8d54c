#include "roi_locator.h"
#include "extraction_error.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <opencv2/features2d.hpp>

namespace {

constexpr int kMinCandidateWidth = 50;
constexpr int kMinCandidateHeight = 15;
constexpr float kMaxCandidateWidthRatio = 0.8f;
constexpr float kMaxCandidateHeightRatio = 0.3f;
constexpr float kMinAspect = 2.0f;
constexpr float kMaxAspect = 20.0f;
constexpr float kLowerHalf = 0.5f;
constexpr float kClusterBand = 0.1f; // 同一行: 帧高的 10% 以内

bool isSubtitleLike(const cv::Rect &r, int frame_w, int frame_h) {
  if (r.width < kMinCandidateWidth || r.height < kMinCandidateHeight)
    return false;
  if (r.width > frame_w * kMaxCandidateWidthRatio)
    return false;
  if (r.height > frame_h * kMaxCandidateHeightRatio)
    return false;
  float aspect = static_cast<float>(r.width) / static_cast<float>(r.height);
  if (aspect < kMinAspect || aspect > kMaxAspect)
    return false;
  if (r.y < frame_h * kLowerHalf)
    return false;
  return true;
}

// Edge density plus contrast, capped at 1.
float textConfidence(const cv::Mat &gray_roi) {
  if (gray_roi.empty())
    return 0.0f;
  cv::Mat edges;
  cv::Canny(gray_roi, edges, 50, 150);
  double edge_density =
      static_cast<double>(cv::countNonZero(edges)) / edges.total();
  cv::Scalar mean, stddev;
  cv::meanStdDev(gray_roi, mean, stddev);
  double confidence = edge_density * 2.0 + stddev[0] / 255.0;
  return static_cast<float>(std::min(confidence, 1.0));
}

} // namespace

RoiMode parseRoiMode(const std::string &name) {
  if (name == "auto")
    return RoiMode::Auto;
  if (name == "fixed_bottom" || name == "bottom_30")
    return RoiMode::FixedBottom;
  if (name == "manual")
    return RoiMode::Manual;
  throw ExtractionError(ErrorKind::Config, "Unsupported ROI mode: " + name);
}

const char *roiModeName(RoiMode mode) {
  switch (mode) {
  case RoiMode::Auto:
    return "auto";
  case RoiMode::FixedBottom:
    return "fixed_bottom";
  case RoiMode::Manual:
    return "manual";
  }
  return "unknown";
}

RoiRegion fixedBottomRoi(int frame_width, int frame_height, double ratio) {
  RoiRegion roi;
  roi.height = static_cast<int>(frame_height * ratio);
  roi.y = frame_height - roi.height;
  roi.x = 0;
  roi.width = frame_width;
  roi.confidence = 1.0f;
  return roi;
}

std::vector<RoiRegion> detectTextCandidates(const cv::Mat &image) {
  std::vector<RoiRegion> candidates;
  if (image.empty())
    return candidates;

  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image;
  }

  cv::Ptr<cv::MSER> mser = cv::MSER::create();
  std::vector<std::vector<cv::Point>> regions;
  std::vector<cv::Rect> boxes;
  mser->detectRegions(gray, regions, boxes);

  for (const auto &box : boxes) {
    if (!isSubtitleLike(box, gray.cols, gray.rows))
      continue;
    cv::Rect clipped = box & cv::Rect(0, 0, gray.cols, gray.rows);
    RoiRegion candidate;
    candidate.x = clipped.x;
    candidate.y = clipped.y;
    candidate.width = clipped.width;
    candidate.height = clipped.height;
    candidate.confidence = textConfidence(gray(clipped));
    candidates.push_back(candidate);
  }
  return candidates;
}

RoiRegion consistentRoi(const std::vector<RoiRegion> &candidates,
                        int frame_width, int frame_height) {
  if (candidates.empty()) {
    return fixedBottomRoi(frame_width, frame_height, 0.3);
  }

  const float threshold = frame_height * kClusterBand;
  // 按 y 坐标分组, 以组内第一个候选的 y 为基准
  std::vector<std::pair<int, std::vector<RoiRegion>>> y_groups;
  for (const auto &region : candidates) {
    bool found = false;
    for (auto &group : y_groups) {
      if (std::abs(region.y - group.first) < threshold) {
        group.second.push_back(region);
        found = true;
        break;
      }
    }
    if (!found) {
      y_groups.push_back({region.y, {region}});
    }
  }

  const std::vector<RoiRegion> *best = &y_groups.front().second;
  for (const auto &group : y_groups) {
    if (group.second.size() > best->size()) {
      best = &group.second;
    }
  }

  int min_x = best->front().x;
  int min_y = best->front().y;
  int max_x = best->front().x + best->front().width;
  int max_y = best->front().y + best->front().height;
  float confidence_sum = 0.0f;
  for (const auto &r : *best) {
    min_x = std::min(min_x, r.x);
    min_y = std::min(min_y, r.y);
    max_x = std::max(max_x, r.x + r.width);
    max_y = std::max(max_y, r.y + r.height);
    confidence_sum += r.confidence;
  }

  RoiRegion roi;
  roi.x = min_x;
  roi.y = min_y;
  roi.width = max_x - min_x;
  roi.height = max_y - min_y;
  roi.confidence = confidence_sum / static_cast<float>(best->size());
  return roi;
}

RoiRegion locateRoi(const RoiSpec &spec, int frame_width, int frame_height,
                    const std::vector<VideoFrame> &sample_frames) {
  switch (spec.mode) {
  case RoiMode::FixedBottom:
    return fixedBottomRoi(frame_width, frame_height, spec.bottom_ratio);

  case RoiMode::Manual: {
    if (spec.manual_rect.width <= 0 || spec.manual_rect.height <= 0) {
      throw ExtractionError(ErrorKind::Config,
                            "Manual ROI rectangle must have a positive size");
    }
    cv::Rect clipped =
        spec.manual_rect & cv::Rect(0, 0, frame_width, frame_height);
    if (clipped.width <= 0 || clipped.height <= 0) {
      throw ExtractionError(ErrorKind::Config,
                            "Manual ROI rectangle lies outside the frame");
    }
    RoiRegion roi;
    roi.x = clipped.x;
    roi.y = clipped.y;
    roi.width = clipped.width;
    roi.height = clipped.height;
    roi.confidence = 1.0f;
    return roi;
  }

  case RoiMode::Auto: {
    std::vector<RoiRegion> candidates;
    for (const auto &frame : sample_frames) {
      auto regions = detectTextCandidates(frame.image);
      candidates.insert(candidates.end(), regions.begin(), regions.end());
    }
    if (candidates.empty()) {
      std::cout << "[ROI] No subtitle-like regions found, falling back to "
                   "bottom 30%"
                << std::endl;
      return fixedBottomRoi(frame_width, frame_height, 0.3);
    }
    return consistentRoi(candidates, frame_width, frame_height);
  }
  }
  throw ExtractionError(ErrorKind::Config, "Unsupported ROI mode");
}
