#pragma once
#include "models.hpp"
#include <opencv2/opencv.hpp>
#include <string>
#include <vector>

enum class RoiMode { Auto, FixedBottom, Manual };

// ROI 策略: 模式 + 各模式自己的参数
struct RoiSpec {
  RoiMode mode = RoiMode::Auto;
  double bottom_ratio = 0.3;
  cv::Rect manual_rect;

  static RoiSpec automatic() { return RoiSpec{RoiMode::Auto, 0.3, {}}; }
  static RoiSpec fixedBottom(double ratio) {
    return RoiSpec{RoiMode::FixedBottom, ratio, {}};
  }
  static RoiSpec manual(const cv::Rect &rect) {
    return RoiSpec{RoiMode::Manual, 0.3, rect};
  }
};

// Number of frames inspected by the automatic strategy.
constexpr int kRoiSampleFrames = 10;

// Throws ExtractionError{Config} for an unknown name.
RoiMode parseRoiMode(const std::string &name);
const char *roiModeName(RoiMode mode);

RoiRegion locateRoi(const RoiSpec &spec, int frame_width, int frame_height,
                    const std::vector<VideoFrame> &sample_frames);

RoiRegion fixedBottomRoi(int frame_width, int frame_height, double ratio);

// Text-like candidate blobs in the lower half of one frame.
std::vector<RoiRegion> detectTextCandidates(const cv::Mat &image);

// Groups candidates by vertical position and returns the union box of the
// most populated group.
RoiRegion consistentRoi(const std::vector<RoiRegion> &candidates,
                        int frame_width, int frame_height);
