// frame_sampler.h
#pragma once
#include "models.hpp"
#include <opencv2/opencv.hpp>
#include <optional>
#include <string>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libswscale/swscale.h>
}

// Sequential FFmpeg decoder that emits every N-th native frame, where
// N = round(native_fps / sample_fps). Single-threaded: the codec context is
// not shared across threads.
class FrameSampler {
public:
  FrameSampler(const std::string &video_file_name, double sample_fps);
  ~FrameSampler();

  FrameSampler(const FrameSampler &) = delete;
  FrameSampler &operator=(const FrameSampler &) = delete;

  // Pulls the next sampled frame. Returns false at end of stream, after a
  // mid-stream decode failure, or once the sampler is closed.
  bool next(VideoFrame &frame);

  // Re-opens the file and starts again from frame 0.
  void rewind();

  // Releases the FFmpeg resources. Safe to call more than once.
  void close();
  bool isOpen() const { return fmtCtx != nullptr; }

  void setBottomCrop(double ratio);
  void setCrop(const cv::Rect &rect);
  void clearCrop();

  // Decodes the frame shown at time_ms with the current crop applied.
  // Leaves the sampler rewound.
  VideoFrame frameAt(long long time_ms);

  const VideoInfo &videoInfo() const { return info_; }
  int frameInterval() const { return interval_; }
  double sampleFps() const { return sample_fps_; }

  static int computeInterval(double native_fps, double sample_fps);
  static long long timestampForFrame(long long frame_number,
                                     double native_fps);

private:
  void open();
  bool decodeNextFrame();
  cv::Mat convertToBgr(const AVFrame *frame);
  cv::Mat applyCrop(const cv::Mat &image) const;

  std::string video_file_name_;
  double sample_fps_;
  int interval_ = 1;
  VideoInfo info_;

  AVFormatContext *fmtCtx = nullptr;
  AVCodecContext *codecCtx = nullptr;
  AVPacket *packet = nullptr;
  AVFrame *frame = nullptr;
  SwsContext *swsCtx = nullptr;
  int video_stream_index = -1;
  long long native_index_ = -1; // 最近一次解码出的原始帧序号
  bool flushing_ = false;
  bool finished_ = false;

  std::optional<double> bottom_ratio_;
  std::optional<cv::Rect> crop_rect_;
};
