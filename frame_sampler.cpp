// frame_sampler.cpp
#include "frame_sampler.h"
#include "extraction_error.h"
#include <algorithm>
#include <cmath>
#include <iostream>

extern "C" {
#include <libavutil/avutil.h>
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
#include <libavutil/mathematics.h>
}

namespace {

std::string avErrorString(int errnum) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(errnum, buf, sizeof(buf));
  return std::string(buf);
}

} // namespace

FrameSampler::FrameSampler(const std::string &video_file_name,
                           double sample_fps)
    : video_file_name_(video_file_name), sample_fps_(sample_fps) {
  if (!(sample_fps_ > 0.0)) {
    throw ExtractionError(ErrorKind::Config,
                          "sample_fps must be positive, got " +
                              std::to_string(sample_fps_));
  }
  open();
  std::cout << "[Sampler] " << video_file_name_ << ": " << info_.width << "x"
            << info_.height << " @ " << info_.fps << " fps, "
            << info_.frame_count << " frames, interval " << interval_
            << std::endl;
}

FrameSampler::~FrameSampler() { close(); }

int FrameSampler::computeInterval(double native_fps, double sample_fps) {
  if (!(native_fps > 0.0) || !(sample_fps > 0.0))
    return 1;
  int interval = static_cast<int>(std::lround(native_fps / sample_fps));
  return std::max(1, interval);
}

long long FrameSampler::timestampForFrame(long long frame_number,
                                          double native_fps) {
  if (!(native_fps > 0.0))
    return 0;
  return static_cast<long long>(
      std::floor(static_cast<double>(frame_number) * 1000.0 / native_fps));
}

void FrameSampler::open() {
  const char *video_file_path = video_file_name_.c_str();
  int ret = avformat_open_input(&fmtCtx, video_file_path, nullptr, nullptr);
  if (ret < 0) {
    fmtCtx = nullptr;
    throw ExtractionError(ErrorKind::FileOpen,
                          "Could not open video file: " + video_file_name_ +
                              " (" + avErrorString(ret) + ")");
  }

  if (avformat_find_stream_info(fmtCtx, nullptr) < 0) {
    close();
    throw ExtractionError(ErrorKind::FileOpen,
                          "Could not get stream info: " + video_file_name_);
  }

  video_stream_index =
      av_find_best_stream(fmtCtx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_index < 0) {
    close();
    throw ExtractionError(ErrorKind::FileOpen,
                          "No video stream found: " + video_file_name_);
  }

  AVStream *video_stream = fmtCtx->streams[video_stream_index];
  const AVCodec *codec = avcodec_find_decoder(video_stream->codecpar->codec_id);
  if (!codec) {
    close();
    throw ExtractionError(ErrorKind::FileOpen,
                          "No decoder for video stream: " + video_file_name_);
  }

  codecCtx = avcodec_alloc_context3(codec);
  if (!codecCtx ||
      avcodec_parameters_to_context(codecCtx, video_stream->codecpar) < 0 ||
      avcodec_open2(codecCtx, codec, nullptr) < 0) {
    close();
    throw ExtractionError(ErrorKind::FileOpen,
                          "Failed to open decoder: " + video_file_name_);
  }

  packet = av_packet_alloc();
  frame = av_frame_alloc();
  if (!packet || !frame) {
    close();
    throw ExtractionError(ErrorKind::FileOpen,
                          "Could not allocate AVPacket/AVFrame");
  }

  info_ = VideoInfo();
  info_.width = video_stream->codecpar->width;
  info_.height = video_stream->codecpar->height;
  if (info_.width == 0 || info_.height == 0) {
    close();
    throw ExtractionError(ErrorKind::FileOpen,
                          "Failed to get frame dimensions: " +
                              video_file_name_);
  }

  double fps = av_q2d(video_stream->avg_frame_rate);
  if (!(fps > 0.0) || std::isnan(fps)) {
    fps = av_q2d(video_stream->r_frame_rate);
  }
  if (!(fps > 0.0) || std::isnan(fps)) {
    std::cerr << "[WARN] Frame rate unknown for " << video_file_name_
              << ", assuming 25 fps" << std::endl;
    fps = 25.0;
  }
  info_.fps = fps;

  if (fmtCtx->duration != AV_NOPTS_VALUE && fmtCtx->duration > 0) {
    info_.duration_sec =
        static_cast<double>(fmtCtx->duration) / AV_TIME_BASE;
  } else if (video_stream->duration != AV_NOPTS_VALUE &&
             video_stream->duration > 0) {
    info_.duration_sec =
        video_stream->duration * av_q2d(video_stream->time_base);
  }

  if (video_stream->nb_frames > 0) {
    info_.frame_count = video_stream->nb_frames;
  } else {
    info_.frame_count =
        static_cast<long long>(std::llround(info_.duration_sec * fps));
  }
  if (info_.duration_sec <= 0.0 && info_.frame_count > 0) {
    info_.duration_sec = info_.frame_count / fps;
  }

  interval_ = computeInterval(info_.fps, sample_fps_);
  native_index_ = -1;
  flushing_ = false;
  finished_ = false;
}

void FrameSampler::close() {
  if (swsCtx) {
    sws_freeContext(swsCtx);
    swsCtx = nullptr;
  }
  if (frame) {
    av_frame_free(&frame);
  }
  if (packet) {
    av_packet_free(&packet);
  }
  if (codecCtx) {
    avcodec_free_context(&codecCtx);
  }
  if (fmtCtx) {
    avformat_close_input(&fmtCtx);
    fmtCtx = nullptr;
  }
  video_stream_index = -1;
  finished_ = true;
}

void FrameSampler::rewind() {
  close();
  open();
}

void FrameSampler::setBottomCrop(double ratio) {
  crop_rect_.reset();
  bottom_ratio_ = ratio;
}

void FrameSampler::setCrop(const cv::Rect &rect) {
  bottom_ratio_.reset();
  crop_rect_ = rect;
}

void FrameSampler::clearCrop() {
  bottom_ratio_.reset();
  crop_rect_.reset();
}

bool FrameSampler::decodeNextFrame() {
  while (!finished_) {
    int ret = avcodec_receive_frame(codecCtx, frame);
    if (ret == 0) {
      native_index_++;
      return true;
    }
    if (ret == AVERROR_EOF) {
      finished_ = true;
      break;
    }
    if (ret != AVERROR(EAGAIN)) {
      std::cerr << "[Sampler] decode failed after frame " << native_index_
                << ": " << avErrorString(ret) << std::endl;
      finished_ = true;
      break;
    }
    if (flushing_) {
      finished_ = true;
      break;
    }

    // 解码器需要更多输入
    bool sent = false;
    while (!sent) {
      int r = av_read_frame(fmtCtx, packet);
      if (r < 0) {
        if (r != AVERROR_EOF) {
          std::cerr << "[Sampler] read failed after frame " << native_index_
                    << ": " << avErrorString(r) << std::endl;
        }
        avcodec_send_packet(codecCtx, nullptr);
        flushing_ = true;
        break;
      }
      if (packet->stream_index == video_stream_index) {
        int s = avcodec_send_packet(codecCtx, packet);
        if (s < 0 && s != AVERROR(EAGAIN)) {
          std::cerr << "[Sampler] send packet failed after frame "
                    << native_index_ << ": " << avErrorString(s)
                    << std::endl;
          av_packet_unref(packet);
          finished_ = true;
          return false;
        }
        sent = true;
      }
      av_packet_unref(packet);
    }
  }
  return false;
}

cv::Mat FrameSampler::convertToBgr(const AVFrame *src) {
  swsCtx = sws_getCachedContext(
      swsCtx, src->width, src->height, static_cast<AVPixelFormat>(src->format),
      src->width, src->height, AV_PIX_FMT_BGR24, SWS_BILINEAR, nullptr,
      nullptr, nullptr);
  if (!swsCtx) {
    std::cerr << "[Error] sws_getContext failed" << std::endl;
    return cv::Mat();
  }

  cv::Mat bgr(src->height, src->width, CV_8UC3);
  uint8_t *dest[1] = {bgr.data};
  int dest_linesize[1] = {static_cast<int>(bgr.step)};
  sws_scale(swsCtx, src->data, src->linesize, 0, src->height, dest,
            dest_linesize);
  return bgr;
}

cv::Mat FrameSampler::applyCrop(const cv::Mat &image) const {
  cv::Rect bounds(0, 0, image.cols, image.rows);
  cv::Rect roi = bounds;
  if (bottom_ratio_) {
    int band = static_cast<int>(image.rows * *bottom_ratio_);
    roi = cv::Rect(0, image.rows - band, image.cols, band);
  } else if (crop_rect_) {
    roi = *crop_rect_ & bounds;
  }
  if (roi == bounds)
    return image;
  if (roi.width <= 0 || roi.height <= 0)
    return cv::Mat();
  // clone() 保证裁剪后的帧拥有独立、连续的内存
  return image(roi).clone();
}

bool FrameSampler::next(VideoFrame &out) {
  if (!fmtCtx)
    return false;
  while (decodeNextFrame()) {
    long long idx = native_index_;
    if (idx % interval_ != 0) {
      av_frame_unref(frame);
      continue;
    }
    cv::Mat bgr = convertToBgr(frame);
    av_frame_unref(frame);
    if (bgr.empty()) {
      finished_ = true;
      return false;
    }
    out.frame_number = static_cast<int>(idx);
    out.timestamp_ms = timestampForFrame(idx, info_.fps);
    out.image = applyCrop(bgr);
    return true;
  }
  return false;
}

VideoFrame FrameSampler::frameAt(long long time_ms) {
  if (!fmtCtx)
    open();

  AVStream *stream = fmtCtx->streams[video_stream_index];
  int64_t target =
      av_rescale_q(time_ms, AVRational{1, 1000}, stream->time_base);
  if (stream->start_time != AV_NOPTS_VALUE)
    target += stream->start_time;

  if (av_seek_frame(fmtCtx, video_stream_index, target,
                    AVSEEK_FLAG_BACKWARD) < 0) {
    rewind();
    throw ExtractionError(ErrorKind::Decode,
                          "Seek failed at " + std::to_string(time_ms) + "ms");
  }
  avcodec_flush_buffers(codecCtx);
  flushing_ = false;
  finished_ = false;

  const long long half_frame_ms =
      static_cast<long long>(500.0 / std::max(info_.fps, 1.0));
  VideoFrame result;
  bool found = false;
  while (decodeNextFrame()) {
    int64_t pts = frame->best_effort_timestamp;
    long long ms = time_ms;
    if (pts != AV_NOPTS_VALUE) {
      if (stream->start_time != AV_NOPTS_VALUE)
        pts -= stream->start_time;
      ms = av_rescale_q(pts, stream->time_base, AVRational{1, 1000});
    }
    if (ms + half_frame_ms >= time_ms) {
      cv::Mat bgr = convertToBgr(frame);
      av_frame_unref(frame);
      if (!bgr.empty()) {
        result.frame_number = static_cast<int>(
            std::llround(static_cast<double>(ms) * info_.fps / 1000.0));
        result.timestamp_ms = time_ms;
        result.image = applyCrop(bgr);
        found = true;
      }
      break;
    }
    av_frame_unref(frame);
  }

  rewind();
  if (!found) {
    throw ExtractionError(ErrorKind::Decode,
                          "Failed to read frame at " +
                              std::to_string(time_ms) + "ms");
  }
  return result;
}
