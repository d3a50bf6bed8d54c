// Lossless FFV1/AVI clips generated on the fly for the decoder suites.
#pragma once

#include <cmath>
#include <filesystem>
#include <functional>
#include <string>

#include <opencv2/core.hpp>
#include <unistd.h>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

namespace test_utils {

using FramePainter = std::function<cv::Mat(int frame_index)>;

inline cv::Mat grayFrame(int width, int height, int level) {
  return cv::Mat(height, width, CV_8UC3, cv::Scalar(level, level, level));
}

// Gray level of the top-left pixel divided by step, rounded. Undoes the
// small YUV round-trip error of the encoder.
inline int levelMarker(const cv::Mat &image, int step) {
  return static_cast<int>(
      std::lround(image.at<cv::Vec3b>(0, 0)[0] / static_cast<double>(step)));
}

inline std::string tempClipPath(const std::string &name) {
  return (std::filesystem::temp_directory_path() /
          ("subex_" + std::to_string(::getpid()) + "_" + name))
      .string();
}

// Encodes frame_count BGR frames from paint() at a constant fps. Every frame
// is a key frame. Returns false when any FFmpeg step fails.
inline bool writeSyntheticClip(const std::string &path, int width, int height,
                               int fps, int frame_count,
                               const FramePainter &paint) {
  const AVCodec *codec = avcodec_find_encoder(AV_CODEC_ID_FFV1);
  if (!codec)
    return false;

  AVFormatContext *oc = nullptr;
  if (avformat_alloc_output_context2(&oc, nullptr, "avi", path.c_str()) < 0 ||
      !oc)
    return false;

  AVCodecContext *enc = avcodec_alloc_context3(codec);
  AVStream *stream = avformat_new_stream(oc, nullptr);
  AVFrame *yuv = av_frame_alloc();
  AVPacket *packet = av_packet_alloc();
  SwsContext *sws = nullptr;

  bool ok = enc && stream && yuv && packet;
  if (ok) {
    enc->width = width;
    enc->height = height;
    enc->pix_fmt = AV_PIX_FMT_YUV420P;
    enc->time_base = AVRational{1, fps};
    enc->framerate = AVRational{fps, 1};
    enc->gop_size = 1;
    if (oc->oformat->flags & AVFMT_GLOBALHEADER)
      enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    ok = avcodec_open2(enc, codec, nullptr) >= 0 &&
         avcodec_parameters_from_context(stream->codecpar, enc) >= 0;
  }
  if (ok) {
    stream->time_base = enc->time_base;
    stream->avg_frame_rate = enc->framerate;
    ok = avio_open(&oc->pb, path.c_str(), AVIO_FLAG_WRITE) >= 0;
  }
  ok = ok && avformat_write_header(oc, nullptr) >= 0;
  if (ok) {
    yuv->format = enc->pix_fmt;
    yuv->width = width;
    yuv->height = height;
    ok = av_frame_get_buffer(yuv, 0) >= 0;
    sws = sws_getContext(width, height, AV_PIX_FMT_BGR24, width, height,
                         AV_PIX_FMT_YUV420P, SWS_BILINEAR, nullptr, nullptr,
                         nullptr);
    ok = ok && sws != nullptr;
  }

  auto drain = [&]() {
    while (true) {
      int ret = avcodec_receive_packet(enc, packet);
      if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF)
        return true;
      if (ret < 0)
        return false;
      av_packet_rescale_ts(packet, enc->time_base, stream->time_base);
      packet->stream_index = stream->index;
      if (av_interleaved_write_frame(oc, packet) < 0)
        return false;
    }
  };

  for (int i = 0; ok && i < frame_count; ++i) {
    cv::Mat bgr = paint(i);
    if (bgr.cols != width || bgr.rows != height || bgr.type() != CV_8UC3 ||
        !bgr.isContinuous()) {
      ok = false;
      break;
    }
    ok = av_frame_make_writable(yuv) >= 0;
    const uint8_t *src[1] = {bgr.data};
    int src_stride[1] = {static_cast<int>(bgr.step)};
    sws_scale(sws, src, src_stride, 0, height, yuv->data, yuv->linesize);
    yuv->pts = i;
    ok = ok && avcodec_send_frame(enc, yuv) >= 0 && drain();
  }
  if (ok)
    ok = avcodec_send_frame(enc, nullptr) >= 0 && drain();
  if (ok)
    ok = av_write_trailer(oc) >= 0;

  sws_freeContext(sws);
  av_packet_free(&packet);
  av_frame_free(&yuv);
  avcodec_free_context(&enc);
  if (oc->pb)
    avio_closep(&oc->pb);
  avformat_free_context(oc);
  return ok;
}

// Open file descriptors of this process, -1 where /proc is unavailable.
inline int openDescriptorCount() {
  std::error_code ec;
  std::filesystem::directory_iterator it("/proc/self/fd", ec);
  if (ec)
    return -1;
  int count = 0;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec)
      return -1;
    ++count;
  }
  return count;
}

} // namespace test_utils
