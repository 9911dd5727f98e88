// Repository: Lenscast
// Component: JpegPreviewEncoder
// Purpose: NV21 frame to JPEG still for the on-phone live preview.
// Copyright (c) 2025 Lenscast

#include "lenscast/media/JpegPreviewEncoder.hpp"

#include <algorithm>
#include <sstream>
#include <string>

#include "lenscast/media/MediaTypes.hpp"
#include "lenscast/util/Logger.hpp"

extern "C" {
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
}

namespace lenscast::media {

namespace {

using util::Logger;

std::string AvError(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return errbuf;
}

// 100 → qscale 2 (best), 1 → qscale 31 (worst).
int QualityToQscale(int quality) {
  const int q = std::clamp(quality, 1, 100);
  return 2 + ((100 - q) * 29) / 99;
}

}  // namespace

JpegPreviewEncoder::JpegPreviewEncoder(int quality)
    : quality_(std::clamp(quality, 1, 100)) {}

JpegPreviewEncoder::~JpegPreviewEncoder() { Close(); }

void JpegPreviewEncoder::Close() {
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  width_ = 0;
  height_ = 0;
  next_pts_ = 0;
}

bool JpegPreviewEncoder::OpenFor(int width, int height) {
  Close();
  av_log_set_level(AV_LOG_ERROR);

  const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MJPEG);
  if (!codec) {
    Logger::Error("[JpegPreviewEncoder] mjpeg encoder not found");
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[JpegPreviewEncoder] Failed to allocate codec context");
    return false;
  }
  codec_ctx_->width = width;
  codec_ctx_->height = height;
  codec_ctx_->pix_fmt = AV_PIX_FMT_YUVJ420P;
  codec_ctx_->color_range = AVCOL_RANGE_JPEG;
  codec_ctx_->time_base = AVRational{1, 24};
  codec_ctx_->flags |= AV_CODEC_FLAG_QSCALE;
  codec_ctx_->global_quality = FF_QP2LAMBDA * QualityToQscale(quality_);

  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    Logger::Error("[JpegPreviewEncoder] Failed to open mjpeg: " + AvError(ret));
    Close();
    return false;
  }

  sws_ctx_ = sws_getContext(width, height, AV_PIX_FMT_NV21,
                            width, height, AV_PIX_FMT_YUVJ420P,
                            SWS_BILINEAR, nullptr, nullptr, nullptr);
  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!sws_ctx_ || !frame_ || !packet_) {
    Logger::Error("[JpegPreviewEncoder] Failed to allocate scaler, frame or packet");
    Close();
    return false;
  }

  frame_->format = AV_PIX_FMT_YUVJ420P;
  frame_->width = width;
  frame_->height = height;
  ret = av_frame_get_buffer(frame_, 0);
  if (ret < 0) {
    Logger::Error("[JpegPreviewEncoder] Failed to allocate frame buffer: " + AvError(ret));
    Close();
    return false;
  }

  width_ = width;
  height_ = height;
  std::ostringstream oss;
  oss << "[JpegPreviewEncoder] opened " << width << "x" << height
      << " quality=" << quality_;
  Logger::Debug(oss.str());
  return true;
}

std::optional<std::vector<uint8_t>> JpegPreviewEncoder::EncodeNV21(
    const uint8_t* nv21, size_t size, int width, int height) {
  if (nv21 == nullptr || width <= 0 || height <= 0 ||
      size != I420BufferSize(width, height)) {
    Logger::Warn("[JpegPreviewEncoder] ignoring malformed frame");
    return std::nullopt;
  }
  // 4:2:0 JPEG needs whole 2x2 chroma blocks.
  if (width % 2 != 0 || height % 2 != 0) {
    Logger::Warn("[JpegPreviewEncoder] odd dimensions " + std::to_string(width) + "x" +
                 std::to_string(height) + " cannot be encoded");
    return std::nullopt;
  }
  if (width != width_ || height != height_ || !codec_ctx_) {
    if (!OpenFor(width, height)) {
      return std::nullopt;
    }
  }

  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    Logger::Warn("[JpegPreviewEncoder] av_frame_make_writable failed: " + AvError(ret));
    return std::nullopt;
  }

  const uint8_t* src_data[4] = {nv21, nv21 + static_cast<size_t>(width) * height,
                                nullptr, nullptr};
  const int src_linesize[4] = {width, width, 0, 0};
  sws_scale(sws_ctx_, src_data, src_linesize, 0, height, frame_->data, frame_->linesize);
  frame_->pts = next_pts_++;
  frame_->quality = codec_ctx_->global_quality;

  ret = avcodec_send_frame(codec_ctx_, frame_);
  if (ret < 0) {
    Logger::Warn("[JpegPreviewEncoder] Error sending frame: " + AvError(ret));
    return std::nullopt;
  }

  std::vector<uint8_t> jpeg;
  while (true) {
    ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
    if (ret < 0) {
      Logger::Warn("[JpegPreviewEncoder] Error receiving packet: " + AvError(ret));
      return std::nullopt;
    }
    jpeg.insert(jpeg.end(), packet_->data, packet_->data + packet_->size);
    av_packet_unref(packet_);
  }
  if (jpeg.empty()) {
    return std::nullopt;
  }
  return jpeg;
}

}  // namespace lenscast::media
