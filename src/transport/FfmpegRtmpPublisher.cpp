// Repository: Lenscast
// Component: FfmpegRtmpPublisher
// Purpose: libx264 + FLV muxer publishing to an rtmp:// or rtmps:// ingest.
// Copyright (c) 2025 Lenscast

#include "lenscast/transport/FfmpegRtmpPublisher.hpp"

#include <mutex>
#include <sstream>

#include "lenscast/util/Logger.hpp"

extern "C" {
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/imgutils.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
}

namespace lenscast::transport {

namespace {

using util::Logger;

constexpr AVRational kMicroseconds{1, 1000000};
// Protocol read/write timeout, microseconds.
constexpr const char* kRwTimeoutUs = "5000000";

std::string AvError(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return errbuf;
}

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

void InitNetworkOnce() {
  static std::once_flag once;
  std::call_once(once, [] {
    avformat_network_init();
    av_log_set_level(AV_LOG_ERROR);
  });
}

}  // namespace

FfmpegRtmpPublisher::FfmpegRtmpPublisher() = default;

FfmpegRtmpPublisher::~FfmpegRtmpPublisher() {
  Interrupt();
  Close();
}

int FfmpegRtmpPublisher::InterruptCallback(void* opaque) {
  auto* self = static_cast<FfmpegRtmpPublisher*>(opaque);
  return self->interrupted_.load(std::memory_order_acquire) ? 1 : 0;
}

void FfmpegRtmpPublisher::Interrupt() {
  interrupted_.store(true, std::memory_order_release);
}

bool FfmpegRtmpPublisher::Open(const VideoPublisherSettings& settings, std::string* error) {
  InitNetworkOnce();
  Close();
  interrupted_.store(false, std::memory_order_release);
  settings_ = settings;

  const AVCodec* codec = avcodec_find_encoder_by_name("libx264");
  if (!codec) {
    SetError(error, "libx264 not found");
    return false;
  }

  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "flv", settings.url.c_str());
  if (ret < 0 || !format_ctx_) {
    SetError(error, "Failed to allocate flv output context: " + AvError(ret));
    Close();
    return false;
  }
  format_ctx_->interrupt_callback.callback = &FfmpegRtmpPublisher::InterruptCallback;
  format_ctx_->interrupt_callback.opaque = this;

  video_stream_ = avformat_new_stream(format_ctx_, nullptr);
  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!video_stream_ || !codec_ctx_) {
    SetError(error, "Failed to create video stream or codec context");
    Close();
    return false;
  }

  const int fps = settings.frame_rate > 0 ? settings.frame_rate : 24;
  codec_ctx_->codec_id = AV_CODEC_ID_H264;
  codec_ctx_->codec_type = AVMEDIA_TYPE_VIDEO;
  codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  codec_ctx_->width = settings.width;
  codec_ctx_->height = settings.height;
  codec_ctx_->bit_rate = settings.bitrate;
  codec_ctx_->rc_max_rate = settings.bitrate;
  codec_ctx_->rc_buffer_size = settings.bitrate;  // One second of VBV.
  codec_ctx_->gop_size = fps * (settings.keyframe_interval_seconds > 0
                                    ? settings.keyframe_interval_seconds : 1);
  codec_ctx_->max_b_frames = 0;
  codec_ctx_->time_base = AVRational{1, fps};
  codec_ctx_->framerate = AVRational{fps, 1};
  codec_ctx_->flags |= AV_CODEC_FLAG_LOW_DELAY;
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }

  AVDictionary* codec_opts = nullptr;
  av_dict_set(&codec_opts, "preset", "ultrafast", 0);
  av_dict_set(&codec_opts, "tune", "zerolatency", 0);
  av_dict_set(&codec_opts, "threads", "1", 0);
  ret = avcodec_open2(codec_ctx_, codec, &codec_opts);
  av_dict_free(&codec_opts);
  if (ret < 0) {
    SetError(error, "Failed to open libx264: " + AvError(ret));
    Close();
    return false;
  }

  // After avcodec_open2 so SPS/PPS extradata reaches the FLV sequence header.
  ret = avcodec_parameters_from_context(video_stream_->codecpar, codec_ctx_);
  if (ret < 0) {
    SetError(error, "Failed to copy codec parameters: " + AvError(ret));
    Close();
    return false;
  }
  video_stream_->time_base = AVRational{1, 1000};

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    SetError(error, "Failed to allocate frame or packet");
    Close();
    return false;
  }
  frame_->format = codec_ctx_->pix_fmt;
  frame_->width = settings.width;
  frame_->height = settings.height;
  ret = av_frame_get_buffer(frame_, 0);
  if (ret < 0) {
    SetError(error, "Failed to allocate frame buffer: " + AvError(ret));
    Close();
    return false;
  }

  AVDictionary* io_opts = nullptr;
  av_dict_set(&io_opts, "rw_timeout", kRwTimeoutUs, 0);
  ret = avio_open2(&format_ctx_->pb, settings.url.c_str(), AVIO_FLAG_WRITE,
                   &format_ctx_->interrupt_callback, &io_opts);
  av_dict_free(&io_opts);
  if (ret < 0) {
    SetError(error, "Failed to connect: " + AvError(ret));
    Close();
    return false;
  }

  ret = avformat_write_header(format_ctx_, nullptr);
  if (ret < 0) {
    SetError(error, "Failed to write stream header: " + AvError(ret));
    Close();
    return false;
  }
  header_written_ = true;

  std::ostringstream oss;
  oss << "[FfmpegRtmpPublisher] publishing " << settings.width << "x" << settings.height
      << "@" << fps << " " << settings.bitrate << "bps";
  Logger::Info(oss.str());
  return true;
}

int64_t FfmpegRtmpPublisher::PushFrame(const uint8_t* i420, size_t size, int64_t pts_us,
                                       std::string* error) {
  if (!header_written_) {
    SetError(error, "publisher not open");
    return -1;
  }
  const int w = settings_.width;
  const int h = settings_.height;
  if (i420 == nullptr ||
      size != static_cast<size_t>(w) * static_cast<size_t>(h) * 3 / 2) {
    SetError(error, "frame size does not match negotiated dimensions");
    return -1;
  }

  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    SetError(error, "av_frame_make_writable failed: " + AvError(ret));
    return -1;
  }
  const uint8_t* src_data[4] = {i420, i420 + static_cast<size_t>(w) * h,
                                i420 + static_cast<size_t>(w) * h * 5 / 4, nullptr};
  const int src_linesize[4] = {w, w / 2, w / 2, 0};
  av_image_copy(frame_->data, frame_->linesize, src_data, src_linesize,
                codec_ctx_->pix_fmt, w, h);
  frame_->pts = av_rescale_q(pts_us, kMicroseconds, codec_ctx_->time_base);

  ret = avcodec_send_frame(codec_ctx_, frame_);
  if (ret == AVERROR(EAGAIN)) {
    const int64_t drained = DrainPackets(error);
    if (drained < 0) return -1;
    ret = avcodec_send_frame(codec_ctx_, frame_);
    if (ret >= 0) {
      const int64_t more = DrainPackets(error);
      return more < 0 ? -1 : drained + more;
    }
  }
  if (ret < 0) {
    SetError(error, "Error sending frame: " + AvError(ret));
    return -1;
  }
  return DrainPackets(error);
}

int64_t FfmpegRtmpPublisher::DrainPackets(std::string* error) {
  int64_t bytes = 0;
  while (true) {
    int ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
    if (ret < 0) {
      SetError(error, "Error receiving packet: " + AvError(ret));
      return -1;
    }
    av_packet_rescale_ts(packet_, codec_ctx_->time_base, video_stream_->time_base);
    packet_->stream_index = video_stream_->index;
    bytes += packet_->size;
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0) {
      SetError(error, "write_frame failed: " + AvError(ret));
      return -1;
    }
  }
  return bytes;
}

void FfmpegRtmpPublisher::Close() {
  if (header_written_ && !interrupted_.load(std::memory_order_acquire)) {
    std::string ignored;
    if (avcodec_send_frame(codec_ctx_, nullptr) >= 0) {
      DrainPackets(&ignored);
    }
    const int ret = av_write_trailer(format_ctx_);
    if (ret < 0) {
      Logger::Warn("[FfmpegRtmpPublisher] write_trailer failed: " + AvError(ret));
    }
  }
  header_written_ = false;

  if (format_ctx_) {
    if (format_ctx_->pb) {
      avio_closep(&format_ctx_->pb);
    }
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
    video_stream_ = nullptr;
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
}

}  // namespace lenscast::transport
