// Repository: Lenscast
// Component: AacAudioEncoder
// Purpose: FFmpeg AAC-LC encoder with a session-lifetime swresample converter.
// Copyright (c) 2025 Lenscast

#include "lenscast/audio/AacAudioEncoder.hpp"

#include <algorithm>
#include <sstream>

#include "lenscast/util/Logger.hpp"

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
}

namespace lenscast::audio {

namespace {

using util::Logger;

std::string AvError(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return errbuf;
}

AVSampleFormat ToAvSampleFormat(media::PcmSampleFormat format) {
  return format == media::PcmSampleFormat::kS16Interleaved ? AV_SAMPLE_FMT_S16
                                                            : AV_SAMPLE_FMT_FLT;
}

void DefaultLayout(AVChannelLayout* layout, int channels) {
  if (channels == 1) {
    av_channel_layout_from_mask(layout, AV_CH_LAYOUT_MONO);
  } else if (channels == 2) {
    av_channel_layout_from_mask(layout, AV_CH_LAYOUT_STEREO);
  } else {
    av_channel_layout_default(layout, channels);
  }
}

}  // namespace

AacAudioEncoder::AacAudioEncoder(AacEncoderConfig config) : config_(config) {}

AacAudioEncoder::~AacAudioEncoder() { Close(); }

void AacAudioEncoder::SetWarningCallback(EncodeWarningCallback callback) {
  std::lock_guard<std::mutex> lock(warning_mutex_);
  warning_callback_ = std::move(callback);
}

void AacAudioEncoder::Warn(const std::string& message) {
  Logger::Warn("[AacAudioEncoder] " + message);
  EncodeWarningCallback cb;
  {
    std::lock_guard<std::mutex> lock(warning_mutex_);
    cb = warning_callback_;
  }
  if (cb) cb(message);
}

bool AacAudioEncoder::Open() {
  if (opened_) return true;
  Close();
  av_log_set_level(AV_LOG_ERROR);

  const AVCodec* codec = avcodec_find_encoder_by_name("aac");
  if (!codec) {
    Logger::Error("[AacAudioEncoder] aac encoder not found");
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[AacAudioEncoder] Failed to allocate codec context");
    return false;
  }

  // The native encoder only takes float planar and defaults to the LC profile.
  codec_ctx_->sample_fmt = AV_SAMPLE_FMT_FLTP;
  codec_ctx_->sample_rate = config_.sample_rate;
  DefaultLayout(&codec_ctx_->ch_layout, config_.channels);
  codec_ctx_->bit_rate = config_.bitrate;
  codec_ctx_->time_base = AVRational{1, config_.sample_rate};

  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    Logger::Error("[AacAudioEncoder] Failed to open aac: " + AvError(ret));
    Close();
    return false;
  }

  frame_size_ = codec_ctx_->frame_size > 0 ? codec_ctx_->frame_size : 1024;

  fifo_ = av_audio_fifo_alloc(codec_ctx_->sample_fmt, config_.channels, frame_size_ * 4);
  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!fifo_ || !frame_ || !packet_) {
    Logger::Error("[AacAudioEncoder] Failed to allocate fifo, frame or packet");
    Close();
    return false;
  }

  frame_->format = codec_ctx_->sample_fmt;
  frame_->sample_rate = codec_ctx_->sample_rate;
  frame_->nb_samples = frame_size_;
  av_channel_layout_copy(&frame_->ch_layout, &codec_ctx_->ch_layout);
  ret = av_frame_get_buffer(frame_, 0);
  if (ret < 0) {
    Logger::Error("[AacAudioEncoder] Failed to allocate frame buffer: " + AvError(ret));
    Close();
    return false;
  }

  opened_ = true;
  next_pts_ = 0;
  next_sequence_ = 0;
  converter_count_ = 0;
  bound_format_.reset();

  std::ostringstream oss;
  oss << "[AacAudioEncoder] opened AAC-LC " << config_.sample_rate << "Hz/"
      << config_.channels << "ch @" << config_.bitrate << "bps frame_size=" << frame_size_;
  Logger::Debug(oss.str());
  return true;
}

void AacAudioEncoder::Close() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
  if (fifo_) {
    av_audio_fifo_free(fifo_);
    fifo_ = nullptr;
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  opened_ = false;
  bound_format_.reset();
}

bool AacAudioEncoder::CreateConverter(const InputFormat& format) {
  AVChannelLayout src_layout{};
  AVChannelLayout dst_layout{};
  DefaultLayout(&src_layout, format.channels);
  av_channel_layout_copy(&dst_layout, &codec_ctx_->ch_layout);

  int ret = swr_alloc_set_opts2(&swr_ctx_,
                                &dst_layout, codec_ctx_->sample_fmt, codec_ctx_->sample_rate,
                                &src_layout, ToAvSampleFormat(format.format), format.sample_rate,
                                0, nullptr);
  av_channel_layout_uninit(&src_layout);
  av_channel_layout_uninit(&dst_layout);
  if (ret < 0 || !swr_ctx_) {
    Logger::Error("[AacAudioEncoder] Failed to set resampler options: " + AvError(ret));
    swr_free(&swr_ctx_);
    return false;
  }
  ret = swr_init(swr_ctx_);
  if (ret < 0) {
    Logger::Error("[AacAudioEncoder] Failed to initialize resampler: " + AvError(ret));
    swr_free(&swr_ctx_);
    return false;
  }

  ++converter_count_;
  std::ostringstream oss;
  oss << "[AacAudioEncoder] converter bound: " << format.sample_rate << "Hz/"
      << format.channels << "ch -> " << codec_ctx_->sample_rate << "Hz/"
      << config_.channels << "ch";
  Logger::Info(oss.str());
  return true;
}

std::vector<media::EncodedAacPacket> AacAudioEncoder::Encode(const media::AudioChunk& chunk) {
  std::vector<media::EncodedAacPacket> out;
  if (!opened_) {
    Warn("encode called before open; chunk dropped");
    return out;
  }
  if (chunk.pcm == nullptr || chunk.sample_rate <= 0 || chunk.channel_count <= 0) {
    Warn("malformed chunk dropped");
    return out;
  }
  const int in_samples = chunk.SampleCount();
  if (in_samples <= 0) {
    return out;
  }

  const InputFormat format{chunk.sample_rate, chunk.channel_count, chunk.format};
  if (!bound_format_) {
    if (!CreateConverter(format)) {
      Warn("converter creation failed; chunk dropped");
      return out;
    }
    bound_format_ = format;
  } else if (!(*bound_format_ == format)) {
    std::ostringstream oss;
    oss << "chunk format " << format.sample_rate << "Hz/" << format.channels
        << "ch differs from session format " << bound_format_->sample_rate << "Hz/"
        << bound_format_->channels << "ch; chunk dropped";
    Warn(oss.str());
    return out;
  }

  const int max_out = swr_get_out_samples(swr_ctx_, in_samples);
  if (max_out < 0) {
    Warn("resampler rejected chunk: " + AvError(max_out));
    return out;
  }
  std::vector<std::vector<float>> planes(static_cast<size_t>(config_.channels),
                                         std::vector<float>(static_cast<size_t>(max_out)));
  std::vector<uint8_t*> out_ptrs;
  for (auto& plane : planes) {
    out_ptrs.push_back(reinterpret_cast<uint8_t*>(plane.data()));
  }
  const uint8_t* in_ptrs[1] = {chunk.pcm};
  const int converted = swr_convert(swr_ctx_, out_ptrs.data(), max_out, in_ptrs, in_samples);
  if (converted < 0) {
    Warn("resampling failed: " + AvError(converted));
    return out;
  }
  if (converted > 0) {
    const int written = av_audio_fifo_write(
        fifo_, reinterpret_cast<void**>(out_ptrs.data()), converted);
    if (written < converted) {
      Warn("sample fifo write failed; chunk dropped");
      return out;
    }
  }

  DrainFifo(false, &out);
  return out;
}

bool AacAudioEncoder::DrainFifo(bool final_partial, std::vector<media::EncodedAacPacket>* out) {
  while (av_audio_fifo_size(fifo_) >= frame_size_ ||
         (final_partial && av_audio_fifo_size(fifo_) > 0)) {
    const int take = std::min(av_audio_fifo_size(fifo_), frame_size_);
    int ret = av_frame_make_writable(frame_);
    if (ret < 0) {
      Warn("av_frame_make_writable failed: " + AvError(ret));
      return false;
    }
    frame_->nb_samples = take;
    if (av_audio_fifo_read(fifo_, reinterpret_cast<void**>(frame_->data), take) < take) {
      Warn("sample fifo read failed");
      return false;
    }
    frame_->pts = next_pts_;
    next_pts_ += take;
    if (!SendAndReceive(frame_, out)) {
      return false;
    }
  }
  frame_->nb_samples = frame_size_;
  return true;
}

bool AacAudioEncoder::SendAndReceive(AVFrame* frame, std::vector<media::EncodedAacPacket>* out) {
  int ret = avcodec_send_frame(codec_ctx_, frame);
  if (ret == AVERROR(EAGAIN)) {
    // Encoder output is full: drain, then resend.
    while (avcodec_receive_packet(codec_ctx_, packet_) >= 0) {
      out->push_back(media::EncodedAacPacket{
          std::vector<uint8_t>(packet_->data, packet_->data + packet_->size),
          config_.sample_rate, config_.channels, next_sequence_++});
      av_packet_unref(packet_);
    }
    ret = avcodec_send_frame(codec_ctx_, frame);
  }
  if (ret < 0 && ret != AVERROR_EOF) {
    Warn("Error sending frame: " + AvError(ret));
    return false;
  }

  while (true) {
    ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) break;
    if (ret < 0) {
      Warn("Error receiving packet: " + AvError(ret));
      return false;
    }
    out->push_back(media::EncodedAacPacket{
        std::vector<uint8_t>(packet_->data, packet_->data + packet_->size),
        config_.sample_rate, config_.channels, next_sequence_++});
    av_packet_unref(packet_);
  }
  return true;
}

std::vector<media::EncodedAacPacket> AacAudioEncoder::Flush() {
  std::vector<media::EncodedAacPacket> out;
  if (!opened_) return out;

  if (swr_ctx_) {
    const int pending = swr_get_out_samples(swr_ctx_, 0);
    if (pending > 0) {
      std::vector<std::vector<float>> planes(static_cast<size_t>(config_.channels),
                                             std::vector<float>(static_cast<size_t>(pending)));
      std::vector<uint8_t*> out_ptrs;
      for (auto& plane : planes) {
        out_ptrs.push_back(reinterpret_cast<uint8_t*>(plane.data()));
      }
      const int got = swr_convert(swr_ctx_, out_ptrs.data(), pending, nullptr, 0);
      if (got > 0 &&
          av_audio_fifo_write(fifo_, reinterpret_cast<void**>(out_ptrs.data()), got) < got) {
        Warn("sample fifo write failed during flush; tail dropped");
      }
    }
  }

  // Both helpers warn on failure; whatever was encoded is still returned.
  if (DrainFifo(true, &out)) {
    SendAndReceive(nullptr, &out);
  }
  opened_ = false;
  return out;
}

}  // namespace lenscast::audio
