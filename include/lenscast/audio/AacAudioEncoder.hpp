// Repository: Lenscast
// Component: AacAudioEncoder
// Purpose: FFmpeg AAC-LC encoder with a session-lifetime swresample converter.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_AUDIO_AAC_AUDIO_ENCODER_HPP_
#define LENSCAST_AUDIO_AAC_AUDIO_ENCODER_HPP_

#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "lenscast/audio/IAudioEncoder.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/audio_fifo.h>
#include <libswresample/swresample.h>
}

namespace lenscast::audio {

struct AacEncoderConfig {
  int sample_rate = 24000;
  int channels = 1;
  int bitrate = 64000;
};

// AacAudioEncoder drives FFmpeg's native "aac" encoder (AAC-LC).
//
// Input PCM of any rate/channel count/sample format is converted by a single
// SwrContext created on the first Encode() call. A later chunk whose format
// differs from that first chunk is dropped with a warning instead of
// rebuilding the converter. Converted samples accumulate in an AVAudioFifo
// and leave it in exact frame_size blocks.
class AacAudioEncoder : public IAudioEncoder {
 public:
  explicit AacAudioEncoder(AacEncoderConfig config = AacEncoderConfig{});
  ~AacAudioEncoder() override;

  AacAudioEncoder(const AacAudioEncoder&) = delete;
  AacAudioEncoder& operator=(const AacAudioEncoder&) = delete;

  bool Open() override;
  std::vector<media::EncodedAacPacket> Encode(const media::AudioChunk& chunk) override;
  std::vector<media::EncodedAacPacket> Flush() override;
  void Close() override;

  int output_sample_rate() const override { return config_.sample_rate; }
  int output_channels() const override { return config_.channels; }

  void SetWarningCallback(EncodeWarningCallback callback) override;

  // Number of converters created since Open(); stays at 1 for a healthy session.
  int converter_count() const { return converter_count_; }

  // Frame size the codec negotiated (1024 for AAC-LC), 0 before Open().
  int frame_size() const { return frame_size_; }

 private:
  struct InputFormat {
    int sample_rate;
    int channels;
    media::PcmSampleFormat format;
    bool operator==(const InputFormat& o) const {
      return sample_rate == o.sample_rate && channels == o.channels && format == o.format;
    }
  };

  bool CreateConverter(const InputFormat& format);
  bool DrainFifo(bool final_partial, std::vector<media::EncodedAacPacket>* out);
  bool SendAndReceive(AVFrame* frame, std::vector<media::EncodedAacPacket>* out);
  void Warn(const std::string& message);

  AacEncoderConfig config_;
  bool opened_ = false;
  int frame_size_ = 0;
  int64_t next_pts_ = 0;
  int64_t next_sequence_ = 0;
  int converter_count_ = 0;
  std::optional<InputFormat> bound_format_;

  AVCodecContext* codec_ctx_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;
  AVAudioFifo* fifo_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;

  std::mutex warning_mutex_;
  EncodeWarningCallback warning_callback_;
};

}  // namespace lenscast::audio

#endif  // LENSCAST_AUDIO_AAC_AUDIO_ENCODER_HPP_
