// Repository: Lenscast
// Component: IAudioEncoder Interface
// Purpose: PCM to AAC packet seam used by the audio transport session.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_AUDIO_IAUDIO_ENCODER_HPP_
#define LENSCAST_AUDIO_IAUDIO_ENCODER_HPP_

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "lenscast/media/MediaTypes.hpp"

namespace lenscast::audio {

// Invoked when a chunk is dropped (bad format, encoder rejection).
using EncodeWarningCallback = std::function<void(const std::string& message)>;

// IAudioEncoder turns PCM chunks into raw AAC access units.
//
// One instance lives for exactly one transport session. Implementations bind
// their sample-format converter to the first chunk they see and keep it for
// the whole session.
class IAudioEncoder {
 public:
  virtual ~IAudioEncoder() = default;

  // Opens the codec. Returns false if the encoder cannot be initialized.
  virtual bool Open() = 0;

  // Returns zero or more packets. An empty result is normal: frame-based
  // codecs need a full frame of input before producing output.
  virtual std::vector<media::EncodedAacPacket> Encode(const media::AudioChunk& chunk) = 0;

  // Drains buffered samples. The encoder must be reopened after a flush.
  virtual std::vector<media::EncodedAacPacket> Flush() = 0;

  // Releases codec and converter resources. Safe to call multiple times.
  virtual void Close() = 0;

  virtual int output_sample_rate() const = 0;
  virtual int output_channels() const = 0;

  virtual void SetWarningCallback(EncodeWarningCallback callback) = 0;
};

using AudioEncoderFactory = std::function<std::unique_ptr<IAudioEncoder>()>;

}  // namespace lenscast::audio

#endif  // LENSCAST_AUDIO_IAUDIO_ENCODER_HPP_
