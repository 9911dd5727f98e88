// Repository: Lenscast
// Component: Media Types
// Purpose: Frame, chunk and packet types flowing from capture to transport.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_MEDIA_MEDIA_TYPES_HPP_
#define LENSCAST_MEDIA_MEDIA_TYPES_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lenscast::media {

// Bytes of an I420 buffer for width x height.
inline size_t I420BufferSize(int width, int height) {
  return static_cast<size_t>(width) * static_cast<size_t>(height) * 3 / 2;
}

// RawVideoFrame is a borrowed view of one planar YUV (I420) capture.
// The producer owns `data` for the duration of the callback only; consumers
// must copy or fully process it before returning.
struct RawVideoFrame {
  int width = 0;
  int height = 0;
  const uint8_t* data = nullptr;
  size_t size = 0;
  int64_t capture_timestamp_us = 0;  // Monotonic capture clock.
};

enum class PcmSampleFormat {
  kS16Interleaved,
  kFloat32Interleaved,
};

// AudioChunk is a borrowed view of interleaved PCM from the microphone.
struct AudioChunk {
  const uint8_t* pcm = nullptr;
  size_t size = 0;  // Bytes.
  int sample_rate = 0;
  int channel_count = 0;
  PcmSampleFormat format = PcmSampleFormat::kS16Interleaved;

  int BytesPerSample() const {
    return format == PcmSampleFormat::kS16Interleaved ? 2 : 4;
  }

  int SampleCount() const {
    if (channel_count <= 0) return 0;
    return static_cast<int>(size / static_cast<size_t>(BytesPerSample() * channel_count));
  }
};

// One raw AAC access unit (no ADTS header).
struct EncodedAacPacket {
  std::vector<uint8_t> payload;
  int sample_rate = 0;
  int channel_count = 0;
  int64_t sequence_index = 0;  // Starts at 0 per encoder session.
};

// An AAC access unit prefixed with its 7-byte ADTS header.
struct AdtsFrame {
  std::vector<uint8_t> bytes;
  int sample_rate = 0;
  int channel_count = 0;

  size_t size() const { return bytes.size(); }
};

}  // namespace lenscast::media

#endif  // LENSCAST_MEDIA_MEDIA_TYPES_HPP_
