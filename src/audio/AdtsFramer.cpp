// Repository: Lenscast
// Component: AdtsFramer
// Purpose: ISO/IEC 13818-7 ADTS header construction for raw AAC-LC packets.
// Copyright (c) 2025 Lenscast

#include "lenscast/audio/AdtsFramer.hpp"

#include <stdexcept>
#include <string>

namespace lenscast::audio {

namespace {

constexpr int kAacLcProfile = 2;
constexpr int kDefaultFrequencyIndex = 6;

constexpr int kFrequencyTable[] = {
    96000, 88200, 64000, 48000, 44100, 32000, 24000,
    22050, 16000, 12000, 11025, 8000, 7350,
};

}  // namespace

int AdtsFrequencyIndex(int sample_rate) {
  for (int i = 0; i < static_cast<int>(sizeof(kFrequencyTable) / sizeof(kFrequencyTable[0])); ++i) {
    if (kFrequencyTable[i] == sample_rate) return i;
  }
  return kDefaultFrequencyIndex;
}

std::array<uint8_t, kAdtsHeaderSize> BuildAdtsHeader(size_t payload_length,
                                                     int sample_rate, int channels) {
  const size_t frame_length = kAdtsHeaderSize + payload_length;
  if (frame_length > kAdtsMaxFrameLength) {
    throw std::invalid_argument("BuildAdtsHeader: frame length " +
                                std::to_string(frame_length) + " exceeds 13 bits");
  }
  const int freq_idx = AdtsFrequencyIndex(sample_rate);

  std::array<uint8_t, kAdtsHeaderSize> header{};
  header[0] = 0xFF;
  header[1] = 0xF1;
  header[2] = static_cast<uint8_t>(((kAacLcProfile - 1) << 6) | (freq_idx << 2) |
                                   ((channels >> 2) & 0x01));
  header[3] = static_cast<uint8_t>(((channels & 0x03) << 6) | ((frame_length >> 11) & 0x03));
  header[4] = static_cast<uint8_t>((frame_length >> 3) & 0xFF);
  header[5] = static_cast<uint8_t>(((frame_length & 0x07) << 5) | 0x1F);
  header[6] = 0xFC;
  return header;
}

media::AdtsFrame FrameAdts(const media::EncodedAacPacket& packet) {
  const auto header = BuildAdtsHeader(packet.payload.size(), packet.sample_rate,
                                      packet.channel_count);
  media::AdtsFrame frame;
  frame.sample_rate = packet.sample_rate;
  frame.channel_count = packet.channel_count;
  frame.bytes.reserve(kAdtsHeaderSize + packet.payload.size());
  frame.bytes.insert(frame.bytes.end(), header.begin(), header.end());
  frame.bytes.insert(frame.bytes.end(), packet.payload.begin(), packet.payload.end());
  return frame;
}

}  // namespace lenscast::audio
