// Repository: Lenscast
// Component: ADTS Framer Unit Tests
// Purpose: Header bit layout, frequency table and frame-length limits.
// Copyright (c) 2025 Lenscast

#include "lenscast/audio/AdtsFramer.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <stdexcept>

using namespace lenscast;
using namespace lenscast::audio;

namespace {

// Field-by-field reading of a 7-byte ADTS header.
struct ParsedAdts {
  int syncword;
  int id;
  int layer;
  int protection_absent;
  int profile;
  int frequency_index;
  int channel_config;
  int frame_length;
  int buffer_fullness;
  int raw_blocks;
};

ParsedAdts Parse(const std::array<uint8_t, kAdtsHeaderSize>& h) {
  ParsedAdts p{};
  p.syncword = (h[0] << 4) | (h[1] >> 4);
  p.id = (h[1] >> 3) & 0x1;
  p.layer = (h[1] >> 1) & 0x3;
  p.protection_absent = h[1] & 0x1;
  p.profile = (h[2] >> 6) & 0x3;
  p.frequency_index = (h[2] >> 2) & 0xF;
  p.channel_config = ((h[2] & 0x1) << 2) | (h[3] >> 6);
  p.frame_length = ((h[3] & 0x3) << 11) | (h[4] << 3) | (h[5] >> 5);
  p.buffer_fullness = ((h[5] & 0x1F) << 6) | (h[6] >> 2);
  p.raw_blocks = h[6] & 0x3;
  return p;
}

}  // namespace

TEST(AdtsFramerTest, Mono24kHundredBytePayload)
{
  const auto header = BuildAdtsHeader(100, 24000, 1);
  const std::array<uint8_t, 7> expected = {0xFF, 0xF1, 0x58, 0x40, 0x0D, 0x7F, 0xFC};
  EXPECT_EQ(header, expected);
}

TEST(AdtsFramerTest, FieldsDecodeBack)
{
  const auto p = Parse(BuildAdtsHeader(371, 44100, 2));
  EXPECT_EQ(p.syncword, 0xFFF);
  EXPECT_EQ(p.id, 0);
  EXPECT_EQ(p.layer, 0);
  EXPECT_EQ(p.protection_absent, 1);
  EXPECT_EQ(p.profile, 1);  // AAC-LC minus one
  EXPECT_EQ(p.frequency_index, 4);
  EXPECT_EQ(p.channel_config, 2);
  EXPECT_EQ(p.frame_length, 378);
  EXPECT_EQ(p.buffer_fullness, 0x7FF);
  EXPECT_EQ(p.raw_blocks, 0);
}

TEST(AdtsFramerTest, FrequencyIndexTable)
{
  EXPECT_EQ(AdtsFrequencyIndex(96000), 0);
  EXPECT_EQ(AdtsFrequencyIndex(48000), 3);
  EXPECT_EQ(AdtsFrequencyIndex(44100), 4);
  EXPECT_EQ(AdtsFrequencyIndex(24000), 6);
  EXPECT_EQ(AdtsFrequencyIndex(16000), 8);
  EXPECT_EQ(AdtsFrequencyIndex(8000), 11);
  EXPECT_EQ(AdtsFrequencyIndex(7350), 12);
  // Off-table rates fall back to the 24 kHz index.
  EXPECT_EQ(AdtsFrequencyIndex(12345), 6);
}

TEST(AdtsFramerTest, FrameLengthLimit)
{
  EXPECT_NO_THROW(BuildAdtsHeader(kAdtsMaxFrameLength - kAdtsHeaderSize, 24000, 1));
  EXPECT_THROW(BuildAdtsHeader(kAdtsMaxFrameLength - kAdtsHeaderSize + 1, 24000, 1),
               std::invalid_argument);

  const auto p = Parse(BuildAdtsHeader(kAdtsMaxFrameLength - kAdtsHeaderSize, 24000, 1));
  EXPECT_EQ(p.frame_length, 0x1FFF);
}

TEST(AdtsFramerTest, FrameAdtsPrefixesPayload)
{
  media::EncodedAacPacket packet;
  packet.payload = {0xDE, 0xAD, 0xBE, 0xEF};
  packet.sample_rate = 24000;
  packet.channel_count = 1;

  const media::AdtsFrame frame = FrameAdts(packet);
  ASSERT_EQ(frame.size(), kAdtsHeaderSize + 4);
  EXPECT_EQ(frame.sample_rate, 24000);
  EXPECT_EQ(frame.channel_count, 1);
  EXPECT_EQ(frame.bytes[0], 0xFF);
  EXPECT_EQ(frame.bytes[7], 0xDE);
  EXPECT_EQ(frame.bytes[10], 0xEF);

  std::array<uint8_t, kAdtsHeaderSize> header{};
  std::copy(frame.bytes.begin(), frame.bytes.begin() + kAdtsHeaderSize, header.begin());
  EXPECT_EQ(Parse(header).frame_length, 11);
}
