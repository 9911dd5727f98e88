// Repository: Lenscast
// Component: JpegPreviewEncoder Unit Tests
// Purpose: NV21 preview frames come out as standalone JPEG images.
// Copyright (c) 2025 Lenscast

#include "lenscast/media/ColorConverter.hpp"
#include "lenscast/media/JpegPreviewEncoder.hpp"
#include "lenscast/media/MediaTypes.hpp"

#include <gtest/gtest.h>
#include <vector>

using namespace lenscast::media;

namespace {

std::vector<uint8_t> GradientNV21(int width, int height) {
  std::vector<uint8_t> i420(I420BufferSize(width, height), 128);
  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      i420[static_cast<size_t>(y) * width + x] = static_cast<uint8_t>((x * 255) / width);
    }
  }
  return ConvertI420ToNV21(i420.data(), i420.size(), width, height);
}

bool IsJpeg(const std::vector<uint8_t>& bytes) {
  return bytes.size() > 4 && bytes[0] == 0xFF && bytes[1] == 0xD8 &&
         bytes[bytes.size() - 2] == 0xFF && bytes[bytes.size() - 1] == 0xD9;
}

}  // namespace

TEST(JpegPreviewEncoderTest, EncodesNv21Frame)
{
  JpegPreviewEncoder encoder;
  EXPECT_EQ(encoder.quality(), 50);

  const auto nv21 = GradientNV21(64, 48);
  const auto jpeg = encoder.EncodeNV21(nv21.data(), nv21.size(), 64, 48);
  ASSERT_TRUE(jpeg.has_value());
  EXPECT_TRUE(IsJpeg(*jpeg));
}

TEST(JpegPreviewEncoderTest, FollowsDimensionChanges)
{
  JpegPreviewEncoder encoder(80);
  const auto small = GradientNV21(32, 32);
  const auto large = GradientNV21(128, 96);

  ASSERT_TRUE(encoder.EncodeNV21(small.data(), small.size(), 32, 32).has_value());
  const auto jpeg = encoder.EncodeNV21(large.data(), large.size(), 128, 96);
  ASSERT_TRUE(jpeg.has_value());
  EXPECT_TRUE(IsJpeg(*jpeg));
}

TEST(JpegPreviewEncoderTest, LowerQualityIsSmaller)
{
  const auto nv21 = GradientNV21(160, 120);
  JpegPreviewEncoder high(95);
  JpegPreviewEncoder low(5);
  const auto a = high.EncodeNV21(nv21.data(), nv21.size(), 160, 120);
  const auto b = low.EncodeNV21(nv21.data(), nv21.size(), 160, 120);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  EXPECT_GT(a->size(), b->size());
}

TEST(JpegPreviewEncoderTest, MalformedFrameIsRejected)
{
  JpegPreviewEncoder encoder;
  std::vector<uint8_t> buf(100);
  EXPECT_FALSE(encoder.EncodeNV21(buf.data(), buf.size(), 64, 48).has_value());
  EXPECT_FALSE(encoder.EncodeNV21(nullptr, 0, 64, 48).has_value());
}

TEST(JpegPreviewEncoderTest, OddDimensionsAreRejected)
{
  JpegPreviewEncoder encoder;
  std::vector<uint8_t> buf(18, 0x80);
  EXPECT_FALSE(encoder.EncodeNV21(buf.data(), buf.size(), 4, 3).has_value());
}
