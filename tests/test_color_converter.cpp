// Repository: Lenscast
// Component: ColorConverter Unit Tests
// Purpose: Byte-level checks of the I420 to NV21 plane rearrangement.
// Copyright (c) 2025 Lenscast

#include "lenscast/media/ColorConverter.hpp"
#include "lenscast/media/MediaTypes.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace lenscast::media;

namespace {

// Y = 0..(w*h-1), U = 100.., V = 200..
std::vector<uint8_t> MakeI420(int width, int height) {
  const size_t y_size = static_cast<size_t>(width) * height;
  const size_t c_size = y_size / 4;
  std::vector<uint8_t> buf(I420BufferSize(width, height));
  std::iota(buf.begin(), buf.begin() + y_size, static_cast<uint8_t>(0));
  std::iota(buf.begin() + y_size, buf.begin() + y_size + c_size, static_cast<uint8_t>(100));
  std::iota(buf.begin() + y_size + c_size, buf.end(), static_cast<uint8_t>(200));
  return buf;
}

}  // namespace

TEST(ColorConverterTest, FourByTwoInterleavesVBeforeU)
{
  const auto i420 = MakeI420(4, 2);
  ASSERT_EQ(i420.size(), 12u);

  const auto nv21 = ConvertI420ToNV21(i420.data(), i420.size(), 4, 2);

  const std::vector<uint8_t> expected = {0, 1, 2, 3, 4, 5, 6, 7, 200, 100, 201, 101};
  EXPECT_EQ(nv21, expected);
}

TEST(ColorConverterTest, LumaPlaneIsCopiedUnchanged)
{
  const int w = 16;
  const int h = 8;
  const auto i420 = MakeI420(w, h);
  const auto nv21 = ConvertI420ToNV21(i420.data(), i420.size(), w, h);

  ASSERT_EQ(nv21.size(), i420.size());
  EXPECT_TRUE(std::equal(i420.begin(), i420.begin() + w * h, nv21.begin()));

  const size_t y_size = static_cast<size_t>(w) * h;
  const size_t c_size = y_size / 4;
  for (size_t n = 0; n < c_size; ++n) {
    EXPECT_EQ(nv21[y_size + 2 * n], i420[y_size + c_size + n]) << "V at " << n;
    EXPECT_EQ(nv21[y_size + 2 * n + 1], i420[y_size + n]) << "U at " << n;
  }
}

TEST(ColorConverterTest, WritesIntoCallerBuffer)
{
  const auto i420 = MakeI420(2, 2);
  std::vector<uint8_t> out(i420.size(), 0xEE);
  ConvertI420ToNV21(i420.data(), i420.size(), 2, 2, out.data());
  const std::vector<uint8_t> expected = {0, 1, 2, 3, 200, 100};
  EXPECT_EQ(out, expected);
}

TEST(ColorConverterTest, RejectsContractViolations)
{
  const auto i420 = MakeI420(4, 2);
  EXPECT_THROW(ConvertI420ToNV21(i420.data(), i420.size() - 1, 4, 2), std::invalid_argument);
  EXPECT_THROW(ConvertI420ToNV21(i420.data(), i420.size(), 0, 2), std::invalid_argument);
  EXPECT_THROW(ConvertI420ToNV21(i420.data(), i420.size(), -4, 2), std::invalid_argument);
  EXPECT_THROW(ConvertI420ToNV21(nullptr, i420.size(), 4, 2), std::invalid_argument);

  // 3x2 has six luma samples, which do not split into four chroma quarters.
  std::vector<uint8_t> odd(I420BufferSize(3, 2));
  EXPECT_THROW(ConvertI420ToNV21(odd.data(), odd.size(), 3, 2), std::invalid_argument);
}

TEST(ColorConverterTest, OddDimensionsWithWholeChromaQuartersConvert)
{
  // 4x3: 12 luma bytes, 3 U bytes, 3 V bytes.
  const auto i420 = MakeI420(4, 3);
  ASSERT_EQ(i420.size(), 18u);

  const auto nv21 = ConvertI420ToNV21(i420.data(), i420.size(), 4, 3);
  ASSERT_EQ(nv21.size(), 18u);
  EXPECT_TRUE(std::equal(i420.begin(), i420.begin() + 12, nv21.begin()));
  const std::vector<uint8_t> vu(nv21.begin() + 12, nv21.end());
  const std::vector<uint8_t> expected = {200, 100, 201, 101, 202, 102};
  EXPECT_EQ(vu, expected);
}

TEST(ColorConverterTest, ConvertibleGeometry)
{
  EXPECT_TRUE(IsConvertibleI420(4, 2, 12));
  EXPECT_TRUE(IsConvertibleI420(4, 3, 18));
  EXPECT_TRUE(IsConvertibleI420(1, 4, 6));
  EXPECT_FALSE(IsConvertibleI420(3, 2, 9));
  EXPECT_FALSE(IsConvertibleI420(4, 3, 17));
  EXPECT_FALSE(IsConvertibleI420(0, 4, 0));
  EXPECT_FALSE(IsConvertibleI420(-4, -2, 12));
}
