// Repository: Lenscast
// Component: ColorConverter
// Purpose: I420 planar to NV21 semi-planar conversion for the preview path.
// Copyright (c) 2025 Lenscast

#include "lenscast/media/ColorConverter.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

#include "lenscast/media/MediaTypes.hpp"

namespace lenscast::media {

namespace {

void CheckGeometry(const uint8_t* i420, size_t size, int width, int height) {
  if (width <= 0 || height <= 0 ||
      (static_cast<size_t>(width) * static_cast<size_t>(height)) % 4 != 0) {
    throw std::invalid_argument("ConvertI420ToNV21: invalid dimensions " +
                                std::to_string(width) + "x" + std::to_string(height));
  }
  const size_t expected = I420BufferSize(width, height);
  if (size != expected) {
    throw std::invalid_argument("ConvertI420ToNV21: buffer size " + std::to_string(size) +
                                " != " + std::to_string(expected));
  }
  if (i420 == nullptr) {
    throw std::invalid_argument("ConvertI420ToNV21: null input");
  }
}

}  // namespace

bool IsConvertibleI420(int width, int height, size_t size) {
  if (width <= 0 || height <= 0) return false;
  const size_t luma = static_cast<size_t>(width) * static_cast<size_t>(height);
  return luma % 4 == 0 && size == I420BufferSize(width, height);
}

void ConvertI420ToNV21(const uint8_t* i420, size_t size, int width, int height,
                       uint8_t* nv21_out) {
  CheckGeometry(i420, size, width, height);
  if (nv21_out == nullptr) {
    throw std::invalid_argument("ConvertI420ToNV21: null output");
  }

  const size_t luma = static_cast<size_t>(width) * static_cast<size_t>(height);
  const size_t quarter = luma / 4;
  std::memcpy(nv21_out, i420, luma);

  const uint8_t* u_plane = i420 + luma;
  const uint8_t* v_plane = u_plane + quarter;
  uint8_t* vu = nv21_out + luma;
  for (size_t n = 0; n < quarter; ++n) {
    vu[2 * n] = v_plane[n];
    vu[2 * n + 1] = u_plane[n];
  }
}

std::vector<uint8_t> ConvertI420ToNV21(const uint8_t* i420, size_t size,
                                       int width, int height) {
  CheckGeometry(i420, size, width, height);
  std::vector<uint8_t> out(size);
  ConvertI420ToNV21(i420, size, width, height, out.data());
  return out;
}

}  // namespace lenscast::media
