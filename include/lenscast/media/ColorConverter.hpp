// Repository: Lenscast
// Component: ColorConverter
// Purpose: I420 planar to NV21 semi-planar conversion for the preview path.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_MEDIA_COLOR_CONVERTER_HPP_
#define LENSCAST_MEDIA_COLOR_CONVERTER_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lenscast::media {

// True when width and height are positive, width*height is a multiple of 4
// and `size` is exactly width*height*3/2. Odd dimensions pass if the product
// divides evenly into four chroma quarters.
bool IsConvertibleI420(int width, int height, size_t size);

// Converts I420 (Y, then U, then V planes) into NV21 (Y, then interleaved V/U).
// The output has the same size as the input and the Y plane is copied as-is.
//
// Throws std::invalid_argument unless IsConvertibleI420() holds. Those are
// caller bugs.
std::vector<uint8_t> ConvertI420ToNV21(const uint8_t* i420, size_t size,
                                       int width, int height);

// Same conversion into a caller-owned buffer of identical size.
void ConvertI420ToNV21(const uint8_t* i420, size_t size, int width, int height,
                       uint8_t* nv21_out);

}  // namespace lenscast::media

#endif  // LENSCAST_MEDIA_COLOR_CONVERTER_HPP_
