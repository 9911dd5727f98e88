// Repository: Lenscast
// Component: JpegPreviewEncoder
// Purpose: NV21 frame to JPEG still for the on-phone live preview.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_MEDIA_JPEG_PREVIEW_ENCODER_HPP_
#define LENSCAST_MEDIA_JPEG_PREVIEW_ENCODER_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libswscale/swscale.h>
}

namespace lenscast::media {

// JpegPreviewEncoder wraps the FFmpeg mjpeg encoder. The codec context is
// opened lazily for the first frame's dimensions and reopened if they change.
// Not thread-safe: drive it from one thread (the frame callback).
class JpegPreviewEncoder {
 public:
  // quality: 1 (worst) .. 100 (best), mapped onto the mjpeg qscale range.
  explicit JpegPreviewEncoder(int quality = 50);
  ~JpegPreviewEncoder();

  JpegPreviewEncoder(const JpegPreviewEncoder&) = delete;
  JpegPreviewEncoder& operator=(const JpegPreviewEncoder&) = delete;

  // Returns the JPEG bytes, or std::nullopt if the encoder rejected the frame.
  std::optional<std::vector<uint8_t>> EncodeNV21(const uint8_t* nv21, size_t size,
                                                 int width, int height);

  void Close();

  int quality() const { return quality_; }

 private:
  bool OpenFor(int width, int height);

  int quality_;
  int width_ = 0;
  int height_ = 0;
  int64_t next_pts_ = 0;

  AVCodecContext* codec_ctx_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
};

}  // namespace lenscast::media

#endif  // LENSCAST_MEDIA_JPEG_PREVIEW_ENCODER_HPP_
