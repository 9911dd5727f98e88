// Repository: Lenscast
// Component: FfmpegRtmpPublisher
// Purpose: libx264 + FLV muxer publishing to an rtmp:// or rtmps:// ingest.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_TRANSPORT_FFMPEG_RTMP_PUBLISHER_HPP_
#define LENSCAST_TRANSPORT_FFMPEG_RTMP_PUBLISHER_HPP_

#include <atomic>
#include <cstdint>

#include "lenscast/transport/IVideoPublisher.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
}

namespace lenscast::transport {

// Low-latency H.264 (ultrafast / zerolatency, no B-frames, single thread)
// muxed as FLV straight onto the RTMP protocol handler. Network calls honor
// an AVIOInterruptCB so Interrupt() aborts a hung connect or write.
class FfmpegRtmpPublisher : public IVideoPublisher {
 public:
  FfmpegRtmpPublisher();
  ~FfmpegRtmpPublisher() override;

  FfmpegRtmpPublisher(const FfmpegRtmpPublisher&) = delete;
  FfmpegRtmpPublisher& operator=(const FfmpegRtmpPublisher&) = delete;

  bool Open(const VideoPublisherSettings& settings, std::string* error) override;
  int64_t PushFrame(const uint8_t* i420, size_t size, int64_t pts_us,
                    std::string* error) override;
  void Close() override;
  void Interrupt() override;

 private:
  static int InterruptCallback(void* opaque);

  // Drains the encoder into the muxer. Returns bytes written or -1.
  int64_t DrainPackets(std::string* error);

  VideoPublisherSettings settings_;
  std::atomic<bool> interrupted_{false};
  bool header_written_ = false;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVStream* video_stream_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
};

}  // namespace lenscast::transport

#endif  // LENSCAST_TRANSPORT_FFMPEG_RTMP_PUBLISHER_HPP_
