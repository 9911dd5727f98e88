// Repository: Lenscast
// Component: IVideoPublisher Interface
// Purpose: H.264 encode + FLV mux + network push capability driven by RTMP sessions.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_TRANSPORT_IVIDEO_PUBLISHER_HPP_
#define LENSCAST_TRANSPORT_IVIDEO_PUBLISHER_HPP_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace lenscast::transport {

struct VideoPublisherSettings {
  std::string url;
  int width = 0;
  int height = 0;
  int bitrate = 2'000'000;
  int frame_rate = 24;
  int keyframe_interval_seconds = 1;
};

// IVideoPublisher is driven from a single worker thread, except Interrupt(),
// which may be called from any thread to abort blocking network I/O.
class IVideoPublisher {
 public:
  virtual ~IVideoPublisher() = default;

  // Opens the encoder for the given dimensions, connects and writes the
  // stream header. Blocks until connected, failed or interrupted.
  virtual bool Open(const VideoPublisherSettings& settings, std::string* error) = 0;

  // Encodes one I420 frame with presentation time `pts_us` (strictly
  // increasing) and writes whatever packets come out. Returns the number of
  // bytes written to the network (0 while the encoder is priming), or -1.
  virtual int64_t PushFrame(const uint8_t* i420, size_t size, int64_t pts_us,
                            std::string* error) = 0;

  // Flushes the encoder, writes the trailer and disconnects. Skips the flush
  // after Interrupt(). Idempotent.
  virtual void Close() = 0;

  virtual void Interrupt() = 0;
};

using VideoPublisherFactory = std::function<std::unique_ptr<IVideoPublisher>()>;

}  // namespace lenscast::transport

#endif  // LENSCAST_TRANSPORT_IVIDEO_PUBLISHER_HPP_
