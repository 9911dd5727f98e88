// Repository: Lenscast
// Component: IMediaTransport Interface
// Purpose: Common lifecycle and status seam for the audio and video uplinks.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_TRANSPORT_IMEDIA_TRANSPORT_HPP_
#define LENSCAST_TRANSPORT_IMEDIA_TRANSPORT_HPP_

#include <functional>
#include <string>

#include "lenscast/media/MediaTypes.hpp"
#include "lenscast/transport/StreamingStats.hpp"

namespace lenscast::transport {

enum class TransportEventKind {
  kConnecting,  // Network connect in progress
  kConnected,   // Remote side confirmed the connection
  kStreaming,   // Media is flowing
  kError,       // Unrecoverable; the owner must tear the session down
  kClosed,      // Stop() completed
};

struct TransportEvent {
  TransportEventKind kind;
  std::string message;
};

using TransportEventCallback = std::function<void(const TransportEvent& event)>;
using TransportStatsCallback = std::function<void(const StreamingStats& stats)>;
using TransportWarningCallback = std::function<void(const std::string& message)>;

const char* TransportEventKindName(TransportEventKind kind);

// IMediaTransport is one network uplink for one media session.
//
// A transport reports what happens to it through the event callback; it never
// decides the session state. The owner reacts to kError by calling Stop().
//
// Consume* calls come from the capture callback thread. Implementations must
// copy or fully process the borrowed buffer before returning and must not
// block on the network.
class IMediaTransport {
 public:
  virtual ~IMediaTransport() = default;

  // Returns false if the session could not be started. No event is required
  // on failure; the return value is authoritative.
  virtual bool Start() = 0;

  // Safe from any state, idempotent, bounded in time.
  virtual void Stop() = 0;

  virtual void ConsumeVideo(const media::RawVideoFrame& frame) = 0;
  virtual void ConsumeAudio(const media::AudioChunk& chunk) = 0;

  virtual StreamingStats GetStats() const = 0;

  // Callbacks may be invoked from any internal thread.
  virtual void SetEventCallback(TransportEventCallback callback) = 0;
  virtual void SetStatsCallback(TransportStatsCallback callback) = 0;
  virtual void SetWarningCallback(TransportWarningCallback callback) = 0;

  virtual const char* name() const = 0;
};

}  // namespace lenscast::transport

#endif  // LENSCAST_TRANSPORT_IMEDIA_TRANSPORT_HPP_
