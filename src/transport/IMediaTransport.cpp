// Repository: Lenscast
// Component: IMediaTransport Interface
// Purpose: Common lifecycle and status seam for the audio and video uplinks.
// Copyright (c) 2025 Lenscast

#include "lenscast/transport/IMediaTransport.hpp"

namespace lenscast::transport {

const char* TransportEventKindName(TransportEventKind kind) {
  switch (kind) {
    case TransportEventKind::kConnecting: return "connecting";
    case TransportEventKind::kConnected: return "connected";
    case TransportEventKind::kStreaming: return "streaming";
    case TransportEventKind::kError: return "error";
    case TransportEventKind::kClosed: return "closed";
  }
  return "unknown";
}

}  // namespace lenscast::transport
