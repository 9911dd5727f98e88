// Repository: Lenscast
// Component: IFrameSource Interface
// Purpose: Narrow view of the wearable SDK: capture sessions, frames and state.
// Copyright (c) 2025 Lenscast

#include "lenscast/session/IFrameSource.hpp"

namespace lenscast::session {

const char* SourceStateName(SourceState state) {
  switch (state) {
    case SourceState::kStarting: return "starting";
    case SourceState::kStreaming: return "streaming";
    case SourceState::kStopped: return "stopped";
    case SourceState::kError: return "error";
  }
  return "unknown";
}

}  // namespace lenscast::session
