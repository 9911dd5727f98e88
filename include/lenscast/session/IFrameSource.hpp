// Repository: Lenscast
// Component: IFrameSource Interface
// Purpose: Narrow view of the wearable SDK: capture sessions, frames and state.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_SESSION_IFRAME_SOURCE_HPP_
#define LENSCAST_SESSION_IFRAME_SOURCE_HPP_

#include <functional>
#include <memory>
#include <string>

#include "lenscast/config/PipelineConfig.hpp"
#include "lenscast/media/MediaTypes.hpp"
#include "lenscast/session/SourceError.hpp"

namespace lenscast::session {

enum class SourceState {
  kStarting,
  kStreaming,
  kStopped,
  kError,
};

const char* SourceStateName(SourceState state);

struct SourceStateEvent {
  SourceState state = SourceState::kStarting;
  SourceError error = SourceError::kNone;  // Set when state == kError
  std::string detail;
};

struct SourceSessionConfig {
  config::VideoQuality video_quality = config::VideoQuality::kMedium;
  int frame_rate = 24;
  bool capture_video = true;
  bool capture_audio = false;
};

using VideoFrameHandler = std::function<void(const media::RawVideoFrame& frame)>;
using AudioChunkHandler = std::function<void(const media::AudioChunk& chunk)>;
using SourceStateHandler = std::function<void(const SourceStateEvent& event)>;

// ISourceSession is one capture/stream session on the device.
//
// Each handler slot holds one subscriber; setting nullptr unsubscribes.
// Handlers run on SDK threads. Frame and chunk buffers are valid only for the
// duration of the handler call.
class ISourceSession {
 public:
  virtual ~ISourceSession() = default;

  virtual void SetVideoFrameHandler(VideoFrameHandler handler) = 0;
  virtual void SetAudioChunkHandler(AudioChunkHandler handler) = 0;
  virtual void SetStateHandler(SourceStateHandler handler) = 0;

  // Ends capture. Idempotent.
  virtual void Close() = 0;
};

// IFrameSource opens capture sessions on the wearable.
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  // Returns nullptr and sets *error when the device cannot start a session.
  virtual std::unique_ptr<ISourceSession> StartSession(const SourceSessionConfig& config,
                                                       SourceError* error) = 0;
};

}  // namespace lenscast::session

#endif  // LENSCAST_SESSION_IFRAME_SOURCE_HPP_
