// Repository: Lenscast
// Component: TransportFactory
// Purpose: Builds the production uplink for a session mode.
// Copyright (c) 2025 Lenscast

#include "lenscast/session/TransportFactory.hpp"

#include "lenscast/audio/AacAudioEncoder.hpp"
#include "lenscast/transport/AudioTransportSession.hpp"
#include "lenscast/transport/BeastWebSocketClient.hpp"
#include "lenscast/transport/FfmpegRtmpPublisher.hpp"
#include "lenscast/transport/RtmpTransportSession.hpp"

namespace lenscast::session {

std::unique_ptr<transport::IMediaTransport> MakeDefaultTransport(
    const config::MediaSessionConfig& config) {
  switch (config.mode) {
    case config::SessionMode::kAudioGateway: {
      const audio::AacEncoderConfig aac{config.audio.sample_rate, config.audio.channels,
                                        config.audio.bitrate};
      return std::make_unique<transport::AudioTransportSession>(
          config.audio,
          [] { return std::make_unique<transport::BeastWebSocketClient>(); },
          [aac] { return std::make_unique<audio::AacAudioEncoder>(aac); });
    }
    case config::SessionMode::kRtmpBroadcast:
      return std::make_unique<transport::RtmpTransportSession>(
          config.rtmp, [] { return std::make_unique<transport::FfmpegRtmpPublisher>(); });
    case config::SessionMode::kPreviewOnly:
      return nullptr;
  }
  return nullptr;
}

}  // namespace lenscast::session
