// Repository: Lenscast
// Component: TransportFactory
// Purpose: Builds the production uplink for a session mode.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_SESSION_TRANSPORT_FACTORY_HPP_
#define LENSCAST_SESSION_TRANSPORT_FACTORY_HPP_

#include <memory>

#include "lenscast/config/PipelineConfig.hpp"
#include "lenscast/transport/IMediaTransport.hpp"

namespace lenscast::session {

// kAudioGateway → AudioTransportSession (Beast WebSocket + FFmpeg AAC)
// kRtmpBroadcast → RtmpTransportSession (FFmpeg libx264 + FLV)
// kPreviewOnly → nullptr
std::unique_ptr<transport::IMediaTransport> MakeDefaultTransport(
    const config::MediaSessionConfig& config);

}  // namespace lenscast::session

#endif  // LENSCAST_SESSION_TRANSPORT_FACTORY_HPP_
