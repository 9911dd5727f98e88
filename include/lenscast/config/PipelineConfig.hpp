// Repository: Lenscast
// Component: PipelineConfig
// Purpose: Configuration for media sessions, audio gateway and RTMP uplinks.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_CONFIG_PIPELINE_CONFIG_HPP_
#define LENSCAST_CONFIG_PIPELINE_CONFIG_HPP_

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace lenscast::config {

// Capture resolution tier requested from the wearable.
enum class VideoQuality {
  kLow,
  kMedium,
  kHigh,
};

enum class SessionMode {
  kAudioGateway,   // Microphone → AAC → WebSocket
  kRtmpBroadcast,  // Camera → H.264/FLV → RTMP ingest
  kPreviewOnly,    // Camera → JPEG preview, no network
};

// What RTMP does with frames that arrive while it is still connecting.
enum class PendingFramePolicy {
  kDrop,
  kBuffer,  // Keep the newest `pending_frame_capacity` frames
};

struct AudioGatewayConfig {
  std::string url;  // ws:// or wss://, bearer token in the query string
  int sample_rate = 24000;
  int channels = 1;
  int bitrate = 64000;
  std::chrono::milliseconds connect_timeout{5000};  // Whole opening handshake
  std::chrono::milliseconds close_timeout{500};
};

struct RtmpConfig {
  std::string url;  // rtmp:// or rtmps://, stream key as last path segment
  int target_bitrate = 2'000'000;
  int frame_rate = 24;
  int keyframe_interval_seconds = 1;
  PendingFramePolicy pending_frame_policy = PendingFramePolicy::kDrop;
  size_t pending_frame_capacity = 3;
  size_t max_queued_frames = 30;
  std::chrono::milliseconds stop_timeout{800};
};

struct PreviewConfig {
  bool enabled = false;
  int jpeg_quality = 50;
};

struct MediaSessionConfig {
  SessionMode mode = SessionMode::kAudioGateway;
  VideoQuality video_quality = VideoQuality::kMedium;
  int frame_rate = 24;
  std::chrono::seconds time_limit{0};  // 0 = unlimited
  AudioGatewayConfig audio;
  RtmpConfig rtmp;
  PreviewConfig preview;
};

const char* VideoQualityName(VideoQuality quality);
const char* SessionModeName(SessionMode mode);
const char* PendingFramePolicyName(PendingFramePolicy policy);

// Case-insensitive.
std::optional<VideoQuality> ParseVideoQuality(const std::string& text);
std::optional<SessionMode> ParseSessionMode(const std::string& text);
std::optional<PendingFramePolicy> ParsePendingFramePolicy(const std::string& text);

// Reads a JSON document into `out`, starting from the values already there.
// Recognizes "transport_url" and "target_bitrate" as shorthands for the
// active mode's URL and the RTMP bitrate.
bool ParseMediaSessionConfig(const std::string& json_text, MediaSessionConfig* out,
                             std::string* error);

// LENSCAST_AUDIO_GATEWAY_URL, LENSCAST_RTMP_URL, LENSCAST_TARGET_BITRATE,
// LENSCAST_VIDEO_QUALITY. Unparseable values are ignored with a warning.
void ApplyEnvironmentOverrides(MediaSessionConfig* config);

bool ValidateMediaSessionConfig(const MediaSessionConfig& config, std::string* error);

}  // namespace lenscast::config

#endif  // LENSCAST_CONFIG_PIPELINE_CONFIG_HPP_
