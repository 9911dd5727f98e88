// Repository: Lenscast
// Component: PipelineConfig
// Purpose: Configuration for media sessions, audio gateway and RTMP uplinks.
// Copyright (c) 2025 Lenscast

#include "lenscast/config/PipelineConfig.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "lenscast/util/Logger.hpp"

namespace lenscast::config {

namespace {

using util::Logger;

std::string Upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return s;
}

bool StartsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

template <typename T>
void ReadIf(const nlohmann::json& node, const char* key, T* out) {
  if (node.contains(key)) {
    *out = node.at(key).get<T>();
  }
}

void ReadMillisIf(const nlohmann::json& node, const char* key, std::chrono::milliseconds* out) {
  if (node.contains(key)) {
    *out = std::chrono::milliseconds(node.at(key).get<int64_t>());
  }
}

template <typename Enum, typename Parser>
void ReadEnumIf(const nlohmann::json& node, const char* key, Parser parse, Enum* out) {
  if (!node.contains(key)) return;
  const std::string text = node.at(key).get<std::string>();
  auto parsed = parse(text);
  if (!parsed) {
    throw std::invalid_argument(std::string("unknown value '") + text + "' for " + key);
  }
  *out = *parsed;
}

}  // namespace

const char* VideoQualityName(VideoQuality quality) {
  switch (quality) {
    case VideoQuality::kLow: return "LOW";
    case VideoQuality::kMedium: return "MEDIUM";
    case VideoQuality::kHigh: return "HIGH";
  }
  return "MEDIUM";
}

const char* SessionModeName(SessionMode mode) {
  switch (mode) {
    case SessionMode::kAudioGateway: return "AUDIO_GATEWAY";
    case SessionMode::kRtmpBroadcast: return "RTMP_BROADCAST";
    case SessionMode::kPreviewOnly: return "PREVIEW_ONLY";
  }
  return "AUDIO_GATEWAY";
}

const char* PendingFramePolicyName(PendingFramePolicy policy) {
  return policy == PendingFramePolicy::kDrop ? "DROP" : "BUFFER";
}

std::optional<VideoQuality> ParseVideoQuality(const std::string& text) {
  const std::string u = Upper(text);
  if (u == "LOW") return VideoQuality::kLow;
  if (u == "MEDIUM") return VideoQuality::kMedium;
  if (u == "HIGH") return VideoQuality::kHigh;
  return std::nullopt;
}

std::optional<SessionMode> ParseSessionMode(const std::string& text) {
  const std::string u = Upper(text);
  if (u == "AUDIO_GATEWAY" || u == "AUDIO") return SessionMode::kAudioGateway;
  if (u == "RTMP_BROADCAST" || u == "RTMP") return SessionMode::kRtmpBroadcast;
  if (u == "PREVIEW_ONLY" || u == "PREVIEW") return SessionMode::kPreviewOnly;
  return std::nullopt;
}

std::optional<PendingFramePolicy> ParsePendingFramePolicy(const std::string& text) {
  const std::string u = Upper(text);
  if (u == "DROP") return PendingFramePolicy::kDrop;
  if (u == "BUFFER") return PendingFramePolicy::kBuffer;
  return std::nullopt;
}

bool ParseMediaSessionConfig(const std::string& json_text, MediaSessionConfig* out,
                             std::string* error) {
  nlohmann::json input = nlohmann::json::parse(json_text, nullptr, /*allow_exceptions=*/false);
  if (input.is_discarded() || !input.is_object()) {
    if (error) *error = "config is not a JSON object";
    return false;
  }

  MediaSessionConfig parsed = *out;
  try {
    ReadEnumIf(input, "mode", ParseSessionMode, &parsed.mode);
    ReadEnumIf(input, "video_quality", ParseVideoQuality, &parsed.video_quality);
    ReadIf(input, "frame_rate", &parsed.frame_rate);
    if (input.contains("time_limit_seconds")) {
      parsed.time_limit = std::chrono::seconds(input.at("time_limit_seconds").get<int64_t>());
    }

    if (input.contains("audio")) {
      const auto& a = input.at("audio");
      ReadIf(a, "url", &parsed.audio.url);
      ReadIf(a, "sample_rate", &parsed.audio.sample_rate);
      ReadIf(a, "channels", &parsed.audio.channels);
      ReadIf(a, "bitrate", &parsed.audio.bitrate);
      ReadMillisIf(a, "connect_timeout_ms", &parsed.audio.connect_timeout);
      ReadMillisIf(a, "close_timeout_ms", &parsed.audio.close_timeout);
    }
    if (input.contains("rtmp")) {
      const auto& r = input.at("rtmp");
      ReadIf(r, "url", &parsed.rtmp.url);
      ReadIf(r, "target_bitrate", &parsed.rtmp.target_bitrate);
      ReadIf(r, "frame_rate", &parsed.rtmp.frame_rate);
      ReadIf(r, "keyframe_interval_seconds", &parsed.rtmp.keyframe_interval_seconds);
      ReadEnumIf(r, "pending_frame_policy", ParsePendingFramePolicy,
                 &parsed.rtmp.pending_frame_policy);
      ReadIf(r, "pending_frame_capacity", &parsed.rtmp.pending_frame_capacity);
      ReadIf(r, "max_queued_frames", &parsed.rtmp.max_queued_frames);
      ReadMillisIf(r, "stop_timeout_ms", &parsed.rtmp.stop_timeout);
    }
    if (input.contains("preview")) {
      const auto& p = input.at("preview");
      ReadIf(p, "enabled", &parsed.preview.enabled);
      ReadIf(p, "jpeg_quality", &parsed.preview.jpeg_quality);
    }

    ReadIf(input, "target_bitrate", &parsed.rtmp.target_bitrate);
    if (input.contains("transport_url")) {
      const std::string url = input.at("transport_url").get<std::string>();
      if (parsed.mode == SessionMode::kAudioGateway) {
        parsed.audio.url = url;
      } else {
        parsed.rtmp.url = url;
      }
    }
  } catch (const std::exception& ex) {
    if (error) *error = std::string("invalid media session config: ") + ex.what();
    return false;
  }

  *out = parsed;
  return true;
}

void ApplyEnvironmentOverrides(MediaSessionConfig* config) {
  if (const char* url = std::getenv("LENSCAST_AUDIO_GATEWAY_URL")) {
    config->audio.url = url;
  }
  if (const char* url = std::getenv("LENSCAST_RTMP_URL")) {
    config->rtmp.url = url;
  }
  if (const char* bitrate = std::getenv("LENSCAST_TARGET_BITRATE")) {
    char* end = nullptr;
    const long value = std::strtol(bitrate, &end, 10);
    if (end != bitrate && *end == '\0' && value > 0) {
      config->rtmp.target_bitrate = static_cast<int>(value);
    } else {
      Logger::Warn(std::string("[PipelineConfig] ignoring LENSCAST_TARGET_BITRATE=") + bitrate);
    }
  }
  if (const char* quality = std::getenv("LENSCAST_VIDEO_QUALITY")) {
    if (auto parsed = ParseVideoQuality(quality)) {
      config->video_quality = *parsed;
    } else {
      Logger::Warn(std::string("[PipelineConfig] ignoring LENSCAST_VIDEO_QUALITY=") + quality);
    }
  }
}

bool ValidateMediaSessionConfig(const MediaSessionConfig& config, std::string* error) {
  auto fail = [error](const std::string& message) {
    if (error) *error = message;
    return false;
  };

  if (config.frame_rate <= 0) return fail("frame_rate must be positive");
  if (config.time_limit.count() < 0) return fail("time_limit must not be negative");

  switch (config.mode) {
    case SessionMode::kAudioGateway: {
      const std::string& url = config.audio.url;
      if (!StartsWith(url, "ws://") && !StartsWith(url, "wss://")) {
        return fail("audio gateway url must start with ws:// or wss://");
      }
      if (config.audio.sample_rate <= 0 || config.audio.channels <= 0 ||
          config.audio.bitrate <= 0) {
        return fail("audio sample_rate, channels and bitrate must be positive");
      }
      if (config.audio.connect_timeout.count() <= 0) {
        return fail("audio connect_timeout must be positive");
      }
      break;
    }
    case SessionMode::kRtmpBroadcast: {
      const std::string& url = config.rtmp.url;
      if (!StartsWith(url, "rtmp://") && !StartsWith(url, "rtmps://")) {
        return fail("rtmp url must start with rtmp:// or rtmps://");
      }
      if (config.rtmp.target_bitrate <= 0 || config.rtmp.frame_rate <= 0 ||
          config.rtmp.keyframe_interval_seconds <= 0) {
        return fail("rtmp target_bitrate, frame_rate and keyframe interval must be positive");
      }
      if (config.rtmp.max_queued_frames == 0) {
        return fail("rtmp max_queued_frames must be positive");
      }
      break;
    }
    case SessionMode::kPreviewOnly:
      break;
  }

  if (config.preview.jpeg_quality < 1 || config.preview.jpeg_quality > 100) {
    return fail("preview jpeg_quality must be in 1..100");
  }
  return true;
}

}  // namespace lenscast::config
