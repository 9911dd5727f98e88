// Repository: Lenscast
// Component: RtmpUrl
// Purpose: RTMP ingest URL parsing, stream-key joining and platform presets.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_TRANSPORT_RTMP_URL_HPP_
#define LENSCAST_TRANSPORT_RTMP_URL_HPP_

#include <optional>
#include <string>

namespace lenscast::transport {

enum class StreamingPlatform {
  kCustom,
  kYouTube,
  kTwitch,
  kBilibili,
  kDouyin,
  kTikTok,
  kFacebook,
};

const char* StreamingPlatformName(StreamingPlatform platform);
std::optional<StreamingPlatform> ParseStreamingPlatform(const std::string& name);

// Ingest server URL for the platform; empty for kCustom.
std::string DefaultIngestUrl(StreamingPlatform platform);

// rtmp[s]://host:port/app + stream key.
struct RtmpEndpoint {
  std::string scheme;  // "rtmp" or "rtmps"
  std::string host;
  int port = 1935;
  std::string app;
  std::string stream_key;

  std::string ServerUrl() const;  // scheme://host:port/app
  std::string FullUrl() const;    // ServerUrl() + "/" + stream_key
};

// The last path segment is the stream key and the segments before it form
// the app. A single segment becomes the key under app "live"; no path gives
// key "stream". Returns std::nullopt for non-RTMP schemes.
std::optional<RtmpEndpoint> ParseRtmpUrl(const std::string& url);

// Trims both parts and joins them with exactly one '/'. An empty key returns
// the trimmed server URL unchanged.
std::string BuildRtmpUrl(const std::string& server_url, const std::string& stream_key);

}  // namespace lenscast::transport

#endif  // LENSCAST_TRANSPORT_RTMP_URL_HPP_
