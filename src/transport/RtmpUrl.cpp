// Repository: Lenscast
// Component: RtmpUrl
// Purpose: RTMP ingest URL parsing, stream-key joining and platform presets.
// Copyright (c) 2025 Lenscast

#include "lenscast/transport/RtmpUrl.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <vector>

namespace lenscast::transport {

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Trim(const std::string& s) {
  const auto not_space = [](unsigned char c) { return !std::isspace(c); };
  auto begin = std::find_if(s.begin(), s.end(), not_space);
  auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
  return begin < end ? std::string(begin, end) : std::string();
}

std::vector<std::string> SplitPath(const std::string& path) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= path.size()) {
    size_t slash = path.find('/', start);
    if (slash == std::string::npos) slash = path.size();
    if (slash > start) parts.push_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  return parts;
}

}  // namespace

const char* StreamingPlatformName(StreamingPlatform platform) {
  switch (platform) {
    case StreamingPlatform::kCustom: return "custom";
    case StreamingPlatform::kYouTube: return "youtube";
    case StreamingPlatform::kTwitch: return "twitch";
    case StreamingPlatform::kBilibili: return "bilibili";
    case StreamingPlatform::kDouyin: return "douyin";
    case StreamingPlatform::kTikTok: return "tiktok";
    case StreamingPlatform::kFacebook: return "facebook";
  }
  return "custom";
}

std::optional<StreamingPlatform> ParseStreamingPlatform(const std::string& name) {
  const std::string n = Lower(Trim(name));
  for (auto p : {StreamingPlatform::kCustom, StreamingPlatform::kYouTube,
                 StreamingPlatform::kTwitch, StreamingPlatform::kBilibili,
                 StreamingPlatform::kDouyin, StreamingPlatform::kTikTok,
                 StreamingPlatform::kFacebook}) {
    if (n == StreamingPlatformName(p)) return p;
  }
  return std::nullopt;
}

std::string DefaultIngestUrl(StreamingPlatform platform) {
  switch (platform) {
    case StreamingPlatform::kYouTube: return "rtmp://a.rtmp.youtube.com/live2";
    case StreamingPlatform::kTwitch: return "rtmp://live.twitch.tv/app";
    case StreamingPlatform::kBilibili: return "rtmp://live-push.bilivideo.com/live-bvc";
    case StreamingPlatform::kDouyin: return "rtmp://push-rtmp-l6.douyincdn.com/third";
    case StreamingPlatform::kTikTok: return "rtmp://push.tiktokv.com/live";
    case StreamingPlatform::kFacebook: return "rtmps://live-api-s.facebook.com:443/rtmp";
    case StreamingPlatform::kCustom: return "";
  }
  return "";
}

std::string RtmpEndpoint::ServerUrl() const {
  return scheme + "://" + host + ":" + std::to_string(port) + "/" + app;
}

std::string RtmpEndpoint::FullUrl() const {
  return ServerUrl() + "/" + stream_key;
}

std::optional<RtmpEndpoint> ParseRtmpUrl(const std::string& url) {
  const std::string trimmed = Trim(url);
  const size_t sep = trimmed.find("://");
  if (sep == std::string::npos) return std::nullopt;

  RtmpEndpoint endpoint;
  endpoint.scheme = Lower(trimmed.substr(0, sep));
  if (endpoint.scheme != "rtmp" && endpoint.scheme != "rtmps") return std::nullopt;

  std::string rest = trimmed.substr(sep + 3);
  const size_t query = rest.find_first_of("?#");
  if (query != std::string::npos) rest = rest.substr(0, query);

  const size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  const std::string path = slash == std::string::npos ? "" : rest.substr(slash);

  const size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    const std::string port_text = authority.substr(colon + 1);
    char* end = nullptr;
    const long port = std::strtol(port_text.c_str(), &end, 10);
    if (port_text.empty() || *end != '\0' || port <= 0 || port > 65535) {
      return std::nullopt;
    }
    endpoint.port = static_cast<int>(port);
    authority = authority.substr(0, colon);
  }
  endpoint.host = authority.empty() ? "localhost" : authority;

  const auto parts = SplitPath(path);
  if (parts.size() < 2) {
    endpoint.app = "live";
    endpoint.stream_key = parts.empty() ? "stream" : parts.front();
    return endpoint;
  }

  endpoint.stream_key = parts.back();
  for (size_t i = 0; i + 1 < parts.size(); ++i) {
    if (i > 0) endpoint.app += "/";
    endpoint.app += parts[i];
  }
  return endpoint;
}

std::string BuildRtmpUrl(const std::string& server_url, const std::string& stream_key) {
  std::string base = Trim(server_url);
  const std::string key = Trim(stream_key);
  if (key.empty()) return base;
  while (!base.empty() && base.back() == '/') base.pop_back();
  size_t key_start = 0;
  while (key_start < key.size() && key[key_start] == '/') ++key_start;
  return base + "/" + key.substr(key_start);
}

}  // namespace lenscast::transport
