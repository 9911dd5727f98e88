// Repository: Lenscast
// Component: TransportEnvelope
// Purpose: JSON message unit sent over the audio gateway WebSocket.
// Copyright (c) 2025 Lenscast

#include "lenscast/transport/TransportEnvelope.hpp"

#include <ctime>

extern "C" {
#include <libavutil/base64.h>
}

namespace lenscast::transport {

namespace {

void StripStringsInPlace(nlohmann::json& node) {
  if (node.is_string()) {
    node = StripNewlines(node.get<std::string>());
  } else if (node.is_object() || node.is_array()) {
    for (auto& child : node) {
      StripStringsInPlace(child);
    }
  }
}

}  // namespace

std::string StripNewlines(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '\n' || c == '\r' || c == '\v' || c == '\f') continue;
    out.push_back(c);
  }
  return out;
}

std::string FormatIso8601Utc(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
  gmtime_r(&t, &utc);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &utc);
  return buf;
}

std::string Base64Encode(const uint8_t* data, size_t size) {
  std::string out(AV_BASE64_SIZE(size), '\0');
  if (av_base64_encode(out.data(), static_cast<int>(out.size()), data,
                       static_cast<int>(size)) == nullptr) {
    return std::string();
  }
  out.resize(out.size() - 1);  // Trailing NUL.
  return out;
}

std::optional<std::vector<uint8_t>> Base64Decode(const std::string& text) {
  std::vector<uint8_t> out(AV_BASE64_DECODE_SIZE(text.size()) + 1);
  const int n = av_base64_decode(out.data(), text.c_str(), static_cast<int>(out.size()));
  if (n < 0) {
    return std::nullopt;
  }
  out.resize(static_cast<size_t>(n));
  return out;
}

std::string TransportEnvelope::Serialize() const {
  nlohmann::json clean_payload = payload;
  StripStringsInPlace(clean_payload);
  nlohmann::json j;
  j["message_type"] = StripNewlines(message_type);
  j["payload"] = std::move(clean_payload);
  return j.dump();
}

std::optional<TransportEnvelope> TransportEnvelope::Parse(const std::string& text) {
  nlohmann::json j = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (j.is_discarded() || !j.is_object()) {
    return std::nullopt;
  }
  auto type_it = j.find("message_type");
  auto payload_it = j.find("payload");
  if (type_it == j.end() || !type_it->is_string() || payload_it == j.end()) {
    return std::nullopt;
  }
  TransportEnvelope envelope;
  envelope.message_type = type_it->get<std::string>();
  envelope.payload = *payload_it;
  return envelope;
}

TransportEnvelope MakeAudioEnvelope(const media::AdtsFrame& frame, int64_t chunk_index,
                                    std::chrono::system_clock::time_point now) {
  TransportEnvelope envelope;
  envelope.message_type = kAudioMessageType;
  envelope.payload = {
      {"timestamp", FormatIso8601Utc(now)},
      {"chunk_index", chunk_index},
      {"codec", kAudioCodecName},
      {"sample_rate", frame.sample_rate},
      {"channels", frame.channel_count},
      {"data", Base64Encode(frame.bytes.data(), frame.bytes.size())},
      {"size", static_cast<int64_t>(frame.bytes.size())},
  };
  return envelope;
}

std::optional<AudioChunkPayload> ReadAudioPayload(const TransportEnvelope& envelope) {
  if (envelope.message_type != kAudioMessageType || !envelope.payload.is_object()) {
    return std::nullopt;
  }
  const auto& p = envelope.payload;
  try {
    AudioChunkPayload out;
    out.timestamp = p.at("timestamp").get<std::string>();
    out.chunk_index = p.at("chunk_index").get<int64_t>();
    out.codec = p.at("codec").get<std::string>();
    out.sample_rate = p.at("sample_rate").get<int>();
    out.channels = p.at("channels").get<int>();
    out.size = p.at("size").get<int64_t>();
    auto data = Base64Decode(p.at("data").get<std::string>());
    if (!data) {
      return std::nullopt;
    }
    out.data = std::move(*data);
    return out;
  } catch (const nlohmann::json::exception&) {
    return std::nullopt;
  }
}

}  // namespace lenscast::transport
