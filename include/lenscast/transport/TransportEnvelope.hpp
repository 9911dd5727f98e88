// Repository: Lenscast
// Component: TransportEnvelope
// Purpose: JSON message unit sent over the audio gateway WebSocket.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_TRANSPORT_TRANSPORT_ENVELOPE_HPP_
#define LENSCAST_TRANSPORT_TRANSPORT_ENVELOPE_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "lenscast/media/MediaTypes.hpp"

namespace lenscast::transport {

inline constexpr const char* kAudioMessageType = "audio";
inline constexpr const char* kAudioCodecName = "AAC";

// {"message_type": ..., "payload": {...}}
struct TransportEnvelope {
  std::string message_type;
  nlohmann::json payload = nlohmann::json::object();

  // Compact JSON, one text frame. Newlines inside payload strings are removed.
  std::string Serialize() const;

  // Returns std::nullopt if `text` is not an envelope object.
  static std::optional<TransportEnvelope> Parse(const std::string& text);
};

// Decoded view of an "audio" payload.
struct AudioChunkPayload {
  std::string timestamp;
  int64_t chunk_index = 0;
  std::string codec;
  int sample_rate = 0;
  int channels = 0;
  std::vector<uint8_t> data;  // ADTS frame after base64 decoding.
  int64_t size = 0;
};

// Builds the "audio" envelope for one ADTS frame.
TransportEnvelope MakeAudioEnvelope(const media::AdtsFrame& frame, int64_t chunk_index,
                                    std::chrono::system_clock::time_point now);

// Returns std::nullopt if the envelope is not a well-formed audio message.
std::optional<AudioChunkPayload> ReadAudioPayload(const TransportEnvelope& envelope);

// "2025-01-31T12:34:56Z"
std::string FormatIso8601Utc(std::chrono::system_clock::time_point tp);

// Removes CR, LF, VT and FF.
std::string StripNewlines(const std::string& value);

std::string Base64Encode(const uint8_t* data, size_t size);
std::optional<std::vector<uint8_t>> Base64Decode(const std::string& text);

}  // namespace lenscast::transport

#endif  // LENSCAST_TRANSPORT_TRANSPORT_ENVELOPE_HPP_
