// Repository: Lenscast
// Component: AdtsFramer
// Purpose: ISO/IEC 13818-7 ADTS header construction for raw AAC-LC packets.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_AUDIO_ADTS_FRAMER_HPP_
#define LENSCAST_AUDIO_ADTS_FRAMER_HPP_

#include <array>
#include <cstddef>
#include <cstdint>

#include "lenscast/media/MediaTypes.hpp"

namespace lenscast::audio {

inline constexpr size_t kAdtsHeaderSize = 7;

// ADTS frame_length is a 13-bit field and includes the header.
inline constexpr size_t kAdtsMaxFrameLength = 0x1FFF;

// Sampling-frequency index per the MPEG-4 table. Rates outside the table
// map to index 6 (24000 Hz).
int AdtsFrequencyIndex(int sample_rate);

// Header for an AAC-LC payload of `payload_length` bytes, MPEG-4 ID, no CRC.
// Throws std::invalid_argument if the framed length does not fit in 13 bits.
std::array<uint8_t, kAdtsHeaderSize> BuildAdtsHeader(size_t payload_length,
                                                     int sample_rate, int channels);

// Prefixes the packet payload with its ADTS header.
media::AdtsFrame FrameAdts(const media::EncodedAacPacket& packet);

}  // namespace lenscast::audio

#endif  // LENSCAST_AUDIO_ADTS_FRAMER_HPP_
