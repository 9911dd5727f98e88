// Repository: Lenscast
// Component: AudioTransportSession
// Purpose: Encodes microphone PCM and ships ADTS chunks to the audio gateway.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_TRANSPORT_AUDIO_TRANSPORT_SESSION_HPP_
#define LENSCAST_TRANSPORT_AUDIO_TRANSPORT_SESSION_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "lenscast/audio/IAudioEncoder.hpp"
#include "lenscast/config/PipelineConfig.hpp"
#include "lenscast/transport/IMediaTransport.hpp"
#include "lenscast/transport/IWebSocketClient.hpp"

namespace lenscast::transport {

enum class AudioTransportStatus {
  kDisconnected,
  kConnecting,  // Socket open, gateway has not spoken yet
  kConnected,   // First inbound message received
  kError,       // Write or read failed; sends are dropped until Stop()/Start()
};

const char* AudioTransportStatusName(AudioTransportStatus status);

// AudioTransportSession owns one WebSocket and one AAC encoder per Start().
//
// ConsumeAudio() encodes on the calling thread, frames each AAC packet with
// ADTS, and writes one JSON envelope per frame. Chunk indices start at 0 on
// every Start() and advance once per framed packet.
//
// Sending is fire-and-forget. A failed write moves the session to kError and
// reports TransportEventKind::kError; it never reconnects on its own.
//
// Stop() may be called from another thread while Start() is still
// connecting; the connect is abandoned and Start() returns false. On a
// running session Stop() first sends the packets the encoder still buffers.
class AudioTransportSession : public IMediaTransport {
 public:
  AudioTransportSession(config::AudioGatewayConfig config,
                        WebSocketClientFactory socket_factory,
                        audio::AudioEncoderFactory encoder_factory);
  ~AudioTransportSession() override;

  AudioTransportSession(const AudioTransportSession&) = delete;
  AudioTransportSession& operator=(const AudioTransportSession&) = delete;

  bool Start() override;
  void Stop() override;

  // Video is not carried on the audio gateway.
  void ConsumeVideo(const media::RawVideoFrame&) override {}
  void ConsumeAudio(const media::AudioChunk& chunk) override;

  // Wraps `frame` in an "audio" envelope and writes it. Returns false if the
  // session is not sending or the write failed.
  bool Send(const media::AdtsFrame& frame, int64_t chunk_index);

  StreamingStats GetStats() const override;
  void SetEventCallback(TransportEventCallback callback) override;
  void SetStatsCallback(TransportStatsCallback callback) override;
  void SetWarningCallback(TransportWarningCallback callback) override;
  const char* name() const override { return "AudioTransportSession"; }

  AudioTransportStatus status() const { return status_.load(std::memory_order_acquire); }
  int64_t next_chunk_index() const;
  int64_t inbound_messages() const { return inbound_messages_.load(std::memory_order_relaxed); }

 private:
  bool IsSending() const;
  bool SendLocked(const media::AdtsFrame& frame, int64_t chunk_index);
  // Sends the packets the encoder still holds. Requires send_mutex_.
  void FlushEncoderLocked();
  void OnInboundMessage(const std::string& text);
  void Fail(const std::string& reason);
  void Emit(TransportEventKind kind, const std::string& message);
  void Warn(const std::string& message);

  const config::AudioGatewayConfig config_;
  WebSocketClientFactory socket_factory_;
  audio::AudioEncoderFactory encoder_factory_;

  // Serializes Start()/Stop().
  std::mutex lifecycle_mutex_;
  // Guards connecting_ and connect_aborted_ while Start() waits in Connect().
  std::mutex connect_mutex_;
  IWebSocketClient* connecting_ = nullptr;
  bool connect_aborted_ = false;
  // Guards encoder_, socket_ use by senders, and next_chunk_index_.
  mutable std::mutex send_mutex_;

  std::atomic<AudioTransportStatus> status_{AudioTransportStatus::kDisconnected};
  std::unique_ptr<IWebSocketClient> socket_;
  std::unique_ptr<audio::IAudioEncoder> encoder_;
  int64_t next_chunk_index_ = 0;
  std::atomic<int64_t> inbound_messages_{0};
  StreamingStatsTracker stats_;

  std::mutex callback_mutex_;
  TransportEventCallback event_callback_;
  TransportWarningCallback warning_callback_;
};

}  // namespace lenscast::transport

#endif  // LENSCAST_TRANSPORT_AUDIO_TRANSPORT_SESSION_HPP_
