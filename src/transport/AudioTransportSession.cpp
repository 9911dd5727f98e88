// Repository: Lenscast
// Component: AudioTransportSession
// Purpose: Encodes microphone PCM and ships ADTS chunks to the audio gateway.
// Copyright (c) 2025 Lenscast

#include "lenscast/transport/AudioTransportSession.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>

#include "lenscast/audio/AdtsFramer.hpp"
#include "lenscast/transport/TransportEnvelope.hpp"
#include "lenscast/util/Logger.hpp"

namespace lenscast::transport {

using util::Logger;

const char* AudioTransportStatusName(AudioTransportStatus status) {
  switch (status) {
    case AudioTransportStatus::kDisconnected: return "disconnected";
    case AudioTransportStatus::kConnecting: return "connecting";
    case AudioTransportStatus::kConnected: return "connected";
    case AudioTransportStatus::kError: return "error";
  }
  return "unknown";
}

AudioTransportSession::AudioTransportSession(config::AudioGatewayConfig config,
                                             WebSocketClientFactory socket_factory,
                                             audio::AudioEncoderFactory encoder_factory)
    : config_(std::move(config)),
      socket_factory_(std::move(socket_factory)),
      encoder_factory_(std::move(encoder_factory)) {}

AudioTransportSession::~AudioTransportSession() { Stop(); }

void AudioTransportSession::SetEventCallback(TransportEventCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  event_callback_ = std::move(callback);
}

// The gateway session has no periodic ticker; stats are polled with GetStats().
void AudioTransportSession::SetStatsCallback(TransportStatsCallback) {}

void AudioTransportSession::SetWarningCallback(TransportWarningCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  warning_callback_ = std::move(callback);
}

void AudioTransportSession::Emit(TransportEventKind kind, const std::string& message) {
  TransportEventCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = event_callback_;
  }
  if (cb) cb(TransportEvent{kind, message});
}

void AudioTransportSession::Warn(const std::string& message) {
  TransportWarningCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = warning_callback_;
  }
  if (cb) cb(message);
}

bool AudioTransportSession::Start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (status() != AudioTransportStatus::kDisconnected) {
    Logger::Warn("[AudioTransportSession] Start while " +
                 std::string(AudioTransportStatusName(status())) + "; ignored");
    return false;
  }

  auto socket = socket_factory_ ? socket_factory_() : nullptr;
  auto encoder = encoder_factory_ ? encoder_factory_() : nullptr;
  if (!socket || !encoder) {
    Logger::Error("[AudioTransportSession] missing socket or encoder factory");
    return false;
  }
  encoder->SetWarningCallback([this](const std::string& message) { Warn(message); });
  if (!encoder->Open()) {
    Logger::Error("[AudioTransportSession] audio encoder failed to open");
    return false;
  }

  status_.store(AudioTransportStatus::kConnecting, std::memory_order_release);
  Emit(TransportEventKind::kConnecting, config_.url);

  {
    std::lock_guard<std::mutex> lock(connect_mutex_);
    connecting_ = socket.get();
    connect_aborted_ = false;
  }
  std::string error;
  const bool connected = socket->Connect(config_.url, config_.connect_timeout, &error);
  bool aborted = false;
  {
    std::lock_guard<std::mutex> lock(connect_mutex_);
    connecting_ = nullptr;
    aborted = connect_aborted_;
  }
  if (!connected || aborted) {
    if (aborted) {
      Logger::Info("[AudioTransportSession] connect abandoned by Stop()");
      socket->Close(config_.close_timeout);
    } else {
      Logger::Error("[AudioTransportSession] connect failed: " + error);
    }
    encoder->Close();
    status_.store(AudioTransportStatus::kDisconnected, std::memory_order_release);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    socket_ = std::move(socket);
    encoder_ = std::move(encoder);
    next_chunk_index_ = 0;
  }
  inbound_messages_.store(0, std::memory_order_relaxed);
  stats_.Reset();
  stats_.MarkConnected(StreamingStatsTracker::Clock::now());

  socket_->StartReading(
      [this](const std::string& text) { OnInboundMessage(text); },
      [this](const std::string& reason) { Fail(reason); });

  Logger::Info("[AudioTransportSession] socket open, awaiting gateway");
  return true;
}

void AudioTransportSession::Stop() {
  // A Start() blocked in Connect() holds lifecycle_mutex_; closing its socket
  // makes it give up.
  {
    std::lock_guard<std::mutex> lock(connect_mutex_);
    if (connecting_) {
      connect_aborted_ = true;
      connecting_->Close(config_.close_timeout);
    }
  }

  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  AudioTransportStatus prior;
  std::unique_ptr<IWebSocketClient> socket;
  std::unique_ptr<audio::IAudioEncoder> encoder;
  {
    std::lock_guard<std::mutex> lock(send_mutex_);
    if (encoder_ && IsSending()) {
      FlushEncoderLocked();
    }
    prior = status_.exchange(AudioTransportStatus::kDisconnected, std::memory_order_acq_rel);
    socket = std::move(socket_);
    encoder = std::move(encoder_);
    next_chunk_index_ = 0;
  }

  // Close() sends what is still queued before the close frame.
  if (socket) {
    socket->Close(config_.close_timeout);
  }
  if (encoder) {
    encoder->Close();
  }
  stats_.Reset();

  if (socket || prior != AudioTransportStatus::kDisconnected) {
    Logger::Info("[AudioTransportSession] stopped (was " +
                 std::string(AudioTransportStatusName(prior)) + ")");
    Emit(TransportEventKind::kClosed, "");
  }
}

bool AudioTransportSession::IsSending() const {
  const AudioTransportStatus s = status();
  return s == AudioTransportStatus::kConnecting || s == AudioTransportStatus::kConnected;
}

int64_t AudioTransportSession::next_chunk_index() const {
  std::lock_guard<std::mutex> lock(send_mutex_);
  return next_chunk_index_;
}

void AudioTransportSession::ConsumeAudio(const media::AudioChunk& chunk) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  if (!encoder_ || !IsSending()) return;

  const auto packets = encoder_->Encode(chunk);
  for (const auto& packet : packets) {
    media::AdtsFrame frame;
    try {
      frame = audio::FrameAdts(packet);
    } catch (const std::invalid_argument& e) {
      Logger::Warn(std::string("[AudioTransportSession] packet dropped: ") + e.what());
      Warn(e.what());
      continue;
    }
    const int64_t index = next_chunk_index_++;
    SendLocked(frame, index);
  }
}

void AudioTransportSession::FlushEncoderLocked() {
  for (const auto& packet : encoder_->Flush()) {
    media::AdtsFrame frame;
    try {
      frame = audio::FrameAdts(packet);
    } catch (const std::invalid_argument& e) {
      Logger::Warn(std::string("[AudioTransportSession] final packet dropped: ") + e.what());
      continue;
    }
    if (!SendLocked(frame, next_chunk_index_++)) {
      return;
    }
  }
}

bool AudioTransportSession::Send(const media::AdtsFrame& frame, int64_t chunk_index) {
  std::lock_guard<std::mutex> lock(send_mutex_);
  return SendLocked(frame, chunk_index);
}

bool AudioTransportSession::SendLocked(const media::AdtsFrame& frame, int64_t chunk_index) {
  if (!socket_ || !IsSending()) {
    return false;
  }
  const std::string text =
      MakeAudioEnvelope(frame, chunk_index, std::chrono::system_clock::now()).Serialize();

  std::string error;
  if (!socket_->SendText(text, &error)) {
    Fail("send failed: " + error);
    return false;
  }
  stats_.RecordSent(static_cast<int64_t>(frame.size()));

  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[AudioTransportSession] sent chunk " << chunk_index << " (" << frame.size()
        << " bytes)";
    Logger::Debug(oss.str());
  }
  return true;
}

void AudioTransportSession::OnInboundMessage(const std::string& text) {
  inbound_messages_.fetch_add(1, std::memory_order_relaxed);
  Logger::Debug("[AudioTransportSession] gateway: " + text);

  AudioTransportStatus expected = AudioTransportStatus::kConnecting;
  if (status_.compare_exchange_strong(expected, AudioTransportStatus::kConnected,
                                      std::memory_order_acq_rel)) {
    Logger::Info("[AudioTransportSession] gateway connected");
    Emit(TransportEventKind::kConnected, "");
  }
}

void AudioTransportSession::Fail(const std::string& reason) {
  AudioTransportStatus s = status();
  while (s == AudioTransportStatus::kConnecting || s == AudioTransportStatus::kConnected) {
    if (status_.compare_exchange_weak(s, AudioTransportStatus::kError,
                                      std::memory_order_acq_rel)) {
      Logger::Error("[AudioTransportSession] " + reason);
      Emit(TransportEventKind::kError, reason);
      return;
    }
  }
}

StreamingStats AudioTransportSession::GetStats() const {
  return stats_.Snapshot(StreamingStatsTracker::Clock::now());
}

}  // namespace lenscast::transport
