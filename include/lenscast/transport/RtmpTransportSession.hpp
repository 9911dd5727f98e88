// Repository: Lenscast
// Component: RtmpTransportSession
// Purpose: Lazily connected RTMP video uplink with 1 Hz streaming statistics.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_TRANSPORT_RTMP_TRANSPORT_SESSION_HPP_
#define LENSCAST_TRANSPORT_RTMP_TRANSPORT_SESSION_HPP_

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "lenscast/config/PipelineConfig.hpp"
#include "lenscast/transport/IMediaTransport.hpp"
#include "lenscast/transport/IVideoPublisher.hpp"

namespace lenscast::transport {

enum class RtmpSessionState {
  kIdle,
  kConnecting,
  kStreaming,
  kError,
};

const char* RtmpSessionStateName(RtmpSessionState state);

// RtmpTransportSession publishes camera frames to one RTMP ingest.
//
// Start() only arms the session. The first frame fed afterwards fixes the
// stream dimensions and triggers exactly one connect attempt on a worker
// thread. Until that connect succeeds, frames are dropped or kept in a small
// buffer according to RtmpConfig::pending_frame_policy.
//
// FeedFrame() copies the caller's buffer and returns without touching the
// network. The worker encodes queued frames in arrival order with smoothed
// timestamps (frame_index / frame_rate).
//
// Stop() is callable from any state. It waits up to RtmpConfig::stop_timeout
// for the worker to finish gracefully, then interrupts the publisher's
// network I/O and waits for the worker to unwind.
class RtmpTransportSession : public IMediaTransport {
 public:
  RtmpTransportSession(config::RtmpConfig config, VideoPublisherFactory publisher_factory);
  ~RtmpTransportSession() override;

  RtmpTransportSession(const RtmpTransportSession&) = delete;
  RtmpTransportSession& operator=(const RtmpTransportSession&) = delete;

  bool Start() override;
  void Stop() override;

  void ConsumeVideo(const media::RawVideoFrame& frame) override;
  // Video-only uplink.
  void ConsumeAudio(const media::AudioChunk&) override {}

  void FeedFrame(const uint8_t* buffer, size_t size, int width, int height,
                 int64_t timestamp_us);

  StreamingStats GetStats() const override;
  void SetEventCallback(TransportEventCallback callback) override;
  void SetStatsCallback(TransportStatsCallback callback) override;
  void SetWarningCallback(TransportWarningCallback callback) override;
  const char* name() const override { return "RtmpTransportSession"; }

  RtmpSessionState state() const;
  int connect_attempts() const { return connect_attempts_.load(std::memory_order_relaxed); }
  int negotiated_width() const;
  int negotiated_height() const;
  int64_t frames_dropped() const { return stats_.frames_dropped(); }

 private:
  struct QueuedFrame {
    std::vector<uint8_t> data;
    int64_t capture_timestamp_us;
  };

  void WorkerLoop(VideoPublisherSettings settings, std::promise<void> done);
  void StatsLoop();
  void DropLocked(const std::string& reason);
  void Emit(TransportEventKind kind, const std::string& message);
  void Warn(const std::string& message);

  const config::RtmpConfig config_;
  VideoPublisherFactory publisher_factory_;

  std::mutex lifecycle_mutex_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;        // Worker: queue or stop
  std::condition_variable stats_cv_;  // Ticker: stop
  bool armed_ = false;
  bool stop_requested_ = false;
  RtmpSessionState state_ = RtmpSessionState::kIdle;
  int width_ = 0;
  int height_ = 0;
  std::deque<QueuedFrame> queue_;
  int64_t frames_fed_ = 0;

  std::unique_ptr<IVideoPublisher> publisher_;
  std::thread worker_;
  std::future<void> worker_done_;
  std::thread stats_thread_;

  std::atomic<int> connect_attempts_{0};
  StreamingStatsTracker stats_;

  std::mutex callback_mutex_;
  TransportEventCallback event_callback_;
  TransportStatsCallback stats_callback_;
  TransportWarningCallback warning_callback_;
};

}  // namespace lenscast::transport

#endif  // LENSCAST_TRANSPORT_RTMP_TRANSPORT_SESSION_HPP_
