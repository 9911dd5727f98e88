// Repository: Lenscast
// Component: StreamingStats
// Purpose: Per-session send counters and the 1 Hz snapshot derived from them.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_TRANSPORT_STREAMING_STATS_HPP_
#define LENSCAST_TRANSPORT_STREAMING_STATS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace lenscast::transport {

struct StreamingStats {
  int64_t frames_sent = 0;
  int64_t bytes_sent = 0;
  double fps = 0.0;
  std::chrono::milliseconds connection_time{0};
};

// "HH:MM:SS" for display.
std::string FormatConnectionTime(std::chrono::milliseconds elapsed);

// StreamingStatsTracker holds the counters a transport session owns.
// Recording is lock-free; Snapshot() derives fps as frames / elapsed seconds
// since the connection was established.
class StreamingStatsTracker {
 public:
  using Clock = std::chrono::steady_clock;

  void MarkConnected(Clock::time_point now);
  void RecordSent(int64_t bytes);
  void RecordDropped();
  void Reset();

  StreamingStats Snapshot(Clock::time_point now) const;

  int64_t frames_sent() const { return frames_sent_.load(std::memory_order_relaxed); }
  int64_t bytes_sent() const { return bytes_sent_.load(std::memory_order_relaxed); }
  int64_t frames_dropped() const { return frames_dropped_.load(std::memory_order_relaxed); }

 private:
  std::atomic<int64_t> frames_sent_{0};
  std::atomic<int64_t> bytes_sent_{0};
  std::atomic<int64_t> frames_dropped_{0};

  mutable std::mutex mutex_;
  std::optional<Clock::time_point> connected_at_;
};

}  // namespace lenscast::transport

#endif  // LENSCAST_TRANSPORT_STREAMING_STATS_HPP_
