// Repository: Lenscast
// Component: StreamingStats
// Purpose: Per-session send counters and the 1 Hz snapshot derived from them.
// Copyright (c) 2025 Lenscast

#include "lenscast/transport/StreamingStats.hpp"

#include <cstdio>

namespace lenscast::transport {

std::string FormatConnectionTime(std::chrono::milliseconds elapsed) {
  const int64_t total = elapsed.count() < 0 ? 0 : elapsed.count() / 1000;
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%02lld:%02lld:%02lld",
                static_cast<long long>(total / 3600),
                static_cast<long long>((total % 3600) / 60),
                static_cast<long long>(total % 60));
  return buf;
}

void StreamingStatsTracker::MarkConnected(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  connected_at_ = now;
}

void StreamingStatsTracker::RecordSent(int64_t bytes) {
  frames_sent_.fetch_add(1, std::memory_order_relaxed);
  bytes_sent_.fetch_add(bytes, std::memory_order_relaxed);
}

void StreamingStatsTracker::RecordDropped() {
  frames_dropped_.fetch_add(1, std::memory_order_relaxed);
}

void StreamingStatsTracker::Reset() {
  frames_sent_.store(0, std::memory_order_relaxed);
  bytes_sent_.store(0, std::memory_order_relaxed);
  frames_dropped_.store(0, std::memory_order_relaxed);
  std::lock_guard<std::mutex> lock(mutex_);
  connected_at_.reset();
}

StreamingStats StreamingStatsTracker::Snapshot(Clock::time_point now) const {
  StreamingStats stats;
  stats.frames_sent = frames_sent();
  stats.bytes_sent = bytes_sent();

  std::lock_guard<std::mutex> lock(mutex_);
  if (!connected_at_ || now <= *connected_at_) {
    return stats;
  }
  stats.connection_time =
      std::chrono::duration_cast<std::chrono::milliseconds>(now - *connected_at_);
  const double seconds = std::chrono::duration<double>(now - *connected_at_).count();
  if (seconds > 0.0) {
    stats.fps = static_cast<double>(stats.frames_sent) / seconds;
  }
  return stats;
}

}  // namespace lenscast::transport
