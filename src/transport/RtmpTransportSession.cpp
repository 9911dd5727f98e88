// Repository: Lenscast
// Component: RtmpTransportSession
// Purpose: Lazily connected RTMP video uplink with 1 Hz streaming statistics.
// Copyright (c) 2025 Lenscast

#include "lenscast/transport/RtmpTransportSession.hpp"

#include <chrono>
#include <sstream>
#include <utility>

#include "lenscast/util/Logger.hpp"

namespace lenscast::transport {

namespace {

using util::Logger;

constexpr auto kStatsInterval = std::chrono::seconds(1);
constexpr int kFrameStatsLogEveryTicks = 5;

}  // namespace

const char* RtmpSessionStateName(RtmpSessionState state) {
  switch (state) {
    case RtmpSessionState::kIdle: return "idle";
    case RtmpSessionState::kConnecting: return "connecting";
    case RtmpSessionState::kStreaming: return "streaming";
    case RtmpSessionState::kError: return "error";
  }
  return "unknown";
}

RtmpTransportSession::RtmpTransportSession(config::RtmpConfig config,
                                           VideoPublisherFactory publisher_factory)
    : config_(std::move(config)), publisher_factory_(std::move(publisher_factory)) {}

RtmpTransportSession::~RtmpTransportSession() { Stop(); }

void RtmpTransportSession::SetEventCallback(TransportEventCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  event_callback_ = std::move(callback);
}

void RtmpTransportSession::SetStatsCallback(TransportStatsCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  stats_callback_ = std::move(callback);
}

void RtmpTransportSession::SetWarningCallback(TransportWarningCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  warning_callback_ = std::move(callback);
}

void RtmpTransportSession::Emit(TransportEventKind kind, const std::string& message) {
  TransportEventCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = event_callback_;
  }
  if (cb) cb(TransportEvent{kind, message});
}

void RtmpTransportSession::Warn(const std::string& message) {
  Logger::Warn("[RtmpTransportSession] " + message);
  TransportWarningCallback cb;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    cb = warning_callback_;
  }
  if (cb) cb(message);
}

RtmpSessionState RtmpTransportSession::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

int RtmpTransportSession::negotiated_width() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return width_;
}

int RtmpTransportSession::negotiated_height() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return height_;
}

bool RtmpTransportSession::Start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (armed_) {
      return false;
    }
    armed_ = true;
    stop_requested_ = false;
    state_ = RtmpSessionState::kIdle;
    width_ = 0;
    height_ = 0;
    frames_fed_ = 0;
    queue_.clear();
  }
  stats_.Reset();
  connect_attempts_.store(0, std::memory_order_relaxed);
  stats_thread_ = std::thread(&RtmpTransportSession::StatsLoop, this);
  Logger::Info("[RtmpTransportSession] armed; connect deferred to first frame");
  return true;
}

void RtmpTransportSession::Stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  bool was_active = false;
  IVideoPublisher* publisher = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    was_active = armed_ || worker_.joinable();
    armed_ = false;
    stop_requested_ = true;
    queue_.clear();
    publisher = publisher_.get();
  }
  cv_.notify_all();
  stats_cv_.notify_all();

  if (worker_.joinable()) {
    if (worker_done_.wait_for(config_.stop_timeout) != std::future_status::ready) {
      Logger::Warn("[RtmpTransportSession] graceful stop timed out; interrupting network I/O");
      if (publisher) publisher->Interrupt();
    }
    worker_.join();
  }
  if (stats_thread_.joinable()) {
    stats_thread_.join();
  }

  std::unique_ptr<IVideoPublisher> released;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    released = std::move(publisher_);
    state_ = RtmpSessionState::kIdle;
    width_ = 0;
    height_ = 0;
    frames_fed_ = 0;
  }
  released.reset();
  stats_.Reset();

  if (was_active) {
    Logger::Info("[RtmpTransportSession] stopped");
    Emit(TransportEventKind::kClosed, "");
  }
}

void RtmpTransportSession::ConsumeVideo(const media::RawVideoFrame& frame) {
  FeedFrame(frame.data, frame.size, frame.width, frame.height, frame.capture_timestamp_us);
}

void RtmpTransportSession::DropLocked(const std::string& reason) {
  stats_.RecordDropped();
  if (!reason.empty()) {
    Logger::Debug("[RtmpTransportSession] frame dropped: " + reason);
  }
}

void RtmpTransportSession::FeedFrame(const uint8_t* buffer, size_t size, int width,
                                     int height, int64_t timestamp_us) {
  bool connecting_now = false;
  std::string warning;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!armed_ || stop_requested_) return;
    ++frames_fed_;

    if (state_ == RtmpSessionState::kError) {
      DropLocked("");
      return;
    }
    if (buffer == nullptr || width <= 0 || height <= 0 ||
        size != media::I420BufferSize(width, height)) {
      std::ostringstream oss;
      oss << "frame size mismatch: got " << size << " bytes for " << width << "x" << height
          << ", expected " << media::I420BufferSize(width, height);
      warning = oss.str();
      DropLocked("");
    } else if (width_ == 0) {
      width_ = width;
      height_ = height;
      publisher_ = publisher_factory_ ? publisher_factory_() : nullptr;
      if (!publisher_) {
        state_ = RtmpSessionState::kError;
        warning = "no video publisher available";
      } else {
        state_ = RtmpSessionState::kConnecting;
        connect_attempts_.fetch_add(1, std::memory_order_relaxed);
        VideoPublisherSettings settings;
        settings.url = config_.url;
        settings.width = width;
        settings.height = height;
        settings.bitrate = config_.target_bitrate;
        settings.frame_rate = config_.frame_rate;
        settings.keyframe_interval_seconds = config_.keyframe_interval_seconds;
        std::promise<void> done;
        worker_done_ = done.get_future();
        worker_ = std::thread(&RtmpTransportSession::WorkerLoop, this, std::move(settings),
                              std::move(done));
        connecting_now = true;
      }
    } else if (width != width_ || height != height_) {
      std::ostringstream oss;
      oss << "frame " << width << "x" << height << " does not match stream " << width_
          << "x" << height_;
      warning = oss.str();
      DropLocked("");
    }

    if (warning.empty()) {
      if (state_ == RtmpSessionState::kConnecting) {
        if (config_.pending_frame_policy == config::PendingFramePolicy::kDrop) {
          DropLocked("not connected yet");
        } else {
          queue_.push_back(QueuedFrame{std::vector<uint8_t>(buffer, buffer + size), timestamp_us});
          while (queue_.size() > config_.pending_frame_capacity) {
            queue_.pop_front();
            DropLocked("pending buffer full");
          }
        }
      } else if (state_ == RtmpSessionState::kStreaming) {
        if (queue_.size() >= config_.max_queued_frames) {
          DropLocked("encoder queue full");
        } else {
          queue_.push_back(QueuedFrame{std::vector<uint8_t>(buffer, buffer + size), timestamp_us});
          cv_.notify_one();
        }
      }
    }
  }

  if (connecting_now) {
    std::ostringstream oss;
    oss << "[RtmpTransportSession] first frame " << width << "x" << height
        << "; connecting";
    Logger::Info(oss.str());
    Emit(TransportEventKind::kConnecting, "");
  }
  if (!warning.empty()) {
    Warn(warning);
    if (state() == RtmpSessionState::kError && !connecting_now) {
      Emit(TransportEventKind::kError, warning);
    }
  }
}

void RtmpTransportSession::WorkerLoop(VideoPublisherSettings settings,
                                      std::promise<void> done) {
  IVideoPublisher* publisher = nullptr;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    publisher = publisher_.get();
  }

  std::string error;
  const bool connected = publisher->Open(settings, &error);
  bool stopping = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping = stop_requested_;
    if (!stopping) {
      if (connected) {
        state_ = RtmpSessionState::kStreaming;
        stats_.MarkConnected(StreamingStatsTracker::Clock::now());
      } else {
        state_ = RtmpSessionState::kError;
        queue_.clear();
      }
    }
  }
  if (stopping || !connected) {
    if (!stopping) {
      Logger::Error("[RtmpTransportSession] connect failed: " + error);
      Emit(TransportEventKind::kError, "RTMP connect failed: " + error);
    }
    publisher->Close();
    done.set_value();
    return;
  }

  Logger::Info("[RtmpTransportSession] streaming");
  Emit(TransportEventKind::kStreaming, "");

  const int fps = settings.frame_rate > 0 ? settings.frame_rate : 24;
  int64_t frame_index = 0;
  while (true) {
    QueuedFrame frame;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] { return stop_requested_ || !queue_.empty(); });
      if (stop_requested_) break;
      frame = std::move(queue_.front());
      queue_.pop_front();
    }

    const int64_t pts_us = frame_index * 1000000 / fps;
    ++frame_index;
    const int64_t bytes = publisher->PushFrame(frame.data.data(), frame.data.size(), pts_us,
                                               &error);
    if (bytes < 0) {
      bool report = false;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stop_requested_) {
          state_ = RtmpSessionState::kError;
          queue_.clear();
          report = true;
        }
      }
      if (report) {
        Logger::Error("[RtmpTransportSession] publish failed: " + error);
        Emit(TransportEventKind::kError, "RTMP publish failed: " + error);
      }
      break;
    }
    stats_.RecordSent(bytes);
  }

  publisher->Close();
  done.set_value();
}

void RtmpTransportSession::StatsLoop() {
  int ticks = 0;
  std::unique_lock<std::mutex> lock(mutex_);
  while (!stop_requested_) {
    if (stats_cv_.wait_for(lock, kStatsInterval, [this] { return stop_requested_; })) {
      break;
    }
    ++ticks;
    const bool streaming = state_ == RtmpSessionState::kStreaming;
    const int64_t fed = frames_fed_;
    lock.unlock();

    if (streaming) {
      const StreamingStats snapshot = stats_.Snapshot(StreamingStatsTracker::Clock::now());
      TransportStatsCallback cb;
      {
        std::lock_guard<std::mutex> cb_lock(callback_mutex_);
        cb = stats_callback_;
      }
      if (cb) cb(snapshot);
    }
    if (ticks % kFrameStatsLogEveryTicks == 0) {
      std::ostringstream oss;
      oss << "[RtmpTransportSession] frame stats: total=" << fed
          << " sent=" << stats_.frames_sent() << " dropped=" << stats_.frames_dropped();
      Logger::Info(oss.str());
    }

    lock.lock();
  }
}

StreamingStats RtmpTransportSession::GetStats() const {
  return stats_.Snapshot(StreamingStatsTracker::Clock::now());
}

}  // namespace lenscast::transport
