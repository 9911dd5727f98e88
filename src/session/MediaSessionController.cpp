// Repository: Lenscast
// Component: MediaSessionController
// Purpose: Couples the wearable capture session to one network uplink with
//          ordered start and cascading teardown.
// Copyright (c) 2025 Lenscast

#include "lenscast/session/MediaSessionController.hpp"

#include <exception>
#include <sstream>

#include "lenscast/media/ColorConverter.hpp"
#include "lenscast/session/TransportFactory.hpp"
#include "lenscast/util/Logger.hpp"

namespace lenscast::session {

using lenscast::util::Logger;

namespace {

constexpr std::chrono::seconds kStatsInterval{1};

}  // namespace

const char* MediaSessionController::StateName(State state) {
  switch (state) {
    case State::kIdle: return "idle";
    case State::kStarting: return "starting";
    case State::kStreaming: return "streaming";
    case State::kStopping: return "stopping";
    case State::kStopped: return "stopped";
    case State::kError: return "error";
  }
  return "unknown";
}

MediaSessionController::MediaSessionController(IFrameSource& source,
                                               config::MediaSessionConfig config,
                                               TransportFactory transport_factory)
    : source_(source),
      config_(std::move(config)),
      transport_factory_(transport_factory ? std::move(transport_factory)
                                           : TransportFactory(&MakeDefaultTransport)) {
  loop_thread_ = std::thread(&MediaSessionController::ControlLoop, this);
}

MediaSessionController::~MediaSessionController() {
  Stop();
  Event shutdown;
  shutdown.kind = Event::Kind::kShutdown;
  Post(std::move(shutdown));
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
}

bool MediaSessionController::Start() { return Submit(Event::Kind::kStart); }

void MediaSessionController::Stop() {
  if (std::this_thread::get_id() != loop_thread_.get_id()) {
    // Unblocks a loop stuck in transport Start() so the stop can be served.
    std::lock_guard<std::mutex> lock(start_mutex_);
    if (starting_transport_) {
      start_abandoned_ = true;
      starting_transport_->Stop();
    }
  }
  Submit(Event::Kind::kStop);
}

MediaSessionController::State MediaSessionController::state() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_.state;
}

MediaSessionController::Status MediaSessionController::status() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

transport::StreamingStats MediaSessionController::GetStats() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return stats_;
}

MediaSessionController::MetricsSnapshot MediaSessionController::Snapshot() const {
  MetricsSnapshot snap;
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    snap.transitions = transitions_;
    snap.ignored_start_total = ignored_start_total_;
    snap.ignored_stop_total = ignored_stop_total_;
    snap.cascaded_stop_total = cascaded_stop_total_;
    snap.error_total = error_total_;
    snap.state = status_.state;
  }
  snap.warning_total = warning_total_.load();
  snap.frames_forwarded = frames_forwarded_.load();
  snap.chunks_forwarded = chunks_forwarded_.load();
  return snap;
}

void MediaSessionController::SetStateCallback(StateCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  state_callback_ = std::move(callback);
}

void MediaSessionController::SetStatsCallback(StatsCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  stats_callback_ = std::move(callback);
}

void MediaSessionController::SetPreviewCallback(PreviewCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  preview_callback_ = std::move(callback);
}

void MediaSessionController::SetWarningCallback(WarningCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  warning_callback_ = std::move(callback);
}

void MediaSessionController::SetForwardDrainTimeout(std::chrono::milliseconds timeout) {
  std::lock_guard<std::mutex> lock(status_mutex_);
  forward_drain_timeout_ = timeout;
}

// ======================================================================
// Control loop
// ======================================================================

bool MediaSessionController::Submit(Event::Kind kind) {
  Event event;
  event.kind = kind;
  // Re-entrant calls from a state/stats/warning callback run inline.
  if (std::this_thread::get_id() == loop_thread_.get_id()) {
    return Dispatch(event);
  }
  auto done = std::make_shared<std::promise<bool>>();
  std::future<bool> result = done->get_future();
  event.done = done;
  Post(std::move(event));
  return result.get();
}

void MediaSessionController::Post(Event event) {
  {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    queue_.push_back(std::move(event));
  }
  queue_cv_.notify_one();
}

void MediaSessionController::ControlLoop() {
  for (;;) {
    std::optional<Event> event;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      // Timers are loop-thread state; reading them here is safe.
      std::optional<Clock::time_point> wake = deadline_;
      if (next_stats_tick_ && (!wake || *next_stats_tick_ < *wake)) {
        wake = next_stats_tick_;
      }
      if (wake) {
        queue_cv_.wait_until(lock, *wake, [this] { return !queue_.empty(); });
      } else {
        queue_cv_.wait(lock, [this] { return !queue_.empty(); });
      }
      if (!queue_.empty()) {
        event = std::move(queue_.front());
        queue_.pop_front();
      }
    }

    if (event) {
      if (event->kind == Event::Kind::kShutdown) {
        if (event->done) event->done->set_value(true);
        return;
      }
      bool result = false;
      try {
        result = Dispatch(*event);
      } catch (const std::exception& e) {
        Logger::Error(std::string("[MediaSessionController] Unhandled failure: ") + e.what());
        if (IsActive()) {
          Teardown(State::kError, e.what());
        }
      }
      if (event->done) event->done->set_value(result);
    }

    HandleTimers();
  }
}

bool MediaSessionController::Dispatch(const Event& event) {
  switch (event.kind) {
    case Event::Kind::kStart:
      return HandleStart();
    case Event::Kind::kStop:
      HandleStop();
      return true;
    case Event::Kind::kSourceState:
      if (event.generation != generation_.load()) {
        Logger::Debug(std::string("[MediaSessionController] Ignoring stale source state ") +
                      SourceStateName(event.source_event.state));
        return false;
      }
      HandleSourceState(event.source_event);
      return true;
    case Event::Kind::kTransport:
      if (event.generation != generation_.load()) {
        Logger::Debug(std::string("[MediaSessionController] Ignoring stale transport event ") +
                      transport::TransportEventKindName(event.transport_event.kind));
        return false;
      }
      HandleTransportEvent(event.transport_event);
      return true;
    case Event::Kind::kWarning: {
      WarningCallback callback;
      {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback = warning_callback_;
      }
      if (callback) callback(event.text);
      return true;
    }
    case Event::Kind::kShutdown:
      return true;
  }
  return false;
}

void MediaSessionController::HandleTimers() {
  const auto now = Clock::now();

  if (deadline_ && now >= *deadline_) {
    deadline_.reset();
    if (IsActive()) {
      Logger::Info("[MediaSessionController] Time limit of " +
                   std::to_string(config_.time_limit.count()) + "s reached, stopping");
      Teardown(State::kStopped, "Time limit reached");
      return;
    }
  }

  if (next_stats_tick_ && now >= *next_stats_tick_) {
    while (*next_stats_tick_ <= now) {
      *next_stats_tick_ += kStatsInterval;
    }
    if (transport_) {
      PublishStats(transport_->GetStats());
    }
  }
}

// ======================================================================
// Transitions
// ======================================================================

bool MediaSessionController::HandleStart() {
  const State current = state();
  if (current != State::kIdle && current != State::kStopped && current != State::kError) {
    {
      std::lock_guard<std::mutex> lock(status_mutex_);
      ++ignored_start_total_;
    }
    Logger::Debug(std::string("[MediaSessionController] Start ignored in state ") +
                  StateName(current));
    return false;
  }

  const uint64_t generation = ++generation_;
  Logger::Info(std::string("[MediaSessionController] Starting ") +
               config::SessionModeName(config_.mode) + " session (quality=" +
               config::VideoQualityName(config_.video_quality) +
               ", fps=" + std::to_string(config_.frame_rate) + ")");
  Transition(State::kStarting, "");
  if (state() != State::kStarting) {
    // A state callback already stopped us.
    return false;
  }

  SourceSessionConfig source_config;
  source_config.video_quality = config_.video_quality;
  source_config.frame_rate = config_.frame_rate;
  source_config.capture_video = config_.mode != config::SessionMode::kAudioGateway;
  source_config.capture_audio = config_.mode == config::SessionMode::kAudioGateway;

  SourceError source_error = SourceError::kNone;
  source_session_ = source_.StartSession(source_config, &source_error);
  if (!source_session_) {
    if (source_error == SourceError::kNone) source_error = SourceError::kUnknown;
    const std::string reason = DescribeSourceError(source_error);
    Logger::Error("[MediaSessionController] Device session failed to start: " + reason);
    Teardown(State::kError, reason);
    return false;
  }

  if (config_.preview.enabled || config_.mode == config::SessionMode::kPreviewOnly) {
    preview_ = std::make_unique<media::JpegPreviewEncoder>(config_.preview.jpeg_quality);
  }

  if (config_.mode != config::SessionMode::kPreviewOnly) {
    transport_ = transport_factory_(config_);
    if (!transport_) {
      const std::string reason = std::string("No transport for ") +
                                 config::SessionModeName(config_.mode) + " session";
      Logger::Error("[MediaSessionController] " + reason);
      Teardown(State::kError, reason);
      return false;
    }
    transport_->SetEventCallback([this, generation](const transport::TransportEvent& ev) {
      Event event;
      event.kind = Event::Kind::kTransport;
      event.generation = generation;
      event.transport_event = ev;
      Post(std::move(event));
    });
    transport_->SetWarningCallback([this](const std::string& message) { ReportWarning(message); });
  }

  source_session_->SetStateHandler([this, generation](const SourceStateEvent& ev) {
    Event event;
    event.kind = Event::Kind::kSourceState;
    event.generation = generation;
    event.source_event = ev;
    Post(std::move(event));
  });

  forwarding_.store(true, std::memory_order_release);
  if (source_config.capture_video) {
    source_session_->SetVideoFrameHandler(
        [this](const media::RawVideoFrame& frame) { ForwardVideo(frame); });
  }
  if (source_config.capture_audio) {
    source_session_->SetAudioChunkHandler(
        [this](const media::AudioChunk& chunk) { ForwardAudio(chunk); });
  }

  bool transport_started = true;
  if (transport_) {
    {
      std::lock_guard<std::mutex> lock(start_mutex_);
      starting_transport_ = transport_.get();
      start_abandoned_ = false;
    }
    transport_started = transport_->Start();
    bool abandoned = false;
    {
      std::lock_guard<std::mutex> lock(start_mutex_);
      starting_transport_ = nullptr;
      abandoned = start_abandoned_;
    }
    if (abandoned) {
      Logger::Info("[MediaSessionController] Start interrupted by Stop()");
      Teardown(State::kStopped, "");
      return false;
    }
  }
  if (!transport_started) {
    const std::string reason = config_.mode == config::SessionMode::kAudioGateway
                                   ? "Audio gateway connection failed"
                                   : "Broadcast session failed to start";
    Logger::Error("[MediaSessionController] " + reason);
    Teardown(State::kError, reason);
    return false;
  }

  next_stats_tick_ = Clock::now() + kStatsInterval;

  // The gateway socket is already open; video modes wait for the device.
  if (config_.mode == config::SessionMode::kAudioGateway) {
    Transition(State::kStreaming, "");
  }
  return true;
}

void MediaSessionController::HandleStop() {
  const State current = state();
  switch (current) {
    case State::kStarting:
    case State::kStreaming:
      Teardown(State::kStopped, "");
      return;
    case State::kError:
      Transition(State::kStopped, "");
      return;
    case State::kIdle:
    case State::kStopping:
    case State::kStopped: {
      std::lock_guard<std::mutex> lock(status_mutex_);
      ++ignored_stop_total_;
      return;
    }
  }
}

void MediaSessionController::HandleSourceState(const SourceStateEvent& event) {
  Logger::Debug(std::string("[MediaSessionController] Device state ") +
                SourceStateName(event.state));
  switch (event.state) {
    case SourceState::kStarting:
      break;
    case SourceState::kStreaming:
      if (state() == State::kStarting && config_.mode != config::SessionMode::kAudioGateway) {
        Transition(State::kStreaming, "");
      }
      break;
    case SourceState::kStopped:
      if (IsActive()) {
        Logger::Info("[MediaSessionController] Device stopped streaming, tearing down");
        {
          std::lock_guard<std::mutex> lock(status_mutex_);
          ++cascaded_stop_total_;
        }
        Teardown(State::kStopped, "Device stopped streaming");
      }
      break;
    case SourceState::kError:
      if (IsActive()) {
        const std::string reason = DescribeSourceError(event.error, event.detail);
        Logger::Error("[MediaSessionController] Device error: " + reason);
        Teardown(State::kError, reason);
      }
      break;
  }
}

void MediaSessionController::HandleTransportEvent(const transport::TransportEvent& event) {
  const char* kind = transport::TransportEventKindName(event.kind);
  switch (event.kind) {
    case transport::TransportEventKind::kError:
      if (IsActive()) {
        const std::string reason = event.message.empty() ? "Transport failed" : event.message;
        Logger::Error("[MediaSessionController] Transport error: " + reason);
        Teardown(State::kError, reason);
      }
      break;
    case transport::TransportEventKind::kConnected:
    case transport::TransportEventKind::kStreaming:
      Logger::Info(std::string("[MediaSessionController] Transport ") + kind +
                   (event.message.empty() ? "" : ": " + event.message));
      break;
    case transport::TransportEventKind::kConnecting:
    case transport::TransportEventKind::kClosed:
      Logger::Debug(std::string("[MediaSessionController] Transport ") + kind);
      break;
  }
}

void MediaSessionController::Teardown(State final_state, const std::string& message) {
  if (IsActive()) {
    Transition(State::kStopping, message);
  }
  // Events still queued for this session are stale from here on.
  ++generation_;

  std::chrono::milliseconds drain_timeout;
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    drain_timeout = forward_drain_timeout_;
  }

  // 1. Stop forwarding.
  forwarding_.store(false, std::memory_order_release);
  {
    std::unique_lock<std::timed_mutex> gate(forward_mutex_, std::defer_lock);
    if (!gate.try_lock_for(drain_timeout)) {
      Logger::Warn("[MediaSessionController] Frame still in flight after " +
                   std::to_string(drain_timeout.count()) + "ms, continuing teardown");
    }
  }
  if (source_session_) {
    source_session_->SetVideoFrameHandler(nullptr);
    source_session_->SetAudioChunkHandler(nullptr);
  }

  // 2. Stop the transport.
  if (transport_) {
    transport_->Stop();
    {
      // A forward that outlived the drain timeout has returned once Stop()
      // has closed the network side.
      std::lock_guard<std::timed_mutex> gate(forward_mutex_);
    }
    transport_.reset();
  }

  // 3. Close the device session.
  if (source_session_) {
    source_session_->Close();
    source_session_->SetStateHandler(nullptr);
    source_session_.reset();
  }

  preview_.reset();
  deadline_.reset();
  next_stats_tick_.reset();
  PublishStats(transport::StreamingStats{});

  Transition(final_state, message);
}

void MediaSessionController::Transition(State to, const std::string& message) {
  State from;
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    from = status_.state;
    status_.state = to;
    status_.message = message;
    transitions_[{from, to}]++;
    if (to == State::kError) ++error_total_;
  }

  std::ostringstream line;
  line << "[MediaSessionController] " << StateName(from) << " -> " << StateName(to);
  if (!message.empty()) line << " (" << message << ")";
  if (to == State::kError) {
    Logger::Error(line.str());
  } else {
    Logger::Info(line.str());
  }

  if (to == State::kStreaming && config_.time_limit.count() > 0) {
    deadline_ = Clock::now() + config_.time_limit;
  }

  StateCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = state_callback_;
  }
  if (callback) callback(Status{to, message});
}

bool MediaSessionController::IsActive() const {
  const State current = state();
  return current == State::kStarting || current == State::kStreaming;
}

// ======================================================================
// Capture-thread path
// ======================================================================

void MediaSessionController::ForwardVideo(const media::RawVideoFrame& frame) {
  if (!forwarding_.load(std::memory_order_acquire)) return;

  std::optional<std::vector<uint8_t>> jpeg;
  {
    std::lock_guard<std::timed_mutex> gate(forward_mutex_);
    if (!forwarding_.load(std::memory_order_acquire)) return;
    if (transport_) {
      transport_->ConsumeVideo(frame);
    }
    frames_forwarded_.fetch_add(1);
    if (preview_) {
      jpeg = EncodePreviewLocked(frame);
    }
  }

  if (jpeg) {
    PreviewCallback callback;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      callback = preview_callback_;
    }
    if (callback) callback(*jpeg, frame.width, frame.height);
  }
}

void MediaSessionController::ForwardAudio(const media::AudioChunk& chunk) {
  if (!forwarding_.load(std::memory_order_acquire)) return;

  std::lock_guard<std::timed_mutex> gate(forward_mutex_);
  if (!forwarding_.load(std::memory_order_acquire)) return;
  if (transport_) {
    transport_->ConsumeAudio(chunk);
  }
  chunks_forwarded_.fetch_add(1);
}

std::optional<std::vector<uint8_t>> MediaSessionController::EncodePreviewLocked(
    const media::RawVideoFrame& frame) {
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (!preview_callback_) return std::nullopt;
  }
  if (frame.data == nullptr ||
      !media::IsConvertibleI420(frame.width, frame.height, frame.size)) {
    ReportWarning("Preview skipped malformed frame " + std::to_string(frame.width) + "x" +
                  std::to_string(frame.height) + " (" + std::to_string(frame.size) + " bytes)");
    return std::nullopt;
  }

  const std::vector<uint8_t> nv21 =
      media::ConvertI420ToNV21(frame.data, frame.size, frame.width, frame.height);
  auto jpeg = preview_->EncodeNV21(nv21.data(), nv21.size(), frame.width, frame.height);
  if (!jpeg) {
    ReportWarning("Preview frame failed to encode");
  }
  return jpeg;
}

void MediaSessionController::ReportWarning(const std::string& message) {
  warning_total_.fetch_add(1);
  Logger::Warn("[MediaSessionController] " + message);
  Event event;
  event.kind = Event::Kind::kWarning;
  event.text = message;
  Post(std::move(event));
}

void MediaSessionController::PublishStats(const transport::StreamingStats& stats) {
  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    stats_ = stats;
  }
  StatsCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = stats_callback_;
  }
  if (callback) callback(stats);
}

}  // namespace lenscast::session
