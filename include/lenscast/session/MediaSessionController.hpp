// Repository: Lenscast
// Component: MediaSessionController
// Purpose: Couples the wearable capture session to one network uplink with
//          ordered start and cascading teardown.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_SESSION_MEDIA_SESSION_CONTROLLER_HPP_
#define LENSCAST_SESSION_MEDIA_SESSION_CONTROLLER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "lenscast/config/PipelineConfig.hpp"
#include "lenscast/media/JpegPreviewEncoder.hpp"
#include "lenscast/session/IFrameSource.hpp"
#include "lenscast/transport/IMediaTransport.hpp"

namespace lenscast::session {

// MediaSessionController owns the session state machine:
//
//   Idle/Stopped/Error --Start()--> Starting --source streaming--> Streaming
//   Starting/Streaming --Stop(), source stopped, time limit--> Stopping --> Stopped
//   Starting/Streaming --source error, transport error--> Stopping --> Error
//
// Every transition runs on one internal loop thread. Source and transport
// callbacks are turned into events for that loop; they never touch state.
// Audio gateway sessions enter Streaming as soon as the socket is open.
//
// Teardown always runs in this order:
//   1. stop forwarding frames (and wait for an in-flight forward, bounded)
//   2. stop the transport
//   3. close the source session
// after which stats read zero.
class MediaSessionController {
 public:
  enum class State {
    kIdle = 0,
    kStarting = 1,
    kStreaming = 2,
    kStopping = 3,
    kStopped = 4,
    kError = 5,
  };

  struct Status {
    State state = State::kIdle;
    std::string message;  // Error reason, or why the session stopped
  };

  struct MetricsSnapshot {
    std::map<std::pair<State, State>, uint64_t> transitions;
    uint64_t ignored_start_total = 0;
    uint64_t ignored_stop_total = 0;
    uint64_t cascaded_stop_total = 0;
    uint64_t error_total = 0;
    uint64_t warning_total = 0;
    uint64_t frames_forwarded = 0;
    uint64_t chunks_forwarded = 0;
    State state = State::kIdle;
  };

  using TransportFactory = std::function<std::unique_ptr<transport::IMediaTransport>(
      const config::MediaSessionConfig& config)>;
  using StateCallback = std::function<void(const Status& status)>;
  using StatsCallback = std::function<void(const transport::StreamingStats& stats)>;
  using PreviewCallback =
      std::function<void(const std::vector<uint8_t>& jpeg, int width, int height)>;
  using WarningCallback = std::function<void(const std::string& message)>;

  // `source` must outlive the controller. A null transport factory uses
  // MakeDefaultTransport().
  MediaSessionController(IFrameSource& source, config::MediaSessionConfig config,
                         TransportFactory transport_factory = nullptr);
  ~MediaSessionController();

  MediaSessionController(const MediaSessionController&) = delete;
  MediaSessionController& operator=(const MediaSessionController&) = delete;

  // Returns true if a new session was started. Ignored (false) unless the
  // controller is Idle, Stopped or Error. Returns false if the session failed
  // to start; status() then carries the reason.
  bool Start();

  // No-op from Idle or Stopped. From Error, acknowledges the error and moves
  // to Stopped. Blocks until teardown has finished. A Start() still waiting
  // on the transport is cut short and the session ends in Stopped.
  void Stop();

  [[nodiscard]] State state() const;
  [[nodiscard]] Status status() const;
  [[nodiscard]] transport::StreamingStats GetStats() const;
  [[nodiscard]] MetricsSnapshot Snapshot() const;

  // State, stats and warning callbacks run on the controller loop and may call
  // Start()/Stop(). The preview callback runs on the capture thread. Set them
  // before Start().
  void SetStateCallback(StateCallback callback);
  void SetStatsCallback(StatsCallback callback);
  void SetPreviewCallback(PreviewCallback callback);
  void SetWarningCallback(WarningCallback callback);

  // Upper bound on waiting for an in-flight frame forward during teardown.
  void SetForwardDrainTimeout(std::chrono::milliseconds timeout);

  static const char* StateName(State state);

 private:
  struct Event {
    enum class Kind { kStart, kStop, kSourceState, kTransport, kWarning, kShutdown };
    Kind kind = Kind::kStop;
    uint64_t generation = 0;
    SourceStateEvent source_event;
    transport::TransportEvent transport_event{transport::TransportEventKind::kClosed, ""};
    std::string text;
    std::shared_ptr<std::promise<bool>> done;
  };

  using Clock = std::chrono::steady_clock;

  bool Submit(Event::Kind kind);
  void Post(Event event);
  void ControlLoop();
  bool Dispatch(const Event& event);

  bool HandleStart();
  void HandleStop();
  void HandleSourceState(const SourceStateEvent& event);
  void HandleTransportEvent(const transport::TransportEvent& event);
  void HandleTimers();

  // Runs the three-step teardown and settles in `final_state`.
  void Teardown(State final_state, const std::string& message);
  void Transition(State to, const std::string& message);
  bool IsActive() const;

  void ForwardVideo(const media::RawVideoFrame& frame);
  void ForwardAudio(const media::AudioChunk& chunk);
  std::optional<std::vector<uint8_t>> EncodePreviewLocked(const media::RawVideoFrame& frame);
  void ReportWarning(const std::string& message);
  void PublishStats(const transport::StreamingStats& stats);

  IFrameSource& source_;
  const config::MediaSessionConfig config_;
  TransportFactory transport_factory_;

  // Loop-thread state.
  std::unique_ptr<ISourceSession> source_session_;
  std::unique_ptr<transport::IMediaTransport> transport_;
  std::unique_ptr<media::JpegPreviewEncoder> preview_;
  std::optional<Clock::time_point> deadline_;
  std::optional<Clock::time_point> next_stats_tick_;
  std::atomic<uint64_t> generation_{0};

  // The transport whose Start() the loop is blocked in, for Stop() callers.
  std::mutex start_mutex_;
  transport::IMediaTransport* starting_transport_ = nullptr;
  bool start_abandoned_ = false;

  // Forwarding gate shared with capture threads.
  std::atomic<bool> forwarding_{false};
  std::timed_mutex forward_mutex_;

  mutable std::mutex status_mutex_;
  Status status_;
  std::chrono::milliseconds forward_drain_timeout_{500};
  std::map<std::pair<State, State>, uint64_t> transitions_;
  uint64_t ignored_start_total_ = 0;
  uint64_t ignored_stop_total_ = 0;
  uint64_t cascaded_stop_total_ = 0;
  uint64_t error_total_ = 0;
  transport::StreamingStats stats_;

  std::atomic<uint64_t> warning_total_{0};
  std::atomic<uint64_t> frames_forwarded_{0};
  std::atomic<uint64_t> chunks_forwarded_{0};

  std::mutex callback_mutex_;
  StateCallback state_callback_;
  StatsCallback stats_callback_;
  PreviewCallback preview_callback_;
  WarningCallback warning_callback_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<Event> queue_;
  std::thread loop_thread_;
};

}  // namespace lenscast::session

#endif  // LENSCAST_SESSION_MEDIA_SESSION_CONTROLLER_HPP_
