// Repository: Lenscast
// Component: Thread-Safe Logger
// Purpose: Line logger shared by the capture callback, controller loop and network threads.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_UTIL_LOGGER_HPP_
#define LENSCAST_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>
#include <utility>

namespace lenscast::util {

// A capture session logs from at least four threads at once: the device's
// frame callback, the MediaSessionController loop, the WebSocket network
// thread and the RTMP publish worker. Each line is written and flushed whole
// while holding one mutex.
//
// Lines carry a "[Component]" prefix chosen by the caller. kInfo and kDebug
// go to stdout, kWarn and kError to stderr. kDebug is discarded unless
// LENSCAST_DEBUG is set in the environment.
class Logger {
 public:
  enum class Level { kDebug, kInfo, kWarn, kError };

  using Sink = std::function<void(const std::string&)>;

  static void Debug(const std::string& line) { Emit(Level::kDebug, line); }
  static void Info(const std::string& line) { Emit(Level::kInfo, line); }
  static void Warn(const std::string& line) { Emit(Level::kWarn, line); }
  static void Error(const std::string& line) { Emit(Level::kError, line); }

  // Lets callers skip building expensive debug text.
  static bool DebugEnabled();

  // Tests observe lines of one level through a sink; the line is still
  // written to its stream. nullptr removes the sink.
  static void SetSink(Level level, Sink sink);
  static void SetErrorSink(Sink sink) { SetSink(Level::kError, std::move(sink)); }
  static void SetWarnSink(Sink sink) { SetSink(Level::kWarn, std::move(sink)); }
  static void SetInfoSink(Sink sink) { SetSink(Level::kInfo, std::move(sink)); }

 private:
  static void Emit(Level level, const std::string& line);

  static std::mutex mutex_;
  static Sink sinks_[4];
};

}  // namespace lenscast::util

#endif  // LENSCAST_UTIL_LOGGER_HPP_
