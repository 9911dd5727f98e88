// Repository: Lenscast
// Component: Thread-Safe Logger
// Purpose: Line logger shared by the capture callback, controller loop and network threads.
// Copyright (c) 2025 Lenscast

#include "lenscast/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace lenscast::util {

std::mutex Logger::mutex_;
Logger::Sink Logger::sinks_[4];

bool Logger::DebugEnabled() {
  return std::getenv("LENSCAST_DEBUG") != nullptr;
}

void Logger::SetSink(Level level, Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_[static_cast<int>(level)] = std::move(sink);
}

void Logger::Emit(Level level, const std::string& line) {
  if (level == Level::kDebug && !DebugEnabled()) return;

  std::ostream& out = level >= Level::kWarn ? std::cerr : std::cout;
  std::lock_guard<std::mutex> lock(mutex_);
  if (const Sink& sink = sinks_[static_cast<int>(level)]) {
    sink(line);
  }
  out << line << '\n';
  out.flush();
}

}  // namespace lenscast::util
