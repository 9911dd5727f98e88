// Repository: Lenscast
// Component: SourceError
// Purpose: Failure taxonomy reported by the wearable capture session.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_SESSION_SOURCE_ERROR_HPP_
#define LENSCAST_SESSION_SOURCE_ERROR_HPP_

#include <string>

namespace lenscast::session {

enum class SourceError {
  kNone,
  kInternal,
  kDeviceNotFound,
  kDeviceNotConnected,
  kTimeout,
  kVideoStreaming,
  kAudioStreaming,
  kPermissionDenied,
  kUnknown,
};

const char* SourceErrorName(SourceError error);

// User-facing sentence for the error; `detail` is appended in parentheses
// when non-empty.
std::string DescribeSourceError(SourceError error, const std::string& detail = "");

}  // namespace lenscast::session

#endif  // LENSCAST_SESSION_SOURCE_ERROR_HPP_
