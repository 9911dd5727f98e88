// Repository: Lenscast
// Component: SourceError
// Purpose: Failure taxonomy reported by the wearable capture session.
// Copyright (c) 2025 Lenscast

#include "lenscast/session/SourceError.hpp"

namespace lenscast::session {

const char* SourceErrorName(SourceError error) {
  switch (error) {
    case SourceError::kNone: return "none";
    case SourceError::kInternal: return "internal";
    case SourceError::kDeviceNotFound: return "device_not_found";
    case SourceError::kDeviceNotConnected: return "device_not_connected";
    case SourceError::kTimeout: return "timeout";
    case SourceError::kVideoStreaming: return "video_streaming";
    case SourceError::kAudioStreaming: return "audio_streaming";
    case SourceError::kPermissionDenied: return "permission_denied";
    case SourceError::kUnknown: return "unknown";
  }
  return "unknown";
}

std::string DescribeSourceError(SourceError error, const std::string& detail) {
  std::string text;
  switch (error) {
    case SourceError::kNone:
      text = "No error.";
      break;
    case SourceError::kInternal:
      text = "An internal error occurred. Please try again.";
      break;
    case SourceError::kDeviceNotFound:
      text = "Device not found. Please ensure your device is connected.";
      break;
    case SourceError::kDeviceNotConnected:
      text = "Device not connected. Please check your connection and try again.";
      break;
    case SourceError::kTimeout:
      text = "The operation timed out. Please try again.";
      break;
    case SourceError::kVideoStreaming:
      text = "Video streaming failed. Please try again.";
      break;
    case SourceError::kAudioStreaming:
      text = "Audio streaming failed. Please try again.";
      break;
    case SourceError::kPermissionDenied:
      text = "Camera permission denied. Please grant permission in Settings.";
      break;
    case SourceError::kUnknown:
      text = "An unknown streaming error occurred.";
      break;
  }
  if (!detail.empty()) {
    text += " (" + detail + ")";
  }
  return text;
}

}  // namespace lenscast::session
