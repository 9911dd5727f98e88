// Repository: Lenscast
// Component: IWebSocketClient Interface
// Purpose: Minimal text-message WebSocket client used by the audio uplink.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_TRANSPORT_IWEBSOCKET_CLIENT_HPP_
#define LENSCAST_TRANSPORT_IWEBSOCKET_CLIENT_HPP_

#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace lenscast::transport {

using WebSocketMessageHandler = std::function<void(const std::string& text)>;
// Invoked once if the connection fails while open. Not invoked for Close().
using WebSocketFailureHandler = std::function<void(const std::string& reason)>;

// One WebSocket connection. Single use: after Close() the client cannot
// connect again.
class IWebSocketClient {
 public:
  virtual ~IWebSocketClient() = default;

  // Resolves, connects and performs the opening handshake. Each stage is
  // bounded by `timeout`. A Close() from another thread makes a pending
  // Connect() return false promptly.
  virtual bool Connect(const std::string& url, std::chrono::milliseconds timeout,
                       std::string* error) = 0;

  // Starts receiving. Handlers run on the client's network thread.
  virtual void StartReading(WebSocketMessageHandler on_message,
                            WebSocketFailureHandler on_failure) = 0;

  // Queues one text frame and returns without waiting for the network. A
  // write that later fails is reported through the failure handler.
  virtual bool SendText(const std::string& text, std::string* error) = 0;

  // Flushes queued frames, sends a close frame and waits up to `timeout` for
  // the handshake, then shuts the socket down hard. Idempotent.
  virtual void Close(std::chrono::milliseconds timeout) = 0;
};

using WebSocketClientFactory = std::function<std::unique_ptr<IWebSocketClient>()>;

}  // namespace lenscast::transport

#endif  // LENSCAST_TRANSPORT_IWEBSOCKET_CLIENT_HPP_
