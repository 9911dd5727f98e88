// Repository: Lenscast
// Component: BeastWebSocketClient
// Purpose: Boost.Beast ws:// and wss:// client for the audio gateway.
// Copyright (c) 2025 Lenscast

#ifndef LENSCAST_TRANSPORT_BEAST_WEBSOCKET_CLIENT_HPP_
#define LENSCAST_TRANSPORT_BEAST_WEBSOCKET_CLIENT_HPP_

#include <memory>
#include <optional>
#include <string>

#include "lenscast/transport/IWebSocketClient.hpp"

namespace lenscast::transport {

struct WebSocketEndpoint {
  bool secure = false;
  std::string host;
  std::string port;
  std::string target;  // Path plus query, at least "/".
};

// Splits ws[s]://host[:port][/path][?query]. Returns std::nullopt for other
// schemes or an empty host.
std::optional<WebSocketEndpoint> ParseWebSocketUrl(const std::string& url);

// Asynchronous Beast client. One io_context thread runs every read, write and
// close operation on a strand, so the stream and its SSL state are only ever
// touched from that thread. Outgoing frames wait in a bounded queue.
// TLS uses the system trust store with hostname verification and SNI.
class BeastWebSocketClient : public IWebSocketClient {
 public:
  BeastWebSocketClient();
  ~BeastWebSocketClient() override;

  BeastWebSocketClient(const BeastWebSocketClient&) = delete;
  BeastWebSocketClient& operator=(const BeastWebSocketClient&) = delete;

  bool Connect(const std::string& url, std::chrono::milliseconds timeout,
               std::string* error) override;
  void StartReading(WebSocketMessageHandler on_message,
                    WebSocketFailureHandler on_failure) override;
  bool SendText(const std::string& text, std::string* error) override;
  void Close(std::chrono::milliseconds timeout) override;

 private:
  struct Impl;

  void StopNetworkThread();

  std::unique_ptr<Impl> impl_;
};

}  // namespace lenscast::transport

#endif  // LENSCAST_TRANSPORT_BEAST_WEBSOCKET_CLIENT_HPP_
