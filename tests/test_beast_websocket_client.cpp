// Repository: Lenscast
// Component: BeastWebSocketClient Unit Tests
// Purpose: URL parsing, bounded connect, and loopback send/read/close.
// Copyright (c) 2025 Lenscast

#include "lenscast/transport/BeastWebSocketClient.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

using namespace lenscast::transport;
using namespace std::chrono_literals;

namespace {

// Listens on loopback and never accepts. The kernel still completes the TCP
// handshake from the backlog, so clients connect and then hear nothing.
class SilentGateway {
 public:
  SilentGateway()
      : acceptor_(ioc_, boost::asio::ip::tcp::endpoint(
                            boost::asio::ip::address_v4::loopback(), 0)) {}

  std::string Url() const {
    return "ws://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) +
           "/audio?token=x";
  }

 private:
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
};

// Accepts one client, pings it, sends one text message, then records every
// frame until the client closes.
class LoopbackGateway {
 public:
  LoopbackGateway()
      : acceptor_(ioc_, boost::asio::ip::tcp::endpoint(
                            boost::asio::ip::address_v4::loopback(), 0)),
        thread_([this] { Serve(); }) {}

  ~LoopbackGateway() {
    if (!accepted_.load()) {
      // Wakes the blocking accept; the handshake then fails on EOF.
      boost::system::error_code ec;
      boost::asio::ip::tcp::socket kick(ioc_);
      kick.connect(acceptor_.local_endpoint(), ec);
    }
    Join();
  }

  std::string Url() const {
    return "ws://127.0.0.1:" + std::to_string(acceptor_.local_endpoint().port()) + "/audio";
  }

  void Join() {
    if (thread_.joinable()) thread_.join();
  }

  std::vector<std::string> Received() {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

  bool closed_by_client() const { return closed_by_client_.load(); }

 private:
  void Serve() {
    namespace websocket = boost::beast::websocket;
    boost::beast::error_code ec;
    boost::asio::ip::tcp::socket socket(ioc_);
    acceptor_.accept(socket, ec);
    accepted_.store(true);
    if (ec) return;

    websocket::stream<boost::asio::ip::tcp::socket> ws(std::move(socket));
    ws.accept(ec);
    if (ec) return;
    ws.ping({}, ec);
    ws.text(true);
    ws.write(boost::asio::buffer(std::string(R"({"type":"ready"})")), ec);

    for (;;) {
      boost::beast::flat_buffer buffer;
      ws.read(buffer, ec);
      if (ec) break;
      std::lock_guard<std::mutex> lock(mutex_);
      received_.push_back(boost::beast::buffers_to_string(buffer.data()));
    }
    closed_by_client_.store(ec == websocket::error::closed);
  }

  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::atomic<bool> accepted_{false};
  std::atomic<bool> closed_by_client_{false};
  std::mutex mutex_;
  std::vector<std::string> received_;
  std::thread thread_;
};

}  // namespace

TEST(BeastWebSocketClientTest, ParsesSchemesPortsAndTargets)
{
  auto ep = ParseWebSocketUrl("wss://gw.example.com/audio?token=abc");
  ASSERT_TRUE(ep.has_value());
  EXPECT_TRUE(ep->secure);
  EXPECT_EQ(ep->host, "gw.example.com");
  EXPECT_EQ(ep->port, "443");
  EXPECT_EQ(ep->target, "/audio?token=abc");

  ep = ParseWebSocketUrl("ws://[::1]:9000?token=abc");
  ASSERT_TRUE(ep.has_value());
  EXPECT_FALSE(ep->secure);
  EXPECT_EQ(ep->host, "::1");
  EXPECT_EQ(ep->port, "9000");
  EXPECT_EQ(ep->target, "/?token=abc");

  EXPECT_FALSE(ParseWebSocketUrl("http://gw.example.com").has_value());
  EXPECT_FALSE(ParseWebSocketUrl("ws://:80/").has_value());
}

TEST(BeastWebSocketClientTest, ConnectGivesUpWhenUpgradeIsNeverAnswered)
{
  SilentGateway gateway;
  BeastWebSocketClient client;

  std::string error;
  const auto begin = std::chrono::steady_clock::now();
  EXPECT_FALSE(client.Connect(gateway.Url(), 300ms, &error));
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, 2s);
  EXPECT_FALSE(error.empty());
}

TEST(BeastWebSocketClientTest, CloseFromAnotherThreadAbortsPendingConnect)
{
  SilentGateway gateway;
  BeastWebSocketClient client;

  std::atomic<bool> connected{true};
  std::string error;
  std::thread connector([&] { connected = client.Connect(gateway.Url(), 30s, &error); });
  std::this_thread::sleep_for(200ms);

  const auto begin = std::chrono::steady_clock::now();
  client.Close(200ms);
  connector.join();
  const auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, 1s);
  EXPECT_FALSE(connected.load());

  // A closed client stays closed.
  EXPECT_FALSE(client.Connect(gateway.Url(), 300ms, &error));
  EXPECT_EQ(error, "client closed");
  EXPECT_FALSE(client.SendText("{}", &error));
}

TEST(BeastWebSocketClientTest, SendsFromCallerThreadWhileReadingAndFlushesBeforeClose)
{
  LoopbackGateway gateway;
  BeastWebSocketClient client;

  std::string error;
  ASSERT_TRUE(client.Connect(gateway.Url(), 2s, &error)) << error;

  std::atomic<int> inbound{0};
  std::atomic<int> failures{0};
  client.StartReading([&](const std::string&) { inbound.fetch_add(1); },
                      [&](const std::string&) { failures.fetch_add(1); });

  // The gateway's ping is answered on the network thread while these queue.
  for (int i = 0; i < 200; ++i) {
    ASSERT_TRUE(client.SendText(R"({"i":)" + std::to_string(i) + "}", &error)) << error;
  }

  const auto deadline = std::chrono::steady_clock::now() + 2s;
  while (inbound.load() == 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_EQ(inbound.load(), 1);

  client.Close(2000ms);
  gateway.Join();

  const auto received = gateway.Received();
  ASSERT_EQ(received.size(), 200u);
  EXPECT_EQ(received.front(), R"({"i":0})");
  EXPECT_EQ(received.back(), R"({"i":199})");
  EXPECT_TRUE(gateway.closed_by_client());
  EXPECT_EQ(failures.load(), 0);
}
