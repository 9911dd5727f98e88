// Scriptable WebSocket client. Tests deliver gateway messages or connection
// failures through the recorder; sent frames are captured verbatim.

#ifndef LENSCAST_TESTS_FIXTURES_FAKE_WEBSOCKET_CLIENT_H_
#define LENSCAST_TESTS_FIXTURES_FAKE_WEBSOCKET_CLIENT_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "lenscast/transport/IWebSocketClient.hpp"

namespace lenscast::tests::fixtures {

struct WebSocketRecorder {
  std::atomic<bool> connect_result{true};
  std::atomic<bool> fail_sends{false};
  std::atomic<int> connects{0};
  std::atomic<int> closes{0};

  std::mutex mutex;
  std::condition_variable cv;
  // When set, Connect() blocks until Close() or its timeout, like a gateway
  // that accepts TCP and never answers the upgrade.
  bool hold_connect = false;
  bool connect_waiting = false;
  std::string last_url;
  std::chrono::milliseconds last_connect_timeout{0};
  std::vector<std::string> sent;
  lenscast::transport::WebSocketMessageHandler on_message;
  lenscast::transport::WebSocketFailureHandler on_failure;

  void DeliverMessage(const std::string& text) {
    lenscast::transport::WebSocketMessageHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex);
      handler = on_message;
    }
    if (handler) handler(text);
  }

  void DeliverFailure(const std::string& reason) {
    lenscast::transport::WebSocketFailureHandler handler;
    {
      std::lock_guard<std::mutex> lock(mutex);
      handler = on_failure;
    }
    if (handler) handler(reason);
  }

  bool WaitForConnectInFlight(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [this] { return connect_waiting; });
  }

  std::vector<std::string> Sent() {
    std::lock_guard<std::mutex> lock(mutex);
    return sent;
  }
};

class FakeWebSocketClient : public lenscast::transport::IWebSocketClient {
 public:
  explicit FakeWebSocketClient(std::shared_ptr<WebSocketRecorder> recorder) : recorder_(std::move(recorder)) {}

  bool Connect(const std::string& url, std::chrono::milliseconds timeout,
               std::string* error) override {
    recorder_->connects.fetch_add(1);
    {
      std::unique_lock<std::mutex> lock(recorder_->mutex);
      recorder_->last_url = url;
      recorder_->last_connect_timeout = timeout;
      if (recorder_->hold_connect) {
        recorder_->connect_waiting = true;
        recorder_->cv.notify_all();
        recorder_->cv.wait_for(lock, timeout, [this] { return closed_; });
        recorder_->connect_waiting = false;
        if (error) *error = closed_ ? "connection aborted" : "handshake timed out";
        return false;
      }
    }
    if (!recorder_->connect_result.load()) {
      if (error) *error = "connection refused";
      return false;
    }
    return true;
  }

  void StartReading(lenscast::transport::WebSocketMessageHandler on_message,
                    lenscast::transport::WebSocketFailureHandler on_failure) override {
    std::lock_guard<std::mutex> lock(recorder_->mutex);
    recorder_->on_message = std::move(on_message);
    recorder_->on_failure = std::move(on_failure);
  }

  bool SendText(const std::string& text, std::string* error) override {
    if (recorder_->fail_sends.load()) {
      if (error) *error = "broken pipe";
      return false;
    }
    std::lock_guard<std::mutex> lock(recorder_->mutex);
    recorder_->sent.push_back(text);
    return true;
  }

  void Close(std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(recorder_->mutex);
    if (closed_) return;
    closed_ = true;
    recorder_->closes.fetch_add(1);
    recorder_->cv.notify_all();
    recorder_->on_message = nullptr;
    recorder_->on_failure = nullptr;
  }

 private:
  std::shared_ptr<WebSocketRecorder> recorder_;
  bool closed_ = false;
};

}  // namespace lenscast::tests::fixtures

#endif  // LENSCAST_TESTS_FIXTURES_FAKE_WEBSOCKET_CLIENT_H_
