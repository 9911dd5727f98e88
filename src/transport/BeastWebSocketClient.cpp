// Repository: Lenscast
// Component: BeastWebSocketClient
// Purpose: Boost.Beast ws:// and wss:// client for the audio gateway.
// Copyright (c) 2025 Lenscast

#include "lenscast/transport/BeastWebSocketClient.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <thread>
#include <type_traits>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include "lenscast/util/Logger.hpp"

namespace lenscast::transport {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;
using util::Logger;

namespace {

// Frames waiting for the network. Beyond this the gateway is not keeping up.
constexpr size_t kMaxQueuedFrames = 256;

using Strand = net::strand<net::io_context::executor_type>;
using PlainStream = websocket::stream<beast::tcp_stream>;
using TlsStream = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

void SetError(std::string* error, const std::string& message) {
  if (error) *error = message;
}

struct Handlers {
  std::mutex mutex;
  WebSocketMessageHandler on_message;
  WebSocketFailureHandler on_failure;
};

// Empty on success, otherwise the reason the opening handshake failed.
using OpenHandler = std::function<void(const std::string& error)>;
using CloseHandler = std::function<void()>;

class Session {
 public:
  virtual ~Session() = default;

  virtual void Open(WebSocketEndpoint endpoint, std::chrono::milliseconds timeout,
                    OpenHandler done) = 0;
  virtual void Read() = 0;
  virtual void Write(std::string text) = 0;
  virtual void CloseGracefully(CloseHandler done) = 0;
  // Cancels whatever is pending and closes the socket.
  virtual void Abort() = 0;

  virtual size_t queued() const = 0;
};

// Every member below is touched only from handlers running on strand_; the
// public entry points post onto it.
template <class Ws>
class StreamSession : public Session,
                      public std::enable_shared_from_this<StreamSession<Ws>> {
 public:
  static constexpr bool kSecure = std::is_same<Ws, TlsStream>::value;

  template <class... Args>
  StreamSession(Strand strand, std::shared_ptr<Handlers> handlers, Args&&... args)
      : strand_(strand),
        handlers_(std::move(handlers)),
        resolver_(strand),
        ws_(strand, std::forward<Args>(args)...) {}

  void Open(WebSocketEndpoint endpoint, std::chrono::milliseconds timeout,
            OpenHandler done) override {
    net::post(strand_, [self = this->shared_from_this(), endpoint = std::move(endpoint),
                        timeout, done = std::move(done)]() mutable {
      self->endpoint_ = std::move(endpoint);
      self->timeout_ = timeout;
      self->open_done_ = std::move(done);
      if (self->aborted_) {
        self->FinishOpen("connection aborted");
        return;
      }
      self->resolver_.async_resolve(
          self->endpoint_.host, self->endpoint_.port,
          [self](beast::error_code ec, tcp::resolver::results_type results) {
            self->OnResolve(ec, std::move(results));
          });
    });
  }

  void Read() override {
    net::post(strand_, [self = this->shared_from_this()] { self->DoRead(); });
  }

  void Write(std::string text) override {
    queued_.fetch_add(1);
    net::post(strand_, [self = this->shared_from_this(), text = std::move(text)]() mutable {
      if (self->closing_ || self->aborted_) {
        self->queued_.fetch_sub(1);
        return;
      }
      self->outbox_.push_back(std::move(text));
      if (self->outbox_.size() == 1) self->DoWrite();
    });
  }

  void CloseGracefully(CloseHandler done) override {
    net::post(strand_, [self = this->shared_from_this(), done = std::move(done)]() mutable {
      self->close_done_ = std::move(done);
      self->closing_ = true;
      if (self->aborted_) {
        self->FinishClose();
      } else if (self->outbox_.empty()) {
        self->DoClose();
      }
      // Otherwise OnWrite starts the close once the outbox drains.
    });
  }

  void Abort() override {
    net::post(strand_, [self = this->shared_from_this()] {
      if (self->aborted_) return;
      self->aborted_ = true;
      self->resolver_.cancel();
      beast::get_lowest_layer(self->ws_).close();
      // A write in flight still owns outbox_.front(); OnWrite clears the rest.
      self->FinishOpen("connection aborted");
      self->FinishClose();
    });
  }

  size_t queued() const override { return queued_.load(); }

 private:
  void OnResolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (aborted_) return FinishOpen("connection aborted");
    if (ec) return FinishOpen("resolve " + endpoint_.host + " failed: " + ec.message());

    if constexpr (kSecure) {
      if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), endpoint_.host.c_str())) {
        ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return FinishOpen("failed to set SNI host name: " + ec.message());
      }
      ws_.next_layer().set_verify_callback(ssl::host_name_verification(endpoint_.host));
    }

    beast::get_lowest_layer(ws_).expires_after(timeout_);
    beast::get_lowest_layer(ws_).async_connect(
        results, [self = this->shared_from_this()](beast::error_code ec,
                                                   const tcp::endpoint&) {
          self->OnConnect(ec);
        });
  }

  void OnConnect(beast::error_code ec) {
    if (aborted_) return FinishOpen("connection aborted");
    if (ec) return FinishOpen("connect " + endpoint_.host + " failed: " + ec.message());

    if constexpr (kSecure) {
      beast::get_lowest_layer(ws_).expires_after(timeout_);
      ws_.next_layer().async_handshake(
          ssl::stream_base::client, [self = this->shared_from_this()](beast::error_code ec) {
            if (self->aborted_) return self->FinishOpen("connection aborted");
            if (ec) return self->FinishOpen("tls handshake failed: " + ec.message());
            self->Upgrade();
          });
    } else {
      Upgrade();
    }
  }

  void Upgrade() {
    // The websocket layer applies its own timeouts from here on.
    beast::get_lowest_layer(ws_).expires_never();
    auto timeouts = websocket::stream_base::timeout::suggested(beast::role_type::client);
    timeouts.handshake_timeout = timeout_;
    ws_.set_option(timeouts);
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
      req.set(beast::http::field::user_agent, "lenscast-audio-uplink");
    }));
    ws_.async_handshake(endpoint_.host + ":" + endpoint_.port, endpoint_.target,
                        [self = this->shared_from_this()](beast::error_code ec) {
                          if (self->aborted_) return self->FinishOpen("connection aborted");
                          if (ec) {
                            return self->FinishOpen("websocket handshake failed: " +
                                                    ec.message());
                          }
                          self->ws_.text(true);
                          self->FinishOpen("");
                        });
  }

  void DoRead() {
    if (aborted_ || reading_) return;
    reading_ = true;
    ws_.async_read(buffer_, [self = this->shared_from_this()](beast::error_code ec, size_t) {
      self->OnRead(ec);
    });
  }

  void OnRead(beast::error_code ec) {
    reading_ = false;
    if (ec) {
      if (!closing_ && !aborted_) {
        ReportFailure("websocket read failed: " + ec.message());
      }
      return;
    }
    WebSocketMessageHandler handler;
    {
      std::lock_guard<std::mutex> lock(handlers_->mutex);
      handler = handlers_->on_message;
    }
    if (handler) handler(beast::buffers_to_string(buffer_.data()));
    buffer_.consume(buffer_.size());
    DoRead();
  }

  void DoWrite() {
    ws_.async_write(net::buffer(outbox_.front()),
                    [self = this->shared_from_this()](beast::error_code ec, size_t) {
                      self->OnWrite(ec);
                    });
  }

  void OnWrite(beast::error_code ec) {
    if (!outbox_.empty()) {
      outbox_.pop_front();
      queued_.fetch_sub(1);
    }
    if (ec) {
      queued_.fetch_sub(outbox_.size());
      outbox_.clear();
      if (!closing_ && !aborted_) {
        ReportFailure("websocket write failed: " + ec.message());
      }
      if (closing_) FinishClose();
      return;
    }
    if (!outbox_.empty()) {
      DoWrite();
    } else if (closing_ && !aborted_) {
      DoClose();
    }
  }

  void DoClose() {
    ws_.async_close(websocket::close_code::normal,
                    [self = this->shared_from_this()](beast::error_code ec) {
                      if (ec && !self->aborted_) {
                        Logger::Debug("[BeastWebSocketClient] close handshake: " + ec.message());
                      }
                      self->FinishClose();
                    });
  }

  void ReportFailure(const std::string& reason) {
    if (failed_) return;
    failed_ = true;
    WebSocketFailureHandler handler;
    {
      std::lock_guard<std::mutex> lock(handlers_->mutex);
      handler = handlers_->on_failure;
    }
    if (handler) handler(reason);
  }

  void FinishOpen(const std::string& error) {
    if (!open_done_) return;
    auto done = std::move(open_done_);
    open_done_ = nullptr;
    done(error);
  }

  void FinishClose() {
    if (!close_done_) return;
    auto done = std::move(close_done_);
    close_done_ = nullptr;
    done();
  }

  Strand strand_;
  std::shared_ptr<Handlers> handlers_;
  tcp::resolver resolver_;
  Ws ws_;
  beast::flat_buffer buffer_;

  WebSocketEndpoint endpoint_;
  std::chrono::milliseconds timeout_{0};
  OpenHandler open_done_;
  CloseHandler close_done_;

  std::deque<std::string> outbox_;
  std::atomic<size_t> queued_{0};
  bool reading_ = false;
  bool closing_ = false;
  bool aborted_ = false;
  bool failed_ = false;
};

}  // namespace

std::optional<WebSocketEndpoint> ParseWebSocketUrl(const std::string& url) {
  std::string lower = url;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  WebSocketEndpoint endpoint;
  std::string rest;
  if (lower.rfind("wss://", 0) == 0) {
    endpoint.secure = true;
    rest = url.substr(6);
  } else if (lower.rfind("ws://", 0) == 0) {
    rest = url.substr(5);
  } else {
    return std::nullopt;
  }

  const size_t target_pos = rest.find_first_of("/?");
  std::string authority = rest.substr(0, target_pos);
  endpoint.target = target_pos == std::string::npos ? "/" : rest.substr(target_pos);
  if (!endpoint.target.empty() && endpoint.target[0] == '?') {
    endpoint.target = "/" + endpoint.target;
  }

  const size_t bracket = authority.find(']');
  const size_t colon = authority.rfind(':');
  if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
    endpoint.port = authority.substr(colon + 1);
    authority = authority.substr(0, colon);
  } else {
    endpoint.port = endpoint.secure ? "443" : "80";
  }
  if (authority.size() >= 2 && authority.front() == '[' && authority.back() == ']') {
    authority = authority.substr(1, authority.size() - 2);
  }
  if (authority.empty() || endpoint.port.empty()) {
    return std::nullopt;
  }
  endpoint.host = authority;
  return endpoint;
}

struct BeastWebSocketClient::Impl {
  ssl::context ssl_ctx{ssl::context::tls_client};

  // Pending handlers keep sessions alive, so ioc is destroyed after the
  // session members below and before ssl_ctx.
  net::io_context ioc;
  std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
  std::thread io_thread;
  std::mutex thread_mutex;

  std::shared_ptr<Handlers> handlers = std::make_shared<Handlers>();

  // Guards session, open and closed.
  std::mutex mutex;
  std::shared_ptr<Session> session;
  bool open = false;
  bool closed = false;
};

BeastWebSocketClient::BeastWebSocketClient() : impl_(std::make_unique<Impl>()) {}

BeastWebSocketClient::~BeastWebSocketClient() {
  Close(std::chrono::milliseconds(200));
  StopNetworkThread();
}

bool BeastWebSocketClient::Connect(const std::string& url, std::chrono::milliseconds timeout,
                                   std::string* error) {
  auto endpoint = ParseWebSocketUrl(url);
  if (!endpoint) {
    SetError(error, "invalid websocket url");
    return false;
  }

  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->closed) {
      SetError(error, "client closed");
      return false;
    }
    if (impl_->session) {
      SetError(error, "already connected");
      return false;
    }

    Strand strand = net::make_strand(impl_->ioc);
    if (endpoint->secure) {
      beast::error_code ec;
      impl_->ssl_ctx.set_default_verify_paths(ec);
      if (ec) {
        Logger::Warn("[BeastWebSocketClient] no default trust store: " + ec.message());
      }
      impl_->ssl_ctx.set_verify_mode(ssl::verify_peer);
      session = std::make_shared<StreamSession<TlsStream>>(strand, impl_->handlers,
                                                           impl_->ssl_ctx);
    } else {
      session = std::make_shared<StreamSession<PlainStream>>(strand, impl_->handlers);
    }
    impl_->session = session;
  }

  {
    std::lock_guard<std::mutex> lock(impl_->thread_mutex);
    if (!impl_->io_thread.joinable()) {
      impl_->work.emplace(impl_->ioc.get_executor());
      impl_->io_thread = std::thread([this] { impl_->ioc.run(); });
    }
  }

  auto opened = std::make_shared<std::promise<std::string>>();
  std::future<std::string> result = opened->get_future();
  session->Open(*endpoint, timeout,
                [opened](const std::string& reason) { opened->set_value(reason); });

  std::string failure;
  if (result.wait_for(timeout) != std::future_status::ready) {
    session->Abort();
    result.wait();
    failure = "connect " + endpoint->host + " timed out after " +
              std::to_string(timeout.count()) + "ms";
  } else {
    failure = result.get();
  }

  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (failure.empty() && impl_->closed) {
      failure = "connection aborted";
    }
    if (failure.empty()) {
      impl_->open = true;
    }
  }
  if (!failure.empty()) {
    session->Abort();
    StopNetworkThread();
    SetError(error, failure);
    return false;
  }

  Logger::Debug("[BeastWebSocketClient] connected to " + endpoint->host + ":" + endpoint->port);
  return true;
}

void BeastWebSocketClient::StartReading(WebSocketMessageHandler on_message,
                                        WebSocketFailureHandler on_failure) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->open || impl_->closed) return;
    session = impl_->session;
  }
  {
    std::lock_guard<std::mutex> lock(impl_->handlers->mutex);
    impl_->handlers->on_message = std::move(on_message);
    impl_->handlers->on_failure = std::move(on_failure);
  }
  session->Read();
}

bool BeastWebSocketClient::SendText(const std::string& text, std::string* error) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->open || impl_->closed) {
      SetError(error, "websocket not open");
      return false;
    }
    session = impl_->session;
  }
  if (session->queued() >= kMaxQueuedFrames) {
    SetError(error, "write queue full");
    return false;
  }
  session->Write(text);
  return true;
}

void BeastWebSocketClient::Close(std::chrono::milliseconds timeout) {
  std::shared_ptr<Session> session;
  bool was_open = false;
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->closed) return;
    impl_->closed = true;
    session = impl_->session;
    was_open = impl_->open;
    impl_->open = false;
  }
  {
    std::lock_guard<std::mutex> lock(impl_->handlers->mutex);
    impl_->handlers->on_message = nullptr;
    impl_->handlers->on_failure = nullptr;
  }
  if (!session) return;
  if (!was_open) {
    // Connect() is still in flight; it observes the abort and cleans up.
    session->Abort();
    return;
  }

  auto closed = std::make_shared<std::promise<void>>();
  std::future<void> finished = closed->get_future();
  session->CloseGracefully([closed] { closed->set_value(); });
  if (finished.wait_for(timeout) != std::future_status::ready) {
    Logger::Warn("[BeastWebSocketClient] close handshake timed out; forcing shutdown");
    session->Abort();
  }
  StopNetworkThread();
}

void BeastWebSocketClient::StopNetworkThread() {
  std::lock_guard<std::mutex> lock(impl_->thread_mutex);
  impl_->work.reset();
  impl_->ioc.stop();
  if (impl_->io_thread.joinable()) {
    impl_->io_thread.join();
  }
}

}  // namespace lenscast::transport
