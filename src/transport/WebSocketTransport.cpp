#include "sockjs/transport/WebSocketTransport.hpp"
#include "sockjs/server/WebSocketServer.hpp"
#include "sockjs/util/Logger.hpp"
#include "sockjs/util/Metrics.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>

#include <chrono>
#include <vector>

namespace sockjs {

namespace websocket = boost::beast::websocket;
namespace beast     = boost::beast;
namespace http      = boost::beast::http;

using util::LogLevel;
using util::logger;
using namespace std::chrono_literals;

std::optional<SessionId> sessionIdFromTarget(std::string_view target) {
  const auto q = target.find('?');
  if (q != std::string_view::npos) target = target.substr(0, q);

  std::vector<std::string_view> segs;
  std::size_t pos = 0;
  while (pos <= target.size()) {
    auto next = target.find('/', pos);
    if (next == std::string_view::npos) next = target.size();
    if (next > pos) segs.push_back(target.substr(pos, next - pos));
    pos = next + 1;
  }

  if (segs.size() < 3 || segs.back() != "websocket") return std::nullopt;
  const auto server  = segs[segs.size() - 3];
  const auto session = segs[segs.size() - 2];
  if (server.find('.') != std::string_view::npos ||
      session.find('.') != std::string_view::npos) {
    return std::nullopt;
  }
  return SessionId(session);
}

WebSocketTransport::WebSocketTransport(tcp::socket socket,
                                       std::shared_ptr<Registry> registry,
                                       WebSocketServer* server)
  : TransportAdapter(socket.get_executor(), std::move(registry))
  , ws_(std::move(socket))
  , server_(server)
{}

WebSocketTransport::~WebSocketTransport() {
  if (auto* server = server_.load(std::memory_order_acquire)) {
    server->unregisterSession(this);
  }
}

std::shared_ptr<WebSocketTransport> WebSocketTransport::self() {
  return std::static_pointer_cast<WebSocketTransport>(shared_from_this());
}

void WebSocketTransport::run() {
  auto self = this->self();
  beast::get_lowest_layer(ws_).expires_after(30s);
  http::async_read(
      ws_.next_layer(), buffer_, req_,
      [self](beast::error_code ec, std::size_t) {
        self->onRequest(ec);
      });
}

void WebSocketTransport::stop() {
  boost::asio::post(executor(), [self = self()]() {
    self->release();
    self->closeWire(WireClose::Normal);
  });
}

void WebSocketTransport::onRequest(beast::error_code ec) {
  if (ec) {
    logger().log(LogLevel::Debug, "ws.request_failed", { {"what", ec.message()} });
    closeWire(WireClose::Abort);
    return;
  }

  if (!websocket::is_upgrade(req_)) {
    logger().log(LogLevel::Warn, "ws.not_upgrade", { {"target", std::string(req_.target())} });
    closeWire(WireClose::Abort);
    return;
  }

  auto sid = sessionIdFromTarget(std::string_view(req_.target().data(), req_.target().size()));
  if (!sid) {
    logger().log(LogLevel::Warn, "ws.bad_target", { {"target", std::string(req_.target())} });
    closeWire(WireClose::Abort);
    return;
  }

  // The websocket stream has its own timeouts.
  beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
  ws_.set_option(websocket::stream_base::decorator(
      [](websocket::response_type& res) {
        res.set(http::field::server,
                std::string(BOOST_BEAST_VERSION_STRING) + " sockjs-broker");
      }));

  auto self = this->self();
  ws_.async_accept(
      req_,
      [self, sid = std::move(*sid)](beast::error_code ec) mutable {
        self->onAccept(ec, std::move(sid));
      });
}

void WebSocketTransport::onAccept(beast::error_code ec, SessionId sid) {
  if (ec) {
    logger().log(LogLevel::Info, "ws.accept_failed", { {"sid", sid}, {"what", ec.message()} });
    closeWire(WireClose::Abort);
    return;
  }

  SOCKJS_METRIC_HIT("ws.accepted");
  setConnected(true);
  ws_.text(true);
  init(std::move(sid));
}

void WebSocketTransport::attached() {
  doRead();
}

void WebSocketTransport::doRead() {
  auto self = this->self();
  ws_.async_read(
      buffer_,
      [self](beast::error_code ec, std::size_t bytes) {
        self->onRead(ec, bytes);
      });
}

void WebSocketTransport::onRead(beast::error_code ec, std::size_t bytes) {
  if (ec == websocket::error::closed) {
    onPeerClose();
    setConnected(false);
    return;
  }
  if (ec == boost::asio::error::operation_aborted) {
    return;
  }
  if (ec) {
    onProtocolError(ec.message());
    return;
  }

  if (ws_.got_text()) {
    const std::string text = beast::buffers_to_string(buffer_.cdata());
    buffer_.consume(buffer_.size());
    onInbound(text);
  } else {
    buffer_.consume(buffer_.size());
    onBinary(bytes);
  }

  if (phase() != Phase::Released) {
    doRead();
  }
}

bool WebSocketTransport::writeText(std::string text) {
  if (closing_ || !ws_.is_open()) return false;

  outbox_.emplace_back(std::move(text));
  if (!writing_) {
    writing_ = true;
    doWrite();
  }
  return true;
}

void WebSocketTransport::doWrite() {
  if (outbox_.empty()) {
    writing_ = false;
    if (closeAfterWrite_) {
      closeAfterWrite_ = false;
      doClose();
    }
    return;
  }

  auto self = this->self();
  ws_.async_write(
      boost::asio::buffer(outbox_.front()),
      [self](beast::error_code ec, std::size_t bytes) {
        self->onWrite(ec, bytes);
      });
}

void WebSocketTransport::onWrite(beast::error_code ec, std::size_t) {
  if (ec) {
    outbox_.clear();
    writing_ = false;
    closeAfterWrite_ = false;
    logger().log(LogLevel::Debug, "ws.write_failed", { {"sid", sid()}, {"what", ec.message()} });
    onProtocolError("write: " + ec.message());
    return;
  }

  outbox_.pop_front();
  doWrite();
}

void WebSocketTransport::closeWire(WireClose how) {
  if (closing_) return;
  closing_ = true;

  if (how == WireClose::Abort || !ws_.is_open()) {
    setConnected(false);
    beast::error_code ec;
    beast::get_lowest_layer(ws_).socket().shutdown(tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(ws_).close();
    return;
  }

  closeReason_ = how == WireClose::InvalidPayload
      ? websocket::close_reason(websocket::close_code::bad_payload, "Broken JSON encoding")
      : websocket::close_reason(websocket::close_code::normal);

  if (writing_) {
    closeAfterWrite_ = true;
  } else {
    doClose();
  }
}

void WebSocketTransport::doClose() {
  auto self = this->self();
  ws_.async_close(
      closeReason_,
      [self](beast::error_code ec) {
        if (ec && ec != websocket::error::closed) {
          logger().log(LogLevel::Debug, "ws.close_failed",
                       { {"sid", self->sid()}, {"what", ec.message()} });
        }
        self->setConnected(false);
      });
}

} // namespace sockjs
