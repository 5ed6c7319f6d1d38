#pragma once

#include "sockjs/transport/TransportAdapter.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sockjs {

class WebSocketServer;

/// Session id from a SockJS WebSocket target:
///   /<prefix...>/<server>/<session>/websocket[?query]
/// Server and session segments must be non-empty and contain no '.'.
std::optional<SessionId> sessionIdFromTarget(std::string_view target);

/// The WebSocket transport: one instance per accepted TCP connection.
class WebSocketTransport final : public TransportAdapter {
public:
  using tcp = boost::asio::ip::tcp;
  using Ws  = boost::beast::websocket::stream<boost::beast::tcp_stream>;

  WebSocketTransport(tcp::socket socket,
                     std::shared_ptr<Registry> registry,
                     WebSocketServer* server = nullptr);
  ~WebSocketTransport() override;

  // Read the upgrade request, accept the WebSocket and acquire the session.
  void run();

  // Detach from the session and close the connection (idempotent).
  void stop();

  // The owning server is going away; skip unregistering on destruction.
  void detachServer() noexcept { server_.store(nullptr, std::memory_order_release); }

protected:
  bool writeText(std::string text) override;
  void closeWire(WireClose how) override;
  void attached() override;

private:
  std::shared_ptr<WebSocketTransport> self();

  void onRequest(boost::beast::error_code ec);
  void onAccept(boost::beast::error_code ec, SessionId sid);

  void doRead();
  void onRead(boost::beast::error_code ec, std::size_t bytes);

  void doWrite();
  void onWrite(boost::beast::error_code ec, std::size_t bytes);

  void doClose();

private:
  Ws ws_;
  std::atomic<WebSocketServer*> server_{nullptr};  // not owned

  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;

  // Outbound write serialization.
  std::deque<std::string> outbox_;
  bool writing_{false};
  bool closing_{false};
  bool closeAfterWrite_{false};
  boost::beast::websocket::close_reason closeReason_;
};

} // namespace sockjs
