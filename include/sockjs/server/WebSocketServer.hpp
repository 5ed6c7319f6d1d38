#pragma once

#include "sockjs/runtime/IStoppable.hpp"
#include "sockjs/session/Registry.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/error.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sockjs {

class WebSocketTransport;

class WebSocketServer : public rt::IStoppable {
public:
  using tcp = boost::asio::ip::tcp;

  // Opens, binds and listens; throws boost::system::system_error on failure.
  WebSocketServer(boost::asio::io_context& ioc,
                  std::shared_ptr<Registry> registry,
                  const std::string& address,
                  unsigned short port);
  ~WebSocketServer() override;

  WebSocketServer(const WebSocketServer&) = delete;
  WebSocketServer& operator=(const WebSocketServer&) = delete;

  void run();

  // Graceful shutdown hooks.
  void stopAccept() noexcept;
  void closeAll() noexcept;

  void stop() override { stopAccept(); closeAll(); }
  bool stopped() const noexcept override { return !accepting_.load(std::memory_order_relaxed); }

  void registerSession(const std::shared_ptr<WebSocketTransport>& s);
  void unregisterSession(WebSocketTransport* s) noexcept;

  std::size_t sessionCount() const;
  unsigned short port() const;

private:
  void doAccept();
  void onAccept(boost::beast::error_code ec, tcp::socket socket);

  boost::asio::io_context& ioc_;
  tcp::acceptor acceptor_;
  std::shared_ptr<Registry> registry_;

  std::atomic<bool> accepting_{false};

  mutable std::mutex sessions_mu_;
  std::unordered_map<WebSocketTransport*, std::weak_ptr<WebSocketTransport>> sessions_;
};

} // namespace sockjs
