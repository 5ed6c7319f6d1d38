#include "sockjs/server/WebSocketServer.hpp"
#include "sockjs/transport/WebSocketTransport.hpp"
#include "sockjs/util/Logger.hpp"
#include "sockjs/util/Metrics.hpp"

#include <boost/asio/strand.hpp>
#include <boost/system/system_error.hpp>

#include <vector>

namespace sockjs {

namespace beast = boost::beast;
using util::LogLevel;
using util::logger;

WebSocketServer::WebSocketServer(boost::asio::io_context& ioc,
                                 std::shared_ptr<Registry> registry,
                                 const std::string& address,
                                 unsigned short port)
  : ioc_(ioc)
  , acceptor_(boost::asio::make_strand(ioc))
  , registry_(std::move(registry))
{
  beast::error_code ec;
  const auto addr = boost::asio::ip::make_address(address, ec);
  if (ec) throw boost::system::system_error(ec, "ws.address");
  const tcp::endpoint endpoint(addr, port);

  acceptor_.open(endpoint.protocol(), ec);
  if (ec) throw boost::system::system_error(ec, "ws.open");

  acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  if (ec) throw boost::system::system_error(ec, "ws.reuse_address");

  acceptor_.bind(endpoint, ec);
  if (ec) throw boost::system::system_error(ec, "ws.bind");

  acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
  if (ec) throw boost::system::system_error(ec, "ws.listen");
}

WebSocketServer::~WebSocketServer() {
  stopAccept();
  // Transports that outlive us must not call back.
  std::lock_guard<std::mutex> lk(sessions_mu_);
  for (auto& kv : sessions_) {
    if (auto sp = kv.second.lock()) sp->detachServer();
  }
  sessions_.clear();
}

void WebSocketServer::run() {
  accepting_.store(true, std::memory_order_relaxed);
  logger().log(LogLevel::Info, "ws.listening", { {"port", std::to_string(port())} });
  doAccept();
}

unsigned short WebSocketServer::port() const {
  beast::error_code ec;
  const auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

void WebSocketServer::doAccept() {
  if (!accepting_.load(std::memory_order_relaxed)) return;
  acceptor_.async_accept(
      boost::asio::make_strand(ioc_),
      [this](beast::error_code ec, tcp::socket socket) {
        onAccept(ec, std::move(socket));
      });
}

void WebSocketServer::onAccept(beast::error_code ec, tcp::socket socket) {
  if (!accepting_.load(std::memory_order_relaxed)) return;

  if (ec) {
    logger().log(LogLevel::Warn, "ws.accept_error", { {"what", ec.message()} });
  } else {
    SOCKJS_METRIC_HIT("ws.connections");
    auto transport = std::make_shared<WebSocketTransport>(std::move(socket), registry_, this);
    registerSession(transport);
    transport->run();
  }
  doAccept();
}

void WebSocketServer::registerSession(const std::shared_ptr<WebSocketTransport>& s) {
  if (!s) return;
  std::lock_guard<std::mutex> lk(sessions_mu_);
  sessions_[s.get()] = s;
}

void WebSocketServer::unregisterSession(WebSocketTransport* s) noexcept {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  (void)sessions_.erase(s);
}

std::size_t WebSocketServer::sessionCount() const {
  std::lock_guard<std::mutex> lk(sessions_mu_);
  return sessions_.size();
}

void WebSocketServer::stopAccept() noexcept {
  accepting_.store(false, std::memory_order_relaxed);
  beast::error_code ec;
  acceptor_.cancel(ec);
  acceptor_.close(ec);
}

void WebSocketServer::closeAll() noexcept {
  // Snapshot so stop() runs without holding the mutex.
  std::vector<std::shared_ptr<WebSocketTransport>> to_close;
  {
    std::lock_guard<std::mutex> lk(sessions_mu_);
    to_close.reserve(sessions_.size());
    for (auto& kv : sessions_) {
      if (auto sp = kv.second.lock()) {
        to_close.emplace_back(std::move(sp));
      }
    }
  }
  logger().log(LogLevel::Info, "ws.close_all", { {"count", std::to_string(to_close.size())} });
  for (auto& s : to_close) {
    s->stop();
  }
}

} // namespace sockjs
