// File: src/main.cpp
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "sockjs/protocol/Frame.hpp"
#include "sockjs/rt/Interval.hpp"
#include "sockjs/runtime/ShutdownCoordinator.hpp"
#include "sockjs/server/WebSocketServer.hpp"
#include "sockjs/session/SessionRegistry.hpp"
#include "sockjs/util/Config.hpp"
#include "sockjs/util/Logger.hpp"
#include "sockjs/util/Metrics.hpp"

namespace {

// Default application: every message comes back to its sender.
class EchoHandler final : public sockjs::SessionHandler {
public:
  void opened(sockjs::SessionContext& ctx) override {
    sockjs::util::logger().log(sockjs::util::LogLevel::Info, "echo.opened", { {"sid", ctx.sid()} });
  }

  void closed(sockjs::SessionContext& ctx, bool interrupted) override {
    sockjs::util::logger().log(sockjs::util::LogLevel::Info, "echo.closed",
                               { {"sid", ctx.sid()}, {"interrupted", interrupted ? "true" : "false"} });
  }

  void onMessage(sockjs::SessionContext& ctx, const std::string& payload) override {
    ctx.send(payload);
  }
};

} // namespace

// ---------------------------
// main
// ---------------------------
int main(int argc, char* argv[]) {
  using namespace sockjs::util;

  // ---------------------------
  // 1) Config
  //    argv[1] = wsPort (optional, overrides the file)
  //    argv[2] = configFilePath (optional)
  // ---------------------------
  Config cfg;

  if (argc > 2) {
    if (!cfg.loadFromFile(argv[2])) {
      std::cerr << "[config] warning: failed to load file: " << argv[2] << "\n";
    }
  }

  if (argc > 1) {
    try {
      const unsigned long p = std::stoul(argv[1]);
      if (p == 0 || p > 65535) throw std::out_of_range("port");
      cfg.wsPort = static_cast<unsigned short>(p);
    } catch (const std::exception&) {
      std::cerr << "Invalid port '" << argv[1] << "', using " << cfg.wsPort << "\n";
    }
  }

  // ---------------------------
  // 2) Logger
  // ---------------------------
  logger().setLevel(parseLevel(cfg.logLevel));
  logger().setFormatJson(cfg.logFormat == "json");
  if (!cfg.logFile.empty()) logger().setFile(cfg.logFile);

  logger().log(LogLevel::Info, "boot",
               { {"wsAddress", cfg.wsAddress},
                 {"wsPort", std::to_string(cfg.wsPort)},
                 {"ioThreads", std::to_string(cfg.ioThreads)},
                 {"shards", std::to_string(cfg.registryShards)} });

  // ---------------------------
  // 3) ASIO + registry + server
  // ---------------------------
  boost::asio::io_context ioc(static_cast<int>(cfg.ioThreads));
  sockjs::rt::ShutdownCoordinator coordinator;

  if (cfg.metricsIntervalS > 0) {
    MetricRegistry::instance().startReporter(cfg.metricsIntervalS);
    coordinator.registerStep("metrics-stop", 70, []{ MetricRegistry::instance().stopReporter(); });
  }


  sockjs::RegistryOptions opts;
  opts.shards          = cfg.registryShards;
  opts.disconnectDelay = std::chrono::milliseconds(cfg.disconnectDelayMs);

  auto registry = std::make_shared<sockjs::SessionRegistry>(
      ioc,
      [](const sockjs::SessionId&) { return std::make_unique<EchoHandler>(); },
      opts);

  std::unique_ptr<sockjs::WebSocketServer> ws;
  try {
    ws = std::make_unique<sockjs::WebSocketServer>(ioc, registry, cfg.wsAddress, cfg.wsPort);
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "ws.listen_failed", { {"what", ex.what()} });
    return EXIT_FAILURE;
  }
  ws->run();

  // Heartbeats go to every Running session; detached ones buffer them.
  auto heartbeat = sockjs::rt::Interval::create(
      ioc, "heartbeat", std::chrono::milliseconds(cfg.heartbeatIntervalMs),
      [registry]{ registry->broadcast(sockjs::frame::Heartbeat{}); });
  heartbeat->start();

  // Detached sessions are reclaimed after the disconnect delay.
  auto reaper = sockjs::rt::Interval::create(
      ioc, "sweep", std::chrono::milliseconds(cfg.disconnectDelayMs),
      [registry]{ registry->sweep(); });
  reaper->start();

  // ---------------------------
  // 4) Shutdown sequencing
  // ---------------------------
  coordinator.registerStep("ws-stop-accept",   5, [&ws]{ ws->stopAccept(); });
  coordinator.registerStep("timers-stop",     10, [heartbeat, reaper]{ heartbeat->stop(); reaper->stop(); });
  coordinator.registerStep("sessions-goaway", 20, [registry]{
    registry->broadcast(sockjs::frame::Close{sockjs::CloseCode::GoAway});
  });
  coordinator.registerStep("ws-close-all",    40, [&ws]{ ws->closeAll(); });
  coordinator.registerStep("registry-stop",   50, [registry]{ registry->stop(); });

  // Give the close handshakes a moment, then stop the loop.
  auto grace = std::make_shared<boost::asio::steady_timer>(ioc);
  coordinator.registerStep("asio-stop",       60, [&ioc, grace]{
    grace->expires_after(std::chrono::seconds(1));
    grace->async_wait([&ioc](const boost::system::error_code&) { ioc.stop(); });
  });

  boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
  signals.async_wait([&coordinator](const boost::system::error_code& ec, int sig) {
    if (ec) return;
    logger().log(LogLevel::Info, "signal", { {"sig", std::to_string(sig)} });
    coordinator.stop();
  });

  logger().log(LogLevel::Info, "listening", { {"wsPort", std::to_string(ws->port())} });

  // ---------------------------
  // 5) Run
  // ---------------------------
  auto runLoop = [&ioc, &coordinator]{
    try {
      ioc.run();
    } catch (const std::exception& ex) {
      logger().log(LogLevel::Error, "io_context exception", { {"what", ex.what()} });
      coordinator.stop();
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(cfg.ioThreads > 0 ? cfg.ioThreads - 1 : 0);
  for (unsigned i = 1; i < cfg.ioThreads; ++i) threads.emplace_back(runLoop);
  runLoop();
  for (auto& t : threads) t.join();

  // Ensure shutdown steps run even on natural exit.
  coordinator.stop();

  logger().log(LogLevel::Info, "stopped", {});
  return EXIT_SUCCESS;
}
