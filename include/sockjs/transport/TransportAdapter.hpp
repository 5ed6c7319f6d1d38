#pragma once

#include "sockjs/protocol/Frame.hpp"
#include "sockjs/session/Record.hpp"
#include "sockjs/session/Registry.hpp"
#include "sockjs/session/TransportSink.hpp"

#include <boost/asio/any_io_executor.hpp>

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace sockjs {

enum class SendResult { Continue, Stop };

/// How the concrete transport should take the connection down.
enum class WireClose {
  Normal,          // orderly close after pending writes
  InvalidPayload,  // orderly close signalling undecodable input
  Abort            // drop the connection now
};

/// Per-connection side of the Acquire/Release handshake.
///
/// Phases: Idle -> Pending (Acquire in flight) -> Attached (snapshot received,
/// backlog flushed, live frames still held back) -> Ready (forwarding) ->
/// Released. Every method except push()/ready()/connected() must run on the
/// adapter's executor. A concrete transport supplies the wire hooks.
class TransportAdapter : public TransportSink,
                         public std::enable_shared_from_this<TransportAdapter> {
public:
  using Executor = boost::asio::any_io_executor;

  enum class Phase { Idle, Pending, Attached, Ready, Released };

  TransportAdapter(Executor executor, std::shared_ptr<Registry> registry);
  ~TransportAdapter() override;

  // TransportSink, called from the registry strand.
  bool push(const Frame& frame) override;
  void ready() override;
  bool connected() const noexcept override { return connected_.load(std::memory_order_acquire); }

  /// Issue Acquire for `sid` and enter Pending.
  void init(SessionId sid);

  /// Transmit when Ready, otherwise append to the record buffer.
  SendResult send(const Frame& frame);

  /// Decode client text and Deliver each payload. Malformed input closes the
  /// connection and releases the session as interrupted.
  void onInbound(const std::string& text);

  /// Binary frames are not part of the protocol: logged and dropped.
  void onBinary(std::size_t bytes);

  /// Peer closed the connection cleanly: session Closed.
  void onPeerClose();

  /// Transport-level failure: session Interrupted.
  void onProtocolError(const std::string& what);

  /// Hand the record back to the registry. Runs at most once; later calls
  /// are no-ops. The disconnect counts as graceful only while connected().
  void release();

  Phase phase() const noexcept { return phase_; }
  const SessionId& sid() const noexcept { return sid_; }

protected:
  // Queue text for the wire; false when the connection cannot take it.
  virtual bool writeText(std::string text) = 0;
  virtual void closeWire(WireClose how) = 0;

  // Acquire succeeded on a live session; inbound traffic may start.
  virtual void attached() {}

  void setConnected(bool v) noexcept { connected_.store(v, std::memory_order_release); }
  const Executor& executor() const noexcept { return executor_; }

private:
  struct ReadyItem {};
  using ChannelItem = std::variant<Frame, ReadyItem>;

  void onAcquired(Registry::AcquireResult r);
  void scheduleDrainLocked();
  void drainInbox();
  void handleItem(ChannelItem item);

  SendResult transmit(const Frame& frame);
  SendResult flushBacklog();
  void markState(SessionState s);
  void finish(WireClose how);

private:
  Executor executor_;
  std::shared_ptr<Registry> registry_;

  SessionId sid_;
  Phase phase_{Phase::Idle};
  std::optional<Record> rec_;
  std::optional<SessionState> deferredMark_;  // state requested before the snapshot arrived
  bool releaseOnReady_{false};

  std::atomic<bool> connected_{false};

  // Items pushed by the registry, drained on the adapter executor.
  std::mutex inboxMu_;
  std::deque<ChannelItem> inbox_;
  bool inboxClosed_{false};
  bool drainScheduled_{false};
};

} // namespace sockjs
