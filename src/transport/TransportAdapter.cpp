#include "sockjs/transport/TransportAdapter.hpp"

#include "sockjs/protocol/Inbound.hpp"
#include "sockjs/util/Logger.hpp"
#include "sockjs/util/Metrics.hpp"

#include <boost/asio/post.hpp>

#include <utility>

namespace sockjs {

using util::LogLevel;
using util::logger;

TransportAdapter::TransportAdapter(Executor executor, std::shared_ptr<Registry> registry)
  : executor_(std::move(executor))
  , registry_(std::move(registry))
{}

TransportAdapter::~TransportAdapter() {
  // Last line of defence: a record must never be dropped without Release.
  if (rec_ && registry_) {
    if (!connected()) rec_->interrupted();
    logger().log(LogLevel::Warn, "transport.release_on_destroy", { {"sid", sid_} });
    registry_->release(std::move(*rec_));
    rec_.reset();
  }
}

void TransportAdapter::init(SessionId sid) {
  if (phase_ != Phase::Idle) return;
  sid_   = std::move(sid);
  phase_ = Phase::Pending;

  auto self = shared_from_this();
  registry_->acquire(sid_, self, [self](Registry::AcquireResult r) {
    boost::asio::post(self->executor_, [self, r = std::move(r)]() mutable {
      self->onAcquired(std::move(r));
    });
  });
}

void TransportAdapter::onAcquired(Registry::AcquireResult r) {
  if (!r) {
    const Error& err = r.error();
    const CloseCode code = err.code == ErrorCode::SessionBusy
                             ? CloseCode::AnotherConnectionStillOpen
                             : CloseCode::InternalError;
    logger().log(LogLevel::Info, "transport.acquire_failed",
                 { {"sid", sid_}, {"error", err.describe()} });
    SOCKJS_METRIC_HIT("transport.acquire_failed");

    // Nothing was bound to us: no record to release.
    const bool alreadyReleased = phase_ == Phase::Released;
    phase_ = Phase::Released;
    {
      std::lock_guard<std::mutex> lk(inboxMu_);
      inboxClosed_ = true;
      inbox_.clear();
    }
    if (!alreadyReleased) {
      (void)writeText(encodeClose(code));
      closeWire(WireClose::Normal);
    }
    return;
  }

  rec_ = std::move(r.value());

  // release() ran while Acquire was in flight.
  if (phase_ == Phase::Released) {
    if (deferredMark_) markState(*deferredMark_);
    // A New snapshot means `o` never went out, though the registry already
    // ran opened().
    if (!connected() || rec_->state == SessionState::New) rec_->interrupted();
    registry_->release(std::move(*rec_));
    rec_.reset();
    return;
  }

  phase_ = Phase::Attached;
  if (deferredMark_) markState(*deferredMark_);

  switch (rec_->state) {
    case SessionState::New:
      if (transmit(frame::Open{}) == SendResult::Stop) {
        rec_->interrupted();
        finish(WireClose::Normal);
        return;
      }
      rec_->state = SessionState::Running;
      if (flushBacklog() == SendResult::Stop) releaseOnReady_ = true;
      break;

    case SessionState::Running:
      if (flushBacklog() == SendResult::Stop) {
        releaseOnReady_ = true;
      }
      break;

    case SessionState::Interrupted:
      (void)transmit(frame::Close{CloseCode::Interrupted});
      finish(WireClose::Normal);
      return;

    case SessionState::Closed:
      (void)transmit(frame::Close{CloseCode::GoAway});
      finish(WireClose::Normal);
      return;
  }

  logger().log(LogLevel::Debug, "transport.attached", { {"sid", sid_} });
  if (!releaseOnReady_) attached();
  drainInbox();
}

bool TransportAdapter::push(const Frame& frame) {
  std::lock_guard<std::mutex> lk(inboxMu_);
  if (inboxClosed_) return false;
  inbox_.emplace_back(frame);
  scheduleDrainLocked();
  return true;
}

void TransportAdapter::ready() {
  std::lock_guard<std::mutex> lk(inboxMu_);
  if (inboxClosed_) return;
  inbox_.emplace_back(ReadyItem{});
  scheduleDrainLocked();
}

void TransportAdapter::scheduleDrainLocked() {
  if (drainScheduled_) return;
  drainScheduled_ = true;
  boost::asio::post(executor_, [self = shared_from_this()]() { self->drainInbox(); });
}

void TransportAdapter::drainInbox() {
  for (;;) {
    ChannelItem item;
    {
      std::lock_guard<std::mutex> lk(inboxMu_);
      // Until the snapshot is in, onAcquired() owns the next drain.
      if (phase_ == Phase::Pending || inbox_.empty()) {
        drainScheduled_ = false;
        return;
      }
      item = std::move(inbox_.front());
      inbox_.pop_front();
    }
    handleItem(std::move(item));
  }
}

void TransportAdapter::handleItem(ChannelItem item) {
  if (!rec_) return;

  if (auto* f = std::get_if<Frame>(&item)) {
    if (phase_ == Phase::Ready) {
      if (transmit(*f) == SendResult::Stop) finish(WireClose::Normal);
    } else {
      rec_->add(std::move(*f));
    }
    return;
  }

  // Ready: backlog complete, flush what arrived meanwhile and go live.
  if (releaseOnReady_ || flushBacklog() == SendResult::Stop) {
    finish(WireClose::Normal);
    return;
  }
  phase_ = Phase::Ready;
  logger().log(LogLevel::Trace, "transport.ready", { {"sid", sid_} });
}

SendResult TransportAdapter::send(const Frame& frame) {
  if (!rec_) return SendResult::Stop;
  if (phase_ != Phase::Ready) {
    rec_->add(frame);
    return SendResult::Continue;
  }
  return transmit(frame);
}

SendResult TransportAdapter::transmit(const Frame& frame) {
  const bool closing = isClose(frame);
  // The record is closed before the bytes leave, so a failed write cannot
  // leave it looking alive.
  if (closing && rec_) rec_->close();

  auto text = encodeText(frame);
  if (!text) return SendResult::Continue;

  if (!writeText(std::move(*text))) {
    logger().log(LogLevel::Debug, "transport.write_refused",
                 { {"sid", sid_}, {"frame", frameKind(frame)} });
    return SendResult::Stop;
  }
  return closing ? SendResult::Stop : SendResult::Continue;
}

// Popped frames are never put back, even when the write is refused.
SendResult TransportAdapter::flushBacklog() {
  while (rec_ && !rec_->buffer.empty()) {
    Frame f = std::move(rec_->buffer.front());
    rec_->buffer.pop_front();
    if (transmit(f) == SendResult::Stop) return SendResult::Stop;
  }
  return SendResult::Continue;
}

void TransportAdapter::onInbound(const std::string& text) {
  if (phase_ == Phase::Idle || phase_ == Phase::Released) return;

  auto decoded = decodeInbound(text);
  if (!decoded) {
    SOCKJS_METRIC_HIT("transport.malformed");
    logger().log(LogLevel::Warn, "transport.malformed",
                 { {"sid", sid_}, {"error", decoded.error().message} });
    markState(SessionState::Interrupted);
    release();
    closeWire(WireClose::InvalidPayload);
    return;
  }

  for (auto& payload : *decoded) {
    registry_->deliver(sid_, std::move(payload));
  }
}

void TransportAdapter::onBinary(std::size_t bytes) {
  SOCKJS_METRIC_HIT("transport.binary_dropped");
  logger().log(LogLevel::Error, "transport.binary_unsupported",
               { {"sid", sid_}, {"bytes", std::to_string(bytes)} });
}

void TransportAdapter::onPeerClose() {
  if (phase_ == Phase::Released) return;
  logger().log(LogLevel::Debug, "transport.peer_close", { {"sid", sid_} });
  markState(SessionState::Closed);
  release();
}

void TransportAdapter::onProtocolError(const std::string& what) {
  setConnected(false);
  if (phase_ == Phase::Released) return;
  logger().log(LogLevel::Info, "transport.protocol_error", { {"sid", sid_}, {"what", what} });
  markState(SessionState::Interrupted);
  release();
  closeWire(WireClose::Abort);
}

void TransportAdapter::markState(SessionState s) {
  if (!rec_) {
    if (!deferredMark_) deferredMark_ = s;
    return;
  }
  if (s == SessionState::Closed) rec_->close();
  else if (s == SessionState::Interrupted) rec_->interrupted();
}

void TransportAdapter::release() {
  if (phase_ == Phase::Released) return;
  phase_ = Phase::Released;

  // From here on the registry keeps whatever it would have pushed to us.
  std::deque<ChannelItem> leftover;
  {
    std::lock_guard<std::mutex> lk(inboxMu_);
    inboxClosed_ = true;
    leftover.swap(inbox_);
  }

  // Still Pending: onAcquired() releases the snapshot when it arrives.
  if (!rec_) return;

  for (auto& item : leftover) {
    if (auto* f = std::get_if<Frame>(&item)) rec_->add(std::move(*f));
  }
  if (!connected()) rec_->interrupted();

  logger().log(LogLevel::Debug, "transport.release",
               { {"sid", sid_}, {"state", sessionStateName(rec_->state)},
                 {"returned", std::to_string(rec_->buffer.size())} });
  SOCKJS_METRIC_HIT("transport.release");

  registry_->release(std::move(*rec_));
  rec_.reset();
}

void TransportAdapter::finish(WireClose how) {
  release();
  closeWire(how);
}

} // namespace sockjs
