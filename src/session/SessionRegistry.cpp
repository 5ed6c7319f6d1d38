#include "sockjs/session/SessionRegistry.hpp"

#include "sockjs/util/Logger.hpp"
#include "sockjs/util/Metrics.hpp"

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>

#include <exception>
#include <unordered_map>
#include <utility>

namespace sockjs {

using util::LogLevel;
using util::logger;

// ---------------------- Shard ----------------------

class SessionRegistry::Shard {
public:
  Shard(boost::asio::io_context& ioc, SessionRegistry& owner, std::size_t index)
    : strand_(boost::asio::make_strand(ioc))
    , owner_(owner)
    , index_(std::to_string(index))
  {}

  template <typename Fn>
  void post(Fn&& fn) {
    boost::asio::post(strand_, std::forward<Fn>(fn));
  }

  void acquire(SessionId sid, std::shared_ptr<TransportSink> sink, AcquireHandler done);
  void release(Record rec);
  void broadcast(const Frame& f);
  void deliver(const SessionId& sid, const std::string& payload);
  void send(const SessionId& sid, std::string payload);
  void close(const SessionId& sid);
  void sweep(Clock::time_point now);
  std::optional<Record> inspect(const SessionId& sid) const;

private:
  struct Entry {
    Record record;                            // attachment != 0 while bound
    std::unique_ptr<SessionHandler> handler;
    std::weak_ptr<TransportSink> sink;
    Clock::time_point touched{Clock::now()};
  };

  class Context final : public SessionContext {
  public:
    Context(Shard& shard, Entry& e) : shard_(shard), e_(e) {}

    const SessionId& sid() const override { return e_.record.sid; }
    SessionState state() const override { return e_.record.state; }

    void send(std::string payload) override {
      if (isTerminal(e_.record.state)) return;
      shard_.forward(e_, frame::Message{std::move(payload)});
    }

    void sendBatch(std::vector<std::string> payloads) override {
      if (payloads.empty() || isTerminal(e_.record.state)) return;
      shard_.forward(e_, frame::MessageBatch{std::move(payloads)});
    }

    void close() override { shard_.closeEntry(e_); }

  private:
    Shard& shard_;
    Entry& e_;
  };

  void forward(Entry& e, Frame f);
  void closeEntry(Entry& e);
  void reply(AcquireHandler& done, AcquireResult r);

  template <typename Fn>
  void invoke(Entry& e, const char* what, Fn&& fn) {
    if (!e.handler) return;
    Context ctx(*this, e);
    try {
      fn(*e.handler, ctx);
    } catch (const std::exception& ex) {
      SOCKJS_METRIC_HIT("registry.handler_error");
      logger().log(LogLevel::Error, "session.handler_error",
                   { {"sid", e.record.sid}, {"callback", what}, {"what", ex.what()} });
    }
  }

  void updateGauge() {
    SOCKJS_METRIC_SET("registry.sessions", static_cast<double>(owner_.size()));
  }

private:
  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  SessionRegistry& owner_;
  std::string index_;
  std::unordered_map<SessionId, Entry> entries_;
};

void SessionRegistry::Shard::forward(Entry& e, Frame f) {
  if (auto sink = e.sink.lock()) {
    if (sink->push(f)) return;
  }
  e.record.add(std::move(f));
}

void SessionRegistry::Shard::closeEntry(Entry& e) {
  if (isTerminal(e.record.state)) return;

  e.record.state = SessionState::Closed;
  e.record.buffer.clear();
  if (auto sink = e.sink.lock()) {
    (void)sink->push(frame::Close{CloseCode::GoAway});
  }
  logger().log(LogLevel::Debug, "session.close", { {"sid", e.record.sid} });
  invoke(e, "closed", [](SessionHandler& h, SessionContext& c) { h.closed(c, false); });
}

void SessionRegistry::Shard::reply(AcquireHandler& done, AcquireResult r) {
  if (!done) return;
  try {
    done(std::move(r));
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "session.acquire_reply_failed", { {"what", ex.what()} });
  }
}

void SessionRegistry::Shard::acquire(SessionId sid,
                                     std::shared_ptr<TransportSink> sink,
                                     AcquireHandler done) {
  if (owner_.stopped()) {
    SOCKJS_METRIC_HIT("registry.acquire_unavailable");
    reply(done, Error{ErrorCode::RegistryUnavailable, "registry stopped"});
    return;
  }

  auto it = entries_.find(sid);
  if (it == entries_.end()) {
    std::unique_ptr<SessionHandler> handler;
    if (owner_.factory_) handler = owner_.factory_(sid);
    if (!handler) {
      logger().log(LogLevel::Error, "session.no_handler", { {"sid", sid} });
      reply(done, Error{ErrorCode::RegistryUnavailable, "no session handler"});
      return;
    }
    Entry e;
    e.record  = Record(sid);
    e.handler = std::move(handler);
    it = entries_.emplace(sid, std::move(e)).first;
    owner_.sessions_.fetch_add(1, std::memory_order_relaxed);
    updateGauge();
    logger().log(LogLevel::Debug, "session.created", { {"sid", sid}, {"shard", index_} });
  }

  Entry& e = it->second;
  // A bound sink that already expired still has its Release queued behind us.
  if (e.record.attachment != 0) {
    SOCKJS_METRIC_HIT("registry.acquire_busy");
    logger().log(LogLevel::Info, "session.busy",
                 { {"sid", sid}, {"sinkAlive", e.sink.expired() ? "false" : "true"} });
    reply(done, Error{ErrorCode::SessionBusy, "another connection still open"});
    return;
  }

  e.record.attachment = owner_.nextAttachment();
  e.sink    = sink;
  e.touched = Clock::now();

  Record snap(e.record.sid);
  snap.state      = e.record.state;
  snap.attachment = e.record.attachment;
  snap.buffer.swap(e.record.buffer);

  const SessionState prev = e.record.state;
  if (prev == SessionState::New) e.record.state = SessionState::Running;

  logger().log(LogLevel::Debug, "session.acquire",
               { {"sid", sid}, {"state", sessionStateName(prev)},
                 {"backlog", std::to_string(snap.buffer.size())} });
  SOCKJS_METRIC_HIT("registry.acquire_ok");

  reply(done, std::move(snap));

  // Frames the handler sends from here on reach the sink after the snapshot
  // and before ready().
  if (prev == SessionState::New) {
    invoke(e, "opened", [](SessionHandler& h, SessionContext& c) { h.opened(c); });
  } else if (prev == SessionState::Running) {
    invoke(e, "acquired", [](SessionHandler& h, SessionContext& c) { h.acquired(c); });
  }

  if (sink) sink->ready();
}

void SessionRegistry::Shard::release(Record rec) {
  auto it = entries_.find(rec.sid);
  if (it == entries_.end()) {
    logger().log(LogLevel::Debug, "session.release_unknown", { {"sid", rec.sid} });
    return;
  }

  Entry& e = it->second;
  if (rec.attachment == 0 || e.record.attachment != rec.attachment) {
    logger().log(LogLevel::Debug, "session.release_stale", { {"sid", rec.sid} });
    return;
  }

  e.record.attachment = 0;
  e.sink.reset();
  e.touched = Clock::now();

  const SessionState prev = e.record.state;
  e.record.state = mergeState(prev, rec.state);
  if (isTerminal(e.record.state)) {
    e.record.buffer.clear();
  } else {
    // What the transport still held was queued before anything the registry
    // kept after the transport stopped accepting.
    e.record.prepend(std::move(rec.buffer));
  }

  logger().log(LogLevel::Debug, "session.release",
               { {"sid", rec.sid}, {"state", sessionStateName(e.record.state)},
                 {"buffered", std::to_string(e.record.buffer.size())} });
  SOCKJS_METRIC_HIT("registry.release");

  invoke(e, "released", [](SessionHandler& h, SessionContext& c) { h.released(c); });
  if (isTerminal(e.record.state) && !isTerminal(prev)) {
    const bool interrupted = e.record.state == SessionState::Interrupted;
    invoke(e, "closed", [interrupted](SessionHandler& h, SessionContext& c) {
      h.closed(c, interrupted);
    });
  }
}

void SessionRegistry::Shard::broadcast(const Frame& f) {
  for (auto& kv : entries_) {
    Entry& e = kv.second;
    if (e.record.state != SessionState::Running) continue;
    forward(e, f);
  }
}

void SessionRegistry::Shard::deliver(const SessionId& sid, const std::string& payload) {
  auto it = entries_.find(sid);
  if (it == entries_.end()) {
    logger().log(LogLevel::Debug, "session.deliver_unknown", { {"sid", sid} });
    return;
  }
  Entry& e = it->second;
  if (isTerminal(e.record.state)) {
    logger().log(LogLevel::Debug, "session.deliver_terminal", { {"sid", sid} });
    return;
  }
  e.touched = Clock::now();
  SOCKJS_METRIC_HIT("registry.deliver");
  invoke(e, "onMessage", [&payload](SessionHandler& h, SessionContext& c) {
    h.onMessage(c, payload);
  });
}

void SessionRegistry::Shard::send(const SessionId& sid, std::string payload) {
  auto it = entries_.find(sid);
  if (it == entries_.end() || isTerminal(it->second.record.state)) {
    logger().log(LogLevel::Debug, "session.send_dropped", { {"sid", sid} });
    return;
  }
  forward(it->second, frame::Message{std::move(payload)});
}

void SessionRegistry::Shard::close(const SessionId& sid) {
  auto it = entries_.find(sid);
  if (it == entries_.end()) return;
  closeEntry(it->second);
}

void SessionRegistry::Shard::sweep(Clock::time_point now) {
  const auto delay = owner_.opts_.disconnectDelay;
  bool changed = false;

  for (auto it = entries_.begin(); it != entries_.end();) {
    Entry& e = it->second;
    if (e.record.attachment != 0 || now - e.touched < delay) {
      ++it;
      continue;
    }
    if (!isTerminal(e.record.state)) {
      e.record.interrupted();
      invoke(e, "closed", [](SessionHandler& h, SessionContext& c) { h.closed(c, true); });
    }
    logger().log(LogLevel::Debug, "session.expired", { {"sid", e.record.sid} });
    SOCKJS_METRIC_HIT("registry.expired");
    it = entries_.erase(it);
    owner_.sessions_.fetch_sub(1, std::memory_order_relaxed);
    changed = true;
  }
  if (changed) updateGauge();
}

std::optional<Record> SessionRegistry::Shard::inspect(const SessionId& sid) const {
  auto it = entries_.find(sid);
  if (it == entries_.end()) return std::nullopt;
  return it->second.record;
}

// ---------------------- SessionRegistry ----------------------

SessionRegistry::SessionRegistry(boost::asio::io_context& ioc,
                                 HandlerFactory factory,
                                 RegistryOptions opts)
  : factory_(std::move(factory))
  , opts_(opts)
{
  if (opts_.shards == 0) opts_.shards = 1;
  shards_.reserve(opts_.shards);
  for (std::size_t i = 0; i < opts_.shards; ++i) {
    shards_.push_back(std::make_unique<Shard>(ioc, *this, i));
  }
}

SessionRegistry::~SessionRegistry() = default;

SessionRegistry::Shard& SessionRegistry::shardFor(const SessionId& sid) {
  return *shards_[std::hash<SessionId>{}(sid) % shards_.size()];
}

void SessionRegistry::acquire(SessionId sid,
                              std::shared_ptr<TransportSink> sink,
                              AcquireHandler done) {
  Shard& shard = shardFor(sid);
  shard.post([&shard, sid = std::move(sid), sink = std::move(sink), done = std::move(done)]() mutable {
    shard.acquire(std::move(sid), std::move(sink), std::move(done));
  });
}

void SessionRegistry::release(Record record) {
  Shard& shard = shardFor(record.sid);
  shard.post([&shard, rec = std::move(record)]() mutable {
    shard.release(std::move(rec));
  });
}

void SessionRegistry::broadcast(Frame frame) {
  SOCKJS_METRIC_HIT("registry.broadcast");
  for (auto& sp : shards_) {
    Shard& shard = *sp;
    shard.post([&shard, frame]() { shard.broadcast(frame); });
  }
}

void SessionRegistry::deliver(SessionId sid, std::string payload) {
  if (stopped()) return;
  Shard& shard = shardFor(sid);
  shard.post([&shard, sid = std::move(sid), payload = std::move(payload)]() {
    shard.deliver(sid, payload);
  });
}

void SessionRegistry::send(SessionId sid, std::string payload) {
  Shard& shard = shardFor(sid);
  shard.post([&shard, sid = std::move(sid), payload = std::move(payload)]() mutable {
    shard.send(sid, std::move(payload));
  });
}

void SessionRegistry::close(SessionId sid) {
  Shard& shard = shardFor(sid);
  shard.post([&shard, sid = std::move(sid)]() { shard.close(sid); });
}

void SessionRegistry::sweep(Clock::time_point now) {
  for (auto& sp : shards_) {
    Shard& shard = *sp;
    shard.post([&shard, now]() { shard.sweep(now); });
  }
}

void SessionRegistry::inspect(SessionId sid, std::function<void(std::optional<Record>)> cb) {
  Shard& shard = shardFor(sid);
  shard.post([&shard, sid = std::move(sid), cb = std::move(cb)]() {
    if (cb) cb(shard.inspect(sid));
  });
}

void SessionRegistry::stop() {
  if (stopped_.exchange(true, std::memory_order_acq_rel)) return;
  logger().log(LogLevel::Info, "registry.stopped",
               { {"sessions", std::to_string(size())} });
}

} // namespace sockjs
