#pragma once

#include "sockjs/runtime/IStoppable.hpp"
#include "sockjs/session/Registry.hpp"
#include "sockjs/session/SessionHandler.hpp"

#include <boost/asio/io_context.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sockjs {

struct RegistryOptions {
  std::size_t shards = 4;
  std::chrono::milliseconds disconnectDelay{5000};
};

/// Owns every session record and the handler created for it.
///
/// Session ids are hashed onto shards; each shard is a strand holding its
/// slice of the map, so all operations on one sid are serialized while
/// different shards proceed concurrently. Every public call only posts to the
/// owning strand and returns.
class SessionRegistry final : public Registry, public rt::IStoppable {
public:
  using Clock = std::chrono::steady_clock;

  SessionRegistry(boost::asio::io_context& ioc,
                  HandlerFactory factory,
                  RegistryOptions opts = {});
  ~SessionRegistry() override;

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // Registry
  void acquire(SessionId sid,
               std::shared_ptr<TransportSink> sink,
               AcquireHandler done) override;
  void release(Record record) override;
  void broadcast(Frame frame) override;
  void deliver(SessionId sid, std::string payload) override;

  // Server-initiated traffic addressed to one session.
  void send(SessionId sid, std::string payload);
  void close(SessionId sid);

  // Reclaim records detached for longer than the disconnect delay.
  void sweep(Clock::time_point now = Clock::now());

  // Copy of the registry-held record (nullopt if unknown), for admin/tests.
  void inspect(SessionId sid, std::function<void(std::optional<Record>)> cb);

  // Refuse further Acquire / Deliver.
  void stop() override;
  bool stopped() const noexcept override { return stopped_.load(std::memory_order_acquire); }

  std::size_t size() const noexcept { return sessions_.load(std::memory_order_relaxed); }
  std::size_t shardCount() const noexcept { return shards_.size(); }

private:
  class Shard;
  friend class Shard;

  Shard& shardFor(const SessionId& sid);
  std::uint64_t nextAttachment() noexcept {
    return nextAttachment_.fetch_add(1, std::memory_order_relaxed);
  }

private:
  HandlerFactory  factory_;
  RegistryOptions opts_;
  std::vector<std::unique_ptr<Shard>> shards_;

  std::atomic<bool>          stopped_{false};
  std::atomic<std::uint64_t> nextAttachment_{1};
  std::atomic<std::size_t>   sessions_{0};
};

} // namespace sockjs
