#pragma once

#include "sockjs/Result.hpp"
#include "sockjs/protocol/Frame.hpp"
#include "sockjs/session/Record.hpp"
#include "sockjs/session/TransportSink.hpp"

#include <functional>
#include <memory>
#include <string>

namespace sockjs {

/// Message contract between transports and the session registry.
class Registry {
public:
  using AcquireResult  = Result<Record>;
  using AcquireHandler = std::function<void(AcquireResult)>;

  virtual ~Registry() = default;

  /// Bind `sink` as the frame sink of `sid`. `done` runs on the registry's
  /// strand with the record snapshot (its backlog moved out of the registry)
  /// or SessionBusy / RegistryUnavailable. On success sink->ready() follows.
  virtual void acquire(SessionId sid,
                       std::shared_ptr<TransportSink> sink,
                       AcquireHandler done) = 0;

  /// End the attachment the record was handed out under. Stale or repeated
  /// releases are ignored.
  virtual void release(Record record) = 0;

  virtual void broadcast(Frame frame) = 0;

  virtual void deliver(SessionId sid, std::string payload) = 0;
};

} // namespace sockjs
