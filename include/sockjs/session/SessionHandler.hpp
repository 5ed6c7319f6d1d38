#pragma once

#include "sockjs/session/Record.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace sockjs {

/// Handle given to a SessionHandler for the duration of a callback.
/// Only valid on the registry strand that invoked the callback.
class SessionContext {
public:
  virtual ~SessionContext() = default;

  virtual const SessionId& sid() const = 0;
  virtual SessionState state() const = 0;

  // Queue frames for the client; buffered while no transport is attached.
  virtual void send(std::string payload) = 0;
  virtual void sendBatch(std::vector<std::string> payloads) = 0;

  // Close the session with Close(GoAway).
  virtual void close() = 0;
};

/// Application side of a session. One instance per session id, owned by the
/// registry for the lifetime of the record.
class SessionHandler {
public:
  SessionHandler() = default;
  virtual ~SessionHandler() = default;

  SessionHandler(const SessionHandler&) = delete;
  SessionHandler& operator=(const SessionHandler&) = delete;

  virtual void opened(SessionContext&) {}
  virtual void acquired(SessionContext&) {}
  virtual void released(SessionContext&) {}
  virtual void closed(SessionContext&, bool /*interrupted*/) {}

  virtual void onMessage(SessionContext& ctx, const std::string& payload) = 0;
};

using HandlerFactory = std::function<std::unique_ptr<SessionHandler>(const SessionId&)>;

} // namespace sockjs
