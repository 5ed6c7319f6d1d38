#pragma once

#include "sockjs/protocol/Frame.hpp"

namespace sockjs {

/// What the registry sees of the transport currently attached to a session.
/// Both calls are made from the registry's strand and must not block.
class TransportSink {
public:
  TransportSink() = default;
  virtual ~TransportSink() = default;

  TransportSink(const TransportSink&) = delete;
  TransportSink& operator=(const TransportSink&) = delete;

  // Queue a live frame. Returns false once the transport has released its
  // record; the caller then keeps the frame in the session buffer.
  virtual bool push(const Frame& frame) = 0;

  // Backlog handed out by Acquire is complete; switch to forwarding.
  virtual void ready() = 0;

  virtual bool connected() const noexcept = 0;
};

} // namespace sockjs
