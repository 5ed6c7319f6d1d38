#pragma once

#include "sockjs/protocol/Frame.hpp"

#include <cstdint>
#include <deque>
#include <string>

namespace sockjs {

using SessionId = std::string;

enum class SessionState {
  New,          // never attached
  Running,      // attached, or detached but alive
  Interrupted,  // transport dropped abnormally (terminal)
  Closed        // closed by either side (terminal)
};

const char* sessionStateName(SessionState s) noexcept;

inline bool isTerminal(SessionState s) noexcept {
  return s == SessionState::Interrupted || s == SessionState::Closed;
}

/// Per-session state. The registry keeps the authoritative copy; a transport
/// works on the snapshot handed out by Acquire and returns it on Release.
class Record {
public:
  Record() = default;
  explicit Record(SessionId sid) : sid(std::move(sid)) {}

  // Terminal states are sticky: close() on an interrupted record keeps it
  // interrupted and vice versa.
  void close() noexcept {
    if (!isTerminal(state)) state = SessionState::Closed;
  }
  void interrupted() noexcept {
    if (!isTerminal(state)) state = SessionState::Interrupted;
  }

  void add(Frame f) { buffer.push_back(std::move(f)); }

  // Put `earlier` in front of the current buffer, keeping both orders.
  void prepend(std::deque<Frame>&& earlier);

  SessionId         sid;
  SessionState      state{SessionState::New};
  std::deque<Frame> buffer;
  std::uint64_t     attachment{0};  // 0 = not handed out under any binding
};

/// Monotonic merge used on Release: a terminal state already recorded by the
/// registry wins over whatever the transport reports.
SessionState mergeState(SessionState registry, SessionState returned) noexcept;

} // namespace sockjs
