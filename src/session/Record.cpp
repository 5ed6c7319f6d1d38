#include "sockjs/session/Record.hpp"

#include <iterator>

namespace sockjs {

const char* sessionStateName(SessionState s) noexcept {
  switch (s) {
    case SessionState::New:         return "new";
    case SessionState::Running:     return "running";
    case SessionState::Interrupted: return "interrupted";
    case SessionState::Closed:      return "closed";
  }
  return "unknown";
}

void Record::prepend(std::deque<Frame>&& earlier) {
  if (earlier.empty()) return;
  if (buffer.empty()) {
    buffer = std::move(earlier);
    return;
  }
  earlier.insert(earlier.end(),
                 std::make_move_iterator(buffer.begin()),
                 std::make_move_iterator(buffer.end()));
  buffer = std::move(earlier);
}

SessionState mergeState(SessionState registry, SessionState returned) noexcept {
  if (isTerminal(registry)) return registry;
  if (isTerminal(returned)) return returned;
  if (registry == SessionState::New && returned == SessionState::New) {
    return SessionState::New;
  }
  return SessionState::Running;
}

} // namespace sockjs
