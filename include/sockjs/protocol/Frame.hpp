#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sockjs {

/// Closing reasons carried by a Close frame.
enum class CloseCode {
  Interrupted,
  GoAway,
  InternalError,
  AnotherConnectionStillOpen,
  InvalidPayload
};

int closeCodeNumber(CloseCode code) noexcept;
const char* closeCodeReason(CloseCode code) noexcept;

namespace frame {

struct Heartbeat {};
struct Open {};

struct Message {
  std::string payload;
};

struct MessageBatch {
  std::vector<std::string> payloads;
};

// Reserved, never emitted by the encoder.
struct MessageBlob {
  std::vector<std::uint8_t> bytes;
};

struct Close {
  CloseCode code;
};

} // namespace frame

using Frame = std::variant<
  frame::Heartbeat,
  frame::Open,
  frame::Message,
  frame::MessageBatch,
  frame::MessageBlob,
  frame::Close
>;

inline bool isClose(const Frame& f) { return std::holds_alternative<frame::Close>(f); }
inline bool isOpen(const Frame& f)  { return std::holds_alternative<frame::Open>(f); }

/// Short name of the frame alternative, for logs.
const char* frameKind(const Frame& f) noexcept;

/// Encode a frame with the WebSocket text framing:
///   h | o | a["msg"] | a["m1","m2"] | c[code,"reason"]
/// Returns nullopt for frames that have no text encoding (MessageBlob).
std::optional<std::string> encodeText(const Frame& f);

/// The close frame text on its own: c[code,"reason"]
std::string encodeClose(CloseCode code);

} // namespace sockjs
