#include "sockjs/protocol/Frame.hpp"

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <type_traits>

namespace sockjs {

int closeCodeNumber(CloseCode code) noexcept {
  switch (code) {
    case CloseCode::Interrupted:                return 1002;
    case CloseCode::GoAway:                     return 3000;
    case CloseCode::InternalError:              return 1011;
    case CloseCode::AnotherConnectionStillOpen: return 2010;
    case CloseCode::InvalidPayload:             return 1007;
  }
  return 1011;
}

const char* closeCodeReason(CloseCode code) noexcept {
  switch (code) {
    case CloseCode::Interrupted:                return "Connection interrupted";
    case CloseCode::GoAway:                     return "Go away!";
    case CloseCode::InternalError:              return "Internal error";
    case CloseCode::AnotherConnectionStillOpen: return "Another connection still open";
    case CloseCode::InvalidPayload:             return "Broken JSON encoding";
  }
  return "Internal error";
}

const char* frameKind(const Frame& f) noexcept {
  switch (f.index()) {
    case 0: return "heartbeat";
    case 1: return "open";
    case 2: return "message";
    case 3: return "batch";
    case 4: return "blob";
    case 5: return "close";
  }
  return "unknown";
}

namespace {

using Writer = rapidjson::Writer<rapidjson::StringBuffer>;

void writeString(Writer& w, const std::string& s) {
  w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
}

std::string encodeMessages(const std::vector<std::string>& payloads) {
  rapidjson::StringBuffer sb;
  Writer w(sb);
  w.StartArray();
  for (const auto& p : payloads) writeString(w, p);
  w.EndArray();
  return std::string("a") + sb.GetString();
}

} // namespace

std::string encodeClose(CloseCode code) {
  rapidjson::StringBuffer sb;
  Writer w(sb);
  w.StartArray();
  w.Int(closeCodeNumber(code));
  w.String(closeCodeReason(code));
  w.EndArray();
  return std::string("c") + sb.GetString();
}

std::optional<std::string> encodeText(const Frame& f) {
  return std::visit([](const auto& v) -> std::optional<std::string> {
    using T = std::decay_t<decltype(v)>;
    if constexpr (std::is_same_v<T, frame::Heartbeat>) {
      return std::string("h");
    } else if constexpr (std::is_same_v<T, frame::Open>) {
      return std::string("o");
    } else if constexpr (std::is_same_v<T, frame::Message>) {
      return encodeMessages({v.payload});
    } else if constexpr (std::is_same_v<T, frame::MessageBatch>) {
      return encodeMessages(v.payloads);
    } else if constexpr (std::is_same_v<T, frame::Close>) {
      return encodeClose(v.code);
    } else {
      return std::nullopt;
    }
  }, f);
}

} // namespace sockjs
