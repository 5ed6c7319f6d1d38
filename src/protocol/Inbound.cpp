#include "sockjs/protocol/Inbound.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace sockjs {

namespace {

Error malformed(std::string why) {
  return Error{ErrorCode::MalformedPayload, std::move(why)};
}

Result<Payloads> fromValue(const rapidjson::Value& v) {
  Payloads out;
  if (v.IsString()) {
    out.emplace_back(v.GetString(), v.GetStringLength());
    return out;
  }
  if (!v.IsArray()) {
    return malformed("expected an array of strings");
  }
  out.reserve(v.Size());
  for (const auto& item : v.GetArray()) {
    if (!item.IsString()) {
      return malformed("array element is not a string");
    }
    out.emplace_back(item.GetString(), item.GetStringLength());
  }
  return out;
}

} // namespace

Result<Payloads> decodeInbound(const std::string& text) {
  if (text.empty()) return Payloads{};

  if (text.front() == '[' && text.size() <= 2) {
    return Payloads{};
  }

  rapidjson::Document doc;
  doc.Parse(text.data(), text.size());
  if (doc.HasParseError()) {
    return malformed(std::string(rapidjson::GetParseError_En(doc.GetParseError())) +
                     " at offset " + std::to_string(doc.GetErrorOffset()));
  }
  return fromValue(doc);
}

} // namespace sockjs
