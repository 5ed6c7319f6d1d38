#pragma once

#include "sockjs/Result.hpp"

#include <string>
#include <vector>

namespace sockjs {

using Payloads = std::vector<std::string>;

/// Decode client->server text into application payloads.
///
/// Accepted forms:
///   ["m1","m2"]   JSON array of strings (the usual client framing)
///   "m1"          a bare JSON string, delivered as one payload
/// Empty text and "[]" decode to an empty list. Anything else, including
/// arrays holding non-string elements, is MalformedPayload.
Result<Payloads> decodeInbound(const std::string& text);

} // namespace sockjs
