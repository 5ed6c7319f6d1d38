#pragma once

#include <string>
#include <utility>
#include <variant>

namespace sockjs {

enum class ErrorCode : int {
  SessionBusy,
  RegistryUnavailable,
  MalformedPayload
};

const char* errorCodeName(ErrorCode code) noexcept;

struct Error {
  ErrorCode code;
  std::string message;

  std::string describe() const {
    return std::string(errorCodeName(code)) + ": " + message;
  }
};

template <typename T>
class Result {
public:
  Result(const T& value) : _value(value) {}
  Result(T&& value) : _value(std::move(value)) {}
  Result(const Error& error) : _value(error) {}
  Result(Error&& error) : _value(std::move(error)) {}

  bool has_value() const { return std::holds_alternative<T>(_value); }
  explicit operator bool() const { return has_value(); }

  T& value() { return std::get<T>(_value); }
  const T& value() const { return std::get<T>(_value); }

  const Error& error() const { return std::get<Error>(_value); }

  T& operator*() { return value(); }
  const T& operator*() const { return value(); }

  T* operator->() { return &value(); }
  const T* operator->() const { return &value(); }

private:
  std::variant<T, Error> _value;
};

inline const char* errorCodeName(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::SessionBusy:         return "SessionBusy";
    case ErrorCode::RegistryUnavailable: return "RegistryUnavailable";
    case ErrorCode::MalformedPayload:    return "MalformedPayload";
  }
  return "Unknown";
}

} // namespace sockjs
