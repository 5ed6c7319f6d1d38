#pragma once
namespace sockjs::rt {

// Components the shutdown sequence can stop.
struct IStoppable {
  virtual ~IStoppable() = default;
  virtual void stop() = 0; // idempotent
  virtual bool stopped() const noexcept = 0;
};

} // namespace sockjs::rt
