#pragma once

#include "sockjs/runtime/IStoppable.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace sockjs::rt {

/// Runs a task every `period` on its own strand until stopped.
/// A zero period makes start() a no-op.
class Interval final : public IStoppable,
                       public std::enable_shared_from_this<Interval> {
public:
  using Task = std::function<void()>;

  static std::shared_ptr<Interval> create(boost::asio::io_context& ioc,
                                          std::string name,
                                          std::chrono::milliseconds period,
                                          Task task);

  void start();
  void stop() override;
  bool stopped() const noexcept override { return stopped_.load(std::memory_order_acquire); }

  std::uint64_t ticks() const noexcept { return ticks_.load(std::memory_order_relaxed); }
  std::chrono::milliseconds period() const noexcept { return period_; }

private:
  Interval(boost::asio::io_context& ioc, std::string name,
           std::chrono::milliseconds period, Task task);

  void arm();
  void onTick();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::string name_;
  std::chrono::milliseconds period_;
  Task task_;

  std::atomic<bool> stopped_{false};
  std::atomic<std::uint64_t> ticks_{0};
};

} // namespace sockjs::rt
