#include "sockjs/rt/Interval.hpp"
#include "sockjs/util/Logger.hpp"

#include <boost/asio/post.hpp>

#include <exception>

namespace sockjs::rt {

using util::LogLevel;
using util::logger;

std::shared_ptr<Interval> Interval::create(boost::asio::io_context& ioc,
                                           std::string name,
                                           std::chrono::milliseconds period,
                                           Task task) {
  return std::shared_ptr<Interval>(new Interval(ioc, std::move(name), period, std::move(task)));
}

Interval::Interval(boost::asio::io_context& ioc, std::string name,
                   std::chrono::milliseconds period, Task task)
  : strand_(boost::asio::make_strand(ioc))
  , timer_(strand_)
  , name_(std::move(name))
  , period_(period)
  , task_(std::move(task))
{}

void Interval::start() {
  if (period_.count() <= 0 || !task_) {
    logger().log(LogLevel::Debug, "interval.disabled", { {"name", name_} });
    return;
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->arm(); });
}

void Interval::stop() {
  if (stopped_.exchange(true, std::memory_order_acq_rel)) return;
  boost::asio::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
}

void Interval::arm() {
  if (stopped()) return;
  timer_.expires_after(period_);
  timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
    if (ec) return;  // cancelled
    self->onTick();
  });
}

void Interval::onTick() {
  if (stopped()) return;
  ticks_.fetch_add(1, std::memory_order_relaxed);
  try {
    task_();
  } catch (const std::exception& ex) {
    logger().log(LogLevel::Error, "interval.task_failed", { {"name", name_}, {"what", ex.what()} });
  }
  arm();
}

} // namespace sockjs::rt
