#include "sockjs/util/Metrics.hpp"
#include "sockjs/util/Logger.hpp"

#include <chrono>
#include <sstream>
#include <vector>

namespace sockjs {
namespace util {

MetricRegistry::~MetricRegistry() {
  stopReporter();
}

void MetricRegistry::startReporter(unsigned int intervalSeconds) {
  // If already running, restart with new interval.
  stopReporter();

  running_.store(true, std::memory_order_release);
  thr_ = std::thread([this, intervalSeconds]{
    reporterLoop(intervalSeconds);
  });
}

void MetricRegistry::stopReporter() {
  {
    std::lock_guard<std::mutex> lk(stopMu_);
    running_.store(false, std::memory_order_release);
  }
  stopCv_.notify_all();
  if (thr_.joinable()) thr_.join();
}

void MetricRegistry::increment(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  counters_[name] += v;
}

void MetricRegistry::setGauge(const std::string& name, double v) {
  std::lock_guard<std::mutex> lk(mu_);
  gauges_[name] = v;
}

double MetricRegistry::counter(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = counters_.find(name);
  return it == counters_.end() ? 0.0 : it->second;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotCounters() const {
  std::lock_guard<std::mutex> lk(mu_);
  return counters_;
}

std::unordered_map<std::string, double> MetricRegistry::snapshotGauges() const {
  std::lock_guard<std::mutex> lk(mu_);
  return gauges_;
}

void MetricRegistry::reset() {
  std::lock_guard<std::mutex> lk(mu_);
  counters_.clear();
  gauges_.clear();
}

void MetricRegistry::reporterLoop(unsigned int intervalSeconds) {
  using namespace std::chrono;
  auto sleep_dur = seconds(intervalSeconds > 0 ? intervalSeconds : 10);

  while (running_.load(std::memory_order_acquire)) {
    {
      std::unique_lock<std::mutex> lk(stopMu_);
      stopCv_.wait_for(lk, sleep_dur, [this]{ return !running_.load(std::memory_order_acquire); });
    }
    if (!running_.load(std::memory_order_acquire)) break;

    // Snapshot under lock, zero the counters after emission
    std::unordered_map<std::string, double> c;
    std::unordered_map<std::string, double> g;
    {
      std::lock_guard<std::mutex> lk(mu_);
      c.swap(counters_);
      g = gauges_;
    }
    if (c.empty() && g.empty()) continue;

    std::vector<Field> fields;
    fields.reserve(c.size() + g.size());
    for (auto& kv : c) {
      std::ostringstream v; v << kv.second;
      fields.push_back({kv.first, v.str()});
    }
    for (auto& kv : g) {
      std::ostringstream v; v << kv.second;
      fields.push_back({kv.first, v.str()});
    }
    logger().log(LogLevel::Info, "metrics", fields);
  }
}

} // namespace util
} // namespace sockjs
