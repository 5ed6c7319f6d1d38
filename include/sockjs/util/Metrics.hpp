#pragma once

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace sockjs {
namespace util {

// A very small, thread-safe in-process metrics registry.
// - Counters are "add-only" numbers.
// - Gauges are "set" numbers.
// Optional: can run a background reporter thread that logs and resets counters.
class MetricRegistry {
public:
  static MetricRegistry& instance() {
    static MetricRegistry inst;
    return inst;
  }

  MetricRegistry() = default;
  ~MetricRegistry();

  MetricRegistry(const MetricRegistry&)            = delete;
  MetricRegistry& operator=(const MetricRegistry&) = delete;
  MetricRegistry(MetricRegistry&&)                 = delete;
  MetricRegistry& operator=(MetricRegistry&&)      = delete;

  // Start/stop a background reporter that logs counters every N seconds.
  void startReporter(unsigned int intervalSeconds = 10);
  void stopReporter();

  void increment(const std::string& name, double v = 1.0);
  void add(const std::string& name, double v) { increment(name, v); }
  void setGauge(const std::string& name, double v);

  double counter(const std::string& name) const;

  // Snapshots (cheap copies) for debug/admin endpoints.
  std::unordered_map<std::string, double> snapshotCounters() const;
  std::unordered_map<std::string, double> snapshotGauges() const;

  void reset();

private:
  void reporterLoop(unsigned int intervalSeconds);

private:
  mutable std::mutex mu_;
  std::unordered_map<std::string, double> counters_;
  std::unordered_map<std::string, double> gauges_;

  std::mutex              stopMu_;
  std::condition_variable stopCv_;
  std::atomic<bool> running_{false};
  std::thread thr_;
};

} // namespace util

#define SOCKJS_METRIC_INC(name, d) ::sockjs::util::MetricRegistry::instance().increment((name), (d))
#define SOCKJS_METRIC_HIT(name)    ::sockjs::util::MetricRegistry::instance().increment((name), 1.0)
#define SOCKJS_METRIC_SET(name, v) ::sockjs::util::MetricRegistry::instance().setGauge((name), (v))

} // namespace sockjs
