#pragma once

#include <string>
#include <cstdint>

namespace sockjs {
namespace util {

class Config {
public:
  // Construct with sensible defaults.
  Config() = default;

  // Load from a simple "key=value" file (unknown keys ignored).
  // Returns true if file read successfully (even if some keys are unknown).
  bool loadFromFile(const std::string& path);

  // Apply a single key=value setting; returns false for unknown keys.
  bool set(const std::string& key, const std::string& value);

  // --- Listener ---
  std::string    wsAddress = "0.0.0.0";
  unsigned short wsPort    = 8080;
  unsigned       ioThreads = 2;

  // --- Registry ---
  unsigned      registryShards      = 4;
  std::uint32_t heartbeatIntervalMs = 25000;  // 0 disables heartbeats
  std::uint32_t disconnectDelayMs   = 5000;   // detached sessions reclaimed after this

  // --- Logging / metrics ---
  std::string logLevel  = "info";
  std::string logFormat = "text";  // "text" | "json"
  std::string logFile;             // empty -> stdout
  unsigned    metricsIntervalS = 0; // 0 disables the reporter

private:
  static bool parseLineKV(const std::string& line, std::string& k, std::string& v);
  static std::string trim(const std::string& s);
  void sanitize();
};

} // namespace util
} // namespace sockjs
