#include "sockjs/util/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace sockjs {
namespace util {

std::string Config::trim(const std::string& s) {
  const auto is_ws = [](unsigned char c){ return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_ws);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_ws).base();
  if (b >= e) return {};
  return std::string(b, e);
}

bool Config::parseLineKV(const std::string& line, std::string& k, std::string& v) {
  auto pos = line.find('=');
  if (pos == std::string::npos) return false;
  k = trim(line.substr(0, pos));
  v = trim(line.substr(pos + 1));
  if (k.empty()) return false;
  return true;
}

bool Config::set(const std::string& key, const std::string& val) {
  const long n = std::atol(val.c_str());

  if      (key == "ws_address")            wsAddress           = val;
  else if (key == "ws_port")               wsPort              = static_cast<unsigned short>(std::clamp(n, 1L, 65535L));
  else if (key == "io_threads")            ioThreads           = static_cast<unsigned>(std::max(1L, n));
  else if (key == "registry_shards")       registryShards      = static_cast<unsigned>(std::max(1L, n));
  else if (key == "heartbeat_interval_ms") heartbeatIntervalMs = static_cast<std::uint32_t>(std::max(0L, n));
  else if (key == "disconnect_delay_ms")   disconnectDelayMs   = static_cast<std::uint32_t>(std::max(0L, n));
  else if (key == "log_level")             logLevel            = val;
  else if (key == "log_format")            logFormat           = val;
  else if (key == "log_file")              logFile             = val;
  else if (key == "metrics_interval_s")    metricsIntervalS    = static_cast<unsigned>(std::max(0L, n));
  else return false;
  return true;
}

void Config::sanitize() {
  if (logFormat != "json") logFormat = "text";
  if (ioThreads == 0) ioThreads = 1;
  if (registryShards == 0) registryShards = 1;
}

bool Config::loadFromFile(const std::string& path) {
  // key=value per line, '#' or ';' start comments.
  // Unknown keys are ignored so older builds accept newer files.
  FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;

  std::string line;
  line.reserve(1024);

  while (true) {
    char tmp[1024];
    if (!std::fgets(tmp, sizeof(tmp), f)) break;
    line.assign(tmp);

    // Strip CR/LF
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

    auto s = trim(line);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == ';') continue; // comment

    std::string key, val;
    if (!parseLineKV(s, key, val)) continue;
    (void)set(key, val);
  }

  std::fclose(f);
  sanitize();
  return true;
}

} // namespace util
} // namespace sockjs
