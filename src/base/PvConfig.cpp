#include "PvConfig.hpp"

#include "SimpleIni.h"
#include "sago/platform_folders.h"

namespace pv {
namespace {
int64_t getInt(const CSimpleIniA &ini, const char *section, const char *key,
               int64_t defaultValue) {
  const char *value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return defaultValue;
  }
  try {
    return stoll(value);
  } catch (const std::exception &e) {
    throw std::runtime_error(string("Invalid integer for [") + section + "] " +
                             key + ": " + value);
  }
}

double getDouble(const CSimpleIniA &ini, const char *section, const char *key,
                 double defaultValue) {
  const char *value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return defaultValue;
  }
  try {
    return stod(value);
  } catch (const std::exception &e) {
    throw std::runtime_error(string("Invalid number for [") + section + "] " +
                             key + ": " + value);
  }
}
}  // namespace

string PvConfig::defaultPath() {
  return sago::getConfigHome() + "/ptyvisor/ptyvisor.ini";
}

PvConfig PvConfig::load(const string &path) {
  PvConfig config;
  if (!fs::exists(path)) {
    VLOG(1) << "No config file at " << path << ", using defaults";
    return config;
  }

  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  const char *hostPath = ini.GetValue("Host", "path", NULL);
  if (hostPath) {
    config.host.path = hostPath;
  }
  config.host.restartDelayMs =
      getInt(ini, "Host", "restart_delay_ms", config.host.restartDelayMs);
  config.host.chunkSize =
      size_t(getInt(ini, "Host", "chunk_size", config.host.chunkSize));
  const char *pattern = ini.GetValue("Host", "storm_pattern", NULL);
  if (pattern) {
    config.host.stormPattern = unescape(pattern);
  }
  config.host.stormThreshold =
      int(getInt(ini, "Host", "storm_threshold", config.host.stormThreshold));
  config.host.stormWindow =
      size_t(getInt(ini, "Host", "storm_window", config.host.stormWindow));

  MonitorSettings &monitor = config.monitor;
  monitor.intervalMs = getInt(ini, "Monitor", "interval_ms", monitor.intervalMs);
  monitor.maxMetricsHistory = size_t(
      getInt(ini, "Monitor", "max_metrics_history", monitor.maxMetricsHistory));
  monitor.maxAlertsHistory = size_t(
      getInt(ini, "Monitor", "max_alerts_history", monitor.maxAlertsHistory));
  MonitorThresholds &t = monitor.thresholds;
  t.memoryWarning =
      getInt(ini, "Monitor", "memory_warning_mb", t.memoryWarning >> 20) << 20;
  t.memoryCritical =
      getInt(ini, "Monitor", "memory_critical_mb", t.memoryCritical >> 20)
      << 20;
  t.latencyWarning =
      getDouble(ini, "Monitor", "latency_warning_ms", t.latencyWarning);
  t.latencyCritical =
      getDouble(ini, "Monitor", "latency_critical_ms", t.latencyCritical);
  t.bufferUtilizationWarning = getDouble(ini, "Monitor", "buffer_warning_pct",
                                         t.bufferUtilizationWarning);
  t.bufferUtilizationCritical = getDouble(
      ini, "Monitor", "buffer_critical_pct", t.bufferUtilizationCritical);
  t.droppedChunksWarning =
      getDouble(ini, "Monitor", "dropped_warning_pct", t.droppedChunksWarning);
  t.droppedChunksCritical = getDouble(ini, "Monitor", "dropped_critical_pct",
                                      t.droppedChunksCritical);

  config.bridge.maxReconnectAttempts =
      int(getInt(ini, "Bridge", "max_reconnect_attempts",
                 config.bridge.maxReconnectAttempts));
  config.bridge.maxQueue =
      size_t(getInt(ini, "Bridge", "max_queue", config.bridge.maxQueue));

  config.server.port = int(getInt(ini, "Server", "port", config.server.port));
  const char *bindIp = ini.GetValue("Server", "bind_ip", NULL);
  if (bindIp) {
    config.server.bindIp = bindIp;
  }

  config.verbose = int(getInt(ini, "Debug", "verbose", config.verbose));
  const char *logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config.maxLogSize = logsize;
  }
  config.silent = getInt(ini, "Debug", "silent", 0) != 0;

  LOG(INFO) << "Loaded config from " << path;
  return config;
}

string PvConfig::unescape(const string &s) {
  string out;
  for (size_t i = 0; i < s.size(); i++) {
    if (s[i] != '\\' || i + 1 == s.size()) {
      out.push_back(s[i]);
      continue;
    }
    char c = s[++i];
    switch (c) {
      case 'r':
        out.push_back('\r');
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'e':
        out.push_back('\x1b');
        break;
      case '\\':
        out.push_back('\\');
        break;
      case 'x': {
        string hex;
        while (hex.size() < 2 && i + 1 < s.size() &&
               isxdigit((unsigned char)s[i + 1])) {
          hex.push_back(s[++i]);
        }
        if (hex.empty()) {
          throw std::runtime_error("Invalid \\x escape in: " + s);
        }
        out.push_back(char(stoi(hex, nullptr, 16)));
        break;
      }
      default:
        out.push_back('\\');
        out.push_back(c);
        break;
    }
  }
  return out;
}
}  // namespace pv
