#ifndef __PV_CONFIG__
#define __PV_CONFIG__

#include "Headers.hpp"

namespace pv {
/** @brief Host process supervision and output shaping. */
struct HostSettings {
  /** @brief Path of the pvhost binary; empty means next to the caller. */
  string path;
  int64_t restartDelayMs = 1000;
  size_t chunkSize = 1024;
  /** @brief Byte pattern treated as a runaway resize redraw. */
  string stormPattern = "\r\r\x1b[m\x1b[m\x1b[m\x1b[J";
  /** @brief Matches tolerated before suppression starts. */
  int stormThreshold = 2;
  /** @brief Recent-output window (bytes) searched for the pattern. */
  size_t stormWindow = 1000;
};

struct MonitorThresholds {
  int64_t memoryWarning = 50 * 1024 * 1024;
  int64_t memoryCritical = 100 * 1024 * 1024;
  double latencyWarning = 50;
  double latencyCritical = 100;
  double bufferUtilizationWarning = 70;
  double bufferUtilizationCritical = 85;
  double droppedChunksWarning = 1;
  double droppedChunksCritical = 5;
};

struct MonitorSettings {
  int64_t intervalMs = 5000;
  size_t maxMetricsHistory = 100;
  size_t maxAlertsHistory = 50;
  MonitorThresholds thresholds;
};

struct BridgeSettings {
  int maxReconnectAttempts = 5;
  size_t maxQueue = 1000;
};

struct ServerSettings {
  int port = 3001;
  string bindIp;
};

/**
 * @brief Process-wide settings read from an INI file.  Missing keys keep
 * their defaults.
 */
struct PvConfig {
  HostSettings host;
  MonitorSettings monitor;
  BridgeSettings bridge;
  ServerSettings server;
  int verbose = 0;
  string maxLogSize = "20971520";
  bool silent = false;

  /** @brief `<config home>/ptyvisor/ptyvisor.ini` */
  static string defaultPath();

  /**
   * @brief Loads settings from `path`.
   * @throws std::runtime_error if the file exists but cannot be parsed.
   * @return Defaults when the file does not exist.
   */
  static PvConfig load(const string &path);

  /**
   * @brief Expands C-style escapes (\r, \n, \t, \\, \xHH, \e) so binary
   * patterns can be written in a text file.
   */
  static string unescape(const string &s);
};
}  // namespace pv

#endif  // __PV_CONFIG__
