#ifndef __PV_PERFORMANCE_MONITOR__
#define __PV_PERFORMANCE_MONITOR__

#include "EventRegistry.hpp"
#include "Headers.hpp"
#include "ProcessMetrics.hpp"
#include "PvConfig.hpp"
#include "Terminal.hpp"
#include "TimerQueue.hpp"

namespace pv {
struct SystemMetrics {
  int64_t memoryUsage = 0;
  int64_t cpuUsage = 0;
  pid_t pid = -1;
  bool isRunning = false;
};

struct PerformanceSample {
  string terminalId;
  string strategy;
  BufferHealth bufferHealth;
  BufferMetrics bufferMetrics;
  SystemMetrics systemMetrics;
  int64_t timestamp = 0;
};

enum AlertType {
  ALERT_MEMORY = 0,
  ALERT_LATENCY = 1,
  ALERT_BUFFER = 2,
  ALERT_CPU = 3,
};

enum AlertSeverity {
  SEVERITY_LOW = 0,
  SEVERITY_MEDIUM = 1,
  SEVERITY_HIGH = 2,
};

string alertTypeName(AlertType type);
string alertSeverityName(AlertSeverity severity);

struct PerformanceAlert {
  string terminalId;
  AlertType type = ALERT_MEMORY;
  AlertSeverity severity = SEVERITY_LOW;
  string message;
  string recommendation;
  int64_t timestamp = 0;
};

struct GlobalPerformanceStats {
  int totalTerminals = 0;
  int activeTerminals = 0;
  int64_t totalMemoryUsage = 0;
  double averageLatency = 0;
  int alertCount = 0;
  int healthyTerminals = 0;
  int warningTerminals = 0;
  int criticalTerminals = 0;
};

enum MonitorEventType {
  MONITOR_STARTED = 0,
  MONITOR_STOPPED = 1,
  MONITOR_PERFORMANCE_UPDATE = 2,
  MONITOR_ALERT = 3,
};

struct MonitorEvent {
  MonitorEventType type;
  GlobalPerformanceStats stats;
  PerformanceAlert alert;
};

/**
 * @brief Samples registered terminals on a fixed interval and raises alerts
 * when memory, buffer latency, buffer utilization or data loss cross their
 * thresholds.
 *
 * Sampling runs on the owner's TimerQueue while at least one terminal is
 * registered.  Whether a terminal reports buffer statistics is decided once,
 * at registration; terminals without them are sampled with a healthy, zeroed
 * baseline.
 */
class PerformanceMonitor {
 public:
  PerformanceMonitor(shared_ptr<TimerQueue> _timers,
                     const MonitorSettings& _settings,
                     shared_ptr<ProcessMetricsSource> _processMetrics);
  ~PerformanceMonitor();

  void registerTerminal(const string& terminalId,
                        shared_ptr<MonitoredTerminal> terminal,
                        const string& strategy);
  /** @brief Drops the terminal and its history.  Unknown ids are ignored. */
  void unregisterTerminal(const string& terminalId);
  bool isRegistered(const string& terminalId) const;

  void startMonitoring();
  void stopMonitoring();
  bool isMonitoring() const { return monitoring; }

  /** @brief One sampling pass over every registered terminal. */
  void collectMetrics();

  GlobalPerformanceStats getGlobalStats() const;
  /** @brief The most recent `limit` samples, oldest first. */
  vector<PerformanceSample> getTerminalMetrics(const string& terminalId,
                                               size_t limit = 10) const;
  vector<PerformanceAlert> getTerminalAlerts(const string& terminalId,
                                             size_t limit = 10) const;
  void clearTerminalData(const string& terminalId);
  /** @brief Applies new settings, restarting the sampler if running. */
  void updateConfig(const MonitorSettings& newSettings);
  const MonitorSettings& getConfig() const { return settings; }

  /** @brief JSON document with config, globalStats, terminals, metrics,
   * alerts and a timestamp. */
  string exportData() const;

  /** @brief Stops sampling and forgets every terminal. */
  void destroy();

  EventRegistry<MonitorEvent>& events() { return eventRegistry; }

 protected:
  struct MonitoredEntry {
    shared_ptr<MonitoredTerminal> terminal;
    InstrumentedTerminal* instrumentation;
    string strategy;
    std::deque<PerformanceSample> samples;
    std::deque<PerformanceAlert> alerts;
  };

  shared_ptr<TimerQueue> timers;
  MonitorSettings settings;
  shared_ptr<ProcessMetricsSource> processMetrics;
  map<string, MonitoredEntry> terminals;
  bool monitoring;
  uint64_t samplingTimer;
  EventRegistry<MonitorEvent> eventRegistry;

  void scheduleNextSample();
  PerformanceSample sampleTerminal(const string& terminalId,
                                   const MonitoredEntry& entry,
                                   int64_t timestamp);
  vector<PerformanceAlert> analyze(const PerformanceSample& sample) const;
};
}  // namespace pv

#endif  // __PV_PERFORMANCE_MONITOR__
