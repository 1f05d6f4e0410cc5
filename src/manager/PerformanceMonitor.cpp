#include "PerformanceMonitor.hpp"

#include "JsonLib.hpp"

namespace pv {
namespace {
/** @brief At most two decimals, no trailing zeros ("87.5", "90"). */
string formatNumber(double value) {
  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2) << value;
  string s = ss.str();
  s.erase(s.find_last_not_of('0') + 1);
  if (!s.empty() && s.back() == '.') {
    s.pop_back();
  }
  return s;
}

json sampleToJson(const PerformanceSample& sample) {
  json j;
  j["terminalId"] = sample.terminalId;
  j["strategy"] = sample.strategy;
  j["bufferHealth"] = {
      {"status", bufferHealthName(sample.bufferHealth.status)},
      {"utilizationPercent", sample.bufferHealth.utilizationPercent},
      {"averageLatency", sample.bufferHealth.averageLatency},
      {"droppedChunksPercent", sample.bufferHealth.droppedChunksPercent}};
  j["bufferMetrics"] = {
      {"totalChunks", sample.bufferMetrics.totalChunks},
      {"totalBytes", sample.bufferMetrics.totalBytes},
      {"droppedChunks", sample.bufferMetrics.droppedChunks},
      {"avgChunkSize", sample.bufferMetrics.avgChunkSize},
      {"maxBufferSize", sample.bufferMetrics.maxBufferSize},
      {"currentBufferSize", sample.bufferMetrics.currentBufferSize},
      {"processingLatency", sample.bufferMetrics.processingLatency}};
  j["systemMetrics"] = {{"memoryUsage", sample.systemMetrics.memoryUsage},
                        {"cpuUsage", sample.systemMetrics.cpuUsage},
                        {"pid", sample.systemMetrics.pid},
                        {"isRunning", sample.systemMetrics.isRunning}};
  j["timestamp"] = sample.timestamp;
  return j;
}

json alertToJson(const PerformanceAlert& alert) {
  return {{"terminalId", alert.terminalId},
          {"type", alertTypeName(alert.type)},
          {"severity", alertSeverityName(alert.severity)},
          {"message", alert.message},
          {"recommendation", alert.recommendation},
          {"timestamp", alert.timestamp}};
}
}  // namespace

string alertTypeName(AlertType type) {
  switch (type) {
    case ALERT_MEMORY:
      return "memory";
    case ALERT_LATENCY:
      return "latency";
    case ALERT_BUFFER:
      return "buffer";
    case ALERT_CPU:
      return "cpu";
  }
  return "memory";
}

string alertSeverityName(AlertSeverity severity) {
  switch (severity) {
    case SEVERITY_LOW:
      return "low";
    case SEVERITY_MEDIUM:
      return "medium";
    case SEVERITY_HIGH:
      return "high";
  }
  return "low";
}

PerformanceMonitor::PerformanceMonitor(
    shared_ptr<TimerQueue> _timers, const MonitorSettings& _settings,
    shared_ptr<ProcessMetricsSource> _processMetrics)
    : timers(_timers),
      settings(_settings),
      processMetrics(_processMetrics),
      monitoring(false),
      samplingTimer(0) {
  VLOG(1) << "Performance monitor initialized: interval "
          << settings.intervalMs << "ms, history "
          << settings.maxMetricsHistory << " samples / "
          << settings.maxAlertsHistory << " alerts";
}

PerformanceMonitor::~PerformanceMonitor() {
  if (samplingTimer) {
    timers->cancel(samplingTimer);
  }
}

void PerformanceMonitor::registerTerminal(
    const string& terminalId, shared_ptr<MonitoredTerminal> terminal,
    const string& strategy) {
  MonitoredEntry entry;
  entry.terminal = terminal;
  entry.instrumentation = terminal->getInstrumentation();
  entry.strategy = strategy;
  terminals[terminalId] = entry;
  LOG(INFO) << "Registered terminal " << terminalId << " with strategy "
            << strategy;
  if (!monitoring) {
    startMonitoring();
  }
}

void PerformanceMonitor::unregisterTerminal(const string& terminalId) {
  if (terminals.erase(terminalId)) {
    LOG(INFO) << "Unregistered terminal " << terminalId;
  }
  if (terminals.empty()) {
    stopMonitoring();
  }
}

bool PerformanceMonitor::isRegistered(const string& terminalId) const {
  return terminals.find(terminalId) != terminals.end();
}

void PerformanceMonitor::startMonitoring() {
  if (monitoring) {
    return;
  }
  monitoring = true;
  scheduleNextSample();
  LOG(INFO) << "Started performance monitoring";
  MonitorEvent event;
  event.type = MONITOR_STARTED;
  eventRegistry.emit(event);
}

void PerformanceMonitor::stopMonitoring() {
  if (!monitoring) {
    return;
  }
  monitoring = false;
  if (samplingTimer) {
    timers->cancel(samplingTimer);
    samplingTimer = 0;
  }
  LOG(INFO) << "Stopped performance monitoring";
  MonitorEvent event;
  event.type = MONITOR_STOPPED;
  eventRegistry.emit(event);
}

void PerformanceMonitor::scheduleNextSample() {
  samplingTimer = timers->schedule(settings.intervalMs, [this]() {
    samplingTimer = 0;
    collectMetrics();
    if (monitoring && !samplingTimer) {
      scheduleNextSample();
    }
  });
}

PerformanceSample PerformanceMonitor::sampleTerminal(
    const string& terminalId, const MonitoredEntry& entry, int64_t timestamp) {
  PerformanceSample sample;
  sample.terminalId = terminalId;
  sample.strategy = entry.strategy;
  sample.timestamp = timestamp;
  if (entry.instrumentation) {
    sample.bufferHealth = entry.instrumentation->getBufferHealth();
    sample.bufferMetrics = entry.instrumentation->getBufferMetrics();
  }
  sample.systemMetrics.pid = entry.terminal->getPid();
  sample.systemMetrics.isRunning = entry.terminal->isRunning();
  ProcessUsage usage = processMetrics->sample(sample.systemMetrics.pid);
  sample.systemMetrics.memoryUsage = usage.memoryBytes;
  sample.systemMetrics.cpuUsage = usage.cpuMicros;
  return sample;
}

void PerformanceMonitor::collectMetrics() {
  int64_t timestamp = epochMillis();
  // Alert listeners may unregister terminals.
  vector<string> ids;
  for (const auto& it : terminals) {
    ids.push_back(it.first);
  }
  for (const string& id : ids) {
    auto it = terminals.find(id);
    if (it == terminals.end()) {
      continue;
    }
    MonitoredEntry& entry = it->second;
    PerformanceSample sample;
    try {
      sample = sampleTerminal(id, entry, timestamp);
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Error collecting metrics for " << id << ": "
                 << ex.what();
      continue;
    }

    entry.samples.push_back(sample);
    while (entry.samples.size() > settings.maxMetricsHistory) {
      entry.samples.pop_front();
    }

    vector<PerformanceAlert> alerts = analyze(sample);
    for (const auto& alert : alerts) {
      entry.alerts.push_back(alert);
    }
    while (entry.alerts.size() > settings.maxAlertsHistory) {
      entry.alerts.pop_front();
    }
    for (const auto& alert : alerts) {
      LOG(WARNING) << "Performance alert for " << id << ": " << alert.message;
      MonitorEvent event;
      event.type = MONITOR_ALERT;
      event.alert = alert;
      eventRegistry.emit(event);
    }
  }

  MonitorEvent update;
  update.type = MONITOR_PERFORMANCE_UPDATE;
  update.stats = getGlobalStats();
  eventRegistry.emit(update);
}

vector<PerformanceAlert> PerformanceMonitor::analyze(
    const PerformanceSample& sample) const {
  const MonitorThresholds& t = settings.thresholds;
  vector<PerformanceAlert> alerts;
  auto addAlert = [&](AlertType type, AlertSeverity severity,
                      const string& message, const string& recommendation) {
    PerformanceAlert alert;
    alert.terminalId = sample.terminalId;
    alert.type = type;
    alert.severity = severity;
    alert.message = message;
    alert.recommendation = recommendation;
    alert.timestamp = sample.timestamp;
    alerts.push_back(alert);
  };

  int64_t memory = sample.systemMetrics.memoryUsage;
  string memoryMb = to_string(int64_t(std::llround(memory / 1024.0 / 1024.0)));
  if (memory > t.memoryCritical) {
    addAlert(ALERT_MEMORY, SEVERITY_HIGH, "High memory usage: " + memoryMb + "MB",
             "Consider reducing buffer size or closing unused terminals");
  } else if (memory > t.memoryWarning) {
    addAlert(ALERT_MEMORY, SEVERITY_MEDIUM,
             "Elevated memory usage: " + memoryMb + "MB",
             "Monitor memory usage and consider optimization");
  }

  const BufferHealth& health = sample.bufferHealth;
  string latency = formatNumber(health.averageLatency);
  if (health.averageLatency > t.latencyCritical) {
    addAlert(ALERT_LATENCY, SEVERITY_HIGH,
             "High buffer latency: " + latency + "ms",
             "Reduce flush interval or increase chunk processing rate");
  } else if (health.averageLatency > t.latencyWarning) {
    addAlert(ALERT_LATENCY, SEVERITY_MEDIUM,
             "Elevated buffer latency: " + latency + "ms",
             "Consider buffer optimization");
  }

  string utilization = formatNumber(health.utilizationPercent);
  if (health.utilizationPercent > t.bufferUtilizationCritical) {
    addAlert(ALERT_BUFFER, SEVERITY_HIGH,
             "Buffer critically full: " + utilization + "%",
             "Increase buffer size or improve processing speed");
  } else if (health.utilizationPercent > t.bufferUtilizationWarning) {
    addAlert(ALERT_BUFFER, SEVERITY_MEDIUM,
             "Buffer utilization high: " + utilization + "%",
             "Monitor buffer usage");
  }

  string dropped = formatNumber(health.droppedChunksPercent);
  if (health.droppedChunksPercent > t.droppedChunksCritical) {
    addAlert(ALERT_BUFFER, SEVERITY_HIGH,
             "High data loss: " + dropped + "% chunks dropped",
             "Increase buffer size or optimize processing pipeline");
  } else if (health.droppedChunksPercent > t.droppedChunksWarning) {
    addAlert(ALERT_BUFFER, SEVERITY_MEDIUM,
             "Data loss detected: " + dropped + "% chunks dropped",
             "Monitor and consider buffer optimization");
  }
  return alerts;
}

GlobalPerformanceStats PerformanceMonitor::getGlobalStats() const {
  GlobalPerformanceStats stats;
  stats.totalTerminals = terminals.size();
  double totalLatency = 0;
  int latencyCount = 0;
  for (const auto& it : terminals) {
    const MonitoredEntry& entry = it.second;
    if (entry.terminal->isRunning()) {
      stats.activeTerminals++;
    }
    if (!entry.samples.empty()) {
      const PerformanceSample& recent = entry.samples.back();
      stats.totalMemoryUsage += recent.systemMetrics.memoryUsage;
      totalLatency += recent.bufferHealth.averageLatency;
      latencyCount++;
      switch (recent.bufferHealth.status) {
        case BUFFER_HEALTHY:
          stats.healthyTerminals++;
          break;
        case BUFFER_WARNING:
          stats.warningTerminals++;
          break;
        case BUFFER_CRITICAL:
          stats.criticalTerminals++;
          break;
      }
    }
    stats.alertCount += entry.alerts.size();
  }
  if (latencyCount > 0) {
    stats.averageLatency = totalLatency / latencyCount;
  }
  return stats;
}

vector<PerformanceSample> PerformanceMonitor::getTerminalMetrics(
    const string& terminalId, size_t limit) const {
  auto it = terminals.find(terminalId);
  if (it == terminals.end()) {
    return {};
  }
  const auto& samples = it->second.samples;
  size_t start = samples.size() > limit ? samples.size() - limit : 0;
  return vector<PerformanceSample>(samples.begin() + start, samples.end());
}

vector<PerformanceAlert> PerformanceMonitor::getTerminalAlerts(
    const string& terminalId, size_t limit) const {
  auto it = terminals.find(terminalId);
  if (it == terminals.end()) {
    return {};
  }
  const auto& alerts = it->second.alerts;
  size_t start = alerts.size() > limit ? alerts.size() - limit : 0;
  return vector<PerformanceAlert>(alerts.begin() + start, alerts.end());
}

void PerformanceMonitor::clearTerminalData(const string& terminalId) {
  auto it = terminals.find(terminalId);
  if (it == terminals.end()) {
    return;
  }
  it->second.samples.clear();
  it->second.alerts.clear();
  LOG(INFO) << "Cleared performance data for terminal " << terminalId;
}

void PerformanceMonitor::updateConfig(const MonitorSettings& newSettings) {
  bool intervalChanged = newSettings.intervalMs != settings.intervalMs;
  settings = newSettings;
  for (auto& it : terminals) {
    while (it.second.samples.size() > settings.maxMetricsHistory) {
      it.second.samples.pop_front();
    }
    while (it.second.alerts.size() > settings.maxAlertsHistory) {
      it.second.alerts.pop_front();
    }
  }
  if (intervalChanged && monitoring) {
    stopMonitoring();
    startMonitoring();
  }
  LOG(INFO) << "Performance monitor configuration updated";
}

string PerformanceMonitor::exportData() const {
  json data;
  data["terminals"] = json::array();
  data["metrics"] = json::object();
  data["alerts"] = json::object();
  for (const auto& it : terminals) {
    data["terminals"].push_back(it.first);
    json samples = json::array();
    for (const auto& sample : it.second.samples) {
      samples.push_back(sampleToJson(sample));
    }
    data["metrics"][it.first] = samples;
    json alerts = json::array();
    for (const auto& alert : it.second.alerts) {
      alerts.push_back(alertToJson(alert));
    }
    data["alerts"][it.first] = alerts;
  }

  GlobalPerformanceStats stats = getGlobalStats();
  data["globalStats"] = {{"totalTerminals", stats.totalTerminals},
                         {"activeTerminals", stats.activeTerminals},
                         {"totalMemoryUsage", stats.totalMemoryUsage},
                         {"averageLatency", stats.averageLatency},
                         {"alertCount", stats.alertCount},
                         {"healthyTerminals", stats.healthyTerminals},
                         {"warningTerminals", stats.warningTerminals},
                         {"criticalTerminals", stats.criticalTerminals}};

  const MonitorThresholds& t = settings.thresholds;
  data["config"] = {
      {"monitoringInterval", settings.intervalMs},
      {"maxMetricsHistory", settings.maxMetricsHistory},
      {"maxAlertsHistory", settings.maxAlertsHistory},
      {"thresholds",
       {{"memoryWarning", t.memoryWarning},
        {"memoryCritical", t.memoryCritical},
        {"latencyWarning", t.latencyWarning},
        {"latencyCritical", t.latencyCritical},
        {"bufferUtilizationWarning", t.bufferUtilizationWarning},
        {"bufferUtilizationCritical", t.bufferUtilizationCritical},
        {"droppedChunksWarning", t.droppedChunksWarning},
        {"droppedChunksCritical", t.droppedChunksCritical}}}};
  data["timestamp"] = epochMillis();
  return dumpJson(data);
}

void PerformanceMonitor::destroy() {
  stopMonitoring();
  terminals.clear();
  eventRegistry.clear();
  LOG(INFO) << "Performance monitor destroyed";
}
}  // namespace pv
