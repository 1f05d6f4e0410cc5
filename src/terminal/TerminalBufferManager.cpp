#include "TerminalBufferManager.hpp"

namespace pv {
string bufferHealthName(BufferHealthStatus status) {
  switch (status) {
    case BUFFER_HEALTHY:
      return "healthy";
    case BUFFER_WARNING:
      return "warning";
    case BUFFER_CRITICAL:
      return "critical";
  }
  return "healthy";
}

TerminalBufferManager::TerminalBufferManager(const BufferConfig& _config)
    : TerminalBufferManager(_config,
                            []() { return std::chrono::steady_clock::now(); }) {}

TerminalBufferManager::TerminalBufferManager(const BufferConfig& _config,
                                             Clock _clock)
    : config(_config), clock(_clock), sequenceCounter(0), paused(false) {
  if (config.chunkSize == 0 || config.maxBufferSize == 0) {
    throw std::runtime_error("Buffer sizes must be positive");
  }
  metrics.maxBufferSize = config.maxBufferSize;
  lastFlush = clock();
  VLOG(1) << "Buffer manager initialized: max " << config.maxBufferSize
          << " bytes, chunk " << config.chunkSize << " bytes, flush every "
          << config.flushIntervalMs << "ms";
}

void TerminalBufferManager::addData(const string& data) {
  if (data.empty()) {
    return;
  }
  TimePoint now = clock();

  if (shouldDropOldChunks()) {
    dropOldChunks();
  }

  for (size_t offset = 0; offset < data.size(); offset += config.chunkSize) {
    addChunk(data.substr(offset, config.chunkSize), now);
  }

  if (isUrgentData(data)) {
    flush(chunks.size());
  }
}

bool TerminalBufferManager::isUrgentData(const string& data) {
  if (data.length() >= URGENT_MAX_LENGTH) {
    return false;
  }
  static const char* urgentPatterns[] = {"\x1b[", "\r", "\n", "\x07",
                                         "\x1b]0;"};
  for (const char* pattern : urgentPatterns) {
    if (data.find(pattern) != string::npos) {
      return true;
    }
  }
  return false;
}

void TerminalBufferManager::addChunk(const string& data, TimePoint timestamp) {
  chunks.push_back(Chunk{data, timestamp, sequenceCounter++});
  metrics.totalChunks++;
  metrics.totalBytes += data.size();
  metrics.currentBufferSize += data.size();
  metrics.avgChunkSize = double(metrics.totalBytes) / metrics.totalChunks;
}

bool TerminalBufferManager::shouldDropOldChunks() const {
  double utilization =
      double(metrics.currentBufferSize) / double(config.maxBufferSize);
  return utilization > config.dropThreshold;
}

void TerminalBufferManager::dropOldChunks() {
  size_t dropCount = size_t(chunks.size() * 0.3);
  int64_t droppedBytes = 0;
  for (size_t a = 0; a < dropCount; a++) {
    droppedBytes += chunks.front().data.size();
    chunks.pop_front();
  }
  metrics.currentBufferSize -= droppedBytes;
  metrics.droppedChunks += dropCount;

  LOG(WARNING) << "Dropped " << dropCount << " chunks (" << droppedBytes
               << " bytes) due to memory pressure";

  BufferEvent event;
  event.type = BUFFER_CHUNKS_DROPPED;
  event.droppedCount = dropCount;
  event.droppedBytes = droppedBytes;
  event.remainingChunks = chunks.size();
  eventRegistry.emit(event);
}

bool TerminalBufferManager::flushIfDue() {
  if (paused) {
    return false;
  }
  TimePoint now = clock();
  if (now - lastFlush < std::chrono::milliseconds(config.flushIntervalMs)) {
    return false;
  }
  lastFlush = now;
  if (chunks.empty()) {
    return false;
  }
  flush(config.maxChunksPerFlush);
  return true;
}

void TerminalBufferManager::flushAll() {
  while (!chunks.empty()) {
    flush(chunks.size());
  }
}

void TerminalBufferManager::flush(size_t maxChunks) {
  if (chunks.empty()) {
    return;
  }
  TimePoint start = clock();

  size_t count = min(maxChunks, chunks.size());
  vector<Chunk> taken(chunks.begin(), chunks.begin() + count);
  chunks.erase(chunks.begin(), chunks.begin() + count);
  for (const auto& chunk : taken) {
    metrics.currentBufferSize -= chunk.data.size();
  }

  for (const string& batch : createBatches(taken)) {
    BufferEvent event;
    event.type = BUFFER_DATA_READY;
    event.data = batch;
    eventRegistry.emit(event);
  }

  double elapsedMs =
      std::chrono::duration<double, std::milli>(clock() - start).count();
  recordProcessingTime(elapsedMs);
}

vector<string> TerminalBufferManager::createBatches(
    const vector<Chunk>& batchChunks) const {
  vector<string> batches;
  string current;
  for (const auto& chunk : batchChunks) {
    if (!current.empty() &&
        current.size() + chunk.data.size() > config.chunkSize) {
      batches.push_back(current);
      current = chunk.data;
    } else {
      current += chunk.data;
    }
  }
  if (!current.empty()) {
    batches.push_back(current);
  }
  return batches;
}

void TerminalBufferManager::recordProcessingTime(double ms) {
  processingTimes.push_back(ms);
  if (processingTimes.size() > LATENCY_SAMPLES) {
    processingTimes.pop_front();
  }
  double total = 0;
  for (double t : processingTimes) {
    total += t;
  }
  metrics.processingLatency = total / processingTimes.size();
}

BufferHealth TerminalBufferManager::getHealthStatus() const {
  BufferHealth health;
  health.utilizationPercent =
      double(metrics.currentBufferSize) / double(config.maxBufferSize) * 100.0;
  health.droppedChunksPercent = double(metrics.droppedChunks) /
                                double(max<int64_t>(metrics.totalChunks, 1)) *
                                100.0;
  health.averageLatency = metrics.processingLatency;

  if (health.utilizationPercent > 80 || health.droppedChunksPercent > 5 ||
      health.averageLatency > 50) {
    health.status = BUFFER_CRITICAL;
  } else if (health.utilizationPercent > 60 ||
             health.droppedChunksPercent > 1 || health.averageLatency > 20) {
    health.status = BUFFER_WARNING;
  }
  return health;
}

void TerminalBufferManager::clear() {
  chunks.clear();
  sequenceCounter = 0;
  metrics.currentBufferSize = 0;
  VLOG(1) << "Buffer cleared";
}

void TerminalBufferManager::pause() {
  paused = true;
  VLOG(1) << "Buffer processing paused";
}

void TerminalBufferManager::resume() {
  if (paused) {
    paused = false;
    lastFlush = clock();
  }
  VLOG(1) << "Buffer processing resumed";
}

void TerminalBufferManager::updateConfig(const BufferConfig& newConfig) {
  if (newConfig.chunkSize == 0 || newConfig.maxBufferSize == 0) {
    throw std::runtime_error("Buffer sizes must be positive");
  }
  config = newConfig;
  metrics.maxBufferSize = config.maxBufferSize;
  VLOG(1) << "Buffer configuration updated";
}
}  // namespace pv
