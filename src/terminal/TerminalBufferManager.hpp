#ifndef __PV_TERMINAL_BUFFER_MANAGER__
#define __PV_TERMINAL_BUFFER_MANAGER__

#include "EventRegistry.hpp"
#include "Headers.hpp"

namespace pv {
struct BufferConfig {
  /** @brief Bytes held before old chunks start being dropped. */
  size_t maxBufferSize = 10 * 1024 * 1024;
  /** @brief Largest chunk stored and largest batch emitted. */
  size_t chunkSize = 64 * 1024;
  size_t maxChunksPerFlush = 50;
  int64_t flushIntervalMs = 16;
  /** @brief Fraction of maxBufferSize above which the oldest 30% of chunks
   * are discarded. */
  double dropThreshold = 0.8;
};

struct BufferMetrics {
  int64_t totalChunks = 0;
  int64_t totalBytes = 0;
  int64_t droppedChunks = 0;
  double avgChunkSize = 0;
  int64_t maxBufferSize = 0;
  int64_t currentBufferSize = 0;
  /** @brief Mean flush duration in ms over the last 100 flushes. */
  double processingLatency = 0;
};

enum BufferHealthStatus {
  BUFFER_HEALTHY = 0,
  BUFFER_WARNING = 1,
  BUFFER_CRITICAL = 2,
};

string bufferHealthName(BufferHealthStatus status);

struct BufferHealth {
  BufferHealthStatus status = BUFFER_HEALTHY;
  double utilizationPercent = 0;
  double averageLatency = 0;
  double droppedChunksPercent = 0;
};

enum BufferEventType {
  BUFFER_DATA_READY = 0,
  BUFFER_CHUNKS_DROPPED = 1,
};

struct BufferEvent {
  BufferEventType type;
  string data;
  int64_t droppedCount = 0;
  int64_t droppedBytes = 0;
  int64_t remainingChunks = 0;
};

/**
 * @brief Chunked output buffer with memory pressure shedding.
 *
 * Output is split into chunks of at most chunkSize bytes.  The owner's event
 * loop calls flushIfDue() on each tick; every flushIntervalMs up to
 * maxChunksPerFlush chunks are merged into batches and emitted as
 * BUFFER_DATA_READY events.  Small interactive output (escape sequences,
 * line endings, bell) is flushed in full as soon as it arrives.
 */
class TerminalBufferManager {
 public:
  typedef std::chrono::steady_clock::time_point TimePoint;
  typedef std::function<TimePoint()> Clock;

  static constexpr size_t LATENCY_SAMPLES = 100;
  static constexpr size_t URGENT_MAX_LENGTH = 100;

  explicit TerminalBufferManager(const BufferConfig& _config = BufferConfig());
  TerminalBufferManager(const BufferConfig& _config, Clock _clock);

  void addData(const string& data);

  /**
   * @brief Flushes one batch window if the interval elapsed and the buffer
   * is not paused.
   * @return True if a flush ran.
   */
  bool flushIfDue();

  /** @brief Emits everything buffered, regardless of pause state. */
  void flushAll();

  bool hasPendingData() const { return !chunks.empty(); }
  size_t pendingChunks() const { return chunks.size(); }

  BufferMetrics getMetrics() const { return metrics; }
  BufferHealth getHealthStatus() const;

  /** @brief Drops buffered chunks without emitting them.  Totals are kept. */
  void clear();
  void pause();
  void resume();
  bool isPaused() const { return paused; }
  void updateConfig(const BufferConfig& newConfig);
  const BufferConfig& getConfig() const { return config; }

  EventRegistry<BufferEvent>& events() { return eventRegistry; }

  static bool isUrgentData(const string& data);

 protected:
  struct Chunk {
    string data;
    TimePoint timestamp;
    uint64_t sequenceId;
  };

  BufferConfig config;
  Clock clock;
  std::deque<Chunk> chunks;
  uint64_t sequenceCounter;
  BufferMetrics metrics;
  std::deque<double> processingTimes;
  TimePoint lastFlush;
  bool paused;
  EventRegistry<BufferEvent> eventRegistry;

  void addChunk(const string& data, TimePoint timestamp);
  bool shouldDropOldChunks() const;
  void dropOldChunks();
  void flush(size_t maxChunks);
  vector<string> createBatches(const vector<Chunk>& batchChunks) const;
  void recordProcessingTime(double ms);
};
}  // namespace pv

#endif  // __PV_TERMINAL_BUFFER_MANAGER__
