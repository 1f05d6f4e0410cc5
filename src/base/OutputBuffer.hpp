#ifndef __PV_OUTPUT_BUFFER__
#define __PV_OUTPUT_BUFFER__

#include "Headers.hpp"

namespace pv {
/**
 * @brief Ordered byte queue drained in bounded chunks.
 *
 * Terminal output is appended as it arrives and handed to the transport in
 * pieces no larger than the chunk ceiling, so a single large read never
 * becomes a single large message.  Byte order is preserved across chunk
 * boundaries.
 */
class OutputBuffer {
 public:
  /** @brief Bytes buffered before canAcceptMore() reports backpressure. */
  static constexpr size_t MAX_BUFFER_SIZE = 256 * 1024;  // 256KB

  explicit OutputBuffer(size_t _chunkCeiling)
      : chunkCeiling(_chunkCeiling), totalBytes(0), readOffset(0) {
    if (chunkCeiling == 0) {
      throw std::runtime_error("Chunk ceiling must be positive");
    }
  }

  /**
   * @brief Returns true if the buffer has room for more data.
   * When false, the caller should stop reading from the source.
   */
  bool canAcceptMore() const { return totalBytes < MAX_BUFFER_SIZE; }

  bool hasPendingData() const { return totalBytes > 0; }

  size_t size() const { return totalBytes; }

  size_t getChunkCeiling() const { return chunkCeiling; }

  void enqueue(const string &data) {
    if (data.empty()) return;
    pending.push_back(data);
    totalBytes += data.size();
  }

  /**
   * @brief Removes and returns the next chunk, at most getChunkCeiling()
   * bytes.  Small queued fragments are coalesced up to the ceiling.
   */
  string takeChunk() {
    string chunk;
    while (!pending.empty() && chunk.size() < chunkCeiling) {
      string &front = pending.front();
      size_t available = front.size() - readOffset;
      size_t wanted = min(available, chunkCeiling - chunk.size());
      chunk.append(front, readOffset, wanted);
      totalBytes -= wanted;
      if (wanted == available) {
        pending.pop_front();
        readOffset = 0;
      } else {
        readOffset += wanted;
      }
    }
    return chunk;
  }

  /** @brief Splits everything pending into ceiling-sized chunks. */
  vector<string> drain() {
    vector<string> chunks;
    while (hasPendingData()) {
      chunks.push_back(takeChunk());
    }
    return chunks;
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
    readOffset = 0;
  }

 private:
  size_t chunkCeiling;
  std::deque<string> pending;
  size_t totalBytes;
  size_t readOffset;  // Offset into the front fragment
};
}  // namespace pv

#endif  // __PV_OUTPUT_BUFFER__
