#ifndef __PV_RESIZE_STORM_GUARD__
#define __PV_RESIZE_STORM_GUARD__

#include "Headers.hpp"

namespace pv {
/**
 * @brief Detects a terminal stuck redrawing its prompt in response to its
 * own resize notifications, and stops that output from reaching the
 * transport.
 *
 * Short output chunks containing the storm pattern are counted two ways:
 * occurrences within the recent output window, and matches arriving less
 * than RAPID_WINDOW_MS apart.  Exceeding the threshold either way blocks the
 * chunk.  One error line is logged per episode; an episode ends when
 * ordinary output is forwarded again.
 */
class ResizeStormGuard {
 public:
  typedef std::chrono::steady_clock::time_point TimePoint;

  /** @brief Chunks at least this long are never treated as storm output. */
  static constexpr size_t MAX_MATCH_LENGTH = 200;
  static constexpr int64_t RAPID_WINDOW_MS = 100;
  /** @brief Output this long without escapes resets the rapid counter. */
  static constexpr size_t SUBSTANTIAL_LENGTH = 20;

  /**
   * @param _pattern Byte sequence that identifies storm output.  An empty
   * pattern disables the guard.
   * @param _threshold Matches tolerated before blocking starts.
   * @param _windowSize Recent output retained for counting; trimmed to half
   * its size when exceeded.
   */
  ResizeStormGuard(const string& _terminalId, const string& _pattern,
                   int _threshold, size_t _windowSize);

  /** @return True if the chunk may be forwarded. */
  bool allow(const string& data, TimePoint now);

  bool isSuppressing() const { return suppressing; }
  int64_t getBlockedCount() const { return blockedCount; }
  /** @brief Number of suppression episodes so far. */
  int64_t getEpisodeCount() const { return episodeCount; }

  /** @brief Non-overlapping occurrences of `needle` in `haystack`. */
  static int countOccurrences(const string& haystack, const string& needle);

 protected:
  string terminalId;
  string pattern;
  int threshold;
  size_t windowSize;
  string window;
  int rapidCount;
  std::optional<TimePoint> lastMatchTime;
  bool suppressing;
  int64_t blockedCount;
  int64_t episodeCount;

  void block(const string& reason);
};
}  // namespace pv

#endif  // __PV_RESIZE_STORM_GUARD__
