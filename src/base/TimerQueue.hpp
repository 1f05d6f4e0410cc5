#ifndef __PV_TIMER_QUEUE__
#define __PV_TIMER_QUEUE__

#include "Headers.hpp"

namespace pv {
/**
 * @brief Deadline-ordered callbacks run from the owner's event loop.
 *
 * Nothing fires on its own: the loop calls runExpired() after each select()
 * and uses msUntilNext() to bound the select timeout.  The clock is
 * injectable so tests can step time by hand.
 */
class TimerQueue {
 public:
  typedef std::chrono::steady_clock::time_point TimePoint;
  typedef std::function<TimePoint()> Clock;
  typedef std::function<void()> Callback;

  TimerQueue();
  explicit TimerQueue(Clock _clock);

  /** @return An id usable with cancel() and getDeadline(). */
  uint64_t schedule(int64_t delayMs, Callback callback);
  /** @return false if the timer already fired or never existed. */
  bool cancel(uint64_t id);
  bool isPending(uint64_t id) const;
  std::optional<TimePoint> getDeadline(uint64_t id) const;

  /**
   * @brief Runs every callback whose deadline has passed, earliest first.
   * Callbacks scheduled while running are only considered if already due.
   * @return The number of callbacks run.
   */
  int runExpired();

  /** @return Milliseconds until the next deadline (0 if overdue), or -1. */
  int64_t msUntilNext() const;

  size_t size() const { return timers.size(); }
  void clear() { timers.clear(); }
  TimePoint now() const { return clock(); }

 protected:
  struct Timer {
    TimePoint deadline;
    Callback callback;
  };
  Clock clock;
  map<uint64_t, Timer> timers;
  uint64_t nextId;
};
}  // namespace pv

#endif  // __PV_TIMER_QUEUE__
