#include "TimerQueue.hpp"

namespace pv {
TimerQueue::TimerQueue()
    : clock([]() { return std::chrono::steady_clock::now(); }), nextId(1) {}

TimerQueue::TimerQueue(Clock _clock) : clock(_clock), nextId(1) {}

uint64_t TimerQueue::schedule(int64_t delayMs, Callback callback) {
  uint64_t id = nextId++;
  Timer timer;
  timer.deadline = clock() + std::chrono::milliseconds(max<int64_t>(0, delayMs));
  timer.callback = callback;
  timers[id] = timer;
  VLOG(2) << "Scheduled timer " << id << " in " << delayMs << "ms";
  return id;
}

bool TimerQueue::cancel(uint64_t id) { return timers.erase(id) > 0; }

bool TimerQueue::isPending(uint64_t id) const {
  return timers.find(id) != timers.end();
}

std::optional<TimerQueue::TimePoint> TimerQueue::getDeadline(
    uint64_t id) const {
  auto it = timers.find(id);
  if (it == timers.end()) {
    return std::nullopt;
  }
  return it->second.deadline;
}

int TimerQueue::runExpired() {
  int count = 0;
  TimePoint current = clock();
  while (true) {
    auto due = timers.end();
    for (auto it = timers.begin(); it != timers.end(); ++it) {
      if (it->second.deadline <= current &&
          (due == timers.end() || it->second.deadline < due->second.deadline)) {
        due = it;
      }
    }
    if (due == timers.end()) {
      break;
    }
    Callback callback = due->second.callback;
    timers.erase(due);
    callback();
    count++;
  }
  return count;
}

int64_t TimerQueue::msUntilNext() const {
  if (timers.empty()) {
    return -1;
  }
  TimePoint earliest = timers.begin()->second.deadline;
  for (const auto& it : timers) {
    earliest = min(earliest, it.second.deadline);
  }
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                       earliest - clock())
                       .count();
  return max<int64_t>(0, remaining);
}
}  // namespace pv
