#include "TestHeaders.hpp"
#include "TimerQueue.hpp"

using namespace pv;

namespace {
struct ManualClock {
  TimerQueue::TimePoint now = TimerQueue::TimePoint();
  void advance(int64_t ms) { now += std::chrono::milliseconds(ms); }
};
}  // namespace

TEST_CASE("TimerQueue runs due callbacks in deadline order", "[TimerQueue]") {
  auto clock = make_shared<ManualClock>();
  TimerQueue timers([clock]() { return clock->now; });
  vector<string> fired;

  timers.schedule(30, [&]() { fired.push_back("c"); });
  timers.schedule(10, [&]() { fired.push_back("a"); });
  timers.schedule(20, [&]() { fired.push_back("b"); });
  REQUIRE(timers.size() == 3);
  REQUIRE(timers.msUntilNext() == 10);

  REQUIRE(timers.runExpired() == 0);
  clock->advance(25);
  REQUIRE(timers.runExpired() == 2);
  REQUIRE(fired == vector<string>({"a", "b"}));
  REQUIRE(timers.msUntilNext() == 5);

  clock->advance(100);
  REQUIRE(timers.msUntilNext() == 0);
  REQUIRE(timers.runExpired() == 1);
  REQUIRE(fired.back() == "c");
  REQUIRE(timers.msUntilNext() == -1);
}

TEST_CASE("TimerQueue cancel", "[TimerQueue]") {
  auto clock = make_shared<ManualClock>();
  TimerQueue timers([clock]() { return clock->now; });
  bool fired = false;

  uint64_t id = timers.schedule(10, [&]() { fired = true; });
  REQUIRE(timers.isPending(id));
  REQUIRE(timers.getDeadline(id).has_value());
  REQUIRE(timers.cancel(id));
  REQUIRE_FALSE(timers.cancel(id));
  REQUIRE_FALSE(timers.isPending(id));
  REQUIRE_FALSE(timers.getDeadline(id).has_value());

  clock->advance(50);
  REQUIRE(timers.runExpired() == 0);
  REQUIRE_FALSE(fired);
}

TEST_CASE("TimerQueue callbacks may schedule more timers", "[TimerQueue]") {
  auto clock = make_shared<ManualClock>();
  TimerQueue timers([clock]() { return clock->now; });
  int immediate = 0;
  int later = 0;

  timers.schedule(0, [&]() {
    timers.schedule(0, [&]() { immediate++; });
    timers.schedule(100, [&]() { later++; });
  });
  REQUIRE(timers.runExpired() == 2);
  REQUIRE(immediate == 1);
  REQUIRE(later == 0);
  REQUIRE(timers.size() == 1);

  clock->advance(100);
  REQUIRE(timers.runExpired() == 1);
  REQUIRE(later == 1);
}

TEST_CASE("TimerQueue treats negative delays as due now", "[TimerQueue]") {
  TimerQueue timers;
  bool fired = false;
  timers.schedule(-5, [&]() { fired = true; });
  REQUIRE(timers.msUntilNext() == 0);
  timers.runExpired();
  REQUIRE(fired);
}
