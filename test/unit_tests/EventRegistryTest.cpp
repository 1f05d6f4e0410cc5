#include "EventRegistry.hpp"
#include "TestHeaders.hpp"

using namespace pv;

TEST_CASE("EventRegistry delivers in subscription order", "[EventRegistry]") {
  EventRegistry<int> registry;
  vector<string> calls;
  registry.subscribe([&](const int& v) { calls.push_back("a" + to_string(v)); });
  registry.subscribe([&](const int& v) { calls.push_back("b" + to_string(v)); });

  registry.emit(1);
  REQUIRE(calls == vector<string>({"a1", "b1"}));
  REQUIRE(registry.size() == 2);
}

TEST_CASE("EventRegistry unsubscribe", "[EventRegistry]") {
  EventRegistry<int> registry;
  int count = 0;
  int handle = registry.subscribe([&](const int&) { count++; });
  REQUIRE(registry.unsubscribe(handle));
  REQUIRE_FALSE(registry.unsubscribe(handle));
  registry.emit(1);
  REQUIRE(count == 0);
}

TEST_CASE("EventRegistry listeners may unsubscribe while emitting",
          "[EventRegistry]") {
  EventRegistry<int> registry;
  int first = 0;
  int second = 0;
  int handle = 0;
  handle = registry.subscribe([&](const int&) {
    first++;
    registry.unsubscribe(handle);
  });
  registry.subscribe([&](const int&) { second++; });

  registry.emit(1);
  registry.emit(2);
  REQUIRE(first == 1);
  REQUIRE(second == 2);
}

TEST_CASE("EventRegistry clear", "[EventRegistry]") {
  EventRegistry<string> registry;
  int count = 0;
  registry.subscribe([&](const string&) { count++; });
  registry.clear();
  registry.emit("x");
  REQUIRE(count == 0);
  REQUIRE(registry.size() == 0);
}
