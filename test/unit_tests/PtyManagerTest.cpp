#include "BackendDetector.hpp"
#include "FakeHostLauncher.hpp"
#include "PtyManager.hpp"
#include "TestHeaders.hpp"

using namespace pv;

namespace {
struct ManualClock {
  TimerQueue::TimePoint now = TimerQueue::TimePoint();
  void advance(int64_t ms) { now += std::chrono::milliseconds(ms); }
};

template <typename T>
bool isReady(const std::future<T>& future) {
  return future.wait_for(std::chrono::seconds(0)) ==
         std::future_status::ready;
}

class PtyManagerFixture {
 public:
  PtyManagerFixture(bool failLaunch = false)
      : launcher(new FakeHostLauncher()),
        clock(new ManualClock()),
        metrics(new FakeProcessMetrics()) {
    launcher->failLaunch = failLaunch;
    auto c = clock;
    timers.reset(new TimerQueue([c]() { return c->now; }));
    monitor.reset(new PerformanceMonitor(timers, MonitorSettings(), metrics));
    HostSettings settings;
    settings.restartDelayMs = 1000;
    manager.reset(new PtyManager(launcher, monitor, timers, settings));
    manager->events().subscribe(
        [this](const ManagerEvent& event) { events.push_back(event); });
  }

  template <typename T>
  void hostSends(HostPacketType type, const T& message) {
    launcher->sendToManager(type, message);
    manager->update(0);
  }

  template <typename T>
  T hostReceives(HostPacketType expected) {
    Packet packet = launcher->readFromManager();
    REQUIRE(int(packet.getHeader()) == int(expected));
    return packet.parse<T>();
  }

  void ready() {
    HostReady hostReady;
    hostReady.set_pid(launcher->currentPid);
    hostSends(HOST_READY, hostReady);
  }

  TerminalSessionInfo infoFor(const string& id) {
    TerminalSessionInfo info;
    info.set_id(id);
    info.set_pid(4321);
    info.set_shell("/bin/bash");
    info.set_cwd("/home/user");
    info.set_strategy("node-pty");
    info.set_backend("native-pty");
    *info.mutable_capabilities() =
        capabilitiesToProto(BackendDetector::nativePtyCapabilities());
    return info;
  }

  /** Creates a terminal and answers for the host. */
  TerminalSession createSession() {
    auto future = manager->createTerminal(TerminalOptions());
    CreateRequest request = hostReceives<CreateRequest>(HOST_CREATE);
    hostSends(HOST_CREATED, infoFor(request.id()));
    REQUIRE(isReady(future));
    return future.get();
  }

  vector<ManagerEvent> eventsOfType(ManagerEventType type) {
    vector<ManagerEvent> matching;
    for (const auto& event : events) {
      if (event.type == type) {
        matching.push_back(event);
      }
    }
    return matching;
  }

  shared_ptr<FakeHostLauncher> launcher;
  shared_ptr<ManualClock> clock;
  shared_ptr<FakeProcessMetrics> metrics;
  shared_ptr<TimerQueue> timers;
  shared_ptr<PerformanceMonitor> monitor;
  shared_ptr<PtyManager> manager;
  vector<ManagerEvent> events;
};
}  // namespace

TEST_CASE("PtyManager starts a host and waits for it", "[PtyManager]") {
  PtyManagerFixture f;
  REQUIRE(f.launcher->launchCount == 1);
  REQUIRE(f.manager->isHostRunning());
  REQUIRE(f.manager->getHostPid() == 5000);
  REQUIRE_FALSE(f.manager->isReady());

  f.ready();
  REQUIRE(f.manager->isReady());
  REQUIRE(f.eventsOfType(MANAGER_READY).size() == 1);
}

TEST_CASE("PtyManager creates terminals", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();

  TerminalOptions options;
  options.shell = "/bin/zsh";
  options.env["FOO"] = "bar";
  options.cols = 100;
  auto future = f.manager->createTerminal(options);
  REQUIRE_FALSE(isReady(future));
  REQUIRE(f.manager->getPendingCount() == 1);

  CreateRequest request = f.hostReceives<CreateRequest>(HOST_CREATE);
  REQUIRE(request.id().find("terminal-") == 0);
  REQUIRE(request.options().shell() == "/bin/zsh");
  REQUIRE_FALSE(request.options().has_cwd());
  REQUIRE(request.options().env().at("FOO") == "bar");
  REQUIRE(request.options().cols() == 100);
  REQUIRE(request.options().rows() == 24);

  TerminalSessionInfo info = f.infoFor(request.id());
  info.set_fallbackreason("Using something weaker");
  f.hostSends(HOST_CREATED, info);

  REQUIRE(isReady(future));
  TerminalSession session = future.get();
  REQUIRE(session.id == request.id());
  REQUIRE(session.pid == 4321);
  REQUIRE(session.shell == "/bin/bash");
  REQUIRE(session.cwd == "/home/user");
  REQUIRE(session.strategy == "node-pty");
  REQUIRE(session.backend == "native-pty");
  REQUIRE(session.capabilities == BackendDetector::nativePtyCapabilities());
  REQUIRE(session.fallbackReason == "Using something weaker");

  REQUIRE(f.manager->getPendingCount() == 0);
  REQUIRE(f.manager->getSessionCount() == 1);
  REQUIRE(f.manager->getTerminalSession(session.id).has_value());
  REQUIRE(f.monitor->isRegistered(session.id));
}

TEST_CASE("PtyManager ids are unique", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  set<string> ids;
  for (int a = 0; a < 20; a++) {
    f.manager->createTerminal(TerminalOptions());
    ids.insert(f.hostReceives<CreateRequest>(HOST_CREATE).id());
  }
  REQUIRE(ids.size() == 20);
}

TEST_CASE("PtyManager fails creates the host rejects", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  auto future = f.manager->createTerminal(TerminalOptions());
  CreateRequest request = f.hostReceives<CreateRequest>(HOST_CREATE);

  HostError error;
  error.set_id(request.id());

  SECTION("With the host's message") {
    error.set_error("no such shell");
    f.hostSends(HOST_ERROR, error);
    REQUIRE_THROWS_WITH(future.get(), "no such shell");
  }

  SECTION("With a generic message") {
    f.hostSends(HOST_ERROR, error);
    REQUIRE_THROWS_WITH(future.get(), "Unknown error");
  }

  REQUIRE(f.manager->getPendingCount() == 0);
  REQUIRE(f.eventsOfType(MANAGER_ERROR).empty());
}

TEST_CASE("PtyManager surfaces unmatched host errors", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  HostError error;
  error.set_id("terminal-unknown");
  error.set_error("write failed");
  f.hostSends(HOST_ERROR, error);

  auto errors = f.eventsOfType(MANAGER_ERROR);
  REQUIRE(errors.size() == 1);
  REQUIRE(errors[0].terminalId == "terminal-unknown");
  REQUIRE(errors[0].error == "write failed");
}

TEST_CASE("PtyManager ignores replies nobody asked for", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  f.hostSends(HOST_CREATED, f.infoFor("terminal-nobody"));
  f.hostSends(HOST_CREATED, TerminalSessionInfo());
  ListReply list;
  list.set_requestid("list-99");
  f.hostSends(HOST_LIST_RESULT, list);
  f.hostSends(HOST_LIST_RESULT, ListReply());
  REQUIRE(f.manager->getSessionCount() == 0);
  REQUIRE(f.eventsOfType(MANAGER_ERROR).empty());
}

TEST_CASE("PtyManager relays terminal output and exits", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  TerminalSession session = f.createSession();

  TerminalData data;
  data.set_id(session.id);
  data.set_data("hello\r\n");
  f.hostSends(HOST_DATA, data);
  auto dataEvents = f.eventsOfType(MANAGER_TERMINAL_DATA);
  REQUIRE(dataEvents.size() == 1);
  REQUIRE(dataEvents[0].terminalId == session.id);
  REQUIRE(dataEvents[0].data == "hello\r\n");

  TerminalExit exit;
  exit.set_id(session.id);
  exit.set_exitcode(130);
  exit.set_signal("SIGINT");
  f.hostSends(HOST_EXIT, exit);
  auto exitEvents = f.eventsOfType(MANAGER_TERMINAL_EXIT);
  REQUIRE(exitEvents.size() == 1);
  REQUIRE(exitEvents[0].exitCode == 130);
  REQUIRE(exitEvents[0].signal == "SIGINT");
  REQUIRE(f.manager->getSessionCount() == 0);
  REQUIRE_FALSE(f.monitor->isRegistered(session.id));
}

TEST_CASE("PtyManager forwards writes, resizes and kills", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  TerminalSession session = f.createSession();

  f.manager->writeToTerminal(session.id, "ls\r");
  WriteRequest write = f.hostReceives<WriteRequest>(HOST_WRITE);
  REQUIRE(write.id() == session.id);
  REQUIRE(write.data() == "ls\r");

  f.manager->resizeTerminal(session.id, 132, 43);
  ResizeRequest resize = f.hostReceives<ResizeRequest>(HOST_RESIZE);
  REQUIRE(resize.cols() == 132);
  REQUIRE(resize.rows() == 43);

  f.manager->killTerminal(session.id);
  REQUIRE(f.manager->getSessionCount() == 0);
  REQUIRE_FALSE(f.monitor->isRegistered(session.id));
  REQUIRE(f.hostReceives<KillRequest>(HOST_KILL).id() == session.id);

  KilledReply killed;
  killed.set_id(session.id);
  f.hostSends(HOST_KILLED, killed);
  auto killedEvents = f.eventsOfType(MANAGER_TERMINAL_KILLED);
  REQUIRE(killedEvents.size() == 1);
  REQUIRE(killedEvents[0].terminalId == session.id);
}

TEST_CASE("PtyManager lists terminals", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  auto first = f.manager->listTerminals();
  auto second = f.manager->listTerminals();
  ListRequest firstRequest = f.hostReceives<ListRequest>(HOST_LIST);
  ListRequest secondRequest = f.hostReceives<ListRequest>(HOST_LIST);
  REQUIRE(firstRequest.requestid().find("list-1-") == 0);
  REQUIRE(secondRequest.requestid().find("list-2-") == 0);

  ListReply reply;
  reply.set_requestid(secondRequest.requestid());
  TerminalSessionInfo* info = reply.add_terminals();
  info->set_id("terminal-a");
  info->set_pid(77);
  info->set_shell("/bin/sh");
  f.hostSends(HOST_LIST_RESULT, reply);

  REQUIRE(isReady(second));
  REQUIRE_FALSE(isReady(first));
  vector<TerminalSession> sessions = second.get();
  REQUIRE(sessions.size() == 1);
  REQUIRE(sessions[0].id == "terminal-a");
  REQUIRE(sessions[0].pid == 77);

  HostError error;
  error.set_id(firstRequest.requestid());
  error.set_error("list failed");
  f.hostSends(HOST_ERROR, error);
  REQUIRE_THROWS_WITH(first.get(), "list failed");
}

TEST_CASE("PtyManager restarts a crashed host", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  TerminalSession session = f.createSession();
  auto pendingCreate = f.manager->createTerminal(TerminalOptions());
  auto pendingList = f.manager->listTerminals();

  f.launcher->exitHost(1);
  f.manager->update(0);

  REQUIRE_THROWS_WITH(pendingCreate.get(), "PTY Host exited");
  REQUIRE_THROWS_WITH(pendingList.get(), "PTY Host exited");
  REQUIRE(f.manager->getSessionCount() == 0);
  REQUIRE_FALSE(f.monitor->isRegistered(session.id));
  REQUIRE_FALSE(f.manager->isHostRunning());
  REQUIRE_FALSE(f.manager->isReady());
  auto exits = f.eventsOfType(MANAGER_HOST_EXIT);
  REQUIRE(exits.size() == 1);
  REQUIRE(exits[0].exitCode == 1);

  REQUIRE(f.manager->isRestartScheduled());
  f.clock->advance(999);
  f.manager->update(0);
  REQUIRE(f.launcher->launchCount == 1);

  f.clock->advance(1);
  f.manager->update(0);
  REQUIRE(f.launcher->launchCount == 2);
  REQUIRE(f.manager->isHostRunning());
  REQUIRE(f.manager->getHostPid() == 5001);
  REQUIRE_FALSE(f.manager->isRestartScheduled());

  f.ready();
  REQUIRE(f.manager->isReady());
  f.createSession();
}

TEST_CASE("PtyManager reports a signalled host", "[PtyManager]") {
  PtyManagerFixture f;
  f.launcher->exitHost(128 + SIGKILL, "SIGKILL");
  f.manager->update(0);
  auto exits = f.eventsOfType(MANAGER_HOST_EXIT);
  REQUIRE(exits.size() == 1);
  REQUIRE(exits[0].signal == "SIGKILL");
  REQUIRE(f.manager->isRestartScheduled());
}

TEST_CASE("PtyManager does not restart after a clean exit", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  f.launcher->exitHost(0);
  f.manager->update(0);
  REQUIRE(f.eventsOfType(MANAGER_HOST_EXIT).size() == 1);
  REQUIRE_FALSE(f.manager->isRestartScheduled());

  f.clock->advance(60000);
  f.manager->update(0);
  REQUIRE(f.launcher->launchCount == 1);
  REQUIRE_THROWS_WITH(f.manager->createTerminal(TerminalOptions()).get(),
                      "PTY Host not initialized");
}

TEST_CASE("PtyManager rejects requests when the channel drops",
          "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  auto pending = f.manager->createTerminal(TerminalOptions());
  f.launcher->dropChannel();
  f.manager->update(10);

  REQUIRE_THROWS_WITH(pending.get(), "PTY Host disconnected");
  REQUIRE_FALSE(f.manager->isReady());
  REQUIRE_THROWS_WITH(f.manager->createTerminal(TerminalOptions()).get(),
                      "PTY Host not initialized");
  REQUIRE_THROWS_WITH(f.manager->listTerminals().get(),
                      "PTY Host not initialized");

  // Fire-and-forget calls only log
  f.manager->writeToTerminal("terminal-x", "x");
  f.manager->resizeTerminal("terminal-x", 80, 24);
  f.manager->killTerminal("terminal-x");
}

TEST_CASE("PtyManager survives a failed launch", "[PtyManager]") {
  PtyManagerFixture f(true);
  REQUIRE(f.launcher->launchCount == 1);
  REQUIRE_FALSE(f.manager->isHostRunning());
  REQUIRE_THROWS_WITH(f.manager->createTerminal(TerminalOptions()).get(),
                      "PTY Host not initialized");
}

TEST_CASE("PtyManager destroy", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  TerminalSession session = f.createSession();
  auto pending = f.manager->createTerminal(TerminalOptions());

  f.manager->destroy();
  REQUIRE_THROWS_WITH(pending.get(), "PTY Manager destroyed");
  REQUIRE(f.launcher->terminated == vector<pid_t>({5000}));
  REQUIRE(f.manager->getSessionCount() == 0);
  REQUIRE_FALSE(f.monitor->isRegistered(session.id));
  REQUIRE_FALSE(f.manager->isHostRunning());
  REQUIRE(f.manager->events().size() == 0);

  REQUIRE_THROWS_WITH(f.manager->createTerminal(TerminalOptions()).get(),
                      "PTY Manager destroyed");
  REQUIRE_THROWS_WITH(f.manager->listTerminals().get(),
                      "PTY Manager destroyed");

  f.manager->destroy();
  REQUIRE(f.launcher->terminated.size() == 1);
}

TEST_CASE("PtyManager destroy cancels a scheduled restart", "[PtyManager]") {
  PtyManagerFixture f;
  f.launcher->exitHost(2);
  f.manager->update(0);
  REQUIRE(f.manager->isRestartScheduled());

  f.manager->destroy();
  REQUIRE_FALSE(f.manager->isRestartScheduled());
  f.clock->advance(5000);
  f.manager->update(0);
  REQUIRE(f.launcher->launchCount == 1);
  REQUIRE(f.launcher->terminated.empty());
}

TEST_CASE("PtyManager destroy rejects every pending request",
          "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();
  vector<std::future<TerminalSession>> creates;
  for (int a = 0; a < 3; a++) {
    creates.push_back(f.manager->createTerminal(TerminalOptions()));
  }
  auto list = f.manager->listTerminals();
  REQUIRE(f.manager->getPendingCount() == 4);

  f.manager->destroy();
  REQUIRE(f.manager->getPendingCount() == 0);
  for (auto& create : creates) {
    REQUIRE(isReady(create));
    REQUIRE_THROWS_WITH(create.get(), "PTY Manager destroyed");
  }
  REQUIRE(isReady(list));
  REQUIRE_THROWS_WITH(list.get(), "PTY Manager destroyed");
}

TEST_CASE("PtyManager drives a bash session", "[PtyManager]") {
  PtyManagerFixture f;
  f.ready();

  TerminalOptions options;
  options.shell = "/bin/bash";
  options.cols = 120;
  options.rows = 40;
  auto future = f.manager->createTerminal(options);

  CreateRequest request = f.hostReceives<CreateRequest>(HOST_CREATE);
  REQUIRE(request.options().shell() == "/bin/bash");
  REQUIRE(request.options().cols() == 120);
  REQUIRE(request.options().rows() == 40);

  TerminalSessionInfo info = f.infoFor(request.id());
  info.set_pid(12345);
  f.hostSends(HOST_CREATED, info);

  REQUIRE(isReady(future));
  TerminalSession session = future.get();
  REQUIRE(session.id == request.id());
  REQUIRE(session.pid == 12345);
  REQUIRE(session.strategy == "node-pty");

  f.manager->writeToTerminal(session.id, "echo hi");
  WriteRequest write = f.hostReceives<WriteRequest>(HOST_WRITE);
  REQUIRE(write.id() == session.id);
  REQUIRE(write.data() == "echo hi");
  REQUIRE_FALSE(f.launcher->managerSentData());
}
