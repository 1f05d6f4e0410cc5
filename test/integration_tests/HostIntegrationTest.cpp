#include "HostLauncher.hpp"
#include "ProcessMetrics.hpp"
#include "PtyManager.hpp"
#include "TestHeaders.hpp"

using namespace pv;

namespace {
template <typename T>
bool isReady(const std::future<T>& future) {
  return future.wait_for(std::chrono::seconds(0)) ==
         std::future_status::ready;
}

/** A manager supervising a real pvhost built next to the test binary. */
class LiveHostFixture {
 public:
  LiveHostFixture() {
    string tmpPath = GetTempDirectory() + string("pv_host_XXXXXXXX");
    logDirectory = string(mkdtemp(&tmpPath[0]));
    launcher.reset(new ForkedHostLauncher(
        shared_ptr<PipeSocketHandler>(new PipeSocketHandler()),
        ForkedHostLauncher::defaultHostPath(),
        {"--logdir=" + logDirectory}));
    timers.reset(new TimerQueue());
    monitor.reset(new PerformanceMonitor(
        timers, MonitorSettings(),
        shared_ptr<ProcessMetricsSource>(new ProcfsMetricsSource())));
    manager.reset(new PtyManager(launcher, monitor, timers, HostSettings()));
    manager->events().subscribe([this](const ManagerEvent& event) {
      if (event.type == MANAGER_TERMINAL_DATA) {
        output[event.terminalId] += event.data;
      } else if (event.type == MANAGER_TERMINAL_EXIT) {
        exitCodes[event.terminalId] = event.exitCode;
      } else if (event.type == MANAGER_TERMINAL_KILLED) {
        killed.insert(event.terminalId);
      }
    });
  }

  ~LiveHostFixture() {
    manager->destroy();
    monitor->destroy();
    fs::remove_all(logDirectory);
  }

  bool pumpUntil(std::function<bool()> condition) {
    auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(10);
    while (!condition()) {
      if (std::chrono::steady_clock::now() > deadline) {
        return false;
      }
      manager->update(50);
    }
    return true;
  }

  string logDirectory;
  shared_ptr<ForkedHostLauncher> launcher;
  shared_ptr<TimerQueue> timers;
  shared_ptr<PerformanceMonitor> monitor;
  shared_ptr<PtyManager> manager;
  map<string, string> output;
  map<string, int> exitCodes;
  set<string> killed;
};
}  // namespace

TEST_CASE("PtyManager drives a live host", "[HostIntegration]") {
  LiveHostFixture f;
  REQUIRE(f.pumpUntil([&f]() { return f.manager->isReady(); }));

  TerminalOptions options;
  options.shell = "/bin/sh";
  options.cwd = "/tmp";
  auto created = f.manager->createTerminal(options);
  REQUIRE(f.pumpUntil([&created]() { return isReady(created); }));
  TerminalSession session = created.get();
  REQUIRE(session.id.find("terminal-") == 0);
  REQUIRE(session.pid > 0);
  REQUIRE(session.shell == "/bin/sh");
  REQUIRE(session.cwd == "/tmp");
  REQUIRE(f.monitor->isRegistered(session.id));

  f.manager->writeToTerminal(session.id, "echo live-$((6*7))\n");
  REQUIRE(f.pumpUntil([&f, &session]() {
    return f.output[session.id].find("live-42") != string::npos;
  }));

  auto listed = f.manager->listTerminals();
  REQUIRE(f.pumpUntil([&listed]() { return isReady(listed); }));
  vector<TerminalSession> sessions = listed.get();
  REQUIRE(sessions.size() == 1);
  REQUIRE(sessions[0].id == session.id);

  f.manager->writeToTerminal(session.id, "exit 4\n");
  REQUIRE(f.pumpUntil(
      [&f, &session]() { return f.exitCodes.count(session.id) > 0; }));
  REQUIRE(f.exitCodes[session.id] == 4);
  REQUIRE(f.manager->getSessionCount() == 0);
  REQUIRE_FALSE(f.monitor->isRegistered(session.id));
}

TEST_CASE("PtyManager kills live terminals", "[HostIntegration]") {
  LiveHostFixture f;
  REQUIRE(f.pumpUntil([&f]() { return f.manager->isReady(); }));

  TerminalOptions options;
  options.shell = "/bin/sh";
  auto created = f.manager->createTerminal(options);
  REQUIRE(f.pumpUntil([&created]() { return isReady(created); }));
  TerminalSession session = created.get();

  f.manager->killTerminal(session.id);
  REQUIRE(f.manager->getSessionCount() == 0);
  REQUIRE(f.pumpUntil(
      [&f, &session]() { return f.killed.count(session.id) > 0; }));
}

TEST_CASE("PtyManager reports a shell that cannot start",
          "[HostIntegration]") {
  LiveHostFixture f;
  REQUIRE(f.pumpUntil([&f]() { return f.manager->isReady(); }));
  pid_t hostPid = f.manager->getHostPid();

  TerminalOptions options;
  options.shell = "/nonexistent/pv-shell";
  auto created = f.manager->createTerminal(options);
  REQUIRE(f.pumpUntil([&created]() { return isReady(created); }));
  TerminalSession session = created.get();
  REQUIRE(f.pumpUntil(
      [&f, &session]() { return f.exitCodes.count(session.id) > 0; }));
  REQUIRE(f.exitCodes[session.id] == 127);
  // The host itself is unaffected
  REQUIRE(f.manager->getHostPid() == hostPid);
  REQUIRE(f.manager->isReady());
}

TEST_CASE("ForkedHostLauncher reports a host that cannot exec",
          "[HostIntegration]") {
  shared_ptr<PipeSocketHandler> socketHandler(new PipeSocketHandler());
  ForkedHostLauncher launcher(socketHandler, "/nonexistent/pvhost", {});
  HostHandle handle = launcher.launch();
  REQUIRE(handle.pid > 0);

  std::optional<HostExitStatus> status;
  for (int attempt = 0; attempt < 500 && !status; attempt++) {
    status = launcher.pollExit(handle.pid);
    if (!status) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
  REQUIRE(status);
  REQUIRE(status->code == ForkedHostLauncher::EXEC_FAILED_EXIT_CODE);
  REQUIRE(status->signal.empty());
  socketHandler->close(handle.fd);
}
