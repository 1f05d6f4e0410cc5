#include "FakeTerminal.hpp"
#include "PipeSocketHandler.hpp"
#include "PtyHost.hpp"
#include "TestHeaders.hpp"

using namespace pv;

namespace {
const string STORM = "\r\r\x1b[m\x1b[m\x1b[m\x1b[J";

class CriticalLineCounter : public el::LogDispatchCallback {
 public:
  int count = 0;

 protected:
  void handle(const el::LogDispatchData* data) override {
    const el::LogMessage* message = data->logMessage();
    if (message->level() == el::Level::Error &&
        message->message().find("CRITICAL") != string::npos) {
      count++;
    }
  }
};

struct ManualClock {
  PtyHost::TimePoint now = PtyHost::TimePoint();
};

class PtyHostFixture {
 public:
  PtyHostFixture(size_t chunkSize = 1024)
      : socketHandler(new PipeSocketHandler()),
        probe(new FakePlatformProbe()),
        factory(new FakeTerminalFactory(probe)),
        clock(new ManualClock()) {
    pair<int, int> fds = socketHandler->createSocketPair();
    managerFd = fds.first;
    hostFd = fds.second;
    HostSettings settings;
    settings.chunkSize = chunkSize;
    auto c = clock;
    host.reset(new PtyHost(socketHandler, hostFd, factory, settings,
                           [c]() { return c->now; }));
  }

  ~PtyHostFixture() {
    host.reset();
    if (managerFd >= 0) {
      socketHandler->close(managerFd);
    }
    socketHandler->close(hostFd);
  }

  template <typename T>
  void request(HostPacketType type, const T& message) {
    host->handlePacket(Packet(uint8_t(type), protoToString(message)));
  }

  void create(const string& id) {
    CreateRequest createRequest;
    createRequest.set_id(id);
    createRequest.mutable_options()->set_shell("/bin/sh");
    createRequest.mutable_options()->set_cwd("/tmp");
    request(HOST_CREATE, createRequest);
  }

  Packet reply() {
    REQUIRE(socketHandler->hasData(managerFd));
    Packet packet;
    REQUIRE(socketHandler->readPacket(managerFd, &packet));
    return packet;
  }

  template <typename T>
  T reply(HostPacketType expected) {
    Packet packet = reply();
    REQUIRE(int(packet.getHeader()) == int(expected));
    return packet.parse<T>();
  }

  bool replyPending() { return socketHandler->hasData(managerFd); }

  shared_ptr<PipeSocketHandler> socketHandler;
  shared_ptr<FakePlatformProbe> probe;
  shared_ptr<FakeTerminalFactory> factory;
  shared_ptr<ManualClock> clock;
  int managerFd;
  int hostFd;
  shared_ptr<PtyHost> host;
};
}  // namespace

TEST_CASE("PtyHost announces itself", "[PtyHost]") {
  PtyHostFixture f;
  f.host->sendReady();
  HostReady ready = f.reply<HostReady>(HOST_READY);
  REQUIRE(ready.pid() == getpid());
}

TEST_CASE("PtyHost creates terminals", "[PtyHost]") {
  PtyHostFixture f;
  f.create("t1");

  TerminalSessionInfo info = f.reply<TerminalSessionInfo>(HOST_CREATED);
  REQUIRE(info.id() == "t1");
  REQUIRE(info.pid() == 1000);
  REQUIRE(info.shell() == "/bin/sh");
  REQUIRE(info.cwd() == "/tmp");
  REQUIRE(info.strategy() == "node-pty");
  REQUIRE(info.backend() == "native-pty");
  REQUIRE(info.capabilities().supportsresize());
  REQUIRE_FALSE(info.has_fallbackreason());
  REQUIRE(f.host->hasTerminal("t1"));

  SECTION("Duplicate ids are rejected") {
    f.create("t1");
    HostError error = f.reply<HostError>(HOST_ERROR);
    REQUIRE(error.id() == "t1");
    REQUIRE(error.error() == "Terminal t1 already exists");
    REQUIRE(f.host->getTerminalCount() == 1);
  }

  SECTION("A missing id is rejected") {
    f.request(HOST_CREATE, CreateRequest());
    HostError error = f.reply<HostError>(HOST_ERROR);
    REQUIRE_FALSE(error.has_id());
    REQUIRE(error.error() == "Missing terminal id");
  }
}

TEST_CASE("PtyHost reports spawn failures", "[PtyHost]") {
  PtyHostFixture f;
  f.factory->failingBackends.insert(BACKEND_NATIVE_PTY);

  SECTION("Fallback to subprocess") {
    f.create("t1");
    TerminalSessionInfo info = f.reply<TerminalSessionInfo>(HOST_CREATED);
    REQUIRE(info.strategy() == "subprocess");
    REQUIRE(info.fallbackreason().find("native-pty spawn failed") == 0);
  }

  SECTION("No backend works") {
    f.factory->failingBackends.insert(BACKEND_SUBPROCESS);
    f.create("t1");
    HostError error = f.reply<HostError>(HOST_ERROR);
    REQUIRE(error.id() == "t1");
    REQUIRE(error.error() == "fake spawn failure");
    REQUIRE_FALSE(f.host->hasTerminal("t1"));
  }
}

TEST_CASE("PtyHost forwards writes and resizes", "[PtyHost]") {
  PtyHostFixture f;
  f.create("t1");
  f.reply();
  auto terminal = f.factory->getTerminal("t1");

  WriteRequest write;
  write.set_id("t1");
  write.set_data("echo hi\r");
  f.request(HOST_WRITE, write);
  REQUIRE(terminal->written == vector<string>({"echo hi\r"}));

  ResizeRequest resize;
  resize.set_id("t1");
  resize.set_cols(120);
  resize.set_rows(40);
  f.request(HOST_RESIZE, resize);
  REQUIRE(terminal->resizes == vector<pair<int, int>>({{120, 40}}));

  // Unknown terminals are ignored without a reply
  write.set_id("missing");
  f.request(HOST_WRITE, write);
  resize.set_id("missing");
  f.request(HOST_RESIZE, resize);
  REQUIRE_FALSE(f.replyPending());
}

TEST_CASE("PtyHost streams terminal output", "[PtyHost]") {
  PtyHostFixture f(4);
  f.create("t1");
  f.reply();
  auto terminal = f.factory->getTerminal("t1");

  terminal->queueOutput("abcdefghij");
  f.host->runOnce(0);

  vector<string> chunks;
  while (f.replyPending()) {
    TerminalData data = f.reply<TerminalData>(HOST_DATA);
    REQUIRE(data.id() == "t1");
    chunks.push_back(data.data());
  }
  REQUIRE(chunks == vector<string>({"abcd", "efgh", "ij"}));
}

TEST_CASE("PtyHost sends pending output before the exit", "[PtyHost]") {
  PtyHostFixture f;
  f.create("t1");
  f.reply();
  auto terminal = f.factory->getTerminal("t1");

  terminal->queueOutput("bye\r\n");
  terminal->queueExit(3, "");
  f.host->runOnce(0);

  REQUIRE(f.reply<TerminalData>(HOST_DATA).data() == "bye\r\n");
  TerminalExit exit = f.reply<TerminalExit>(HOST_EXIT);
  REQUIRE(exit.id() == "t1");
  REQUIRE(exit.exitcode() == 3);
  REQUIRE_FALSE(exit.has_signal());
  REQUIRE_FALSE(f.host->hasTerminal("t1"));
}

TEST_CASE("PtyHost kills terminals", "[PtyHost]") {
  PtyHostFixture f;
  f.create("t1");
  f.reply();
  f.create("t2");
  f.reply();
  auto terminal = f.factory->getTerminal("t1");

  KillRequest kill;
  kill.set_id("t1");
  f.request(HOST_KILL, kill);
  REQUIRE(terminal->killCount == 1);
  REQUIRE(f.reply<KilledReply>(HOST_KILLED).id() == "t1");

  // A dying terminal no longer takes input or shows up in listings
  WriteRequest write;
  write.set_id("t1");
  write.set_data("x");
  f.request(HOST_WRITE, write);
  REQUIRE(terminal->written.empty());

  ListRequest list;
  list.set_requestid("list-1");
  f.request(HOST_LIST, list);
  ListReply listReply = f.reply<ListReply>(HOST_LIST_RESULT);
  REQUIRE(listReply.requestid() == "list-1");
  REQUIRE(listReply.terminals_size() == 1);
  REQUIRE(listReply.terminals(0).id() == "t2");
  REQUIRE(listReply.terminals(0).pid() == 1001);

  // Killing it again is a no-op
  f.request(HOST_KILL, kill);
  REQUIRE(terminal->killCount == 1);
  REQUIRE_FALSE(f.replyPending());

  f.host->runOnce(0);
  TerminalExit exit = f.reply<TerminalExit>(HOST_EXIT);
  REQUIRE(exit.id() == "t1");
  REQUIRE(exit.signal() == "SIGHUP");
  REQUIRE(f.host->getTerminalCount() == 1);
}

TEST_CASE("PtyHost forwards repeated output unchanged", "[PtyHost]") {
  PtyHostFixture f;
  f.create("t1");
  f.reply();
  auto terminal = f.factory->getTerminal("t1");

  for (int a = 0; a < 6; a++) {
    terminal->queueOutput("hello");
  }
  f.host->runOnce(0);
  string forwarded;
  while (f.replyPending()) {
    forwarded += f.reply<TerminalData>(HOST_DATA).data();
  }
  REQUIRE(forwarded == "hellohellohellohellohellohello");

  // Repeats in later ticks are not held back either
  for (int a = 0; a < 3; a++) {
    terminal->queueOutput("hello");
    f.host->runOnce(0);
    REQUIRE(f.reply<TerminalData>(HOST_DATA).data() == "hello");
  }
  REQUIRE_FALSE(f.replyPending());
}

TEST_CASE("PtyHost suppresses resize storms", "[PtyHost]") {
  PtyHostFixture f;
  f.create("t1");
  f.reply();
  auto terminal = f.factory->getTerminal("t1");

  for (int a = 0; a < 3; a++) {
    terminal->queueOutput(STORM);
    f.host->runOnce(0);
  }
  REQUIRE(f.reply<TerminalData>(HOST_DATA).data() == STORM);
  REQUIRE(f.reply<TerminalData>(HOST_DATA).data() == STORM);
  REQUIRE_FALSE(f.replyPending());
}

TEST_CASE("PtyHost logs one critical line per storm", "[PtyHost]") {
  PtyHostFixture f;
  f.create("t1");
  f.reply();
  auto terminal = f.factory->getTerminal("t1");

  el::Helpers::installLogDispatchCallback<CriticalLineCounter>(
      "CriticalLineCounter");
  auto counter = el::Helpers::logDispatchCallback<CriticalLineCounter>(
      "CriticalLineCounter");
  counter->count = 0;

  for (int a = 0; a < 5; a++) {
    terminal->queueOutput(STORM);
  }
  f.host->runOnce(0);
  int messages = 0;
  string forwarded;
  while (f.replyPending()) {
    forwarded += f.reply<TerminalData>(HOST_DATA).data();
    messages++;
  }
  int criticalLines = counter->count;
  el::Helpers::uninstallLogDispatchCallback<CriticalLineCounter>(
      "CriticalLineCounter");

  REQUIRE(messages < 5);
  REQUIRE(ResizeStormGuard::countOccurrences(forwarded, STORM) < 5);
  REQUIRE(criticalLines == 1);

  // Ordinary output still gets through afterwards
  terminal->queueOutput("$ ls\r\nfile-one file-two\r\n");
  f.host->runOnce(0);
  REQUIRE(f.reply<TerminalData>(HOST_DATA).data() ==
          "$ ls\r\nfile-one file-two\r\n");
  REQUIRE_FALSE(f.replyPending());
}

TEST_CASE("PtyHost relays terminal errors", "[PtyHost]") {
  PtyHostFixture f;
  f.create("t1");
  f.reply();
  f.factory->getTerminal("t1")->raiseError("read failed");
  HostError error = f.reply<HostError>(HOST_ERROR);
  REQUIRE(error.id() == "t1");
  REQUIRE(error.error() == "read failed");
}

TEST_CASE("PtyHost reports malformed requests", "[PtyHost]") {
  PtyHostFixture f;
  f.host->handlePacket(Packet(uint8_t(HOST_CREATE), "\xff\xff\xff"));
  HostError error = f.reply<HostError>(HOST_ERROR);
  REQUIRE_FALSE(error.has_id());

  // Unknown packet types are logged and dropped
  f.host->handlePacket(Packet(uint8_t(99), ""));
  REQUIRE_FALSE(f.replyPending());
}

TEST_CASE("PtyHost cleans up when the manager goes away", "[PtyHost]") {
  PtyHostFixture f;
  f.create("t1");
  f.reply();
  auto terminal = f.factory->getTerminal("t1");

  f.socketHandler->close(f.managerFd);
  f.managerFd = -1;
  REQUIRE_FALSE(f.host->runOnce(10));
  REQUIRE_FALSE(f.host->runOnce(0));

  f.host->shutdown();
  REQUIRE(terminal->killCount == 1);
  REQUIRE(f.host->getTerminalCount() == 0);
}
