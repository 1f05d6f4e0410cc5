#ifndef __PV_FAKE_HOST_LAUNCHER__
#define __PV_FAKE_HOST_LAUNCHER__

#include "HostLauncher.hpp"
#include "ProcessMetrics.hpp"

namespace pv {
/**
 * Launches nothing: each launch() opens a socket pair and the test plays
 * the host on the far end.  Host exits are reported when the test sets
 * them.
 */
class FakeHostLauncher : public HostLauncher {
 public:
  FakeHostLauncher()
      : socketHandler(new PipeSocketHandler()),
        nextPid(5000),
        failLaunch(false),
        launchCount(0),
        hostFd(-1) {}
  virtual ~FakeHostLauncher() {}

  virtual HostHandle launch() {
    launchCount++;
    if (failLaunch) {
      throw std::runtime_error("fake launch failure");
    }
    pair<int, int> fds = socketHandler->createSocketPair();
    HostHandle handle;
    handle.pid = nextPid++;
    handle.fd = fds.first;
    hostFd = fds.second;
    currentPid = handle.pid;
    return handle;
  }

  virtual std::optional<HostExitStatus> pollExit(pid_t pid) {
    auto it = exits.find(pid);
    if (it == exits.end()) {
      return std::nullopt;
    }
    HostExitStatus status = it->second;
    exits.erase(it);
    return status;
  }

  virtual void terminate(pid_t pid) { terminated.push_back(pid); }

  virtual shared_ptr<SocketHandler> getSocketHandler() {
    return socketHandler;
  }

  /** Makes the next pollExit() for the current host report this status. */
  void exitHost(int code, const string& signal = "") {
    HostExitStatus status;
    status.code = code;
    status.signal = signal;
    exits[currentPid] = status;
  }

  void sendToManager(HostPacketType type,
                     const google::protobuf::MessageLite& message) {
    socketHandler->writePacket(hostFd,
                               Packet(uint8_t(type), protoToString(message)));
  }

  Packet readFromManager() {
    Packet packet;
    if (!socketHandler->readPacket(hostFd, &packet)) {
      throw std::runtime_error("Empty packet from manager");
    }
    return packet;
  }

  bool managerSentData() { return socketHandler->hasData(hostFd); }

  /** Closes the host end of the channel, as a crashing host would. */
  void dropChannel() {
    socketHandler->close(hostFd);
    hostFd = -1;
  }

  shared_ptr<PipeSocketHandler> socketHandler;
  pid_t nextPid;
  pid_t currentPid;
  bool failLaunch;
  int launchCount;
  int hostFd;
  map<pid_t, HostExitStatus> exits;
  vector<pid_t> terminated;
};

/** Serves canned usage figures per pid. */
class FakeProcessMetrics : public ProcessMetricsSource {
 public:
  virtual ~FakeProcessMetrics() {}

  virtual ProcessUsage sample(pid_t pid) {
    if (failing.find(pid) != failing.end()) {
      throw std::runtime_error("No such process: " + to_string(pid));
    }
    auto it = usage.find(pid);
    if (it == usage.end()) {
      return ProcessUsage();
    }
    return it->second;
  }

  void setMemory(pid_t pid, int64_t bytes) { usage[pid].memoryBytes = bytes; }

  map<pid_t, ProcessUsage> usage;
  set<pid_t> failing;
};
}  // namespace pv

#endif  // __PV_FAKE_HOST_LAUNCHER__
