#ifndef __PV_PTY_MANAGER__
#define __PV_PTY_MANAGER__

#include "EventRegistry.hpp"
#include "Headers.hpp"
#include "HostLauncher.hpp"
#include "Packet.hpp"
#include "PerformanceMonitor.hpp"
#include "PvConfig.hpp"
#include "Terminal.hpp"
#include "TerminalCapabilities.hpp"
#include "TimerQueue.hpp"

namespace pv {
/** @brief A terminal living inside the host, as the manager knows it. */
struct TerminalSession {
  string id;
  pid_t pid = -1;
  string shell;
  string cwd;
  string strategy;
  string backend;
  TerminalCapabilities capabilities;
  string fallbackReason;
};

/**
 * @brief Stand-in registered with the performance monitor for a terminal
 * that runs in the host process.  It carries no buffer statistics.
 */
class RemoteTerminalProxy : public MonitoredTerminal {
 public:
  explicit RemoteTerminalProxy(pid_t _pid) : pid(_pid), running(true) {}
  virtual pid_t getPid() const { return pid; }
  virtual bool isRunning() const { return running; }
  void markExited() { running = false; }

 protected:
  pid_t pid;
  bool running;
};

enum ManagerEventType {
  MANAGER_READY = 0,
  MANAGER_TERMINAL_DATA = 1,
  MANAGER_TERMINAL_EXIT = 2,
  MANAGER_TERMINAL_KILLED = 3,
  MANAGER_ERROR = 4,
  MANAGER_HOST_EXIT = 5,
};

struct ManagerEvent {
  ManagerEventType type;
  string terminalId;
  string data;
  int exitCode = 0;
  string signal;
  string error;
};

/**
 * @brief Supervises the terminal host process and correlates requests with
 * its replies.
 *
 * The manager owns at most one live host.  A host that exits with a
 * non-zero code is restarted after `restartDelayMs`; a clean exit is final.
 * Create and list return futures that are fulfilled (or failed) exactly
 * once, when the matching reply arrives or the manager gives up on the
 * host.  Write, resize and kill never throw.
 *
 * Nothing happens in the background: the owner drives the manager by
 * calling update() from its event loop.
 */
class PtyManager {
 public:
  PtyManager(shared_ptr<HostLauncher> _launcher,
             shared_ptr<PerformanceMonitor> _monitor,
             shared_ptr<TimerQueue> _timers, const HostSettings& _settings);
  virtual ~PtyManager();

  std::future<TerminalSession> createTerminal(const TerminalOptions& options);
  void writeToTerminal(const string& id, const string& data);
  void resizeTerminal(const string& id, int cols, int rows);
  /** @brief Forgets the session locally, then asks the host to kill it. */
  void killTerminal(const string& id);
  std::future<vector<TerminalSession>> listTerminals();

  std::optional<TerminalSession> getTerminalSession(const string& id) const;
  size_t getSessionCount() const { return sessions.size(); }
  size_t getPendingCount() const {
    return pendingCreates.size() + pendingLists.size();
  }

  /** @brief True once the current host has reported HOST_READY. */
  bool isReady() const { return ready; }
  bool isHostRunning() const { return hostPid > 0; }
  pid_t getHostPid() const { return hostPid; }
  bool isRestartScheduled() const { return restartTimer != 0; }

  /**
   * @brief Runs due timers, reaps the host, and handles every reply that
   * arrives within `timeoutMs`.
   */
  void update(int64_t timeoutMs);

  /**
   * @brief Fails every pending request with "PTY Manager destroyed", stops
   * the host and drops all listeners.  Safe to call more than once.
   */
  void destroy();

  EventRegistry<ManagerEvent>& events() { return eventRegistry; }

 protected:
  struct SessionEntry {
    TerminalSession session;
    shared_ptr<RemoteTerminalProxy> proxy;
  };

  shared_ptr<HostLauncher> launcher;
  shared_ptr<PerformanceMonitor> monitor;
  shared_ptr<TimerQueue> timers;
  HostSettings settings;
  shared_ptr<SocketHandler> socketHandler;

  pid_t hostPid;
  int hostFd;
  bool ready;
  bool destroyed;
  uint64_t restartTimer;
  uint64_t nextListId;

  map<string, SessionEntry> sessions;
  map<string, std::promise<TerminalSession>> pendingCreates;
  map<string, std::promise<vector<TerminalSession>>> pendingLists;
  EventRegistry<ManagerEvent> eventRegistry;

  void startHost();
  void scheduleRestart();
  void checkHostExit();
  void onHostExit(const HostExitStatus& status);
  void onHostDisconnect(const string& reason);
  void closeLink();
  void readReplies();

  /** @throws std::runtime_error if there is no host link. */
  void send(HostPacketType type, const google::protobuf::MessageLite& message);

  void handlePacket(const Packet& packet);
  void handleCreated(const TerminalSessionInfo& info);
  void handleData(const TerminalData& data);
  void handleExit(const TerminalExit& exit);
  void handleError(const HostError& error);
  void handleKilled(const KilledReply& reply);
  void handleListResult(const ListReply& reply);

  void dropSession(const string& id);
  void rejectAll(const string& message);
  void emitError(const string& terminalId, const string& error);

  static TerminalSession sessionFromInfo(const TerminalSessionInfo& info);
};
}  // namespace pv

#endif  // __PV_PTY_MANAGER__
