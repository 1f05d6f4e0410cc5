#ifndef __PV_HOST_LAUNCHER__
#define __PV_HOST_LAUNCHER__

#include "Headers.hpp"
#include "PipeSocketHandler.hpp"

namespace pv {
/** @brief A running host process and the manager's end of its channel. */
struct HostHandle {
  pid_t pid = -1;
  int fd = -1;
};

struct HostExitStatus {
  /** @brief Exit code, or 128 + signal number when killed by a signal. */
  int code = 0;
  /** @brief Name of the terminating signal, empty for a normal exit. */
  string signal;
};

/**
 * @brief Starts and reaps terminal host processes on behalf of the manager.
 */
class HostLauncher {
 public:
  virtual ~HostLauncher() {}

  /**
   * @brief Starts a host connected to a fresh channel.  The returned fd is
   * tracked by getSocketHandler().
   * @throws std::runtime_error if the host could not be started.
   */
  virtual HostHandle launch() = 0;

  /** @brief Non-blocking check for the host's exit. */
  virtual std::optional<HostExitStatus> pollExit(pid_t pid) = 0;

  /** @brief Asks the host to shut down (SIGTERM). */
  virtual void terminate(pid_t pid) = 0;

  virtual shared_ptr<SocketHandler> getSocketHandler() = 0;
};

/**
 * @brief Forks and execs the pvhost binary with the child end of a socket
 * pair passed through --fd.
 */
class ForkedHostLauncher : public HostLauncher {
 public:
  /** @brief How long terminate() waits before escalating to SIGKILL. */
  static constexpr int64_t TERMINATE_GRACE_MS = 2000;
  /** @brief Exit code of a child that could not exec the host binary. */
  static constexpr int EXEC_FAILED_EXIT_CODE = 127;

  ForkedHostLauncher(shared_ptr<PipeSocketHandler> _socketHandler,
                     const string& _hostPath,
                     const vector<string>& _extraArgs);
  virtual ~ForkedHostLauncher() {}

  virtual HostHandle launch();
  virtual std::optional<HostExitStatus> pollExit(pid_t pid);
  /** @brief SIGTERM, then SIGKILL if the host is still alive after
   * TERMINATE_GRACE_MS.  The host is reaped before returning. */
  virtual void terminate(pid_t pid);
  virtual shared_ptr<SocketHandler> getSocketHandler() {
    return socketHandler;
  }

  /** @brief `pvhost` in the same directory as the running executable. */
  static string defaultHostPath();

  static HostExitStatus decodeStatus(int status);

 protected:
  shared_ptr<PipeSocketHandler> socketHandler;
  string hostPath;
  vector<string> extraArgs;
};
}  // namespace pv

#endif  // __PV_HOST_LAUNCHER__
