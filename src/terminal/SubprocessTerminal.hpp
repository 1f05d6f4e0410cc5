#ifndef __PV_SUBPROCESS_TERMINAL__
#define __PV_SUBPROCESS_TERMINAL__

#include "Terminal.hpp"
#include "TerminalBufferManager.hpp"

namespace pv {
/**
 * @brief Runs the shell with plain pipes for when no pty is available.
 *
 * stdout and stderr share one pipe.  Since nothing echoes input, printable
 * keystrokes, carriage returns and backspaces are echoed locally.  Output
 * goes through a TerminalBufferManager, so this terminal is instrumented.
 */
class SubprocessTerminal : public Terminal, public InstrumentedTerminal {
 public:
  /** @brief Grace period between SIGTERM and SIGKILL. */
  static constexpr int64_t KILL_GRACE_MS = 5000;

  SubprocessTerminal(const string& _id, const TerminalOptions& _options);
  virtual ~SubprocessTerminal();

  static BufferConfig defaultBufferConfig();

  virtual void spawn();
  virtual void write(const string& data);
  /** @brief Records the geometry and signals SIGWINCH; pipes have no real
   * window size. */
  virtual void resize(int cols, int rows);
  /** @brief SIGTERM now, SIGKILL from poll() once the grace period ends. */
  virtual void kill();
  virtual int getFd() const { return outputFd; }
  virtual void poll();

  virtual InstrumentedTerminal* getInstrumentation() { return this; }
  virtual BufferHealth getBufferHealth() const {
    return bufferManager.getHealthStatus();
  }
  virtual BufferMetrics getBufferMetrics() const {
    return bufferManager.getMetrics();
  }

 protected:
  int inputFd;
  int outputFd;
  TerminalBufferManager bufferManager;
  std::optional<std::chrono::steady_clock::time_point> killDeadline;

  void echo(const string& data);
  void handleSessionEnd(bool block);
  void closePipes();
};
}  // namespace pv

#endif  // __PV_SUBPROCESS_TERMINAL__
