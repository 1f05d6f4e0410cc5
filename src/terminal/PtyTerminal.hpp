#ifndef __PV_PTY_TERMINAL__
#define __PV_PTY_TERMINAL__

#include "Terminal.hpp"

namespace pv {
/**
 * @brief Runs the shell under a pseudo-terminal created with forkpty(3).
 */
class PtyTerminal : public Terminal {
 public:
  PtyTerminal(const string& _id, const TerminalOptions& _options);
  virtual ~PtyTerminal();

  virtual void spawn();
  virtual void write(const string& data);
  /** @brief Applies the new geometry with ioctl(TIOCSWINSZ). */
  virtual void resize(int cols, int rows);
  /** @brief Hangs up the shell (SIGHUP).  The exit event follows from
   * poll(). */
  virtual void kill();
  virtual int getFd() const { return masterFd; }
  virtual void poll();

 protected:
  int masterFd;

  /** @brief Reaps the child and emits TERMINAL_EXIT. */
  void handleSessionEnd();
  /** @brief Only returns if exec fails. */
  void runShell();
};
}  // namespace pv

#endif  // __PV_PTY_TERMINAL__
