#ifndef __PV_SUBPROCESS_UTILS__
#define __PV_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace pv {
/**
 * @brief Utility class for executing subprocesses and capturing output.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments (no shell) and captures its stdout.
   * @param exitCode Receives the exit status, or -1 if the child was killed
   * by a signal.
   * @throws std::runtime_error if the pipe or fork fails.
   */
  virtual string SubprocessToStringInteractive(const string& command,
                                               const vector<string>& args,
                                               int* exitCode);
};
}  // namespace pv

#endif  // __PV_SUBPROCESS_UTILS__
