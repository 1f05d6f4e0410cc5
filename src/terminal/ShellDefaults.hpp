#ifndef __PV_SHELL_DEFAULTS__
#define __PV_SHELL_DEFAULTS__

#include "Headers.hpp"

namespace pv {
/**
 * @brief Fills in the shell and working directory when spawn options leave
 * them empty.
 */
class ShellDefaults {
 public:
  /** @brief SHELL, else the platform's usual login shell. */
  static string defaultShell() {
#if defined(_WIN32)
    const char* comspec = ::getenv("COMSPEC");
    if (comspec && *comspec) {
      return comspec;
    }
    return "cmd.exe";
#else
    const char* shell = ::getenv("SHELL");
    if (shell && *shell) {
      return shell;
    }
#if __APPLE__
    return "/bin/zsh";
#else
    return "/bin/bash";
#endif
#endif
  }

  /** @brief `requested`, else HOME, else the current directory. */
  static string defaultCwd(const string& requested) {
    if (!requested.empty()) {
      return requested;
    }
    const char* home = ::getenv("HOME");
    if (home && *home) {
      return home;
    }
    char buf[PATH_MAX];
    if (::getcwd(buf, sizeof(buf)) == NULL) {
      return "/";
    }
    return buf;
  }
};
}  // namespace pv

#endif  // __PV_SHELL_DEFAULTS__
