#ifndef __PV_BACKEND_DETECTOR__
#define __PV_BACKEND_DETECTOR__

#include "Headers.hpp"
#include "SubprocessUtils.hpp"
#include "TerminalCapabilities.hpp"

namespace pv {
/**
 * @brief The facts about the running system that backend selection depends
 * on.  Tests substitute a fake to simulate other platforms.
 */
class PlatformProbe {
 public:
  virtual ~PlatformProbe() {}

  /** @brief "linux", "darwin", "win32", ... */
  virtual string platform() = 0;
  /** @brief Kernel/OS release string, e.g. "10.0.19041". */
  virtual string osRelease() = 0;
  /** @brief Attempts a throwaway pty spawn. */
  virtual bool canSpawnNativePty() = 0;
  /** @brief True if `command` resolves on the search path. */
  virtual bool commandResolves(const string& command) = 0;
};

/**
 * @brief PlatformProbe backed by uname(2), forkpty(3) and which/where.
 */
class SystemPlatformProbe : public PlatformProbe {
 public:
  explicit SystemPlatformProbe(shared_ptr<SubprocessUtils> _subprocessUtils)
      : subprocessUtils(_subprocessUtils) {}
  virtual ~SystemPlatformProbe() {}

  virtual string platform();
  virtual string osRelease();
  /**
   * @brief Runs `echo test` under a fresh pty and waits for it to exit
   * cleanly.
   */
  virtual bool canSpawnNativePty();
  virtual bool commandResolves(const string& command);

 protected:
  shared_ptr<SubprocessUtils> subprocessUtils;
};

/**
 * @brief Chooses the strongest terminal backend available on this machine.
 *
 * Order: native pty, ConPTY (Windows 10 build 17763+), WinPTY (Windows with
 * the winpty helper installed), plain subprocess.  The subprocess backend is
 * always viable, so detection never fails.
 */
class BackendDetector {
 public:
  static constexpr int CONPTY_MIN_BUILD = 17763;

  explicit BackendDetector(shared_ptr<PlatformProbe> _probe) : probe(_probe) {}

  /** @brief Never throws; probe failures count as "unavailable". */
  TerminalCapabilities detectBestBackend();

  /**
   * @brief "<backend> (<reliability> reliability, <features>)".  An empty
   * feature list still leaves the separating comma in place.
   */
  static string getCapabilitiesDescription(
      const TerminalCapabilities& capabilities);

  /** @return True if the release string is "major.minor.build" with a build
   * new enough for ConPTY. */
  static bool isConPtyRelease(const string& release);

  static TerminalCapabilities nativePtyCapabilities();
  static TerminalCapabilities conPtyCapabilities();
  static TerminalCapabilities winPtyCapabilities();
  static TerminalCapabilities subprocessCapabilities();

 protected:
  shared_ptr<PlatformProbe> probe;

  bool checkNativePty();
  bool checkConPty(const string& platform);
  bool checkWinPty(const string& platform);
};
}  // namespace pv

#endif  // __PV_BACKEND_DETECTOR__
