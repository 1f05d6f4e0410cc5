#ifndef __PV_TERMINAL_FACTORY__
#define __PV_TERMINAL_FACTORY__

#include "BackendDetector.hpp"
#include "Headers.hpp"
#include "Terminal.hpp"

namespace pv {
struct TerminalCreateResult {
  shared_ptr<Terminal> terminal;
  /** @brief Strategy tag of the backend actually used ("node-pty"). */
  string strategy;
  TerminalCapabilities capabilities;
  /** @brief Why a weaker backend is in use; empty when none was
   * substituted. */
  string fallbackReason;
};

/**
 * @brief Creates and spawns terminals on the best detected backend.
 *
 * Detection runs once and is cached until refreshStrategy().  When the
 * detected backend cannot be used (a native spawn fails, or the backend has
 * no implementation on this platform) the terminal is created on the
 * subprocess backend and the reason is reported with the result.
 */
class TerminalFactory {
 public:
  explicit TerminalFactory(shared_ptr<BackendDetector> _detector)
      : detector(_detector) {}
  virtual ~TerminalFactory() {}

  /**
   * @brief Fills in defaults, creates the terminal and spawns it.
   * @throws std::runtime_error if no backend could start the shell.
   */
  virtual TerminalCreateResult createTerminal(const string& id,
                                              const TerminalOptions& options);

  /** @brief Cached backend detection. */
  TerminalCapabilities detectBestStrategy();
  /** @brief Discards the cached detection and detects again. */
  TerminalCapabilities refreshStrategy();

  std::optional<string> getActiveStrategy() const;
  std::optional<TerminalCapabilities> getCapabilities() const {
    return cachedCapabilities;
  }
  /** @return The reliability note for the detected backend, if any. */
  std::optional<string> getFallbackReason() const;

  /** @brief Applies shell, cwd and geometry defaults. */
  static TerminalOptions resolveOptions(const TerminalOptions& options);

  static string reliabilityReason(const TerminalCapabilities& capabilities);

 protected:
  shared_ptr<BackendDetector> detector;
  std::optional<TerminalCapabilities> cachedCapabilities;

  /** @brief Constructs an unspawned terminal for the backend. */
  virtual shared_ptr<Terminal> newTerminal(TerminalBackend backend,
                                           const string& id,
                                           const TerminalOptions& options);
};
}  // namespace pv

#endif  // __PV_TERMINAL_FACTORY__
