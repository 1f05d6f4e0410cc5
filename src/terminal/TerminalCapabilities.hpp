#ifndef __PV_TERMINAL_CAPABILITIES__
#define __PV_TERMINAL_CAPABILITIES__

#include "Headers.hpp"

namespace pv {
enum TerminalBackend {
  BACKEND_NATIVE_PTY = 0,
  BACKEND_CONPTY = 1,
  BACKEND_WINPTY = 2,
  BACKEND_SUBPROCESS = 3,
};

enum BackendReliability {
  RELIABILITY_HIGH = 0,
  RELIABILITY_MEDIUM = 1,
  RELIABILITY_LOW = 2,
};

/**
 * @brief What the selected backend can do.  Computed once per process by
 * BackendDetector.
 */
struct TerminalCapabilities {
  TerminalBackend backend = BACKEND_SUBPROCESS;
  bool supportsResize = false;
  bool supportsColors = false;
  bool supportsInteractivity = false;
  bool supportsHistory = false;
  BackendReliability reliability = RELIABILITY_MEDIUM;

  bool operator==(const TerminalCapabilities& other) const {
    return backend == other.backend &&
           supportsResize == other.supportsResize &&
           supportsColors == other.supportsColors &&
           supportsInteractivity == other.supportsInteractivity &&
           supportsHistory == other.supportsHistory &&
           reliability == other.reliability;
  }
  bool operator!=(const TerminalCapabilities& other) const {
    return !(*this == other);
  }
};

/** @brief Backend name used in capability descriptions ("native-pty"). */
string backendName(TerminalBackend backend);

/**
 * @brief Strategy tag sent to consumers ("node-pty", "conpty", "winpty",
 * "subprocess").
 */
string strategyName(TerminalBackend backend);

/** @throws std::runtime_error for an unknown tag. */
TerminalBackend strategyFromName(const string& name);

string reliabilityName(BackendReliability reliability);

/** @throws std::runtime_error for an unknown name. */
BackendReliability reliabilityFromName(const string& name);

Capabilities capabilitiesToProto(const TerminalCapabilities& capabilities);
/** @throws std::runtime_error if the backend or reliability is unknown. */
TerminalCapabilities capabilitiesFromProto(const Capabilities& proto);
}  // namespace pv

#endif  // __PV_TERMINAL_CAPABILITIES__
