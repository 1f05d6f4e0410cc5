#include "TerminalCapabilities.hpp"

namespace pv {
string backendName(TerminalBackend backend) {
  switch (backend) {
    case BACKEND_NATIVE_PTY:
      return "native-pty";
    case BACKEND_CONPTY:
      return "conpty";
    case BACKEND_WINPTY:
      return "winpty";
    case BACKEND_SUBPROCESS:
      return "subprocess";
  }
  return "subprocess";
}

string strategyName(TerminalBackend backend) {
  if (backend == BACKEND_NATIVE_PTY) {
    return "node-pty";
  }
  return backendName(backend);
}

TerminalBackend strategyFromName(const string& name) {
  if (name == "node-pty" || name == "native-pty") return BACKEND_NATIVE_PTY;
  if (name == "conpty") return BACKEND_CONPTY;
  if (name == "winpty") return BACKEND_WINPTY;
  if (name == "subprocess") return BACKEND_SUBPROCESS;
  throw std::runtime_error("Unknown terminal strategy: " + name);
}

string reliabilityName(BackendReliability reliability) {
  switch (reliability) {
    case RELIABILITY_HIGH:
      return "high";
    case RELIABILITY_MEDIUM:
      return "medium";
    case RELIABILITY_LOW:
      return "low";
  }
  return "low";
}

BackendReliability reliabilityFromName(const string& name) {
  if (name == "high") return RELIABILITY_HIGH;
  if (name == "medium") return RELIABILITY_MEDIUM;
  if (name == "low") return RELIABILITY_LOW;
  throw std::runtime_error("Unknown reliability: " + name);
}

Capabilities capabilitiesToProto(const TerminalCapabilities& capabilities) {
  Capabilities proto;
  proto.set_backend(backendName(capabilities.backend));
  proto.set_supportsresize(capabilities.supportsResize);
  proto.set_supportscolors(capabilities.supportsColors);
  proto.set_supportsinteractivity(capabilities.supportsInteractivity);
  proto.set_supportshistory(capabilities.supportsHistory);
  proto.set_reliability(reliabilityName(capabilities.reliability));
  return proto;
}

TerminalCapabilities capabilitiesFromProto(const Capabilities& proto) {
  TerminalCapabilities capabilities;
  capabilities.backend = strategyFromName(proto.backend());
  capabilities.supportsResize = proto.supportsresize();
  capabilities.supportsColors = proto.supportscolors();
  capabilities.supportsInteractivity = proto.supportsinteractivity();
  capabilities.supportsHistory = proto.supportshistory();
  capabilities.reliability = reliabilityFromName(proto.reliability());
  return capabilities;
}
}  // namespace pv
