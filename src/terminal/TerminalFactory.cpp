#include "TerminalFactory.hpp"

#include "PtyTerminal.hpp"
#include "ShellDefaults.hpp"
#include "SubprocessTerminal.hpp"

namespace pv {
TerminalOptions TerminalFactory::resolveOptions(
    const TerminalOptions& options) {
  TerminalOptions resolved = options;
  if (resolved.shell.empty()) {
    resolved.shell = ShellDefaults::defaultShell();
  }
  resolved.cwd = ShellDefaults::defaultCwd(resolved.cwd);
  if (resolved.cols <= 0) {
    resolved.cols = DEFAULT_TERMINAL_COLS;
  }
  if (resolved.rows <= 0) {
    resolved.rows = DEFAULT_TERMINAL_ROWS;
  }
  return resolved;
}

string TerminalFactory::reliabilityReason(
    const TerminalCapabilities& capabilities) {
  if (capabilities.reliability == RELIABILITY_HIGH) {
    return "";
  }
  return "Using " + backendName(capabilities.backend) + " backend (" +
         reliabilityName(capabilities.reliability) + " reliability)";
}

TerminalCapabilities TerminalFactory::detectBestStrategy() {
  if (cachedCapabilities) {
    return *cachedCapabilities;
  }
  LOG(INFO) << "Detecting best terminal backend...";
  cachedCapabilities = detector->detectBestBackend();
  LOG(INFO) << "Selected terminal backend: "
            << BackendDetector::getCapabilitiesDescription(
                   *cachedCapabilities);
  return *cachedCapabilities;
}

TerminalCapabilities TerminalFactory::refreshStrategy() {
  LOG(INFO) << "Refreshing backend detection...";
  cachedCapabilities.reset();
  return detectBestStrategy();
}

std::optional<string> TerminalFactory::getActiveStrategy() const {
  if (!cachedCapabilities) {
    return std::nullopt;
  }
  return strategyName(cachedCapabilities->backend);
}

std::optional<string> TerminalFactory::getFallbackReason() const {
  if (!cachedCapabilities) {
    return std::nullopt;
  }
  string reason = reliabilityReason(*cachedCapabilities);
  if (reason.empty()) {
    return std::nullopt;
  }
  return reason;
}

shared_ptr<Terminal> TerminalFactory::newTerminal(
    TerminalBackend backend, const string& id,
    const TerminalOptions& options) {
  switch (backend) {
    case BACKEND_NATIVE_PTY:
      return shared_ptr<Terminal>(new PtyTerminal(id, options));
    case BACKEND_SUBPROCESS:
      return shared_ptr<Terminal>(new SubprocessTerminal(id, options));
    default:
      throw std::runtime_error("The " + backendName(backend) +
                               " backend is not available in this build");
  }
}

TerminalCreateResult TerminalFactory::createTerminal(
    const string& id, const TerminalOptions& options) {
  TerminalOptions resolved = resolveOptions(options);
  TerminalCapabilities capabilities = detectBestStrategy();
  LOG(INFO) << "Creating terminal " << id << " (" << resolved.shell << " in "
            << resolved.cwd << ")";

  TerminalCreateResult result;
  if (capabilities.backend != BACKEND_SUBPROCESS) {
    try {
      result.terminal = newTerminal(capabilities.backend, id, resolved);
      result.terminal->spawn();
      result.capabilities = capabilities;
      result.strategy = strategyName(capabilities.backend);
      result.fallbackReason = reliabilityReason(capabilities);
      LOG(INFO) << "Created terminal " << id << " with "
                << backendName(capabilities.backend) << " backend";
      return result;
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Could not start terminal " << id << " with "
                   << backendName(capabilities.backend)
                   << " backend: " << re.what();
      result.fallbackReason = backendName(capabilities.backend) +
                              " spawn failed (" + re.what() +
                              "), using subprocess backend";
    }
  }

  result.capabilities = BackendDetector::subprocessCapabilities();
  result.terminal = newTerminal(BACKEND_SUBPROCESS, id, resolved);
  result.terminal->spawn();
  result.strategy = strategyName(BACKEND_SUBPROCESS);
  if (result.fallbackReason.empty()) {
    result.fallbackReason = reliabilityReason(result.capabilities);
  }
  LOG(INFO) << "Created terminal " << id << " with subprocess backend";
  return result;
}
}  // namespace pv
