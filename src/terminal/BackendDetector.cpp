#include "BackendDetector.hpp"

namespace pv {
string SystemPlatformProbe::platform() {
#if defined(_WIN32)
  return "win32";
#elif __APPLE__
  return "darwin";
#elif __FreeBSD__
  return "freebsd";
#elif __NetBSD__
  return "netbsd";
#else
  return "linux";
#endif
}

string SystemPlatformProbe::osRelease() {
  utsname name;
  if (uname(&name) == -1) {
    throw std::runtime_error(string("uname failed: ") + strerror(errno));
  }
  return string(name.release);
}

bool SystemPlatformProbe::canSpawnNativePty() {
  int masterFd;
  pid_t pid = forkpty(&masterFd, NULL, NULL, NULL);
  if (pid == -1) {
    VLOG(1) << "forkpty failed: " << strerror(errno);
    return false;
  }
  if (pid == 0) {
    execl("/bin/echo", "echo", "test", (char*)NULL);
    _exit(127);
  }

  // Drain the master so the child never blocks on a full pty.
  while (true) {
    fd_set readSet;
    FD_ZERO(&readSet);
    FD_SET(masterFd, &readSet);
    timeval tv;
    tv.tv_sec = 1;
    tv.tv_usec = 0;
    int rc = select(masterFd + 1, &readSet, NULL, NULL, &tv);
    if (rc <= 0) {
      break;
    }
    char buf[256];
    ssize_t bytesRead = ::read(masterFd, buf, sizeof(buf));
    if (bytesRead <= 0) {
      break;
    }
  }
  ::close(masterFd);

  int status = 0;
  if (waitpid(pid, &status, 0) == -1) {
    return false;
  }
  return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

bool SystemPlatformProbe::commandResolves(const string& command) {
  int exitCode = -1;
  string locator = platform() == "win32" ? "where" : "which";
  subprocessUtils->SubprocessToStringInteractive(locator, {command},
                                                 &exitCode);
  return exitCode == 0;
}

TerminalCapabilities BackendDetector::nativePtyCapabilities() {
  TerminalCapabilities c;
  c.backend = BACKEND_NATIVE_PTY;
  c.supportsResize = true;
  c.supportsColors = true;
  c.supportsInteractivity = true;
  c.supportsHistory = true;
  c.reliability = RELIABILITY_HIGH;
  return c;
}

TerminalCapabilities BackendDetector::conPtyCapabilities() {
  TerminalCapabilities c = nativePtyCapabilities();
  c.backend = BACKEND_CONPTY;
  return c;
}

TerminalCapabilities BackendDetector::winPtyCapabilities() {
  TerminalCapabilities c;
  c.backend = BACKEND_WINPTY;
  c.supportsResize = true;
  c.supportsColors = true;
  c.supportsInteractivity = true;
  c.supportsHistory = false;
  c.reliability = RELIABILITY_MEDIUM;
  return c;
}

TerminalCapabilities BackendDetector::subprocessCapabilities() {
  TerminalCapabilities c;
  c.backend = BACKEND_SUBPROCESS;
  c.supportsResize = false;
  c.supportsColors = true;
  c.supportsInteractivity = true;
  c.supportsHistory = true;
  c.reliability = RELIABILITY_MEDIUM;
  return c;
}

TerminalCapabilities BackendDetector::detectBestBackend() {
  string platform;
  try {
    platform = probe->platform();
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Could not determine platform: " << ex.what();
  }

  if (checkNativePty()) {
    VLOG(1) << "Selected native pty backend";
    return nativePtyCapabilities();
  }
  if (checkConPty(platform)) {
    VLOG(1) << "Selected conpty backend";
    return conPtyCapabilities();
  }
  if (checkWinPty(platform)) {
    VLOG(1) << "Selected winpty backend";
    return winPtyCapabilities();
  }
  LOG(INFO) << "No pty backend available, falling back to subprocess";
  return subprocessCapabilities();
}

bool BackendDetector::checkNativePty() {
  try {
    return probe->canSpawnNativePty();
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Native pty unavailable: " << ex.what();
    return false;
  }
}

bool BackendDetector::checkConPty(const string& platform) {
  if (platform != "win32") {
    return false;
  }
  try {
    return isConPtyRelease(probe->osRelease());
  } catch (const std::exception& ex) {
    LOG(WARNING) << "ConPTY unavailable: " << ex.what();
    return false;
  }
}

bool BackendDetector::checkWinPty(const string& platform) {
  if (platform != "win32") {
    return false;
  }
  try {
    return probe->commandResolves("winpty");
  } catch (const std::exception& ex) {
    LOG(WARNING) << "WinPTY unavailable: " << ex.what();
    return false;
  }
}

bool BackendDetector::isConPtyRelease(const string& release) {
  vector<string> tokens = split(release, '.');
  if (tokens.size() != 3) {
    return false;
  }
  long parts[3];
  for (int a = 0; a < 3; a++) {
    const string& token = tokens[a];
    if (token.empty() ||
        !all_of(token.begin(), token.end(),
                [](char c) { return c >= '0' && c <= '9'; })) {
      return false;
    }
    try {
      parts[a] = stol(token);
    } catch (const std::out_of_range& oor) {
      return false;
    }
  }
  long major = parts[0];
  long build = parts[2];
  return major > 10 || (major == 10 && build >= CONPTY_MIN_BUILD);
}

string BackendDetector::getCapabilitiesDescription(
    const TerminalCapabilities& capabilities) {
  vector<string> features;
  if (capabilities.supportsResize) features.push_back("resize");
  if (capabilities.supportsColors) features.push_back("colors");
  if (capabilities.supportsInteractivity) features.push_back("interactive");
  if (capabilities.supportsHistory) features.push_back("history");

  string joined;
  for (size_t a = 0; a < features.size(); a++) {
    if (a) joined += ", ";
    joined += features[a];
  }
  return backendName(capabilities.backend) + " (" +
         reliabilityName(capabilities.reliability) + " reliability, " +
         joined + ")";
}
}  // namespace pv
