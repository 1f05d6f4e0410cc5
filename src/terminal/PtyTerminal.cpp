#include "PtyTerminal.hpp"

#include "RawSocketUtils.hpp"

namespace pv {
#define BUF_SIZE (16 * 1024)

PtyTerminal::PtyTerminal(const string& _id, const TerminalOptions& _options)
    : Terminal(_id, _options), masterFd(-1) {}

PtyTerminal::~PtyTerminal() {
  if (running && pid > 0) {
    ::kill(pid, SIGKILL);
    int status;
    waitpid(pid, &status, 0);
  }
  if (masterFd >= 0) {
    ::close(masterFd);
  }
}

void PtyTerminal::spawn() {
  if (running) {
    throw std::runtime_error("Terminal " + id + " is already running");
  }
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = options.cols;
  win.ws_row = options.rows;

  pid_t childPid = forkpty(&masterFd, NULL, NULL, &win);
  switch (childPid) {
    case -1:
      masterFd = -1;
      throw std::runtime_error(string("forkpty failed: ") +
                               strerror(GetErrno()));
    case 0: {
      runShell();
      // only get here if exec fails
      _exit(127);
    }
    default: {
      // parent
      VLOG(1) << "pty opened " << masterFd << " for terminal " << id
              << " (pid " << childPid << ")";
      pid = childPid;
      running = true;
      RawSocketUtils::setNonBlocking(masterFd);
      RawSocketUtils::setCloseOnExec(masterFd);
      break;
    }
  }
}

void PtyTerminal::runShell() {
  if (chdir(options.cwd.c_str()) == -1) {
    fprintf(stderr, "Could not chdir to %s: %s\n", options.cwd.c_str(),
            strerror(errno));
  }
  for (const auto& it : options.env) {
    setenv(it.first.c_str(), it.second.c_str(), 1);
  }
  setenv("PV_VERSION", PV_VERSION, 1);
  // The host may have SIGCHLD ignored; shells inherit that disposition and
  // break tools that expect to wait on their own children.
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);
  signal(SIGTERM, SIG_DFL);
  signal(SIGINT, SIG_DFL);
  execl(options.shell.c_str(), options.shell.c_str(), (char*)NULL);
  fprintf(stderr, "Could not exec %s: %s\n", options.shell.c_str(),
          strerror(errno));
}

void PtyTerminal::write(const string& data) {
  if (!running || masterFd < 0) {
    throw std::runtime_error("Terminal " + id + " is not running");
  }
  RawSocketUtils::writeAll(masterFd, data.c_str(), data.length());
}

void PtyTerminal::resize(int cols, int rows) {
  if (!running || masterFd < 0) {
    LOG(WARNING) << "Ignoring resize of stopped terminal " << id;
    return;
  }
  winsize win;
  memset(&win, 0, sizeof(win));
  win.ws_col = cols;
  win.ws_row = rows;
  if (ioctl(masterFd, TIOCSWINSZ, &win) == -1) {
    throw std::runtime_error(string("Resize failed: ") + strerror(GetErrno()));
  }
  options.cols = cols;
  options.rows = rows;
}

void PtyTerminal::kill() {
  if (!running || pid <= 0) {
    return;
  }
  if (::kill(pid, SIGHUP) == -1 && GetErrno() != ESRCH) {
    throw std::runtime_error(string("Could not signal terminal: ") +
                             strerror(GetErrno()));
  }
}

void PtyTerminal::poll() {
  if (!running || masterFd < 0) {
    return;
  }
  bool eof = false;
  string output;
  try {
    output = RawSocketUtils::readAvailable(masterFd, BUF_SIZE, &eof);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Terminal " << id << " read failed: " << re.what();
    emitError(re.what());
    eof = true;
  }
  if (!output.empty()) {
    emitData(output);
  }
  if (eof) {
    handleSessionEnd();
  }
}

void PtyTerminal::handleSessionEnd() {
  LOG(INFO) << "Terminal session ended: " << id;
  ::close(masterFd);
  masterFd = -1;
  running = false;

  int status = 0;
  int exitCode = -1;
  string signalName;
  pid_t rc;
  do {
    rc = waitpid(pid, &status, 0);
  } while (rc == -1 && GetErrno() == EINTR);
  if (rc == pid) {
    decodeWaitStatus(status, &exitCode, &signalName);
  } else {
    LOG(WARNING) << "Could not reap terminal " << id << ": "
                 << strerror(GetErrno());
  }
  emitExit(exitCode, signalName);
}
}  // namespace pv
