#include "HostLauncher.hpp"

#include "RawSocketUtils.hpp"

namespace pv {
ForkedHostLauncher::ForkedHostLauncher(
    shared_ptr<PipeSocketHandler> _socketHandler, const string& _hostPath,
    const vector<string>& _extraArgs)
    : socketHandler(_socketHandler),
      hostPath(_hostPath),
      extraArgs(_extraArgs) {}

string ForkedHostLauncher::defaultHostPath() {
  char buf[PATH_MAX];
  ssize_t len = readlink("/proc/self/exe", buf, sizeof(buf) - 1);
  if (len <= 0) {
    return "pvhost";
  }
  buf[len] = '\0';
  return (fs::path(buf).parent_path() / "pvhost").string();
}

HostExitStatus ForkedHostLauncher::decodeStatus(int status) {
  HostExitStatus exitStatus;
  if (WIFSIGNALED(status)) {
    int sig = WTERMSIG(status);
    exitStatus.code = 128 + sig;
    exitStatus.signal = string("SIG") + to_string(sig);
    switch (sig) {
      case SIGTERM:
        exitStatus.signal = "SIGTERM";
        break;
      case SIGKILL:
        exitStatus.signal = "SIGKILL";
        break;
      case SIGSEGV:
        exitStatus.signal = "SIGSEGV";
        break;
      case SIGABRT:
        exitStatus.signal = "SIGABRT";
        break;
    }
  } else if (WIFEXITED(status)) {
    exitStatus.code = WEXITSTATUS(status);
  } else {
    exitStatus.code = -1;
  }
  return exitStatus;
}

HostHandle ForkedHostLauncher::launch() {
  pair<int, int> fds = socketHandler->createSocketPair(false);
  int managerFd = fds.first;
  int hostFd = fds.second;
  RawSocketUtils::setCloseOnExec(managerFd);

  vector<string> args = {hostPath, "--fd=" + to_string(hostFd)};
  args.insert(args.end(), extraArgs.begin(), extraArgs.end());
  // Everything the child needs is built here: after fork() it may only make
  // async-signal-safe calls.
  vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(&arg[0]);
  }
  argv.push_back(NULL);
  struct sigaction defaultAction;
  memset(&defaultAction, 0, sizeof(defaultAction));
  defaultAction.sa_handler = SIG_DFL;
  sigemptyset(&defaultAction.sa_mask);

  pid_t pid = fork();
  if (pid == -1) {
    auto forkErrno = GetErrno();
    socketHandler->close(managerFd);
    ::close(hostFd);
    throw std::runtime_error(string("Failed to fork pty host: ") +
                             strerror(forkErrno));
  }
  if (pid == 0) {
    // child process
    sigaction(SIGCHLD, &defaultAction, NULL);
    execv(argv[0], &argv[0]);
    _exit(EXEC_FAILED_EXIT_CODE);
  }

  // parent process
  ::close(hostFd);
  LOG(INFO) << "PTY host started with pid " << pid;
  HostHandle handle;
  handle.pid = pid;
  handle.fd = managerFd;
  return handle;
}

std::optional<HostExitStatus> ForkedHostLauncher::pollExit(pid_t pid) {
  int status = 0;
  pid_t rc = waitpid(pid, &status, WNOHANG);
  if (rc == 0) {
    return std::nullopt;
  }
  if (rc == -1) {
    if (GetErrno() == EINTR) {
      return std::nullopt;
    }
    // ECHILD: already reaped elsewhere
    LOG(WARNING) << "Could not wait on pty host " << pid << ": "
                 << strerror(GetErrno());
    HostExitStatus unknown;
    unknown.code = -1;
    return unknown;
  }
  return decodeStatus(status);
}

void ForkedHostLauncher::terminate(pid_t pid) {
  if (::kill(pid, SIGTERM) == -1) {
    if (GetErrno() != ESRCH) {
      LOG(WARNING) << "Could not signal pty host " << pid << ": "
                   << strerror(GetErrno());
    }
  }
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(TERMINATE_GRACE_MS);
  while (std::chrono::steady_clock::now() < deadline) {
    int status;
    pid_t rc = waitpid(pid, &status, WNOHANG);
    if (rc == pid || (rc == -1 && GetErrno() != EINTR)) {
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  LOG(WARNING) << "PTY host " << pid << " ignored SIGTERM, killing";
  ::kill(pid, SIGKILL);
  int status;
  waitpid(pid, &status, 0);
}
}  // namespace pv
