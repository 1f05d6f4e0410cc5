#include "SubprocessTerminal.hpp"

#include "RawSocketUtils.hpp"

namespace pv {
#define BUF_SIZE (16 * 1024)

BufferConfig SubprocessTerminal::defaultBufferConfig() {
  BufferConfig config;
  config.maxBufferSize = 8 * 1024 * 1024;
  config.chunkSize = 32 * 1024;
  config.maxChunksPerFlush = 50;
  config.flushIntervalMs = 16;
  config.dropThreshold = 0.75;
  return config;
}

SubprocessTerminal::SubprocessTerminal(const string& _id,
                                       const TerminalOptions& _options)
    : Terminal(_id, _options),
      inputFd(-1),
      outputFd(-1),
      bufferManager(defaultBufferConfig()) {
  bufferManager.events().subscribe([this](const BufferEvent& event) {
    if (event.type == BUFFER_DATA_READY) {
      emitData(event.data);
    } else {
      LOG(WARNING) << "Terminal " << id << " dropped " << event.droppedCount
                   << " chunks due to high load";
    }
  });
}

SubprocessTerminal::~SubprocessTerminal() {
  if (running && pid > 0) {
    ::kill(pid, SIGKILL);
    int status;
    waitpid(pid, &status, 0);
  }
  closePipes();
}

void SubprocessTerminal::closePipes() {
  if (inputFd >= 0) {
    ::close(inputFd);
    inputFd = -1;
  }
  if (outputFd >= 0) {
    ::close(outputFd);
    outputFd = -1;
  }
}

void SubprocessTerminal::spawn() {
  if (running) {
    throw std::runtime_error("Terminal " + id + " is already running");
  }
  int inputPipe[2];
  int outputPipe[2];
  if (pipe(inputPipe) == -1) {
    throw std::runtime_error(string("pipe failed: ") + strerror(GetErrno()));
  }
  if (pipe(outputPipe) == -1) {
    auto pipeErrno = GetErrno();
    ::close(inputPipe[0]);
    ::close(inputPipe[1]);
    throw std::runtime_error(string("pipe failed: ") + strerror(pipeErrno));
  }

  pid_t childPid = fork();
  if (childPid == -1) {
    auto forkErrno = GetErrno();
    for (int fd : {inputPipe[0], inputPipe[1], outputPipe[0], outputPipe[1]}) {
      ::close(fd);
    }
    throw std::runtime_error(string("Failed to fork: ") + strerror(forkErrno));
  }

  if (childPid == 0) {
    // child process
    dup2(inputPipe[0], STDIN_FILENO);
    dup2(outputPipe[1], STDOUT_FILENO);
    dup2(outputPipe[1], STDERR_FILENO);
    ::close(inputPipe[0]);
    ::close(inputPipe[1]);
    ::close(outputPipe[0]);
    ::close(outputPipe[1]);
    setsid();

    if (chdir(options.cwd.c_str()) == -1) {
      fprintf(stderr, "Could not chdir to %s: %s\n", options.cwd.c_str(),
              strerror(errno));
    }
    for (const auto& it : options.env) {
      setenv(it.first.c_str(), it.second.c_str(), 1);
    }
    setenv("TERM", "xterm-256color", 1);
    setenv("COLORTERM", "truecolor", 1);
    setenv("COLUMNS", to_string(options.cols).c_str(), 1);
    setenv("LINES", to_string(options.rows).c_str(), 1);
    setenv("PV_VERSION", PV_VERSION, 1);
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    signal(SIGTERM, SIG_DFL);
    signal(SIGINT, SIG_DFL);
    execl(options.shell.c_str(), options.shell.c_str(), (char*)NULL);
    fprintf(stderr, "Could not exec %s: %s\n", options.shell.c_str(),
            strerror(errno));
    _exit(127);
  }

  // parent process
  ::close(inputPipe[0]);
  ::close(outputPipe[1]);
  inputFd = inputPipe[1];
  outputFd = outputPipe[0];
  RawSocketUtils::setNonBlocking(outputFd);
  RawSocketUtils::setCloseOnExec(inputFd);
  RawSocketUtils::setCloseOnExec(outputFd);
  pid = childPid;
  running = true;
  LOG(INFO) << "Spawned subprocess terminal " << id << " with pid " << pid;
}

void SubprocessTerminal::echo(const string& data) {
  bufferManager.addData(data);
}

void SubprocessTerminal::write(const string& data) {
  if (!running || inputFd < 0) {
    throw std::runtime_error("Terminal " + id + " is not running");
  }
  if (data == "\r") {
    echo("\r\n");
    RawSocketUtils::writeAll(inputFd, "\n", 1);
  } else if (data == "\x7f" || data == "\b") {
    echo("\b \b");
  } else if (data.length() == 1 && data[0] >= ' ' && data[0] <= '~') {
    echo(data);
    RawSocketUtils::writeAll(inputFd, data.c_str(), 1);
  } else {
    RawSocketUtils::writeAll(inputFd, data.c_str(), data.length());
  }
}

void SubprocessTerminal::resize(int cols, int rows) {
  options.cols = cols;
  options.rows = rows;
  if (running && pid > 0 && ::kill(pid, SIGWINCH) == -1) {
    LOG(WARNING) << "Failed to send resize signal to " << id << ": "
                 << strerror(GetErrno());
  }
}

void SubprocessTerminal::kill() {
  if (!running || pid <= 0) {
    return;
  }
  LOG(INFO) << "Killing terminal " << id;
  bufferManager.clear();
  if (::kill(pid, SIGTERM) == -1 && GetErrno() != ESRCH) {
    throw std::runtime_error(string("Could not signal terminal: ") +
                             strerror(GetErrno()));
  }
  killDeadline = std::chrono::steady_clock::now() +
                 std::chrono::milliseconds(KILL_GRACE_MS);
}

void SubprocessTerminal::poll() {
  if (!running) {
    return;
  }
  bool eof = false;
  if (outputFd >= 0) {
    try {
      string output = RawSocketUtils::readAvailable(outputFd, BUF_SIZE, &eof);
      if (!output.empty()) {
        bufferManager.addData(output);
      }
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Terminal " << id << " read failed: " << re.what();
      emitError(re.what());
      eof = true;
    }
  }
  bufferManager.flushIfDue();

  if (killDeadline && std::chrono::steady_clock::now() >= *killDeadline) {
    LOG(INFO) << "Force killing terminal " << id;
    ::kill(pid, SIGKILL);
    killDeadline.reset();
  }

  handleSessionEnd(eof);
}

void SubprocessTerminal::handleSessionEnd(bool block) {
  int status = 0;
  pid_t rc;
  do {
    rc = waitpid(pid, &status, block ? 0 : WNOHANG);
  } while (rc == -1 && GetErrno() == EINTR);
  if (rc == 0) {
    return;
  }

  // Drain whatever the shell wrote before exiting.
  if (!block && outputFd >= 0) {
    bool eof = false;
    while (!eof) {
      string output;
      try {
        output = RawSocketUtils::readAvailable(outputFd, BUF_SIZE, &eof);
      } catch (const std::runtime_error& re) {
        LOG(WARNING) << "Terminal " << id << " final read failed: "
                     << re.what();
        break;
      }
      if (output.empty()) {
        break;
      }
      bufferManager.addData(output);
    }
  }

  running = false;
  killDeadline.reset();
  closePipes();
  bufferManager.flushAll();

  int exitCode = -1;
  string signalName;
  if (rc == pid) {
    decodeWaitStatus(status, &exitCode, &signalName);
  } else {
    LOG(WARNING) << "Could not reap terminal " << id << ": "
                 << strerror(GetErrno());
  }
  LOG(INFO) << "Terminal " << id << " exited with code " << exitCode;
  emitExit(exitCode, signalName);
}
}  // namespace pv
