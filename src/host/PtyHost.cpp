#include "PtyHost.hpp"

namespace pv {
namespace {
volatile sig_atomic_t hostTerminateFlag = 0;
}

void PtyHost::requestTerminate(int signum) { hostTerminateFlag = 1; }

bool PtyHost::terminateRequested() { return hostTerminateFlag != 0; }

PtyHost::PtyHost(shared_ptr<SocketHandler> _socketHandler, int _channelFd,
                 shared_ptr<TerminalFactory> _terminalFactory,
                 const HostSettings& _settings)
    : PtyHost(_socketHandler, _channelFd, _terminalFactory, _settings,
              []() { return std::chrono::steady_clock::now(); }) {}

PtyHost::PtyHost(shared_ptr<SocketHandler> _socketHandler, int _channelFd,
                 shared_ptr<TerminalFactory> _terminalFactory,
                 const HostSettings& _settings, Clock _clock)
    : socketHandler(_socketHandler),
      channelFd(_channelFd),
      terminalFactory(_terminalFactory),
      settings(_settings),
      clock(_clock),
      connected(true) {
  if (settings.chunkSize == 0) {
    throw std::runtime_error("Host chunk size must be positive");
  }
}

PtyHost::~PtyHost() { shutdown(); }

void PtyHost::run() {
  sendReady();
  while (!terminateRequested()) {
    if (!runOnce(10)) {
      LOG(INFO) << "Disconnected from manager, cleaning up...";
      break;
    }
  }
  if (terminateRequested()) {
    LOG(INFO) << "Received SIGTERM, cleaning up...";
  }
  shutdown();
}

bool PtyHost::runOnce(int64_t timeoutMs) {
  if (!connected) {
    return false;
  }
  fd_set rfd;
  FD_ZERO(&rfd);
  int maxFd = channelFd;
  FD_SET(channelFd, &rfd);
  for (auto& it : terminals) {
    int fd = it.second->terminal->getFd();
    if (fd >= 0 && it.second->output.canAcceptMore()) {
      FD_SET(fd, &rfd);
      maxFd = max(maxFd, fd);
    }
  }
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(maxFd + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() != EINTR) {
      throw std::runtime_error(string("select failed: ") +
                               strerror(GetErrno()));
    }
    FD_ZERO(&rfd);
  }

  if (FD_ISSET(channelFd, &rfd)) {
    readRequests();
  }
  pollTerminals();

  auto snapshot = terminals;
  for (auto& it : snapshot) {
    flushOutput(it.first, it.second.get(), MAX_CHUNKS_PER_TICK);
  }
  return connected;
}

void PtyHost::readRequests() {
  while (connected && socketHandler->hasData(channelFd)) {
    Packet packet;
    try {
      if (!socketHandler->readPacket(channelFd, &packet)) {
        continue;
      }
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Manager channel closed: " << re.what();
      connected = false;
      return;
    }
    handlePacket(packet);
  }
}

void PtyHost::handlePacket(const Packet& packet) {
  try {
    switch (packet.getHeader()) {
      case HOST_CREATE:
        createTerminal(packet.parse<CreateRequest>());
        break;
      case HOST_WRITE:
        writeToTerminal(packet.parse<WriteRequest>());
        break;
      case HOST_RESIZE:
        resizeTerminal(packet.parse<ResizeRequest>());
        break;
      case HOST_KILL:
        killTerminal(packet.parse<KillRequest>());
        break;
      case HOST_LIST:
        listTerminals(packet.parse<ListRequest>());
        break;
      default:
        LOG(WARNING) << "Unknown message type: " << int(packet.getHeader());
        break;
    }
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to handle message " << int(packet.getHeader())
               << ": " << re.what();
    sendError("", re.what());
  }
}

void PtyHost::send(HostPacketType type,
                   const google::protobuf::MessageLite& message) {
  if (!connected) {
    VLOG(1) << "Dropping message " << type << ", manager is gone";
    return;
  }
  try {
    socketHandler->writePacket(channelFd,
                               Packet(uint8_t(type), protoToString(message)));
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not send message to manager: " << re.what();
    connected = false;
  }
}

void PtyHost::sendReady() {
  HostReady ready;
  ready.set_pid(getpid());
  send(HOST_READY, ready);
}

void PtyHost::sendError(const string& id, const string& error) {
  HostError reply;
  if (!id.empty()) {
    reply.set_id(id);
  }
  reply.set_error(error);
  send(HOST_ERROR, reply);
}

bool PtyHost::hasTerminal(const string& id) const {
  return terminals.find(id) != terminals.end();
}

shared_ptr<PtyHost::HostedTerminal> PtyHost::findRunning(
    const string& id, const string& operation) {
  auto it = terminals.find(id);
  if (it == terminals.end() || it->second->state != STATE_RUNNING) {
    LOG(WARNING) << "Terminal " << id << " not found for " << operation;
    return nullptr;
  }
  return it->second;
}

TerminalSessionInfo PtyHost::describe(const string& id,
                                      const HostedTerminal& hosted) const {
  TerminalSessionInfo info;
  info.set_id(id);
  info.set_pid(hosted.terminal->getPid());
  info.set_shell(hosted.terminal->getShell());
  info.set_cwd(hosted.terminal->getCwd());
  info.set_strategy(hosted.strategy);
  info.set_backend(backendName(hosted.capabilities.backend));
  *info.mutable_capabilities() = capabilitiesToProto(hosted.capabilities);
  if (!hosted.fallbackReason.empty()) {
    info.set_fallbackreason(hosted.fallbackReason);
  }
  return info;
}

void PtyHost::createTerminal(const CreateRequest& request) {
  const string& id = request.id();
  if (id.empty()) {
    sendError("", "Missing terminal id");
    return;
  }
  if (hasTerminal(id)) {
    sendError(id, "Terminal " + id + " already exists");
    return;
  }

  TerminalOptions options;
  const SpawnOptions& spawnOptions = request.options();
  options.shell = spawnOptions.shell();
  options.cwd = spawnOptions.cwd();
  for (const auto& it : spawnOptions.env()) {
    options.env[it.first] = it.second;
  }
  options.cols = spawnOptions.cols();
  options.rows = spawnOptions.rows();

  TerminalCreateResult result;
  try {
    result = terminalFactory->createTerminal(id, options);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to create terminal " << id << ": " << ex.what();
    string message = ex.what();
    sendError(id, message.empty() ? "Failed to create terminal" : message);
    return;
  }

  LOG(INFO) << "Using " << result.strategy << " strategy for terminal " << id
            << ": "
            << BackendDetector::getCapabilitiesDescription(result.capabilities);
  if (!result.fallbackReason.empty()) {
    LOG(WARNING) << "Fallback reason: " << result.fallbackReason;
  }

  shared_ptr<HostedTerminal> hosted(new HostedTerminal(id, settings));
  hosted->terminal = result.terminal;
  hosted->strategy = result.strategy;
  hosted->capabilities = result.capabilities;
  hosted->fallbackReason = result.fallbackReason;
  terminals[id] = hosted;

  hosted->terminal->events().subscribe(
      [this, id](const TerminalEvent& event) {
        switch (event.type) {
          case TERMINAL_DATA:
            onTerminalData(id, event.data);
            break;
          case TERMINAL_EXIT:
            onTerminalExit(id, event.exitCode, event.signal);
            break;
          case TERMINAL_ERROR:
            onTerminalError(id, event.error);
            break;
        }
      });

  send(HOST_CREATED, describe(id, *hosted));
}

void PtyHost::writeToTerminal(const WriteRequest& request) {
  auto hosted = findRunning(request.id(), "write");
  if (!hosted) {
    return;
  }
  try {
    hosted->terminal->write(request.data());
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to write to terminal " << request.id() << ": "
               << ex.what();
    sendError(request.id(), ex.what());
  }
}

void PtyHost::resizeTerminal(const ResizeRequest& request) {
  auto hosted = findRunning(request.id(), "resize");
  if (!hosted) {
    return;
  }
  try {
    hosted->terminal->resize(request.cols(), request.rows());
    VLOG(1) << "Resized terminal " << request.id() << " to " << request.cols()
            << "x" << request.rows();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to resize terminal " << request.id() << ": "
               << ex.what();
  }
}

void PtyHost::killTerminal(const KillRequest& request) {
  auto hosted = findRunning(request.id(), "kill");
  if (!hosted) {
    return;
  }
  try {
    hosted->terminal->kill();
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to kill terminal " << request.id() << ": "
               << ex.what();
    return;
  }
  hosted->state = STATE_EXITING;
  LOG(INFO) << "Killed terminal " << request.id();
  KilledReply reply;
  reply.set_id(request.id());
  send(HOST_KILLED, reply);
}

void PtyHost::listTerminals(const ListRequest& request) {
  ListReply reply;
  reply.set_requestid(request.requestid());
  for (const auto& it : terminals) {
    if (it.second->state != STATE_RUNNING) {
      continue;
    }
    TerminalSessionInfo* info = reply.add_terminals();
    info->set_id(it.first);
    info->set_shell(it.second->terminal->getShell());
    info->set_cwd(it.second->terminal->getCwd());
    info->set_pid(it.second->terminal->getPid());
  }
  send(HOST_LIST_RESULT, reply);
}

void PtyHost::onTerminalData(const string& id, const string& data) {
  auto it = terminals.find(id);
  if (it == terminals.end()) {
    return;
  }
  HostedTerminal* hosted = it->second.get();
  if (!hosted->stormGuard.allow(data, clock())) {
    return;
  }
  hosted->output.enqueue(data);
}

void PtyHost::flushOutput(const string& id, HostedTerminal* hosted,
                          int maxChunks) {
  int sent = 0;
  while (hosted->output.hasPendingData() &&
         (maxChunks < 0 || sent < maxChunks)) {
    TerminalData message;
    message.set_id(id);
    message.set_data(hosted->output.takeChunk());
    send(HOST_DATA, message);
    sent++;
  }
}

void PtyHost::onTerminalExit(const string& id, int exitCode,
                             const string& signal) {
  LOG(INFO) << "Terminal " << id << " exited with code " << exitCode
            << (signal.empty() ? "" : ", signal " + signal);
  auto it = terminals.find(id);
  if (it != terminals.end()) {
    flushOutput(id, it->second.get(), -1);
    terminals.erase(it);
  }
  TerminalExit message;
  message.set_id(id);
  message.set_exitcode(exitCode);
  if (!signal.empty()) {
    message.set_signal(signal);
  }
  send(HOST_EXIT, message);
}

void PtyHost::onTerminalError(const string& id, const string& error) {
  LOG(ERROR) << "Terminal " << id << " error: " << error;
  auto it = terminals.find(id);
  if (it != terminals.end()) {
    it->second->output.clear();
  }
  sendError(id, error);
}

void PtyHost::pollTerminals() {
  auto snapshot = terminals;
  for (auto& it : snapshot) {
    if (!it.second->output.canAcceptMore()) {
      continue;
    }
    try {
      it.second->terminal->poll();
    } catch (const std::exception& ex) {
      onTerminalError(it.first, ex.what());
    }
  }
}

void PtyHost::shutdown() {
  if (terminals.empty()) {
    return;
  }
  LOG(INFO) << "Cleaning up " << terminals.size() << " terminals...";
  for (auto& it : terminals) {
    try {
      it.second->terminal->kill();
      VLOG(1) << "Cleaned up terminal " << it.first;
    } catch (const std::exception& ex) {
      LOG(ERROR) << "Error cleaning up terminal " << it.first << ": "
                 << ex.what();
    }
  }
  terminals.clear();
}
}  // namespace pv
