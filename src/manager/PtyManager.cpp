#include "PtyManager.hpp"

namespace pv {
namespace {
template <typename T>
void fail(std::promise<T>* promise, const string& message) {
  promise->set_exception(
      std::make_exception_ptr(std::runtime_error(message)));
}
}  // namespace

PtyManager::PtyManager(shared_ptr<HostLauncher> _launcher,
                       shared_ptr<PerformanceMonitor> _monitor,
                       shared_ptr<TimerQueue> _timers,
                       const HostSettings& _settings)
    : launcher(_launcher),
      monitor(_monitor),
      timers(_timers),
      settings(_settings),
      socketHandler(_launcher->getSocketHandler()),
      hostPid(-1),
      hostFd(-1),
      ready(false),
      destroyed(false),
      restartTimer(0),
      nextListId(1) {
  startHost();
}

PtyManager::~PtyManager() { destroy(); }

void PtyManager::startHost() {
  if (destroyed || hostPid > 0) {
    return;
  }
  try {
    HostHandle handle = launcher->launch();
    hostPid = handle.pid;
    hostFd = handle.fd;
    LOG(INFO) << "PTY Host started with pid " << hostPid;
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to start PTY Host: " << re.what();
    emitError("", re.what());
  }
}

void PtyManager::scheduleRestart() {
  if (destroyed || restartTimer) {
    return;
  }
  LOG(INFO) << "Restarting PTY Host in " << settings.restartDelayMs << "ms";
  restartTimer = timers->schedule(settings.restartDelayMs, [this]() {
    restartTimer = 0;
    startHost();
  });
}

void PtyManager::update(int64_t timeoutMs) {
  timers->runExpired();
  checkHostExit();

  int64_t waitMs = timeoutMs;
  int64_t timerMs = timers->msUntilNext();
  if (timerMs >= 0) {
    waitMs = min(waitMs, timerMs);
  }
  fd_set rfd;
  FD_ZERO(&rfd);
  int maxFd = -1;
  if (hostFd >= 0) {
    FD_SET(hostFd, &rfd);
    maxFd = hostFd;
  }
  timeval tv;
  tv.tv_sec = waitMs / 1000;
  tv.tv_usec = (waitMs % 1000) * 1000;
  int rc = select(maxFd + 1, &rfd, NULL, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() != EINTR) {
      throw std::runtime_error(string("select failed: ") +
                               strerror(GetErrno()));
    }
    FD_ZERO(&rfd);
  }
  if (hostFd >= 0 && FD_ISSET(hostFd, &rfd)) {
    readReplies();
  }

  timers->runExpired();
  checkHostExit();
}

void PtyManager::readReplies() {
  while (hostFd >= 0 && socketHandler->hasData(hostFd)) {
    Packet packet;
    try {
      if (!socketHandler->readPacket(hostFd, &packet)) {
        continue;
      }
    } catch (const std::runtime_error& re) {
      onHostDisconnect(re.what());
      return;
    }
    handlePacket(packet);
  }
}

void PtyManager::checkHostExit() {
  if (hostPid <= 0) {
    return;
  }
  std::optional<HostExitStatus> status = launcher->pollExit(hostPid);
  if (status) {
    onHostExit(*status);
  }
}

void PtyManager::closeLink() {
  if (hostFd >= 0) {
    socketHandler->close(hostFd);
    hostFd = -1;
  }
  ready = false;
}

void PtyManager::onHostDisconnect(const string& reason) {
  LOG(WARNING) << "PTY Host disconnected: " << reason;
  closeLink();
  rejectAll("PTY Host disconnected");
}

void PtyManager::onHostExit(const HostExitStatus& status) {
  LOG(INFO) << "PTY Host exited with code " << status.code
            << (status.signal.empty() ? "" : " (" + status.signal + ")");
  hostPid = -1;
  closeLink();
  rejectAll("PTY Host exited");

  // The host takes its terminals with it.
  vector<string> ids;
  for (const auto& it : sessions) {
    ids.push_back(it.first);
  }
  for (const string& id : ids) {
    dropSession(id);
  }

  ManagerEvent event;
  event.type = MANAGER_HOST_EXIT;
  event.exitCode = status.code;
  event.signal = status.signal;
  eventRegistry.emit(event);

  if (status.code != 0) {
    scheduleRestart();
  }
}

void PtyManager::send(HostPacketType type,
                      const google::protobuf::MessageLite& message) {
  if (hostFd < 0) {
    throw std::runtime_error("PTY Host not initialized");
  }
  socketHandler->writePacket(hostFd,
                             Packet(uint8_t(type), protoToString(message)));
}

std::future<TerminalSession> PtyManager::createTerminal(
    const TerminalOptions& options) {
  std::promise<TerminalSession> promise;
  std::future<TerminalSession> future = promise.get_future();
  if (destroyed) {
    fail(&promise, "PTY Manager destroyed");
    return future;
  }

  string id = "terminal-" + to_string(epochMillis()) + "-" + genRandomBase36(9);
  CreateRequest request;
  request.set_id(id);
  SpawnOptions* spawnOptions = request.mutable_options();
  if (!options.shell.empty()) {
    spawnOptions->set_shell(options.shell);
  }
  if (!options.cwd.empty()) {
    spawnOptions->set_cwd(options.cwd);
  }
  for (const auto& it : options.env) {
    (*spawnOptions->mutable_env())[it.first] = it.second;
  }
  spawnOptions->set_cols(options.cols);
  spawnOptions->set_rows(options.rows);

  pendingCreates[id] = std::move(promise);
  try {
    send(HOST_CREATE, request);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to send create for " << id << ": " << re.what();
    auto it = pendingCreates.find(id);
    fail(&it->second, re.what());
    pendingCreates.erase(it);
  }
  return future;
}

void PtyManager::writeToTerminal(const string& id, const string& data) {
  WriteRequest request;
  request.set_id(id);
  request.set_data(data);
  try {
    send(HOST_WRITE, request);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to write to terminal " << id << ": " << ex.what();
  }
}

void PtyManager::resizeTerminal(const string& id, int cols, int rows) {
  ResizeRequest request;
  request.set_id(id);
  request.set_cols(cols);
  request.set_rows(rows);
  try {
    send(HOST_RESIZE, request);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to resize terminal " << id << ": " << ex.what();
  }
}

void PtyManager::killTerminal(const string& id) {
  dropSession(id);
  KillRequest request;
  request.set_id(id);
  try {
    send(HOST_KILL, request);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to kill terminal " << id << ": " << ex.what();
  }
}

std::future<vector<TerminalSession>> PtyManager::listTerminals() {
  std::promise<vector<TerminalSession>> promise;
  std::future<vector<TerminalSession>> future = promise.get_future();
  if (destroyed) {
    fail(&promise, "PTY Manager destroyed");
    return future;
  }

  string requestId =
      "list-" + to_string(nextListId++) + "-" + to_string(epochMillis());
  ListRequest request;
  request.set_requestid(requestId);
  pendingLists[requestId] = std::move(promise);
  try {
    send(HOST_LIST, request);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to send list request: " << re.what();
    auto it = pendingLists.find(requestId);
    fail(&it->second, re.what());
    pendingLists.erase(it);
  }
  return future;
}

std::optional<TerminalSession> PtyManager::getTerminalSession(
    const string& id) const {
  auto it = sessions.find(id);
  if (it == sessions.end()) {
    return std::nullopt;
  }
  return it->second.session;
}

void PtyManager::handlePacket(const Packet& packet) {
  try {
    switch (packet.getHeader()) {
      case HOST_READY:
        ready = true;
        VLOG(1) << "PTY Host " << packet.parse<HostReady>().pid()
                << " is ready";
        {
          ManagerEvent event;
          event.type = MANAGER_READY;
          eventRegistry.emit(event);
        }
        break;
      case HOST_CREATED:
        handleCreated(packet.parse<TerminalSessionInfo>());
        break;
      case HOST_DATA:
        handleData(packet.parse<TerminalData>());
        break;
      case HOST_EXIT:
        handleExit(packet.parse<TerminalExit>());
        break;
      case HOST_ERROR:
        handleError(packet.parse<HostError>());
        break;
      case HOST_KILLED:
        handleKilled(packet.parse<KilledReply>());
        break;
      case HOST_LIST_RESULT:
        handleListResult(packet.parse<ListReply>());
        break;
      default:
        LOG(WARNING) << "Unknown message from PTY Host: "
                     << int(packet.getHeader());
        break;
    }
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Malformed message from PTY Host: " << re.what();
  }
}

TerminalSession PtyManager::sessionFromInfo(const TerminalSessionInfo& info) {
  TerminalSession session;
  session.id = info.id();
  session.pid = info.pid();
  session.shell = info.shell();
  session.cwd = info.cwd();
  session.strategy = info.strategy();
  session.backend = info.backend();
  if (info.has_capabilities()) {
    session.capabilities = capabilitiesFromProto(info.capabilities());
  }
  session.fallbackReason = info.fallbackreason();
  return session;
}

void PtyManager::handleCreated(const TerminalSessionInfo& info) {
  if (info.id().empty()) {
    LOG(ERROR) << "Received created message without id";
    return;
  }
  auto it = pendingCreates.find(info.id());
  if (it == pendingCreates.end()) {
    LOG(WARNING) << "No pending create for terminal " << info.id();
    return;
  }
  std::promise<TerminalSession> promise = std::move(it->second);
  pendingCreates.erase(it);

  TerminalSession session;
  try {
    session = sessionFromInfo(info);
  } catch (const std::runtime_error& re) {
    fail(&promise, re.what());
    return;
  }
  SessionEntry entry;
  entry.session = session;
  entry.proxy.reset(new RemoteTerminalProxy(session.pid));
  sessions[session.id] = entry;
  monitor->registerTerminal(session.id, entry.proxy, session.strategy);
  LOG(INFO) << "Terminal " << session.id << " created with pid "
            << session.pid << " using " << session.strategy;
  if (!session.fallbackReason.empty()) {
    LOG(INFO) << "Terminal " << session.id << ": " << session.fallbackReason;
  }
  promise.set_value(session);
}

void PtyManager::handleData(const TerminalData& data) {
  ManagerEvent event;
  event.type = MANAGER_TERMINAL_DATA;
  event.terminalId = data.id();
  event.data = data.data();
  eventRegistry.emit(event);
}

void PtyManager::handleExit(const TerminalExit& exit) {
  LOG(INFO) << "Terminal " << exit.id() << " exited with code "
            << exit.exitcode();
  dropSession(exit.id());
  ManagerEvent event;
  event.type = MANAGER_TERMINAL_EXIT;
  event.terminalId = exit.id();
  event.exitCode = exit.exitcode();
  event.signal = exit.signal();
  eventRegistry.emit(event);
}

void PtyManager::handleError(const HostError& error) {
  string message = error.error().empty() ? "Unknown error" : error.error();
  if (!error.id().empty()) {
    auto createIt = pendingCreates.find(error.id());
    if (createIt != pendingCreates.end()) {
      std::promise<TerminalSession> promise = std::move(createIt->second);
      pendingCreates.erase(createIt);
      fail(&promise, message);
      return;
    }
    auto listIt = pendingLists.find(error.id());
    if (listIt != pendingLists.end()) {
      std::promise<vector<TerminalSession>> promise =
          std::move(listIt->second);
      pendingLists.erase(listIt);
      fail(&promise, message);
      return;
    }
  }
  LOG(ERROR) << "Unhandled PTY Host error"
             << (error.id().empty() ? "" : " for " + error.id()) << ": "
             << message;
  emitError(error.id(), message);
}

void PtyManager::handleKilled(const KilledReply& reply) {
  VLOG(1) << "Terminal " << reply.id() << " killed";
  ManagerEvent event;
  event.type = MANAGER_TERMINAL_KILLED;
  event.terminalId = reply.id();
  eventRegistry.emit(event);
}

void PtyManager::handleListResult(const ListReply& reply) {
  if (reply.requestid().empty()) {
    LOG(ERROR) << "Received list message without requestId";
    return;
  }
  auto it = pendingLists.find(reply.requestid());
  if (it == pendingLists.end()) {
    LOG(WARNING) << "No pending list request " << reply.requestid();
    return;
  }
  std::promise<vector<TerminalSession>> promise = std::move(it->second);
  pendingLists.erase(it);
  vector<TerminalSession> result;
  try {
    for (const auto& info : reply.terminals()) {
      result.push_back(sessionFromInfo(info));
    }
  } catch (const std::runtime_error& re) {
    fail(&promise, re.what());
    return;
  }
  promise.set_value(result);
}

void PtyManager::dropSession(const string& id) {
  auto it = sessions.find(id);
  if (it != sessions.end()) {
    it->second.proxy->markExited();
    sessions.erase(it);
  }
  if (monitor->isRegistered(id)) {
    monitor->unregisterTerminal(id);
  }
}

void PtyManager::rejectAll(const string& message) {
  auto creates = std::move(pendingCreates);
  pendingCreates.clear();
  for (auto& it : creates) {
    fail(&it.second, message);
  }
  auto lists = std::move(pendingLists);
  pendingLists.clear();
  for (auto& it : lists) {
    fail(&it.second, message);
  }
}

void PtyManager::emitError(const string& terminalId, const string& error) {
  ManagerEvent event;
  event.type = MANAGER_ERROR;
  event.terminalId = terminalId;
  event.error = error;
  eventRegistry.emit(event);
}

void PtyManager::destroy() {
  if (destroyed) {
    return;
  }
  destroyed = true;
  for (const auto& it : sessions) {
    if (monitor->isRegistered(it.first)) {
      monitor->unregisterTerminal(it.first);
    }
  }
  sessions.clear();
  rejectAll("PTY Manager destroyed");
  if (restartTimer) {
    timers->cancel(restartTimer);
    restartTimer = 0;
  }
  closeLink();
  if (hostPid > 0) {
    launcher->terminate(hostPid);
    hostPid = -1;
  }
  eventRegistry.clear();
  LOG(INFO) << "PTY Manager destroyed";
}
}  // namespace pv
