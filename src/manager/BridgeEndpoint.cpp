#include "BridgeEndpoint.hpp"

namespace pv {
namespace {
TerminalSessionInfo sessionToInfo(const TerminalSession& session) {
  TerminalSessionInfo info;
  info.set_id(session.id);
  info.set_pid(session.pid);
  info.set_shell(session.shell);
  info.set_cwd(session.cwd);
  info.set_strategy(session.strategy);
  info.set_backend(session.backend);
  *info.mutable_capabilities() = capabilitiesToProto(session.capabilities);
  if (!session.fallbackReason.empty()) {
    info.set_fallbackreason(session.fallbackReason);
  }
  return info;
}
}  // namespace

BridgeEndpoint::BridgeEndpoint(shared_ptr<SocketHandler> _socketHandler,
                               int _fd, shared_ptr<PtyManager> _manager)
    : socketHandler(_socketHandler), fd(_fd), manager(_manager) {
  managerSubscription = manager->events().subscribe(
      [this](const ManagerEvent& event) { onManagerEvent(event); });
}

BridgeEndpoint::~BridgeEndpoint() { close(); }

void BridgeEndpoint::close() {
  if (managerSubscription) {
    manager->events().unsubscribe(managerSubscription);
    managerSubscription = 0;
  }
  if (fd >= 0) {
    socketHandler->close(fd);
    fd = -1;
  }
}

void BridgeEndpoint::poll() {
  while (fd >= 0 && socketHandler->hasData(fd)) {
    Packet packet;
    try {
      if (!socketHandler->readPacket(fd, &packet)) {
        continue;
      }
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Bridge client went away: " << re.what();
      close();
      return;
    }
    if (packet.getHeader() != BRIDGE_REQUEST) {
      LOG(WARNING) << "Unexpected bridge packet " << int(packet.getHeader());
      continue;
    }
    try {
      handleRequest(packet.parse<BridgeRequest>());
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Malformed bridge request: " << re.what();
    }
  }
  completeCreates();
}

string BridgeEndpoint::resolve(const string& channelTerminalId) const {
  auto it = channelToSession.find(channelTerminalId);
  return it == channelToSession.end() ? channelTerminalId : it->second;
}

void BridgeEndpoint::forget(const string& sessionId) {
  auto it = sessionToChannel.find(sessionId);
  if (it != sessionToChannel.end()) {
    channelToSession.erase(it->second);
    sessionToChannel.erase(it);
  }
}

void BridgeEndpoint::handleRequest(const BridgeRequest& request) {
  VLOG(1) << "Bridge request: " << request.type() << " ("
          << request.requestid() << ")";
  const string& type = request.type();
  if (type == "create") {
    TerminalOptions options;
    options.shell = request.options().shell();
    options.cwd = request.options().cwd();
    for (const auto& it : request.options().env()) {
      options.env[it.first] = it.second;
    }
    options.cols = request.options().cols();
    options.rows = request.options().rows();
    PendingCreate pendingCreate;
    pendingCreate.requestId = request.requestid();
    pendingCreate.channelTerminalId = request.terminalid();
    pendingCreate.future = manager->createTerminal(options);
    pendingCreates.push_back(std::move(pendingCreate));
  } else if (type == "write") {
    manager->writeToTerminal(resolve(request.terminalid()), request.data());
    respond(request.requestid(), "", NULL);
  } else if (type == "resize") {
    if (!request.has_cols() || !request.has_rows()) {
      respond(request.requestid(), "Missing terminal dimensions", NULL);
      return;
    }
    manager->resizeTerminal(resolve(request.terminalid()), request.cols(),
                            request.rows());
    respond(request.requestid(), "", NULL);
  } else if (type == "kill") {
    string sessionId = resolve(request.terminalid());
    manager->killTerminal(sessionId);
    forget(sessionId);
    respond(request.requestid(), "", NULL);
  } else {
    respond(request.requestid(), "Unknown request type: " + type, NULL);
  }
}

void BridgeEndpoint::completeCreates() {
  for (auto it = pendingCreates.begin(); it != pendingCreates.end();) {
    if (it->future.wait_for(std::chrono::seconds(0)) !=
        std::future_status::ready) {
      ++it;
      continue;
    }
    try {
      TerminalSession session = it->future.get();
      channelToSession[it->channelTerminalId] = session.id;
      sessionToChannel[session.id] = it->channelTerminalId;
      respond(it->requestId, "", &session);
    } catch (const std::runtime_error& re) {
      respond(it->requestId, re.what(), NULL);
    }
    it = pendingCreates.erase(it);
  }
}

void BridgeEndpoint::onManagerEvent(const ManagerEvent& event) {
  if (event.type != MANAGER_TERMINAL_DATA &&
      event.type != MANAGER_TERMINAL_EXIT) {
    return;
  }
  auto it = sessionToChannel.find(event.terminalId);
  if (it == sessionToChannel.end()) {
    return;
  }
  BridgeEvent stream;
  stream.set_terminalid(it->second);
  stream.set_timestamp(epochMillis());
  if (event.type == MANAGER_TERMINAL_DATA) {
    stream.set_type("data");
    stream.set_data(event.data);
  } else {
    stream.set_type("exit");
    stream.set_exitcode(event.exitCode);
    if (!event.signal.empty()) {
      stream.set_signal(event.signal);
    }
    forget(event.terminalId);
  }
  sendPacket(BRIDGE_EVENT, stream);
}

void BridgeEndpoint::respond(const string& requestId, const string& error,
                             const TerminalSession* session) {
  BridgeResponse response;
  response.set_success(error.empty());
  if (!error.empty()) {
    response.set_error(error);
  }
  if (session) {
    *response.mutable_data() = sessionToInfo(*session);
  }
  response.set_timestamp(epochMillis());
  response.set_requestid(requestId);
  sendPacket(BRIDGE_RESPONSE, response);
}

void BridgeEndpoint::sendPacket(BridgePacketType type,
                                const google::protobuf::MessageLite& message) {
  if (fd < 0) {
    return;
  }
  try {
    socketHandler->writePacket(fd,
                               Packet(uint8_t(type), protoToString(message)));
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Could not reach bridge client: " << re.what();
    close();
  }
}

EndpointConnector::EndpointConnector(
    shared_ptr<PipeSocketHandler> _socketHandler,
    shared_ptr<PtyManager> _manager)
    : socketHandler(_socketHandler), manager(_manager) {}

int EndpointConnector::connect() {
  pair<int, int> fds = socketHandler->createSocketPair();
  endpoints.push_back(
      shared_ptr<BridgeEndpoint>(
          new BridgeEndpoint(socketHandler, fds.second, manager)));
  return fds.first;
}

void EndpointConnector::poll() {
  for (auto& endpoint : endpoints) {
    endpoint->poll();
  }
  endpoints.erase(
      std::remove_if(endpoints.begin(), endpoints.end(),
                     [](const shared_ptr<BridgeEndpoint>& endpoint) {
                       return !endpoint->isOpen();
                     }),
      endpoints.end());
}

void EndpointConnector::closeAll() {
  for (auto& endpoint : endpoints) {
    endpoint->close();
  }
  endpoints.clear();
}
}  // namespace pv
