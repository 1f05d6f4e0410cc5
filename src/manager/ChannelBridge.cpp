#include "ChannelBridge.hpp"

namespace pv {
namespace {
void failResponse(std::promise<BridgeResponse>* promise, const string& message) {
  promise->set_exception(
      std::make_exception_ptr(std::runtime_error(message)));
}
}  // namespace

ChannelBridge::ChannelBridge(const string& _channelId,
                             shared_ptr<SocketHandler> _socketHandler,
                             shared_ptr<ChannelConnector> _connector,
                             shared_ptr<TimerQueue> _timers,
                             const BridgeSettings& _settings)
    : channelId(_channelId),
      socketHandler(_socketHandler),
      connector(_connector),
      timers(_timers),
      settings(_settings),
      fd(-1),
      connected(false),
      reconnectAttempts(0),
      reconnectTimer(0) {}

ChannelBridge::~ChannelBridge() {
  if (reconnectTimer) {
    timers->cancel(reconnectTimer);
  }
  rejectPending("MessagePort closed");
  closeChannel();
}

int64_t ChannelBridge::reconnectDelay(int attempt) {
  int64_t delay = BASE_RECONNECT_DELAY_MS;
  for (int i = 0; i < attempt && delay < MAX_RECONNECT_DELAY_MS; i++) {
    delay *= 2;
  }
  return min(delay, MAX_RECONNECT_DELAY_MS);
}

void ChannelBridge::initialize() {
  LOG(INFO) << "Setting up channel " << channelId;
  closeChannel();
  try {
    fd = connector->connect();
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to set up channel " << channelId << ": "
               << re.what();
    handleConnectionError(re.what());
    throw;
  }
  connected = true;
  reconnectAttempts = 0;
  performance.channelsActive++;
  if (reconnectTimer) {
    timers->cancel(reconnectTimer);
    reconnectTimer = 0;
  }
  processQueue();
  LOG(INFO) << "Channel " << channelId << " connected";
  emit(CHANNEL_CONNECTED);
}

BridgeRequest ChannelBridge::makeRequest(const string& type) {
  int64_t now = epochMillis();
  BridgeRequest request;
  request.set_type(type);
  request.set_terminalid(channelId);
  request.set_timestamp(now);
  request.set_requestid(type + "-" + channelId + "-" + to_string(now));
  return request;
}

std::future<BridgeResponse> ChannelBridge::createTerminal(
    const TerminalOptions& options) {
  BridgeRequest request = makeRequest("create");
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
  return sendRequest(request);
}

std::future<BridgeResponse> ChannelBridge::write(const string& data) {
  BridgeRequest request = makeRequest("write");
  request.set_data(data);
  return sendRequest(request);
}

std::future<BridgeResponse> ChannelBridge::resize(int cols, int rows) {
  BridgeRequest request = makeRequest("resize");
  request.set_cols(cols);
  request.set_rows(rows);
  return sendRequest(request);
}

std::future<BridgeResponse> ChannelBridge::kill() {
  return sendRequest(makeRequest("kill"));
}

std::future<BridgeResponse> ChannelBridge::sendRequest(
    const BridgeRequest& request) {
  std::promise<BridgeResponse> promise;
  std::future<BridgeResponse> future = promise.get_future();
  if (!connected) {
    LOG(WARNING) << "Queuing message - not connected: " << request.type();
    if (queue.size() >= settings.maxQueue) {
      LOG_EVERY_N(100, WARNING) << "Channel queue full, dropping oldest";
      queue.pop_front();
    }
    if (settings.maxQueue > 0) {
      queue.push_back(request);
    }
    failResponse(&promise, "MessagePort not connected");
    return future;
  }

  // Two requests of one type inside the same millisecond share an id.
  BridgeRequest unique = request;
  int suffix = 2;
  while (pending.find(unique.requestid()) != pending.end()) {
    unique.set_requestid(request.requestid() + "-" + to_string(suffix++));
  }
  PendingResponse entry;
  entry.promise = std::move(promise);
  entry.sentAt = unique.timestamp();
  pending[unique.requestid()] = std::move(entry);
  try {
    transmit(unique);
    VLOG(1) << "Sent request: " << unique.type() << " ("
            << unique.requestid() << ")";
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to send request: " << re.what();
    auto it = pending.find(unique.requestid());
    failResponse(&it->second.promise, re.what());
    pending.erase(it);
  }
  return future;
}

void ChannelBridge::transmit(const BridgeRequest& request) {
  if (fd < 0) {
    throw std::runtime_error("MessagePort not connected");
  }
  socketHandler->writePacket(
      fd, Packet(uint8_t(BRIDGE_REQUEST), protoToString(request)));
  performance.messageCount++;
}

void ChannelBridge::processQueue() {
  if (queue.empty()) {
    return;
  }
  LOG(INFO) << "Processing " << queue.size() << " queued messages";
  std::deque<BridgeRequest> replay;
  replay.swap(queue);
  for (const auto& request : replay) {
    try {
      transmit(request);
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Failed to process queued message: " << re.what();
      emitError(re.what());
    }
  }
}

void ChannelBridge::poll() {
  while (connected && fd >= 0 && socketHandler->hasData(fd)) {
    Packet packet;
    try {
      if (!socketHandler->readPacket(fd, &packet)) {
        continue;
      }
    } catch (const std::runtime_error& re) {
      VLOG(1) << "Channel read failed: " << re.what();
      handleDisconnection();
      return;
    }
    try {
      switch (packet.getHeader()) {
        case BRIDGE_RESPONSE:
          handleResponse(packet.parse<BridgeResponse>());
          break;
        case BRIDGE_EVENT: {
          ChannelEvent event;
          event.type = CHANNEL_DATA;
          event.stream = packet.parse<BridgeEvent>();
          eventRegistry.emit(event);
          break;
        }
        default:
          LOG(WARNING) << "Unexpected packet on channel " << channelId << ": "
                       << int(packet.getHeader());
          break;
      }
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Malformed packet on channel " << channelId << ": "
                 << re.what();
      emitError(re.what());
    }
  }
}

void ChannelBridge::handleResponse(const BridgeResponse& response) {
  VLOG(1) << "Received response: " << response.requestid();
  auto it = pending.find(response.requestid());
  if (it != pending.end()) {
    if (response.has_timestamp()) {
      int64_t latency = max(int64_t(0), response.timestamp() - it->second.sentAt);
      performance.totalLatency += latency;
      performance.maxLatency = max(performance.maxLatency, latency);
    }
    std::promise<BridgeResponse> promise = std::move(it->second.promise);
    pending.erase(it);
    if (response.success()) {
      promise.set_value(response);
    } else {
      failResponse(&promise, response.error().empty() ? "Unknown error"
                                                      : response.error());
    }
  } else {
    VLOG(1) << "No pending request for response " << response.requestid();
  }

  ChannelEvent event;
  event.type = CHANNEL_RESPONSE;
  event.response = response;
  eventRegistry.emit(event);
}

void ChannelBridge::handleDisconnection() {
  LOG(WARNING) << "Channel " << channelId << " closed";
  connected = false;
  closeChannel();
  rejectPending("MessagePort disconnected");
  performance.channelsActive = max(0, performance.channelsActive - 1);
  emit(CHANNEL_DISCONNECTED);
  handleConnectionError("MessagePort disconnected");
}

void ChannelBridge::handleConnectionError(const string& error) {
  connected = false;
  emitError(error);
  if (reconnectTimer) {
    return;
  }
  if (reconnectAttempts < settings.maxReconnectAttempts) {
    reconnectAttempts++;
    int64_t delay = reconnectDelay(reconnectAttempts);
    LOG(INFO) << "Attempting reconnection " << reconnectAttempts << "/"
              << settings.maxReconnectAttempts << " in " << delay << "ms";
    reconnectTimer = timers->schedule(delay, [this]() {
      reconnectTimer = 0;
      try {
        initialize();
      } catch (const std::runtime_error& re) {
        LOG(ERROR) << "Reconnection failed: " << re.what();
      }
    });
  } else {
    LOG(ERROR) << "Max reconnection attempts reached for channel "
               << channelId;
    emit(CHANNEL_MAX_RECONNECT_ATTEMPTS_REACHED);
  }
}

void ChannelBridge::reconnect() {
  connected = false;
  reconnectAttempts = 0;
  if (reconnectTimer) {
    timers->cancel(reconnectTimer);
    reconnectTimer = 0;
  }
  rejectPending("MessagePort disconnected");
  try {
    initialize();
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Manual reconnection failed: " << re.what();
  }
}

void ChannelBridge::cleanup() {
  connected = false;
  queue.clear();
  if (reconnectTimer) {
    timers->cancel(reconnectTimer);
    reconnectTimer = 0;
  }
  rejectPending("MessagePort closed");
  closeChannel();
  performance.channelsActive = 0;
  emit(CHANNEL_CLEANUP);
  LOG(INFO) << "Channel " << channelId << " cleaned up";
}

void ChannelBridge::closeChannel() {
  if (fd >= 0) {
    socketHandler->close(fd);
    fd = -1;
  }
}

void ChannelBridge::rejectPending(const string& message) {
  auto inFlight = std::move(pending);
  pending.clear();
  for (auto& it : inFlight) {
    failResponse(&it.second.promise, message);
  }
}

ConnectionStatus ChannelBridge::getStatus() const {
  ConnectionStatus status;
  status.connected = connected;
  status.reconnectAttempts = reconnectAttempts;
  status.queuedMessages = queue.size();
  status.performance = performance;
  status.performance.avgLatency =
      performance.messageCount > 0
          ? double(performance.totalLatency) / performance.messageCount
          : 0;
  return status;
}

void ChannelBridge::emit(ChannelEventType type) {
  ChannelEvent event;
  event.type = type;
  eventRegistry.emit(event);
}

void ChannelBridge::emitError(const string& error) {
  ChannelEvent event;
  event.type = CHANNEL_ERROR;
  event.error = error;
  eventRegistry.emit(event);
}
}  // namespace pv
