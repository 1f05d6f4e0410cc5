#include "RemoteTerminalServer.hpp"

namespace pv {
namespace {
// Bounds the handlers drained per turn so busy sockets cannot starve
// terminal polling.
const int MAX_HANDLERS_PER_TURN = 256;

string targetOf(const HttpRequest& request) {
  return string(request.target().data(), request.target().size());
}
}  // namespace

/**
 * @brief Answers plain HTTP requests until the client asks for the terminal
 * WebSocket, then hands its socket to the server.
 */
class RemoteTerminalServer::HttpConnection
    : public std::enable_shared_from_this<HttpConnection> {
 public:
  HttpConnection(RemoteTerminalServer* _server, tcp::socket _socket)
      : server(_server), socket(std::move(_socket)) {}

  void start() { readRequest(); }

  void close() {
    beast::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
  }

 protected:
  RemoteTerminalServer* server;
  tcp::socket socket;
  beast::flat_buffer buffer;
  HttpRequest request;
  shared_ptr<HttpResponse> response;

  void readRequest() {
    request = {};
    auto self = shared_from_this();
    http::async_read(socket, buffer, request,
                     [self](beast::error_code ec, size_t) {
                       self->onRequest(ec);
                     });
  }

  void onRequest(const beast::error_code& ec) {
    if (ec == http::error::end_of_stream) {
      close();
      return;
    }
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        VLOG(1) << "HTTP read failed: " << ec.message();
      }
      return;
    }
    if (websocket::is_upgrade(request) && targetOf(request) == TERMINAL_PATH) {
      server->upgrade(std::move(socket), std::move(request));
      return;
    }
    response.reset(new HttpResponse(server->handleHttp(request)));
    auto self = shared_from_this();
    http::async_write(socket, *response,
                      [self](beast::error_code ec, size_t) {
                        self->onWrite(ec);
                      });
  }

  void onWrite(const beast::error_code& ec) {
    if (ec) {
      VLOG(1) << "HTTP write failed: " << ec.message();
      return;
    }
    if (response->need_eof()) {
      close();
      return;
    }
    readRequest();
  }
};

/**
 * @brief One client on /terminal.  Writes are queued so at most one is in
 * flight.
 */
class RemoteTerminalServer::TerminalConnection
    : public std::enable_shared_from_this<TerminalConnection> {
 public:
  TerminalConnection(RemoteTerminalServer* _server, tcp::socket socket,
                     const string& _id)
      : server(_server),
        ws(std::move(socket)),
        id(_id),
        open(false),
        writing(false) {
    ws.read_message_max(MAX_MESSAGE_SIZE);
    ws.text(true);
  }

  const string& getId() const { return id; }

  void accept(HttpRequest request) {
    auto self = shared_from_this();
    ws.async_accept(request,
                    [self](beast::error_code ec) { self->onAccept(ec); });
  }

  void send(const string& text) {
    if (!open) {
      return;
    }
    outbox.push_back(text);
    if (!writing) {
      writeNext();
    }
  }

  void close() {
    open = false;
    beast::error_code ec;
    beast::get_lowest_layer(ws).shutdown(tcp::socket::shutdown_both, ec);
    beast::get_lowest_layer(ws).close(ec);
  }

 protected:
  RemoteTerminalServer* server;
  websocket::stream<tcp::socket> ws;
  string id;
  bool open;
  bool writing;
  beast::flat_buffer buffer;
  std::deque<string> outbox;

  void onAccept(const beast::error_code& ec) {
    if (ec) {
      LOG(WARNING) << "WebSocket handshake failed: " << ec.message();
      close();
      return;
    }
    open = true;
    server->onConnectionOpened(shared_from_this());
    readMessage();
  }

  void readMessage() {
    auto self = shared_from_this();
    ws.async_read(buffer, [self](beast::error_code ec, size_t) {
      self->onRead(ec);
    });
  }

  void onRead(const beast::error_code& ec) {
    if (ec) {
      if (ec == websocket::error::closed) {
        VLOG(1) << "Connection " << id << " closed by peer";
      } else if (ec != asio::error::operation_aborted) {
        LOG(INFO) << "Connection " << id << " lost: " << ec.message();
      }
      server->closeConnection(id);
      return;
    }
    string text = beast::buffers_to_string(buffer.data());
    buffer.consume(buffer.size());
    server->handleMessage(id, text);
    if (open) {
      readMessage();
    }
  }

  void writeNext() {
    writing = true;
    auto self = shared_from_this();
    ws.async_write(asio::buffer(outbox.front()),
                   [self](beast::error_code ec, size_t) {
                     self->onWrite(ec);
                   });
  }

  void onWrite(const beast::error_code& ec) {
    writing = false;
    if (ec) {
      if (open) {
        LOG(WARNING) << "Could not write to connection " << id << ": "
                     << ec.message();
      }
      server->closeConnection(id);
      return;
    }
    outbox.pop_front();
    if (open && !outbox.empty()) {
      writeNext();
    }
  }
};

RemoteTerminalServer::RemoteTerminalServer(
    shared_ptr<TerminalFactory> _terminalFactory, const string& _bindIp,
    int _port)
    : terminalFactory(_terminalFactory),
      bindIp(_bindIp),
      port(_port),
      boundPort(0),
      running(false),
      acceptor(ioContext) {}

RemoteTerminalServer::~RemoteTerminalServer() { stop(); }

string RemoteTerminalServer::generateTerminalId() {
  return "terminal-" + to_string(epochMillis()) + "-" + genRandomBase36(9);
}

string RemoteTerminalServer::generateSessionId() {
  return "session-" + to_string(epochMillis()) + "-" + genRandomBase36(9);
}

void RemoteTerminalServer::start() {
  if (running) {
    return;
  }
  ioContext.restart();
  beast::error_code ec;
  auto address =
      asio::ip::make_address(bindIp.empty() ? "0.0.0.0" : bindIp, ec);
  if (ec) {
    throw std::runtime_error("Invalid bind address " + bindIp + ": " +
                             ec.message());
  }
  tcp::endpoint endpoint(address, port);
  acceptor.open(endpoint.protocol(), ec);
  if (!ec) {
    acceptor.set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor.bind(endpoint, ec);
  }
  if (!ec) {
    acceptor.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    beast::error_code closeError;
    acceptor.close(closeError);
    throw std::runtime_error("Could not listen on port " + to_string(port) +
                             ": " + ec.message());
  }
  boundPort = acceptor.local_endpoint().port();
  running = true;
  startTime = std::chrono::steady_clock::now();
  acceptNext();
  LOG(INFO) << "Remote terminal server listening on port " << boundPort
            << ", terminals on " << TERMINAL_PATH;
}

void RemoteTerminalServer::stop() {
  if (!running) {
    return;
  }
  running = false;
  vector<string> connectionIds;
  for (const auto& it : connections) {
    connectionIds.push_back(it.first);
  }
  for (const auto& connectionId : connectionIds) {
    closeConnection(connectionId);
  }
  for (auto& it : sessions) {
    if (it.second.watcher) {
      beast::error_code ec;
      it.second.watcher->close(ec);
    }
    try {
      it.second.terminal->kill();
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Error killing terminal " << it.first << ": "
                   << re.what();
    }
  }
  sessions.clear();

  beast::error_code ec;
  acceptor.close(ec);
  for (auto& weakConnection : httpConnections) {
    auto connection = weakConnection.lock();
    if (connection) {
      connection->close();
    }
  }
  httpConnections.clear();
  // Completes the aborted operations so their connections are released.
  ioContext.restart();
  ioContext.poll();
  LOG(INFO) << "Remote terminal server stopped";
}

void RemoteTerminalServer::runOnce(int64_t timeoutMs) {
  if (!running) {
    return;
  }
  if (ioContext.stopped()) {
    ioContext.restart();
  }
  ioContext.run_one_for(std::chrono::milliseconds(max(timeoutMs, int64_t(0))));
  for (int handled = 0; handled < MAX_HANDLERS_PER_TURN && ioContext.poll_one();
       handled++) {
  }
  // Buffered backends flush on poll even when their fd is quiet.
  pollTerminals();
}

void RemoteTerminalServer::acceptNext() {
  acceptor.async_accept([this](beast::error_code ec, tcp::socket socket) {
    onAccept(ec, std::move(socket));
  });
}

void RemoteTerminalServer::onAccept(const beast::error_code& ec,
                                    tcp::socket socket) {
  if (ec == asio::error::operation_aborted || !running) {
    return;
  }
  if (ec) {
    LOG(WARNING) << "Accept failed: " << ec.message();
  } else {
    shared_ptr<HttpConnection> connection(
        new HttpConnection(this, std::move(socket)));
    httpConnections.erase(
        std::remove_if(httpConnections.begin(), httpConnections.end(),
                       [](const weak_ptr<HttpConnection>& weakConnection) {
                         return weakConnection.expired();
                       }),
        httpConnections.end());
    httpConnections.push_back(connection);
    connection->start();
  }
  acceptNext();
}

void RemoteTerminalServer::upgrade(tcp::socket socket, HttpRequest request) {
  shared_ptr<TerminalConnection> connection(
      new TerminalConnection(this, std::move(socket), generateSessionId()));
  connection->accept(std::move(request));
}

void RemoteTerminalServer::onConnectionOpened(
    shared_ptr<TerminalConnection> connection) {
  if (!running) {
    connection->close();
    return;
  }
  connections[connection->getId()] = connection;
  LOG(INFO) << "New connection " << connection->getId();
  json welcome;
  welcome["type"] = "connected";
  welcome["data"] = {{"sessionId", connection->getId()}};
  send(connection->getId(), welcome);
}

void RemoteTerminalServer::closeConnection(const string& connectionId) {
  auto it = connections.find(connectionId);
  if (it == connections.end()) {
    return;
  }
  LOG(INFO) << "Connection " << connectionId << " closed";
  vector<string> owned;
  for (const auto& sessionIt : sessions) {
    if (sessionIt.second.connectionId == connectionId) {
      owned.push_back(sessionIt.first);
    }
  }
  for (const auto& terminalId : owned) {
    shared_ptr<Terminal> terminal = sessions[terminalId].terminal;
    eraseSession(terminalId);
    try {
      terminal->kill();
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Error killing terminal " << terminalId << ": "
                   << re.what();
    }
  }
  shared_ptr<TerminalConnection> connection = it->second;
  connections.erase(it);
  connection->close();
}

void RemoteTerminalServer::watchTerminal(const string& terminalId) {
  auto it = sessions.find(terminalId);
  if (it == sessions.end()) {
    return;
  }
  int fd = it->second.terminal->getFd();
  if (fd < 0) {
    return;
  }
  // The watcher owns a duplicate so the terminal keeps control of its fd.
  int watchFd = ::dup(fd);
  if (watchFd < 0) {
    LOG(WARNING) << "Could not watch terminal " << terminalId << ": "
                 << strerror(GetErrno());
    return;
  }
  it->second.watcher.reset(
      new asio::posix::stream_descriptor(ioContext, watchFd));
  armWatcher(terminalId, it->second.watcher);
}

void RemoteTerminalServer::armWatcher(
    const string& terminalId,
    shared_ptr<asio::posix::stream_descriptor> watcher) {
  watcher->async_wait(
      asio::posix::stream_descriptor::wait_read,
      [this, terminalId, watcher](const beast::error_code& ec) {
        if (ec) {
          return;
        }
        auto it = sessions.find(terminalId);
        if (it == sessions.end() || it->second.watcher != watcher) {
          return;
        }
        shared_ptr<Terminal> terminal = it->second.terminal;
        try {
          terminal->poll();
        } catch (const std::runtime_error& re) {
          LOG(ERROR) << "Error polling terminal " << terminalId << ": "
                     << re.what();
        }
        it = sessions.find(terminalId);
        if (it != sessions.end() && it->second.watcher == watcher &&
            terminal->isRunning()) {
          armWatcher(terminalId, watcher);
        }
      });
}

void RemoteTerminalServer::eraseSession(const string& terminalId) {
  auto it = sessions.find(terminalId);
  if (it == sessions.end()) {
    return;
  }
  if (it->second.watcher) {
    beast::error_code ec;
    it->second.watcher->close(ec);
  }
  sessions.erase(it);
}

void RemoteTerminalServer::pollTerminals() {
  // Exit handlers erase sessions; the snapshot keeps terminals alive.
  vector<shared_ptr<Terminal>> terminals;
  for (const auto& it : sessions) {
    terminals.push_back(it.second.terminal);
  }
  for (auto& terminal : terminals) {
    try {
      terminal->poll();
    } catch (const std::runtime_error& re) {
      LOG(ERROR) << "Error polling terminal " << terminal->getId() << ": "
                 << re.what();
    }
  }
}

void RemoteTerminalServer::handleMessage(const string& connectionId,
                                         const string& text) {
  try {
    json message = json::parse(text);
    if (!message.is_object()) {
      throw std::runtime_error("Message must be a JSON object");
    }
    string type = message.value("type", "");
    if (type == "create") {
      handleCreate(connectionId, message);
    } else if (type == "write") {
      handleWrite(message);
    } else if (type == "resize") {
      handleResize(message);
    } else if (type == "kill") {
      handleKill(message);
    } else if (type == "list") {
      handleList(connectionId);
    } else {
      LOG(WARNING) << "Unknown message type: " << type;
    }
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Error processing message from " << connectionId << ": "
               << ex.what();
    sendError(connectionId, "", ex.what());
  }
}

void RemoteTerminalServer::handleCreate(const string& connectionId,
                                        const json& message) {
  string terminalId;
  if (message.contains("terminalId") && message["terminalId"].is_string()) {
    terminalId = message["terminalId"].get<string>();
  }
  if (terminalId.empty()) {
    terminalId = generateTerminalId();
  }
  if (sessions.find(terminalId) != sessions.end()) {
    sendError(connectionId, terminalId,
              "Terminal " + terminalId + " already exists");
    return;
  }

  json data = json::object();
  if (message.contains("data") && message["data"].is_object()) {
    data = message["data"];
  }
  TerminalOptions options;
  options.shell = data.value("shell", "");
  options.cwd = data.value("cwd", "");
  if (data.contains("env") && data["env"].is_object()) {
    for (auto& it : data["env"].items()) {
      options.env[it.key()] = it.value().get<string>();
    }
  }
  int cols = data.value("cols", 0);
  int rows = data.value("rows", 0);
  options.cols = cols > 0 ? cols : DEFAULT_TERMINAL_COLS;
  options.rows = rows > 0 ? rows : DEFAULT_TERMINAL_ROWS;

  LOG(INFO) << "Creating terminal " << terminalId << " for " << connectionId;
  TerminalCreateResult result;
  try {
    result = terminalFactory->createTerminal(terminalId, options);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to create terminal: " << re.what();
    sendError(connectionId, "",
              strlen(re.what()) ? re.what() : "Failed to create terminal");
    return;
  }

  result.terminal->events().subscribe(
      [this, connectionId, terminalId](const TerminalEvent& event) {
        onTerminalEvent(connectionId, terminalId, event);
      });

  RemoteSession session;
  session.id = terminalId;
  session.terminal = result.terminal;
  session.strategy = result.strategy;
  session.connectionId = connectionId;
  session.createdAt = epochMillis();
  session.lastActivity = session.createdAt;
  sessions[terminalId] = session;
  watchTerminal(terminalId);

  json created;
  created["type"] = "created";
  created["terminalId"] = terminalId;
  created["data"] = {{"strategy", result.strategy},
                     {"pid", result.terminal->getPid()}};
  if (!result.fallbackReason.empty()) {
    created["data"]["fallbackReason"] = result.fallbackReason;
  }
  send(connectionId, created);
}

void RemoteTerminalServer::handleWrite(const json& message) {
  string terminalId = message.value("terminalId", "");
  auto it = sessions.find(terminalId);
  if (it == sessions.end()) {
    LOG(WARNING) << "Terminal " << terminalId << " not found for write";
    return;
  }
  it->second.terminal->write(message.at("data").get<string>());
  it->second.lastActivity = epochMillis();
}

void RemoteTerminalServer::handleResize(const json& message) {
  string terminalId = message.value("terminalId", "");
  auto it = sessions.find(terminalId);
  if (it == sessions.end()) {
    LOG(WARNING) << "Terminal " << terminalId << " not found for resize";
    return;
  }
  const json& data = message.at("data");
  it->second.terminal->resize(data.at("cols").get<int>(),
                              data.at("rows").get<int>());
  it->second.lastActivity = epochMillis();
}

void RemoteTerminalServer::handleKill(const json& message) {
  string terminalId = message.value("terminalId", "");
  auto it = sessions.find(terminalId);
  if (it == sessions.end()) {
    LOG(WARNING) << "Terminal " << terminalId << " not found for kill";
    return;
  }
  shared_ptr<Terminal> terminal = it->second.terminal;
  eraseSession(terminalId);
  terminal->kill();
}

void RemoteTerminalServer::handleList(const string& connectionId) {
  json terminals = json::array();
  for (const auto& it : sessions) {
    terminals.push_back(describeSession(it.second));
  }
  json list;
  list["type"] = "list";
  list["data"] = {{"terminals", terminals}};
  send(connectionId, list);
}

void RemoteTerminalServer::onTerminalEvent(const string& connectionId,
                                           const string& terminalId,
                                           const TerminalEvent& event) {
  json message;
  message["terminalId"] = terminalId;
  switch (event.type) {
    case TERMINAL_DATA:
      message["type"] = "data";
      message["data"] = event.data;
      break;
    case TERMINAL_EXIT:
      LOG(INFO) << "Terminal " << terminalId << " exited with code "
                << event.exitCode;
      message["type"] = "exit";
      message["data"] = {{"exitCode", event.exitCode}};
      if (event.signal.empty()) {
        message["data"]["signal"] = nullptr;
      } else {
        message["data"]["signal"] = event.signal;
      }
      eraseSession(terminalId);
      break;
    case TERMINAL_ERROR:
      LOG(ERROR) << "Terminal " << terminalId << " error: " << event.error;
      message["type"] = "error";
      message["data"] = {{"error", event.error}};
      break;
  }
  send(connectionId, message);
}

json RemoteTerminalServer::describeSession(
    const RemoteSession& session) const {
  return {{"id", session.id},
          {"strategy", session.strategy},
          {"pid", session.terminal->getPid()},
          {"isRunning", session.terminal->isRunning()},
          {"createdAt", session.createdAt},
          {"lastActivity", session.lastActivity}};
}

void RemoteTerminalServer::send(const string& connectionId, json message) {
  auto it = connections.find(connectionId);
  if (it == connections.end()) {
    VLOG(1) << "Dropping " << message.value("type", "")
            << " for closed connection " << connectionId;
    return;
  }
  message["timestamp"] = epochMillis();
  it->second->send(dumpJson(message));
}

void RemoteTerminalServer::sendError(const string& connectionId,
                                     const string& terminalId,
                                     const string& error) {
  json message;
  message["type"] = "error";
  if (!terminalId.empty()) {
    message["terminalId"] = terminalId;
  }
  message["data"] = {{"error", error}};
  send(connectionId, message);
}

RemoteServerStatus RemoteTerminalServer::getStatus() const {
  RemoteServerStatus status;
  status.running = running;
  status.port = boundPort;
  status.sessions = sessions.size();
  if (running) {
    status.uptime = std::chrono::duration<double>(
                        std::chrono::steady_clock::now() - startTime)
                        .count();
  }
  return status;
}

string RemoteTerminalServer::healthJson() const {
  RemoteServerStatus status = getStatus();
  json health = {{"status", "healthy"},
                 {"sessionsActive", status.sessions},
                 {"uptime", status.uptime},
                 {"timestamp", epochMillis()}};
  return dumpJson(health);
}

string RemoteTerminalServer::terminalsJson() const {
  json body;
  body["sessions"] = json::array();
  for (const auto& it : sessions) {
    body["sessions"].push_back(describeSession(it.second));
  }
  return dumpJson(body);
}

HttpResponse RemoteTerminalServer::handleHttp(
    const HttpRequest& request) const {
  HttpResponse response;
  response.version(request.version());
  response.keep_alive(request.keep_alive());
  response.set(http::field::server, string("pvserver/") + PV_VERSION);
  response.set(http::field::content_type, "application/json");
  response.set(http::field::access_control_allow_origin, "*");
  string target = targetOf(request);
  if (target != "/health" && target != "/terminals") {
    response.result(http::status::not_found);
    response.body() = dumpJson(json({{"error", "Not found"}}));
  } else if (request.method() != http::verb::get) {
    response.result(http::status::method_not_allowed);
    response.body() = dumpJson(json({{"error", "Method not allowed"}}));
  } else {
    response.result(http::status::ok);
    response.body() = target == "/health" ? healthJson() : terminalsJson();
  }
  response.prepare_payload();
  return response;
}
}  // namespace pv
