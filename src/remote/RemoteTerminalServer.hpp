#ifndef __PV_REMOTE_TERMINAL_SERVER__
#define __PV_REMOTE_TERMINAL_SERVER__

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "TerminalFactory.hpp"

namespace pv {
namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

typedef http::request<http::string_body> HttpRequest;
typedef http::response<http::string_body> HttpResponse;

struct RemoteServerStatus {
  bool running = false;
  int port = 0;
  size_t sessions = 0;
  /** @brief Seconds since start(). */
  double uptime = 0;
};

/**
 * @brief Serves terminals to remote clients.
 *
 * One listener answers `GET /health` and `GET /terminals`, and upgrades
 * `/terminal` to a WebSocket that carries JSON envelopes
 * `{type, terminalId, data, timestamp}`, one per text message.
 *
 * Terminals run in this process.  Every terminal belongs to the WebSocket
 * that created it and is killed when that socket closes.  Everything runs
 * on the thread that calls runOnce().
 */
class RemoteTerminalServer {
 public:
  static constexpr const char* TERMINAL_PATH = "/terminal";
  /** @brief Largest WebSocket message accepted from a client. */
  static constexpr size_t MAX_MESSAGE_SIZE = 4 * 1024 * 1024;

  /**
   * @param _port Port to listen on, 0 to let the kernel pick one.
   */
  RemoteTerminalServer(shared_ptr<TerminalFactory> _terminalFactory,
                       const string& _bindIp, int _port);
  virtual ~RemoteTerminalServer();

  /** @throws std::runtime_error if the port cannot be bound. */
  void start();
  /** @brief Kills every terminal and closes every connection. */
  void stop();
  bool isRunning() const { return running; }
  /** @brief The bound port, valid after start(). */
  int getPort() const { return boundPort; }

  /**
   * @brief Runs network handlers and polls terminals, waiting at most
   * `timeoutMs` for activity.
   */
  void runOnce(int64_t timeoutMs);

  RemoteServerStatus getStatus() const;
  size_t getConnectionCount() const { return connections.size(); }
  /** @brief Body of GET /health. */
  string healthJson() const;
  /** @brief Body of GET /terminals. */
  string terminalsJson() const;
  HttpResponse handleHttp(const HttpRequest& request) const;

  static string generateTerminalId();
  static string generateSessionId();

 protected:
  class HttpConnection;
  class TerminalConnection;

  struct RemoteSession {
    string id;
    shared_ptr<Terminal> terminal;
    string strategy;
    string connectionId;
    int64_t createdAt;
    int64_t lastActivity;
    /** @brief Wakes the loop when the terminal has output; may be null. */
    shared_ptr<asio::posix::stream_descriptor> watcher;
  };

  shared_ptr<TerminalFactory> terminalFactory;
  string bindIp;
  int port;
  int boundPort;

  bool running;
  std::chrono::steady_clock::time_point startTime;

  asio::io_context ioContext;
  tcp::acceptor acceptor;
  vector<weak_ptr<HttpConnection>> httpConnections;
  map<string, shared_ptr<TerminalConnection>> connections;
  map<string, RemoteSession> sessions;

  void acceptNext();
  void onAccept(const beast::error_code& ec, tcp::socket socket);
  void upgrade(tcp::socket socket, HttpRequest request);
  void onConnectionOpened(shared_ptr<TerminalConnection> connection);
  void closeConnection(const string& connectionId);
  void watchTerminal(const string& terminalId);
  void armWatcher(const string& terminalId,
                  shared_ptr<asio::posix::stream_descriptor> watcher);
  /** @brief Forgets a terminal without killing it. */
  void eraseSession(const string& terminalId);
  void pollTerminals();

  void handleMessage(const string& connectionId, const string& text);
  void handleCreate(const string& connectionId, const json& message);
  void handleWrite(const json& message);
  void handleResize(const json& message);
  void handleKill(const json& message);
  void handleList(const string& connectionId);
  void onTerminalEvent(const string& connectionId, const string& terminalId,
                       const TerminalEvent& event);

  json describeSession(const RemoteSession& session) const;
  void send(const string& connectionId, json message);
  void sendError(const string& connectionId, const string& terminalId,
                 const string& error);
};
}  // namespace pv

#endif  // __PV_REMOTE_TERMINAL_SERVER__
