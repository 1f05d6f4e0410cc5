#ifndef __PV_CHANNEL_BRIDGE__
#define __PV_CHANNEL_BRIDGE__

#include "EventRegistry.hpp"
#include "Headers.hpp"
#include "Packet.hpp"
#include "PvConfig.hpp"
#include "SocketHandler.hpp"
#include "Terminal.hpp"
#include "TimerQueue.hpp"

namespace pv {
/**
 * @brief Opens the local end of a bridge channel whose far end is already
 * being serviced.
 */
class ChannelConnector {
 public:
  virtual ~ChannelConnector() {}
  /**
   * @return A connected fd tracked by the bridge's socket handler.
   * @throws std::runtime_error if no channel could be opened.
   */
  virtual int connect() = 0;
};

struct ConnectionPerformance {
  int64_t messageCount = 0;
  int64_t totalLatency = 0;
  double avgLatency = 0;
  int64_t maxLatency = 0;
  int channelsActive = 0;
};

struct ConnectionStatus {
  bool connected = false;
  int reconnectAttempts = 0;
  size_t queuedMessages = 0;
  ConnectionPerformance performance;
};

enum ChannelEventType {
  CHANNEL_CONNECTED = 0,
  CHANNEL_DISCONNECTED = 1,
  CHANNEL_ERROR = 2,
  CHANNEL_CLEANUP = 3,
  CHANNEL_MAX_RECONNECT_ATTEMPTS_REACHED = 4,
  CHANNEL_RESPONSE = 5,
  CHANNEL_DATA = 6,
};

struct ChannelEvent {
  ChannelEventType type;
  string error;
  BridgeResponse response;
  /** @brief Terminal output or exit streamed from the far end. */
  BridgeEvent stream;
};

/**
 * @brief Client side of a reconnecting request channel for one terminal.
 *
 * Requests made while disconnected fail immediately with "MessagePort not
 * connected" and are queued; the queue is replayed in order on the next
 * successful connect.  A closed channel is reopened with exponential
 * backoff, min(1000 * 2^attempt, 10000) ms, until `maxReconnectAttempts`
 * is exhausted.
 *
 * The owner selects on getFd(), calls poll() when it is readable, and runs
 * the shared TimerQueue.
 */
class ChannelBridge {
 public:
  static constexpr int64_t BASE_RECONNECT_DELAY_MS = 1000;
  static constexpr int64_t MAX_RECONNECT_DELAY_MS = 10000;

  ChannelBridge(const string& _channelId,
                shared_ptr<SocketHandler> _socketHandler,
                shared_ptr<ChannelConnector> _connector,
                shared_ptr<TimerQueue> _timers,
                const BridgeSettings& _settings);
  virtual ~ChannelBridge();

  /**
   * @brief Opens the channel and replays queued requests.
   * @throws std::runtime_error if the channel could not be opened; a
   * reconnect is scheduled before throwing.
   */
  void initialize();

  std::future<BridgeResponse> createTerminal(const TerminalOptions& options);
  std::future<BridgeResponse> write(const string& data);
  std::future<BridgeResponse> resize(int cols, int rows);
  std::future<BridgeResponse> kill();

  /** @brief Reads every response and stream event that is available. */
  void poll();
  int getFd() const { return fd; }
  bool isConnected() const { return connected; }

  /** @brief Resets the attempt counter and reopens the channel now. */
  void reconnect();

  /** @brief Closes the channel and drops queued requests. */
  void cleanup();

  ConnectionStatus getStatus() const;
  const string& getChannelId() const { return channelId; }

  static int64_t reconnectDelay(int attempt);

  EventRegistry<ChannelEvent>& events() { return eventRegistry; }

 protected:
  struct PendingResponse {
    std::promise<BridgeResponse> promise;
    int64_t sentAt;
  };

  string channelId;
  shared_ptr<SocketHandler> socketHandler;
  shared_ptr<ChannelConnector> connector;
  shared_ptr<TimerQueue> timers;
  BridgeSettings settings;

  int fd;
  bool connected;
  int reconnectAttempts;
  uint64_t reconnectTimer;
  std::deque<BridgeRequest> queue;
  map<string, PendingResponse> pending;
  ConnectionPerformance performance;
  EventRegistry<ChannelEvent> eventRegistry;

  BridgeRequest makeRequest(const string& type);
  std::future<BridgeResponse> sendRequest(const BridgeRequest& request);
  /** @throws std::runtime_error if the write fails. */
  void transmit(const BridgeRequest& request);
  void processQueue();
  void handleResponse(const BridgeResponse& response);
  void handleDisconnection();
  void handleConnectionError(const string& error);
  void closeChannel();
  void rejectPending(const string& message);
  void emit(ChannelEventType type);
  void emitError(const string& error);
};
}  // namespace pv

#endif  // __PV_CHANNEL_BRIDGE__
