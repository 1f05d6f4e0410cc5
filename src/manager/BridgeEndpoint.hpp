#ifndef __PV_BRIDGE_ENDPOINT__
#define __PV_BRIDGE_ENDPOINT__

#include "ChannelBridge.hpp"
#include "Headers.hpp"
#include "PipeSocketHandler.hpp"
#include "PtyManager.hpp"

namespace pv {
/**
 * @brief Services the far end of a bridge channel: requests are forwarded
 * into a PtyManager and terminal output is streamed back as BRIDGE_EVENT
 * packets.
 *
 * The client addresses its terminal by the channel id; the endpoint maps
 * that name to the session id the manager assigned on create.
 */
class BridgeEndpoint {
 public:
  BridgeEndpoint(shared_ptr<SocketHandler> _socketHandler, int _fd,
                 shared_ptr<PtyManager> _manager);
  virtual ~BridgeEndpoint();

  /** @brief Handles available requests and answers finished creates. */
  void poll();
  bool isOpen() const { return fd >= 0; }
  int getFd() const { return fd; }
  void close();

 protected:
  struct PendingCreate {
    string requestId;
    string channelTerminalId;
    std::future<TerminalSession> future;
  };

  shared_ptr<SocketHandler> socketHandler;
  int fd;
  shared_ptr<PtyManager> manager;
  int managerSubscription;
  map<string, string> channelToSession;
  map<string, string> sessionToChannel;
  vector<PendingCreate> pendingCreates;

  void handleRequest(const BridgeRequest& request);
  void completeCreates();
  void onManagerEvent(const ManagerEvent& event);
  string resolve(const string& channelTerminalId) const;
  void forget(const string& sessionId);
  void respond(const string& requestId, const string& error,
               const TerminalSession* session);
  void sendPacket(BridgePacketType type,
                  const google::protobuf::MessageLite& message);
};

/**
 * @brief Opens in-process channels whose far ends are serviced by
 * BridgeEndpoints bound to one manager.
 */
class EndpointConnector : public ChannelConnector {
 public:
  EndpointConnector(shared_ptr<PipeSocketHandler> _socketHandler,
                    shared_ptr<PtyManager> _manager);
  virtual ~EndpointConnector() {}
  virtual int connect();

  /** @brief Polls every endpoint and drops the closed ones. */
  void poll();
  size_t getEndpointCount() const { return endpoints.size(); }
  /** @brief Closes every endpoint, as if the serving side went away. */
  void closeAll();

 protected:
  shared_ptr<PipeSocketHandler> socketHandler;
  shared_ptr<PtyManager> manager;
  vector<shared_ptr<BridgeEndpoint>> endpoints;
};
}  // namespace pv

#endif  // __PV_BRIDGE_ENDPOINT__
