#ifndef __PV_PTY_HOST__
#define __PV_PTY_HOST__

#include "Headers.hpp"
#include "OutputBuffer.hpp"
#include "Packet.hpp"
#include "PvConfig.hpp"
#include "ResizeStormGuard.hpp"
#include "SocketHandler.hpp"
#include "TerminalFactory.hpp"

namespace pv {
/**
 * @brief The terminal host process: owns every live terminal and speaks the
 * host protocol with the manager over one connected socket.
 *
 * Terminal output passes through the resize storm guard, then is queued per
 * terminal and sent as HOST_DATA packets of at most `chunkSize` bytes.  Any queued output is sent before a terminal's
 * HOST_EXIT.
 */
class PtyHost {
 public:
  typedef std::chrono::steady_clock::time_point TimePoint;
  typedef std::function<TimePoint()> Clock;

  /** @brief Upper bound on HOST_DATA packets sent per terminal per tick. */
  static constexpr int MAX_CHUNKS_PER_TICK = 64;

  PtyHost(shared_ptr<SocketHandler> _socketHandler, int _channelFd,
          shared_ptr<TerminalFactory> _terminalFactory,
          const HostSettings& _settings);
  PtyHost(shared_ptr<SocketHandler> _socketHandler, int _channelFd,
          shared_ptr<TerminalFactory> _terminalFactory,
          const HostSettings& _settings, Clock _clock);
  virtual ~PtyHost();

  /**
   * @brief Sends HOST_READY and loops until the manager disconnects or
   * termination is requested, then kills every terminal.
   */
  void run();

  /**
   * @brief One loop iteration: waits up to `timeoutMs` for requests, polls
   * every terminal and sends pending output.
   * @return False once the manager has disconnected.
   */
  bool runOnce(int64_t timeoutMs);

  /** @brief Kills every tracked terminal, logging individual failures. */
  void shutdown();

  void sendReady();
  void handlePacket(const Packet& packet);

  size_t getTerminalCount() const { return terminals.size(); }
  bool hasTerminal(const string& id) const;

  /** @brief Async-signal-safe; makes run() return at the next tick. */
  static void requestTerminate(int signum);
  static bool terminateRequested();

 protected:
  enum TerminalState {
    STATE_RUNNING,
    STATE_EXITING,
  };

  struct HostedTerminal {
    HostedTerminal(const string& id, const HostSettings& settings)
        : stormGuard(id, settings.stormPattern, settings.stormThreshold,
                     settings.stormWindow),
          output(settings.chunkSize),
          state(STATE_RUNNING) {}

    shared_ptr<Terminal> terminal;
    string strategy;
    TerminalCapabilities capabilities;
    string fallbackReason;
    ResizeStormGuard stormGuard;
    OutputBuffer output;
    TerminalState state;
  };

  shared_ptr<SocketHandler> socketHandler;
  int channelFd;
  shared_ptr<TerminalFactory> terminalFactory;
  HostSettings settings;
  Clock clock;
  map<string, shared_ptr<HostedTerminal>> terminals;
  bool connected;

  void send(HostPacketType type, const google::protobuf::MessageLite& message);
  void sendError(const string& id, const string& error);

  void createTerminal(const CreateRequest& request);
  void writeToTerminal(const WriteRequest& request);
  void resizeTerminal(const ResizeRequest& request);
  void killTerminal(const KillRequest& request);
  void listTerminals(const ListRequest& request);

  /** @return The terminal if it is running, else nullptr (with a warning). */
  shared_ptr<HostedTerminal> findRunning(const string& id,
                                         const string& operation);
  TerminalSessionInfo describe(const string& id,
                               const HostedTerminal& hosted) const;

  void onTerminalData(const string& id, const string& data);
  void onTerminalExit(const string& id, int exitCode, const string& signal);
  void onTerminalError(const string& id, const string& error);

  void readRequests();
  void pollTerminals();
  /** @brief Sends queued output for one terminal. */
  void flushOutput(const string& id, HostedTerminal* hosted, int maxChunks);
};
}  // namespace pv

#endif  // __PV_PTY_HOST__
