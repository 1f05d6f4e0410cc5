#ifndef __PV_TERMINAL__
#define __PV_TERMINAL__

#include "EventRegistry.hpp"
#include "Headers.hpp"
#include "TerminalBufferManager.hpp"

namespace pv {
struct TerminalOptions {
  string shell;
  string cwd;
  map<string, string> env;
  int cols = DEFAULT_TERMINAL_COLS;
  int rows = DEFAULT_TERMINAL_ROWS;
};

enum TerminalEventType {
  TERMINAL_DATA = 0,
  TERMINAL_EXIT = 1,
  TERMINAL_ERROR = 2,
};

struct TerminalEvent {
  TerminalEventType type;
  string data;
  int exitCode = 0;
  /** @brief Name of the terminating signal ("SIGKILL"), empty if none. */
  string signal;
  string error;
};

class InstrumentedTerminal;

/**
 * @brief The view of a terminal the performance monitor needs.
 */
class MonitoredTerminal {
 public:
  virtual ~MonitoredTerminal() {}

  virtual pid_t getPid() const = 0;
  virtual bool isRunning() const = 0;
  /**
   * @brief Buffer statistics, if this terminal keeps any.
   * @return nullptr when the terminal does not buffer its output.
   */
  virtual InstrumentedTerminal* getInstrumentation() { return nullptr; }
};

/**
 * @brief Implemented by terminals that buffer output and can report on it.
 */
class InstrumentedTerminal {
 public:
  virtual ~InstrumentedTerminal() {}

  virtual BufferHealth getBufferHealth() const = 0;
  virtual BufferMetrics getBufferMetrics() const = 0;
};

/**
 * @brief A shell process whose raw byte stream is exposed to the caller.
 *
 * Terminals never block and own no threads: the owning loop selects on
 * getFd() and calls poll(), which reads whatever is available and emits
 * TERMINAL_DATA, TERMINAL_EXIT or TERMINAL_ERROR events.
 */
class Terminal : public MonitoredTerminal {
 public:
  Terminal(const string& _id, const TerminalOptions& _options)
      : id(_id), options(_options), pid(-1), running(false) {}
  virtual ~Terminal() {}

  /** @throws std::runtime_error if the process could not be started. */
  virtual void spawn() = 0;
  /** @throws std::runtime_error if the terminal is not running. */
  virtual void write(const string& data) = 0;
  virtual void resize(int cols, int rows) = 0;
  virtual void kill() = 0;

  /** @return The descriptor carrying output, or -1 when there is none. */
  virtual int getFd() const = 0;
  /** @brief Reads available output and dispatches events. */
  virtual void poll() = 0;

  virtual pid_t getPid() const { return pid; }
  virtual bool isRunning() const { return running; }

  const string& getId() const { return id; }
  const string& getShell() const { return options.shell; }
  const string& getCwd() const { return options.cwd; }
  const TerminalOptions& getOptions() const { return options; }

  EventRegistry<TerminalEvent>& events() { return eventRegistry; }

 protected:
  string id;
  TerminalOptions options;
  pid_t pid;
  bool running;
  EventRegistry<TerminalEvent> eventRegistry;

  void emitData(const string& data) {
    TerminalEvent event;
    event.type = TERMINAL_DATA;
    event.data = data;
    eventRegistry.emit(event);
  }

  void emitExit(int exitCode, const string& signal) {
    TerminalEvent event;
    event.type = TERMINAL_EXIT;
    event.exitCode = exitCode;
    event.signal = signal;
    eventRegistry.emit(event);
  }

  void emitError(const string& error) {
    TerminalEvent event;
    event.type = TERMINAL_ERROR;
    event.error = error;
    eventRegistry.emit(event);
  }

  static string signalName(int sig) {
    switch (sig) {
      case SIGHUP:
        return "SIGHUP";
      case SIGINT:
        return "SIGINT";
      case SIGQUIT:
        return "SIGQUIT";
      case SIGABRT:
        return "SIGABRT";
      case SIGKILL:
        return "SIGKILL";
      case SIGSEGV:
        return "SIGSEGV";
      case SIGPIPE:
        return "SIGPIPE";
      case SIGTERM:
        return "SIGTERM";
      default:
        return "SIG" + to_string(sig);
    }
  }

  /**
   * @brief Translates a waitpid status into an exit code and signal name.
   */
  static void decodeWaitStatus(int status, int* exitCode, string* signal) {
    if (WIFSIGNALED(status)) {
      int sig = WTERMSIG(status);
      *exitCode = 128 + sig;
      *signal = signalName(sig);
    } else {
      *exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
      signal->clear();
    }
  }
};
}  // namespace pv

#endif  // __PV_TERMINAL__
