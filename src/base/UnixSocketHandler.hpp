#ifndef __PV_UNIX_SOCKET_HANDLER__
#define __PV_UNIX_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace pv {
/**
 * @brief Default SocketHandler implementation using POSIX sockets with mutex
 * guards.
 */
class UnixSocketHandler : public SocketHandler {
 public:
  UnixSocketHandler();
  virtual ~UnixSocketHandler() {}

  /**
   * @brief Blocks with select() until the fd becomes readable.
   */
  virtual bool waitForData(int fd, int64_t sec, int64_t usec);
  virtual bool hasData(int fd);
  /** @brief Reads up to `count` bytes while holding the per-socket mutex. */
  virtual ssize_t read(int fd, void* buf, size_t count);
  /** @brief Writes `count` bytes by retrying until completion or timeout. */
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /** @brief Closes the descriptor and removes it from the tracked set. */
  virtual void close(int fd);

  /**
   * @brief Starts tracking an already-connected descriptor that was created
   * elsewhere (inherited across exec, or one end of a socketpair).
   */
  void adoptSocket(int fd);

 protected:
  /**
   * @brief Ensures that a descriptor is tracked and has its own mutex.
   */
  void addToActiveSockets(int fd);
  /**
   * @brief Performs per-socket initialization (non-blocking, signal handling).
   */
  virtual void initSocket(int fd);

  /** @brief Mutex per active socket to ensure serial read/write. */
  map<int, shared_ptr<recursive_mutex>> activeSocketMutexes;
  /** @brief Guards access to the active socket map. */
  recursive_mutex globalMutex;
};
}  // namespace pv

#endif  // __PV_UNIX_SOCKET_HANDLER__
