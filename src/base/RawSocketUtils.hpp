#ifndef __PV_RAW_SOCKET_UTILS__
#define __PV_RAW_SOCKET_UTILS__

#include "Headers.hpp"

namespace pv {
/**
 * @brief Read/write loops for raw descriptors (pty masters and pipes) that
 * are not owned by a SocketHandler.
 */
class RawSocketUtils {
 public:
  /**
   * @brief Writes the entire buffer to the given descriptor, retrying on
   * EAGAIN.
   * @throws std::runtime_error if the descriptor is invalid or closed.
   */
  static void writeAll(int fd, const char* buf, size_t count);

  /**
   * @brief Reads whatever is immediately available, up to `maxBytes`.
   * @param eof Set to true when the descriptor reached end of file (or
   * returned EIO, which is how a pty master reports a dead child).
   * @throws std::runtime_error on any other read failure.
   */
  static string readAvailable(int fd, size_t maxBytes, bool* eof);

  /** @brief Switches the descriptor to non-blocking mode. */
  static void setNonBlocking(int fd);

  /** @brief Keeps the descriptor out of processes spawned later. */
  static void setCloseOnExec(int fd);
};
}  // namespace pv
#endif  // __PV_RAW_SOCKET_UTILS__
