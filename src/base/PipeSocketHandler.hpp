#ifndef __PV_PIPE_SOCKET_HANDLER__
#define __PV_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace pv {
/**
 * @brief Hands out connected UNIX domain socket pairs, used between a
 * parent and the child it spawns.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Creates a connected stream pair.  Both ends are tracked by this
   * handler.
   * @param trackSecond When false the second end is left untracked so it can
   * be handed to a child process.
   */
  pair<int, int> createSocketPair(bool trackSecond = true);
};
}  // namespace pv

#endif  // __PV_PIPE_SOCKET_HANDLER__
