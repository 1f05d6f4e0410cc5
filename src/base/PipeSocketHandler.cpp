#include "PipeSocketHandler.hpp"

namespace pv {
PipeSocketHandler::PipeSocketHandler() {}

pair<int, int> PipeSocketHandler::createSocketPair(bool trackSecond) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  int fds[2];
  FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
  addToActiveSockets(fds[0]);
  initSocket(fds[0]);
  if (trackSecond) {
    addToActiveSockets(fds[1]);
    initSocket(fds[1]);
  }
  VLOG(1) << "Created socket pair " << fds[0] << " <-> " << fds[1];
  return make_pair(fds[0], fds[1]);
}
}  // namespace pv
