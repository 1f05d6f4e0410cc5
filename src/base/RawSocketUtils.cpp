#include "RawSocketUtils.hpp"

namespace pv {
void RawSocketUtils::writeAll(int fd, const char* buf, size_t count) {
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for writeAll");
  }
  if (count == 0) {
    return;
  }

  size_t bytesWritten = 0;
  do {
    int rc = ::write(fd, buf + bytesWritten, count - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        // This is fine, just keep retrying
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      if (localErrno == EINTR) {
        continue;
      }
      LOG(WARNING) << "Cannot write to raw socket: " << strerror(localErrno);
      throw std::runtime_error(string("Cannot write to raw socket: ") +
                               strerror(localErrno));
    }
    if (rc == 0) {
      throw std::runtime_error("Cannot write to raw socket: socket closed");
    }
    bytesWritten += rc;
  } while (bytesWritten != count);
}

string RawSocketUtils::readAvailable(int fd, size_t maxBytes, bool* eof) {
  *eof = false;
  if (fd < 0) {
    throw std::runtime_error("Invalid file descriptor for readAvailable");
  }
  string s(maxBytes, '\0');
  ssize_t rc = ::read(fd, &s[0], maxBytes);
  if (rc < 0) {
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
        localErrno == EINTR) {
      return string();
    }
    if (localErrno == EIO) {
      // Linux reports EIO on a pty master once the slave side is gone
      *eof = true;
      return string();
    }
    throw std::runtime_error(string("Cannot read from raw socket: ") +
                             strerror(localErrno));
  }
  if (rc == 0) {
    *eof = true;
    return string();
  }
  s.resize(rc);
  return s;
}

void RawSocketUtils::setNonBlocking(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
}

void RawSocketUtils::setCloseOnExec(int fd) {
  int flags = fcntl(fd, F_GETFD);
  FATAL_FAIL(flags);
  FATAL_FAIL(fcntl(fd, F_SETFD, flags | FD_CLOEXEC));
}
}  // namespace pv
