#ifndef __PV_SOCKET_HANDLER__
#define __PV_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace pv {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 *
 * All framed traffic (host protocol, channel bridge) goes through
 * readPacket/writePacket: an int64 length prefix followed by the packet
 * bytes.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Returns true when the kernel reports data ready to read on a
   * descriptor.
   */
  virtual bool hasData(int fd) = 0;
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Whether to enforce the internal transfer timeout while
   * waiting.
   * @throws std::runtime_error when the peer closes or the read fails.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Reads a length-prefixed packet.
   * @returns false when the packet length is zero (empty message).
   * @throws std::runtime_error on a closed peer or an invalid length.
   */
  inline bool readPacket(int fd, Packet* packet) {
    int64_t length;
    readAll(fd, (char*)&length, sizeof(int64_t), false);
    if (length < 0 || length > MAX_FRAME_LENGTH) {
      // If the message is < 0 or too big, assume this is a bad packet and throw
      string s("Invalid size (<0 or >128 MB): ");
      s += std::to_string(length);
      throw std::runtime_error(s.c_str());
    }
    if (length == 0) {
      return false;
    }
    string s(length, '\0');
    readAll(fd, &s[0], length, false);
    *packet = Packet(s);
    return true;
  }

  /**
   * @brief Serializes and writes a packet with a leading length prefix.
   */
  inline void writePacket(int fd, const Packet& packet) {
    string s = packet.serialize();
    int64_t length = s.length();
    if (length < 0 || length > MAX_FRAME_LENGTH) {
      throw std::runtime_error("Invalid message length: " +
                               to_string(length));
    }
    writeAllOrThrow(fd, (const char*)&length, sizeof(int64_t), false);
    if (length) {
      writeAllOrThrow(fd, &s[0], length, false);
    }
  }

  virtual void close(int fd) = 0;
};
}  // namespace pv

#endif  // __PV_SOCKET_HANDLER__
