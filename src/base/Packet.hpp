#ifndef __PV_PACKET_H__
#define __PV_PACKET_H__

#include "Headers.hpp"

namespace pv {
/**
 * @brief A typed message frame: one header byte naming the message kind,
 * followed by a serialized protobuf payload.
 */
class Packet {
 public:
  Packet() : header(255) {}
  Packet(uint8_t _header, const string& _payload)
      : header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from its raw byte representation.
   * @throws std::runtime_error if the frame is empty.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.empty()) {
      throw std::runtime_error("Empty packet");
    }
    header = serializedPacket[0];
    payload = serializedPacket.substr(HEADER_SIZE);
  }

  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  /** @brief Returns the serialized byte count including the header. */
  ssize_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s = "0" + payload;
    s[0] = header;
    return s;
  }

  /** @brief Parses the payload as the given message type. */
  template <typename T>
  T parse() const {
    return stringToProto<T>(payload);
  }

 protected:
  static const int HEADER_SIZE = 1;
  uint8_t header;
  string payload;
};
}  // namespace pv

#endif
