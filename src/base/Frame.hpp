#ifndef __FSN_FRAME_H__
#define __FSN_FRAME_H__

#include "FsNotifyErrors.hpp"
#include "Headers.hpp"

namespace fsn {
/**
 * @brief One length-prefixed, id-tagged unit on the helper stream.
 *
 * Wire layout is `[length:u16][correlationId:u64][payload]`, big endian, with
 * `length == 8 + payload.size()`.
 */
class Frame {
 public:
  /** @brief Size of the length prefix. */
  static constexpr int LENGTH_SIZE = 2;
  /** @brief Size of the correlation id that follows the length prefix. */
  static constexpr int ID_SIZE = 8;
  /** @brief Largest payload whose length still fits the u16 prefix. */
  static constexpr size_t MAX_PAYLOAD_SIZE = 0xFFFF - ID_SIZE;

  /** @brief Constructs an empty broadcast frame. */
  Frame() : correlationId(BROADCAST_CORRELATION_ID) {}
  /** @brief Builds a frame carrying `_payload` under `_correlationId`. */
  Frame(uint64_t _correlationId, const string& _payload)
      : correlationId(_correlationId), payload(_payload) {}

  /**
   * @brief Parses the bytes that follow the length prefix.
   * @throws FramingError when the body is too short to hold an id.
   */
  static Frame fromBody(const string& body) {
    if (body.length() < ID_SIZE) {
      throw FramingError("Frame body of " + to_string(body.length()) +
                         " bytes cannot hold a correlation id");
    }
    uint64_t id = 0;
    for (int i = 0; i < ID_SIZE; i++) {
      id = (id << 8) | uint8_t(body[i]);
    }
    return Frame(id, body.substr(ID_SIZE));
  }

  /** @brief Returns the correlation id (0 for broadcasts). */
  uint64_t getCorrelationId() const { return correlationId; }
  /** @brief Returns the raw payload bytes. */
  const string& getPayload() const { return payload; }
  /** @brief True when the frame was not sent in reply to a command. */
  bool isBroadcast() const {
    return correlationId == BROADCAST_CORRELATION_ID;
  }

  /** @brief Value of the length prefix for this frame. */
  size_t length() const { return ID_SIZE + payload.length(); }

  /**
   * @brief Serializes the frame into its wire format.
   * @throws FramingError when the payload does not fit the length prefix.
   */
  string serialize() const {
    if (payload.length() > MAX_PAYLOAD_SIZE) {
      throw FramingError("Payload of " + to_string(payload.length()) +
                         " bytes exceeds the frame limit");
    }
    uint16_t len = uint16_t(length());
    string s(LENGTH_SIZE + ID_SIZE, '\0');
    s[0] = char((len >> 8) & 0xFF);
    s[1] = char(len & 0xFF);
    for (int i = 0; i < ID_SIZE; i++) {
      s[LENGTH_SIZE + i] =
          char((correlationId >> (8 * (ID_SIZE - 1 - i))) & 0xFF);
    }
    s.append(payload);
    return s;
  }

  bool operator==(const Frame& other) const {
    return correlationId == other.correlationId && payload == other.payload;
  }

 protected:
  /** @brief Pairs a reply with its command; 0 marks a broadcast. */
  uint64_t correlationId;
  /** @brief Message body, JSON or a plain command string. */
  string payload;
};
}  // namespace fsn

#endif  // __FSN_FRAME_H__
