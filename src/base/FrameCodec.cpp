#include "FrameCodec.hpp"

namespace fsn {
FrameCodec::FrameCodec(shared_ptr<SocketHandler> _socketHandler)
    : socketHandler(_socketHandler) {}

string FrameCodec::encode(uint64_t id, const string& payload) {
  return Frame(id, payload).serialize();
}

Frame FrameCodec::decode(const string& bytes) {
  if (bytes.length() < Frame::LENGTH_SIZE) {
    throw FramingError("Missing frame length prefix");
  }
  size_t length = (size_t(uint8_t(bytes[0])) << 8) | uint8_t(bytes[1]);
  if (bytes.length() - Frame::LENGTH_SIZE != length) {
    throw FramingError("Frame declares " + to_string(length) +
                       " bytes but holds " +
                       to_string(bytes.length() - Frame::LENGTH_SIZE));
  }
  return Frame::fromBody(bytes.substr(Frame::LENGTH_SIZE));
}

bool FrameCodec::readFrame(int fd, Frame* frame) {
  unsigned char lengthBytes[Frame::LENGTH_SIZE];
  size_t bytesRead =
      socketHandler->readAllOrEof(fd, lengthBytes, Frame::LENGTH_SIZE);
  if (bytesRead == 0) {
    return false;
  }
  if (bytesRead < Frame::LENGTH_SIZE) {
    throw FramingError("Stream closed inside a frame length prefix");
  }
  size_t length = (size_t(lengthBytes[0]) << 8) | lengthBytes[1];
  if (length < Frame::ID_SIZE) {
    throw FramingError("Frame length " + to_string(length) +
                       " is shorter than a correlation id");
  }

  string body(length, '\0');
  bytesRead = socketHandler->readAllOrEof(fd, &body[0], length);
  if (bytesRead < length) {
    throw FramingError("Stream closed after " + to_string(bytesRead) + " of " +
                       to_string(length) + " frame bytes");
  }
  *frame = Frame::fromBody(body);
  VLOG(3) << "Read frame " << frame->getCorrelationId() << " with "
          << frame->getPayload().length() << " payload bytes";
  return true;
}

void FrameCodec::writeFrame(int fd, const Frame& frame) {
  string s = frame.serialize();
  VLOG(3) << "Writing frame " << frame.getCorrelationId() << " with "
          << frame.getPayload().length() << " payload bytes";
  socketHandler->writeAllOrThrow(fd, s.data(), s.length(), false);
}

size_t FrameCodec::writeFrameUntil(
    int fd, const Frame& frame,
    std::chrono::steady_clock::time_point deadline) {
  string s = frame.serialize();
  VLOG(3) << "Writing frame " << frame.getCorrelationId() << " with "
          << frame.getPayload().length() << " payload bytes";
  return socketHandler->writeAllUntil(fd, s.data(), s.length(), deadline);
}
}  // namespace fsn
