#ifndef __FSN_SOCKET_HANDLER__
#define __FSN_SOCKET_HANDLER__

#include "Headers.hpp"

namespace fsn {
/**
 * @brief Provides an abstract API for descriptor reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  /** @brief Ensures derived handlers can clean up platform-specific resources.
   */
  virtual ~SocketHandler() {}

  /**
   * @brief Reads up to count bytes from fd.
   * @return Bytes read, 0 at end-of-stream, -1 with errno set on failure.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd.
   * @return Bytes written, which is less than `count` when the socket buffer
   * fills after some bytes went out; -1 with errno set (EAGAIN when nothing
   * could be written) otherwise.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads until `count` bytes arrive or the peer closes the stream.
   * @return Number of bytes read; less than `count` only at end-of-stream.
   * @throws std::runtime_error on a read error other than EAGAIN.
   */
  size_t readAllOrEof(int fd, void* buf, size_t count);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);
  /**
   * @brief Writes until all bytes are out or `deadline` passes, waiting for
   * the socket to drain in between.
   * @return Number of bytes written; less than `count` only if the deadline
   * passed first.
   * @throws std::runtime_error on a write error other than EAGAIN.
   */
  size_t writeAllUntil(int fd, const void* buf, size_t count,
                       std::chrono::steady_clock::time_point deadline);

  /**
   * @brief Creates a connected pair of stream descriptors.
   * @return The two ends, both tracked by this handler.
   */
  virtual pair<int, int> createPair() = 0;
  /**
   * @brief Starts tracking a descriptor opened elsewhere (e.g. inherited
   * stdin).
   */
  virtual void adopt(int fd) = 0;
  /**
   * @brief Disables further reads and writes so a blocked reader sees
   * end-of-stream. The descriptor stays open until `close`.
   */
  virtual void shutdownSocket(int fd) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace fsn

#endif  // __FSN_SOCKET_HANDLER__
