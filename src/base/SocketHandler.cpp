#include "SocketHandler.hpp"

namespace fsn {
#define SOCKET_DATA_TRANSFER_TIMEOUT (10)

size_t SocketHandler::readAllOrEof(int fd, void* buf, size_t count) {
  size_t pos = 0;
  while (pos < count) {
    if (!waitOnSocketData(fd)) {
      continue;
    }

    ssize_t bytesRead = read(fd, ((char*)buf) + pos, count - pos);
    if (bytesRead == 0) {
      // The peer closed its end (or the stream was shut down locally).
      VLOG(1) << "End of stream on fd " << fd << " after " << pos << " of "
              << count << " bytes";
      return pos;
    }
    if (bytesRead < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // This is fine, just keep retrying
        continue;
      }
      VLOG(1) << "Failed a call to readAllOrEof: " << strerror(localErrno);
      throw std::runtime_error(string("Failed a call to readAllOrEof: ") +
                               strerror(localErrno));
    }
    pos += bytesRead;
  }
  return pos;
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  time_t startTime = time(NULL);
  size_t pos = 0;
  while (pos < count) {
    time_t currentTime = time(NULL);
    if (timeout && currentTime > startTime + SOCKET_DATA_TRANSFER_TIMEOUT) {
      throw std::runtime_error("Socket Timeout");
    }
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    auto localErrno = errno;
    if (bytesWritten < 0) {
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
        LOG(INFO) << "Got EAGAIN, waiting...";
        // This is fine, just keep retrying at 10hz
        std::this_thread::sleep_for(std::chrono::microseconds(100 * 1000));
      } else {
        LOG(WARNING) << "Failed a call to writeAll: " << strerror(localErrno);
        throw std::runtime_error("Failed a call to writeAll");
      }
    } else if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAll");
    } else {
      pos += bytesWritten;
      // Reset the timeout as long as we are writing bytes
      startTime = currentTime;
    }
  }
}

size_t SocketHandler::writeAllUntil(
    int fd, const void* buf, size_t count,
    std::chrono::steady_clock::time_point deadline) {
  size_t pos = 0;
  while (pos < count) {
    ssize_t bytesWritten = write(fd, ((const char*)buf) + pos, count - pos);
    if (bytesWritten > 0) {
      pos += bytesWritten;
      continue;
    }
    if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during writeAllUntil");
    }
    auto localErrno = errno;
    if (localErrno != EAGAIN && localErrno != EWOULDBLOCK &&
        localErrno != EINTR) {
      LOG(WARNING) << "Failed a call to writeAllUntil: "
                   << strerror(localErrno);
      throw std::runtime_error(string("Failed a call to writeAllUntil: ") +
                               strerror(localErrno));
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      VLOG(1) << "Write deadline passed on fd " << fd << " after " << pos
              << " of " << count << " bytes";
      return pos;
    }
    waitOnSocketWritable(fd, int(std::min<int64_t>(remaining.count(), 1000)));
  }
  return pos;
}
}  // namespace fsn
