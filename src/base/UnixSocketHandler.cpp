#include "UnixSocketHandler.hpp"

namespace fsn {
UnixSocketHandler::UnixSocketHandler() {}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd < 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  shared_ptr<recursive_mutex> socketMutex;
  {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    auto it = activeSocketMutexes.find(fd);
    if (it == activeSocketMutexes.end()) {
      LOG(INFO) << "Tried to read from a socket that has been closed: " << fd;
      errno = EPIPE;
      return -1;
    }
    socketMutex = it->second;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  VLOG(4) << "Unixsocket handler read from fd: " << fd;
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  VLOG(4) << "Unixsocket handler write to fd: " << fd;
  if (fd < 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  shared_ptr<recursive_mutex> socketMutex;
  {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    auto it = activeSocketMutexes.find(fd);
    if (it == activeSocketMutexes.end()) {
      LOG(INFO) << "Tried to write to a socket that has been closed: " << fd;
      errno = EPIPE;
      return -1;
    }
    socketMutex = it->second;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  size_t bytesWritten = 0;
  while (bytesWritten < count) {
    ssize_t w = ::send(fd, ((const char *)buf) + bytesWritten,
                       count - bytesWritten, MSG_NOSIGNAL);
    if (w < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (bytesWritten > 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        // The buffer is full; report what went out so the caller resumes
        // after it.
        return bytesWritten;
      }
      return -1;
    }
    bytesWritten += w;
  }
  return count;
}

pair<int, int> UnixSocketHandler::createPair() {
  int fds[2];
  FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds));
  lock_guard<std::recursive_mutex> guard(globalMutex);
  addToActiveSockets(fds[0]);
  addToActiveSockets(fds[1]);
  initSocket(fds[0]);
  initSocket(fds[1]);
  VLOG(3) << "Created socket pair " << fds[0] << " <-> " << fds[1];
  return make_pair(fds[0], fds[1]);
}

void UnixSocketHandler::adopt(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  addToActiveSockets(fd);
  initSocket(fd);
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSocketMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
}

void UnixSocketHandler::shutdownSocket(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (activeSocketMutexes.find(fd) == activeSocketMutexes.end()) {
    LOG(INFO) << "Tried to shut down a socket that is not active: " << fd;
    return;
  }
  VLOG(1) << "Shutting down socket: " << fd;
  // ENOTCONN means the peer is already gone, which is the state we want.
  if (::shutdown(fd, SHUT_RDWR) == -1 && GetErrno() != ENOTCONN) {
    LOG(WARNING) << "shutdown failed on fd " << fd << ": "
                 << strerror(GetErrno());
  }
}

void UnixSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    // Connection was already killed.
    STERROR << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  auto m = it->second;
  lock_guard<std::recursive_mutex> guard(*m);
  VLOG(1) << "Closing connection: " << fd;
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  vector<int> fds;
  for (auto it : activeSocketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

void UnixSocketHandler::initSocket(int fd) {
  int opts;
  opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts));
}
}  // namespace fsn
